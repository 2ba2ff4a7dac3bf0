#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "analyzer_config.hpp"

using json = nlohmann::json;

TEST(AnalyzerConfig, Defaults) {
    AnalyzerConfig cfg;
    EXPECT_EQ(cfg.image, "python:3.10-slim");
    EXPECT_EQ(cfg.memory_limit_bytes, 128LL * 1024 * 1024);
    EXPECT_EQ(cfg.cpu_quota, 50000);
    EXPECT_EQ(cfg.python_executable, "python3");
    EXPECT_TRUE(cfg.enable_container);
}

TEST(AnalyzerConfig, OverridesFromJson) {
    auto cfg = analyzer_config_from_json({
        {"image", "python:3.12-slim"},
        {"memory_limit_bytes", 64 * 1024 * 1024},
        {"enable_container", false},
        {"unknown_key", "ignored"}
    });
    EXPECT_EQ(cfg.image, "python:3.12-slim");
    EXPECT_EQ(cfg.memory_limit_bytes, 64LL * 1024 * 1024);
    EXPECT_FALSE(cfg.enable_container);
    EXPECT_EQ(cfg.cpu_quota, 50000);
}

TEST(AnalyzerConfig, RejectsBadValues) {
    EXPECT_THROW(analyzer_config_from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(analyzer_config_from_json({{"image", 3}}), std::invalid_argument);
    EXPECT_THROW(analyzer_config_from_json({{"image", ""}}), std::invalid_argument);
    EXPECT_THROW(analyzer_config_from_json({{"cpu_quota", -1}}), std::invalid_argument);
    EXPECT_THROW(analyzer_config_from_json({{"verbose", "yes"}}), std::invalid_argument);
    EXPECT_THROW(analyzer_config_from_json({{"docker_api_timeout_ms", 0}}), std::invalid_argument);
}

TEST(AnalyzerConfig, RoundTripsThroughJson) {
    AnalyzerConfig cfg;
    cfg.image = "custom:1";
    cfg.pids_limit = 16;
    auto back = analyzer_config_from_json(analyzer_config_to_json(cfg));
    EXPECT_EQ(back.image, "custom:1");
    EXPECT_EQ(back.pids_limit, 16);
}

TEST(AnalyzerConfig, LoadsFileWithComments) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("codeguard-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "{\n  // tighter sandbox\n  \"cpu_quota\": 25000,\n  \"verbose\": true\n}\n";
    }
    auto cfg = load_analyzer_config(path.string());
    EXPECT_EQ(cfg.cpu_quota, 25000);
    EXPECT_TRUE(cfg.verbose);
    std::filesystem::remove(path);

    EXPECT_THROW(load_analyzer_config(path.string()), std::invalid_argument);
}

TEST(AnalyzerConfig, DockerHostPrecedence) {
    AnalyzerConfig cfg;
    cfg.docker_host = "tcp://127.0.0.1:2375";
    EXPECT_EQ(effective_docker_host(cfg), "tcp://127.0.0.1:2375");

    cfg.docker_host.clear();
    ::setenv("DOCKER_HOST", "unix:///tmp/codeguard-test.sock", 1);
    EXPECT_EQ(effective_docker_host(cfg), "unix:///tmp/codeguard-test.sock");
    ::unsetenv("DOCKER_HOST");
    EXPECT_EQ(effective_docker_host(cfg), "unix:///var/run/docker.sock");
}

TEST(AnalyzerConfig, TimeoutFromSeconds) {
    EXPECT_EQ(analysis_timeout_from_seconds(5.0), std::chrono::milliseconds(5000));
    EXPECT_EQ(analysis_timeout_from_seconds(0.0015), std::chrono::milliseconds(2));
    EXPECT_EQ(analysis_timeout_from_seconds(kMaxAnalysisTimeoutSeconds),
              std::chrono::milliseconds(static_cast<long long>(kMaxAnalysisTimeoutSeconds) * 1000));

    EXPECT_THROW(analysis_timeout_from_seconds(0.0), std::invalid_argument);
    EXPECT_THROW(analysis_timeout_from_seconds(-1.0), std::invalid_argument);
    EXPECT_THROW(analysis_timeout_from_seconds(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(analysis_timeout_from_seconds(std::nan("")), std::invalid_argument);
    EXPECT_THROW(analysis_timeout_from_seconds(1e300), std::invalid_argument);
}

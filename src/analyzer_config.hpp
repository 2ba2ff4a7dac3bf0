#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

struct AnalyzerConfig {
    // container backend
    std::string image = "python:3.10-slim";
    std::string container_python = "python";
    int64_t memory_limit_bytes = 128LL * 1024 * 1024;
    int64_t cpu_quota = 50000;
    int64_t cpu_period = 100000;
    int64_t pids_limit = 64;
    bool enable_container = true;
    std::string docker_host;            // empty: $DOCKER_HOST, then the local socket
    int64_t docker_api_timeout_ms = 5000;

    // subprocess backend
    std::string python_executable = "python3";
    int64_t subprocess_memory_limit_bytes = 512LL * 1024 * 1024;

    int64_t max_output_bytes = 1024 * 1024;
    bool verbose = false;
};

// Longest per-request time budget accepted from users.
inline constexpr double kMaxAnalysisTimeoutSeconds = 24 * 60 * 60;

// Converts a user-supplied budget in seconds, rounding up to whole
// milliseconds. Non-finite, non-positive or too-large values throw
// std::invalid_argument.
std::chrono::milliseconds analysis_timeout_from_seconds(double seconds);

// Resolves docker_host against the environment.
std::string effective_docker_host(const AnalyzerConfig& cfg);

// Missing keys keep their defaults; a key of the wrong type throws
// std::invalid_argument.
AnalyzerConfig analyzer_config_from_json(const nlohmann::json& j);
AnalyzerConfig load_analyzer_config(const std::string& path);

nlohmann::json analyzer_config_to_json(const AnalyzerConfig& cfg);

#include "analyzer_config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

static const char* kDefaultDockerHost = "unix:///var/run/docker.sock";

namespace {

void read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw std::invalid_argument(std::string("config key '") + key + "' must be a string");
    out = it->get<std::string>();
}

void read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) throw std::invalid_argument(std::string("config key '") + key + "' must be a boolean");
    out = it->get<bool>();
}

void read_count(const json& j, const char* key, int64_t& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0)
        throw std::invalid_argument(std::string("config key '") + key + "' must be a non-negative integer");
    out = it->get<int64_t>();
}

} // namespace

std::chrono::milliseconds analysis_timeout_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxAnalysisTimeoutSeconds) {
        throw std::invalid_argument("timeout must be a positive number of seconds, at most " +
                                    std::to_string(static_cast<long long>(kMaxAnalysisTimeoutSeconds)));
    }
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

std::string effective_docker_host(const AnalyzerConfig& cfg) {
    if (!cfg.docker_host.empty()) return cfg.docker_host;
    const char* env = std::getenv("DOCKER_HOST");
    if (env && *env) return env;
    return kDefaultDockerHost;
}

AnalyzerConfig analyzer_config_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("config must be a JSON object");
    AnalyzerConfig c;
    read_string(j, "image", c.image);
    read_string(j, "container_python", c.container_python);
    read_count(j, "memory_limit_bytes", c.memory_limit_bytes);
    read_count(j, "cpu_quota", c.cpu_quota);
    read_count(j, "cpu_period", c.cpu_period);
    read_count(j, "pids_limit", c.pids_limit);
    read_bool(j, "enable_container", c.enable_container);
    read_string(j, "docker_host", c.docker_host);
    read_count(j, "docker_api_timeout_ms", c.docker_api_timeout_ms);
    read_string(j, "python_executable", c.python_executable);
    read_count(j, "subprocess_memory_limit_bytes", c.subprocess_memory_limit_bytes);
    read_count(j, "max_output_bytes", c.max_output_bytes);
    read_bool(j, "verbose", c.verbose);

    if (c.image.empty()) throw std::invalid_argument("config key 'image' must not be empty");
    if (c.python_executable.empty()) throw std::invalid_argument("config key 'python_executable' must not be empty");
    if (c.docker_api_timeout_ms == 0) throw std::invalid_argument("config key 'docker_api_timeout_ms' must be positive");
    return c;
}

AnalyzerConfig load_analyzer_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::invalid_argument("cannot open config file " + path);
    json j = json::parse(in, nullptr, /*allow_exceptions*/false, /*ignore_comments*/true);
    if (j.is_discarded()) throw std::invalid_argument("config file " + path + " is not valid JSON");
    return analyzer_config_from_json(j);
}

json analyzer_config_to_json(const AnalyzerConfig& c) {
    return json{
        {"image", c.image},
        {"container_python", c.container_python},
        {"memory_limit_bytes", c.memory_limit_bytes},
        {"cpu_quota", c.cpu_quota},
        {"cpu_period", c.cpu_period},
        {"pids_limit", c.pids_limit},
        {"enable_container", c.enable_container},
        {"docker_host", c.docker_host},
        {"docker_api_timeout_ms", c.docker_api_timeout_ms},
        {"python_executable", c.python_executable},
        {"subprocess_memory_limit_bytes", c.subprocess_memory_limit_bytes},
        {"max_output_bytes", c.max_output_bytes},
        {"verbose", c.verbose}
    };
}

#include "container_executor.hpp"
#include "backend_error.hpp"
#include "result_record.hpp"
#include "../docker_client.hpp"
#include "../scratch_script.hpp"
#include <iostream>

namespace {

// Force-removes the container on every way out of run_script.
class ContainerGuard {
public:
    ContainerGuard(const DockerClient& docker, std::string id)
        : docker_(docker), id_(std::move(id)) {}

    ~ContainerGuard() {
        try {
            docker_.remove_container(id_);
        } catch (const std::exception& e) {
            std::cerr << "[container] failed to remove " << id_.substr(0, 12) << ": " << e.what() << std::endl;
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    const DockerClient& docker_;
    std::string id_;
};

} // namespace

ContainerExecutor::ContainerExecutor(std::shared_ptr<const DockerClient> docker,
                                     std::unique_ptr<HostPathMapper> mapper)
    : docker_(std::move(docker)), mapper_(std::move(mapper)) {}

bool ContainerExecutor::initialize(const AnalyzerConfig& cfg) {
    cfg_ = cfg;
    return docker_ != nullptr && mapper_ != nullptr;
}

ContainerExecutor::json ContainerExecutor::container_spec(const ScratchScript& scratch) const {
    const std::string bind = mapper_->to_mount_source(scratch.directory().string()) + ":/code:ro";
    json host_config = {
        {"Binds", json::array({bind})},
        {"NetworkMode", "none"},
        {"Memory", cfg_.memory_limit_bytes},
        {"MemorySwap", cfg_.memory_limit_bytes},
        {"CpuQuota", cfg_.cpu_quota},
        {"CpuPeriod", cfg_.cpu_period},
        {"AutoRemove", false}
    };
    if (cfg_.pids_limit > 0) host_config["PidsLimit"] = cfg_.pids_limit;

    return json{
        {"Image", cfg_.image},
        {"Cmd", json::array({cfg_.container_python, "-I", "/code/" + scratch.file_name()})},
        {"WorkingDir", "/code"},
        {"NetworkDisabled", true},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"Tty", false},
        {"Labels", {{kRequestLabel, scratch.request_id()}}},
        {"HostConfig", host_config}
    };
}

RawExecutionResult ContainerExecutor::run_script(const WrapperScript& script,
                                                 std::chrono::milliseconds timeout) const {
    if (!docker_) throw BackendError(BackendFailure::Unavailable, "no container runtime handle");

    ScratchScript scratch(script);
    const std::string container_name = "codeguard-" + scratch.request_id();

    const std::string id = docker_->create_container(container_name, container_spec(scratch));
    ContainerGuard guard(*docker_, id);
    if (cfg_.verbose) {
        std::cerr << "[container] " << container_name << " (" << id.substr(0, 12) << ") created from " << cfg_.image << std::endl;
    }

    docker_->start_container(id);

    auto status = docker_->wait_container(id, timeout);
    if (!status) {
        std::cerr << "[container] " << container_name << " exceeded " << timeout.count() << " ms, killing" << std::endl;
        try {
            docker_->kill_container(id);
        } catch (const std::exception& e) {
            // the guard still force-removes it
            std::cerr << "[container] kill failed: " << e.what() << std::endl;
        }
        return make_timeout_result();
    }

    auto logs = docker_->container_logs(id, static_cast<size_t>(cfg_.max_output_bytes));
    if (cfg_.verbose) {
        std::cerr << "[container] " << container_name << " exited with status " << *status << std::endl;
    }
    return parse_result_record(select_record_stream(logs.stdout_text, logs.stderr_text));
}

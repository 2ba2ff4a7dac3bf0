#pragma once
#include "iexecutor.hpp"
#include "../analyzer_config.hpp"
#include "../path_mapper.hpp"
#include <memory>
#include <nlohmann/json.hpp>

class DockerClient;
class ScratchScript;

// Runs the wrapper in a fresh, single-use container: network disabled,
// memory and CPU capped, script directory mounted read-only at /code.
class ContainerExecutor : public IExecutor {
public:
    using json = nlohmann::json;

    static constexpr const char* kRequestLabel = "codeguard.request";

    explicit ContainerExecutor(std::shared_ptr<const DockerClient> docker,
                               std::unique_ptr<HostPathMapper> mapper = make_host_path_mapper());

    bool initialize(const AnalyzerConfig& cfg) override;
    RawExecutionResult run_script(const WrapperScript& script,
                                  std::chrono::milliseconds timeout) const override;
    const char* name() const override { return "container"; }

    // Engine API create body for one request.
    json container_spec(const ScratchScript& scratch) const;

private:
    std::shared_ptr<const DockerClient> docker_;
    std::unique_ptr<HostPathMapper> mapper_;
    AnalyzerConfig cfg_;
};

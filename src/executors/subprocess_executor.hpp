#pragma once
#include "iexecutor.hpp"
#include "../analyzer_config.hpp"
#include <string>

// Runs the wrapper as a plain child process of this one. Nothing isolates it
// beyond the process boundary and rlimits; callers gate it with the safety
// filter.
class SubprocessExecutor : public IExecutor {
public:
    SubprocessExecutor() = default;

    // Fails when the configured interpreter is not found on PATH.
    bool initialize(const AnalyzerConfig& cfg) override;
    RawExecutionResult run_script(const WrapperScript& script,
                                  std::chrono::milliseconds timeout) const override;
    const char* name() const override { return "subprocess"; }

private:
    AnalyzerConfig cfg_;
    std::string interpreter_;
};

// Absolute path of `program` (searched on PATH unless it contains '/'), or
// empty when nothing executable is found.
std::string resolve_executable(const std::string& program);

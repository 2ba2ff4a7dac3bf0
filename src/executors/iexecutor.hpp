#pragma once
#include <chrono>
#include <optional>
#include <string>

struct AnalyzerConfig;

// Self-contained script produced by the wrapper builder.
struct WrapperScript {
    std::string text;
};

// One execution outcome, as reported by the wrapper record or synthesized by a
// backend (timeout, unparseable output).
struct RawExecutionResult {
    bool success{false};
    std::string output;
    std::optional<std::string> error;
    std::optional<std::string> error_kind;
    std::optional<std::string> traceback;
};

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual bool initialize(const AnalyzerConfig& cfg) = 0;

    // Blocks until the script finishes or `timeout` elapses. Code-level
    // failures come back as data; anything that prevents execution is thrown
    // as BackendError. Safe to call from several threads after initialize().
    virtual RawExecutionResult run_script(const WrapperScript& script,
                                          std::chrono::milliseconds timeout) const = 0;

    virtual const char* name() const = 0;
};

#pragma once
#include "analyzer_config.hpp"
#include "classifier.hpp"
#include "executors/iexecutor.hpp"
#include <chrono>
#include <memory>
#include <string>

class DockerClient;

// Orchestrates the backends in fixed order: container, then subprocess
// (only for code the safety filter permits), then a documented skip.
// analyze() never throws and is safe to call concurrently.
class TieredExecutor {
public:
    // Either backend may be null. A null container backend means no runtime
    // handle was acquired.
    TieredExecutor(AnalyzerConfig cfg,
                   std::unique_ptr<IExecutor> container,
                   std::unique_ptr<IExecutor> subprocess);

    // Builds the standard backends around a runtime handle acquired once by
    // the caller (nullptr when the runtime is unavailable).
    static std::unique_ptr<TieredExecutor> create(const AnalyzerConfig& cfg,
                                                  std::shared_ptr<const DockerClient> docker);

    Classification analyze(const std::string& code, std::chrono::milliseconds timeout) const noexcept;

    bool has_container_backend() const { return container_ != nullptr; }

private:
    enum class Stage { TryContainer, TrySubprocess, Skipped };

    Classification run_tiers(const std::string& code, std::chrono::milliseconds timeout) const;

    AnalyzerConfig cfg_;
    std::unique_ptr<IExecutor> container_;
    std::unique_ptr<IExecutor> subprocess_;
};

// Skip explanations.
inline constexpr const char* kSkipFilteredReason =
    "Dynamic analysis skipped (container unavailable and code contains system imports)";
inline constexpr const char* kSkipNoBackendReason =
    "Dynamic analysis skipped (no execution backend available)";

#include "tiered_executor.hpp"
#include "digest.hpp"
#include "docker_client.hpp"
#include "safety_filter.hpp"
#include "wrapper_builder.hpp"
#include "executors/backend_error.hpp"
#include "executors/container_executor.hpp"
#include "executors/subprocess_executor.hpp"
#include <algorithm>
#include <iostream>

TieredExecutor::TieredExecutor(AnalyzerConfig cfg,
                               std::unique_ptr<IExecutor> container,
                               std::unique_ptr<IExecutor> subprocess)
    : cfg_(std::move(cfg)), container_(std::move(container)), subprocess_(std::move(subprocess)) {}

std::unique_ptr<TieredExecutor> TieredExecutor::create(const AnalyzerConfig& cfg,
                                                       std::shared_ptr<const DockerClient> docker) {
    std::unique_ptr<IExecutor> container;
    if (docker) {
        container = std::make_unique<ContainerExecutor>(std::move(docker));
        if (!container->initialize(cfg)) container.reset();
    }
    // Kept even when the interpreter is missing: run_script then raises a
    // launch error and the request ends in the skip outcome.
    auto subprocess = std::make_unique<SubprocessExecutor>();
    subprocess->initialize(cfg);
    return std::make_unique<TieredExecutor>(cfg, std::move(container), std::move(subprocess));
}

Classification TieredExecutor::analyze(const std::string& code,
                                       std::chrono::milliseconds timeout) const noexcept {
    // Keeps deadline arithmetic in the backends well clear of overflow.
    const std::chrono::milliseconds longest(static_cast<long long>(kMaxAnalysisTimeoutSeconds * 1000));
    try {
        return run_tiers(code, std::min(timeout, longest));
    } catch (const std::exception& e) {
        std::cerr << "[analyzer] internal failure: " << e.what() << std::endl;
        return skipped_classification(std::string("Dynamic analysis skipped (internal error: ") + e.what() + ")");
    } catch (...) {
        std::cerr << "[analyzer] internal failure of unknown type" << std::endl;
        return skipped_classification("Dynamic analysis skipped (internal error)");
    }
}

Classification TieredExecutor::run_tiers(const std::string& code, std::chrono::milliseconds timeout) const {
    const std::string tag = sha256_hex(code).substr(0, 12);
    const WrapperScript script = build_wrapper(code);
    std::string skip_reason = kSkipNoBackendReason;

    Stage stage = container_ ? Stage::TryContainer : Stage::TrySubprocess;
    while (true) {
        switch (stage) {
        case Stage::TryContainer:
            try {
                Classification c = classify(container_->run_script(script, timeout));
                c.backend = container_->name();
                if (cfg_.verbose) std::cerr << "[analyzer] " << tag << " classified via container" << std::endl;
                return c;
            } catch (const BackendError& e) {
                std::cerr << "[analyzer] " << tag << " container backend failed ("
                          << backend_failure_name(e.failure()) << "): " << e.what() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[analyzer] " << tag << " container backend error: " << e.what() << std::endl;
            }
            stage = Stage::TrySubprocess;
            break;

        case Stage::TrySubprocess: {
            if (!subprocess_) {
                stage = Stage::Skipped;
                break;
            }
            const SafetyVerdict verdict = check_subprocess_safety(code);
            if (!verdict.permitted) {
                std::cerr << "[filter] " << tag << " skipping subprocess execution, system import '"
                          << verdict.blocked_module << "' detected" << std::endl;
                skip_reason = kSkipFilteredReason;
                stage = Stage::Skipped;
                break;
            }
            if (cfg_.verbose) std::cerr << "[analyzer] " << tag << " using subprocess backend" << std::endl;
            try {
                Classification c = classify(subprocess_->run_script(script, timeout));
                c.backend = subprocess_->name();
                return c;
            } catch (const std::exception& e) {
                std::cerr << "[analyzer] " << tag << " subprocess backend failed: " << e.what() << std::endl;
                skip_reason = std::string("Dynamic analysis skipped (container unavailable and subprocess failed: ") +
                              e.what() + ")";
            }
            stage = Stage::Skipped;
            break;
        }

        case Stage::Skipped:
            return skipped_classification(skip_reason);
        }
    }
}

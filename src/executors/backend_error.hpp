#pragma once
#include <stdexcept>
#include <string>

enum class BackendFailure {
    Unavailable,         // no runtime handle / backend disabled
    RuntimeUnreachable,  // daemon did not answer
    ImageMissing,        // reference image not present on the host
    LaunchError          // environment or process could not be started
};

inline const char* backend_failure_name(BackendFailure f) {
    switch (f) {
        case BackendFailure::Unavailable: return "unavailable";
        case BackendFailure::RuntimeUnreachable: return "runtime-unreachable";
        case BackendFailure::ImageMissing: return "image-missing";
        case BackendFailure::LaunchError: return "launch-error";
    }
    return "unknown";
}

class BackendError : public std::runtime_error {
public:
    BackendError(BackendFailure failure, const std::string& what)
        : std::runtime_error(what), failure_(failure) {}

    BackendFailure failure() const noexcept { return failure_; }

private:
    BackendFailure failure_;
};

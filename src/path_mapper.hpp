#pragma once
#include <memory>
#include <string>

// Translates a host path into the form the container runtime expects as a
// bind-mount source.
class HostPathMapper {
public:
    virtual ~HostPathMapper() = default;
    virtual std::string to_mount_source(const std::string& host_path) const = 0;
};

// Linux / macOS: host paths are used verbatim.
class PosixPathMapper final : public HostPathMapper {
public:
    std::string to_mount_source(const std::string& host_path) const override;
};

// Windows: `C:\Users\me\tmp` -> `/c/Users/me/tmp`.
class WindowsPathMapper final : public HostPathMapper {
public:
    std::string to_mount_source(const std::string& host_path) const override;
};

std::unique_ptr<HostPathMapper> make_host_path_mapper();

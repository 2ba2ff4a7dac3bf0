#pragma once
#include "executors/iexecutor.hpp"
#include <filesystem>
#include <string>

// Private temp directory holding a single wrapper script for one request.
// The directory and everything in it is removed when the object goes away.
class ScratchScript {
public:
    explicit ScratchScript(const WrapperScript& script);
    ~ScratchScript();

    ScratchScript(const ScratchScript&) = delete;
    ScratchScript& operator=(const ScratchScript&) = delete;

    const std::filesystem::path& directory() const { return dir_; }
    const std::filesystem::path& path() const { return file_; }
    std::string file_name() const { return file_.filename().string(); }

    // Unique per live request on this host; safe in container names.
    const std::string& request_id() const { return request_id_; }

private:
    std::filesystem::path dir_;
    std::filesystem::path file_;
    std::string request_id_;
};

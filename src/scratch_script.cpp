#include "scratch_script.hpp"
#include "executors/backend_error.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>
#include <stdlib.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

static const char* kDirPrefix = "codeguard-";
static const char* kScriptName = "snippet.py";

namespace {

[[noreturn]] void give_up(const fs::path& dir, const std::string& what) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    throw BackendError(BackendFailure::LaunchError, what);
}

} // namespace

ScratchScript::ScratchScript(const WrapperScript& script) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";

    std::string tmpl = (base / (std::string(kDirPrefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw BackendError(BackendFailure::LaunchError,
                           "cannot create scratch directory under " + base.string() + ": " + std::strerror(errno));
    }
    dir_ = fs::path(buf.data());
    request_id_ = dir_.filename().string().substr(std::strlen(kDirPrefix));
    file_ = dir_ / kScriptName;

    // The container may run the interpreter as a different uid.
    if (::chmod(dir_.c_str(), 0755) != 0)
        give_up(dir_, "cannot open up " + dir_.string() + ": " + std::strerror(errno));

    std::ofstream out(file_, std::ios::binary | std::ios::trunc);
    out << script.text;
    out.close();
    if (!out) give_up(dir_, "cannot write wrapper script to " + file_.string());
    if (::chmod(file_.c_str(), 0644) != 0)
        give_up(dir_, "cannot open up " + file_.string() + ": " + std::strerror(errno));
}

ScratchScript::~ScratchScript() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        std::cerr << "[scratch] failed to remove " << dir_ << ": " << ec.message() << std::endl;
    }
}

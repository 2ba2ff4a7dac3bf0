#include "subprocess_executor.hpp"
#include "backend_error.hpp"
#include "result_record.hpp"
#include "../scratch_script.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
extern char **environ;

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

[[noreturn]] void throw_launch_error(const std::string& what) {
    throw BackendError(BackendFailure::LaunchError, what + ": " + std::strerror(errno));
}

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) throw_launch_error("pipe failed");
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

// Owns the child until it has been reaped. Leaving scope early kills the
// child's whole process group first.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ > 0) {
            kill_group();
            reap();
        }
    }
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void kill_group() const {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }

    // Exited, but left as a zombie so the pid (and group id) stay reserved.
    bool has_exited() const {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        return ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
               info.si_pid != 0;
    }

    int reap() {
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
        pid_ = -1;
        return status;
    }

private:
    pid_t pid_;
};

// Trims in batches; the caller applies the exact cap once reading is done.
void append_capped(std::string& dst, const char* data, size_t n, size_t limit) {
    dst.append(data, n);
    if (dst.size() > 2 * limit) keep_tail(dst, limit);
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

} // namespace

std::string resolve_executable(const std::string& program) {
    namespace fs = std::filesystem;
    auto executable = [](const std::string& p) {
        struct stat st;
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };
    if (program.empty()) return "";
    if (program.find('/') != std::string::npos) {
        return executable(program) ? fs::absolute(program).string() : "";
    }

    const char* env_path = std::getenv("PATH");
    std::stringstream dirs(env_path && *env_path ? env_path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + program;
        if (executable(candidate)) return fs::absolute(candidate).string();
    }
    return "";
}

bool SubprocessExecutor::initialize(const AnalyzerConfig& cfg) {
    cfg_ = cfg;
    interpreter_ = resolve_executable(cfg.python_executable);
    if (interpreter_.empty()) {
        std::cerr << "[subprocess] interpreter '" << cfg.python_executable << "' not found on PATH" << std::endl;
        return false;
    }
    if (cfg_.verbose) std::cerr << "[subprocess] using " << interpreter_ << std::endl;
    return true;
}

RawExecutionResult SubprocessExecutor::run_script(const WrapperScript& script,
                                                  std::chrono::milliseconds timeout) const {
    if (interpreter_.empty()) {
        throw BackendError(BackendFailure::LaunchError,
                           "interpreter '" + cfg_.python_executable + "' not found on PATH");
    }

    ScratchScript scratch(script);
    const std::string script_path = scratch.path().string();
    const std::string workdir = scratch.directory().string();

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv = {
        const_cast<char*>(interpreter_.c_str()),
        const_cast<char*>("-I"),
        const_cast<char*>(script_path.c_str()),
        nullptr
    };
    const rlim_t memory_limit = static_cast<rlim_t>(cfg_.subprocess_memory_limit_bytes);
    const rlim_t cpu_seconds = static_cast<rlim_t>((timeout.count() + 999) / 1000 + 1);

    UniqueFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull) throw_launch_error("cannot open /dev/null");
    Pipe out = make_pipe();
    Pipe err = make_pipe();
    Pipe exec_status = make_pipe();

    const auto started = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid == -1) throw_launch_error("fork failed");

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(devnull.get(), STDIN_FILENO);
        ::dup2(out.write.get(), STDOUT_FILENO);
        ::dup2(err.write.get(), STDERR_FILENO);
        if (::chdir(workdir.c_str()) == 0) {
            struct rlimit rl;
            if (memory_limit > 0) {
                rl.rlim_cur = rl.rlim_max = memory_limit;
                ::setrlimit(RLIMIT_AS, &rl);
            }
            rl.rlim_cur = cpu_seconds;
            rl.rlim_max = cpu_seconds + 1;
            ::setrlimit(RLIMIT_CPU, &rl);
            ::execve(argv[0], argv.data(), environ);
        }
        int e = errno;
        ssize_t ignored = ::write(exec_status.write.get(), &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    ChildGuard child(pid);
    ::setpgid(pid, pid);  // whichever of parent/child runs first wins
    out.write.reset();
    err.write.reset();
    exec_status.write.reset();

    // EOF here means execve() succeeded and closed the close-on-exec end.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read.get(), &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        throw BackendError(BackendFailure::LaunchError,
                           "cannot start " + interpreter_ + ": " + std::strerror(exec_errno));
    }

    const size_t limit = static_cast<size_t>(cfg_.max_output_bytes);
    const auto deadline = started + timeout;
    std::string stdout_text, stderr_text;
    std::vector<std::pair<int, std::string*>> streams = {
        {out.read.get(), &stdout_text},
        {err.read.get(), &stderr_text}
    };
    bool exited = false;
    char buf[4096];

    while (true) {
        if (!exited && child.has_exited()) {
            exited = true;
            // Background processes it left behind would hold the pipes open.
            child.kill_group();
        }
        const auto now = std::chrono::steady_clock::now();
        if (exited && (streams.empty() || now >= deadline)) break;
        if (!exited && now >= deadline) {
            child.kill_group();
            std::cerr << "[subprocess] " << scratch.request_id() << " exceeded "
                      << timeout.count() << " ms, killed" << std::endl;
            return make_timeout_result();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::max<long long>(1, std::min<long long>(50, remaining)));

        std::vector<pollfd> fds;
        for (const auto& s : streams) fds.push_back(pollfd{s.first, POLLIN, 0});
        if (fds.empty()) {
            ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
            continue;
        }
        int rc = ::poll(fds.data(), fds.size(), wait_ms);
        if (rc == -1) {
            if (errno == EINTR) continue;
            throw_launch_error("poll failed");
        }
        for (size_t i = fds.size(); i-- > 0;) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                append_capped(*streams[i].second, buf, static_cast<size_t>(got), limit);
            } else if (got == 0 || errno != EINTR) {
                streams.erase(streams.begin() + static_cast<std::ptrdiff_t>(i));
            }
        }
    }

    keep_tail(stdout_text, limit);
    keep_tail(stderr_text, limit);
    const int status = child.reap();
    if (cfg_.verbose) {
        std::cerr << "[subprocess] " << scratch.request_id() << " finished with " << describe_status(status) << std::endl;
    }
    return parse_result_record(select_record_stream(stdout_text, stderr_text));
}

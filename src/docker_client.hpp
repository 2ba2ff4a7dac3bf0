#pragma once
#include "executors/backend_error.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

// Where the Docker Engine API listens.
struct DockerEndpoint {
    enum class Transport { Unix, Tcp };
    Transport transport{Transport::Unix};
    std::string socket_path;   // Unix
    std::string host;          // Tcp
    std::string port;          // Tcp
};

// Accepts `unix:///path/to/docker.sock` and `tcp://host:port`.
// Throws std::invalid_argument for anything else.
DockerEndpoint parse_docker_host(const std::string& docker_host);

struct ContainerLogs {
    std::string stdout_text;
    std::string stderr_text;
};

// Splits Docker's multiplexed log stream (8-byte frame headers). A stream
// that does not start with a valid header is returned as stdout. Each side
// keeps its newest `limit` bytes.
ContainerLogs demux_log_stream(const std::string& raw, size_t limit);

class DockerError : public BackendError {
public:
    DockerError(BackendFailure failure, const std::string& what, bool timed_out = false)
        : BackendError(failure, what), timed_out_(timed_out) {}

    // The request got no complete answer before its deadline.
    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

// Blocking client for the subset of the Engine API the container backend
// needs. Every call opens its own connection, so one instance can be shared
// by concurrent requests without locking.
class DockerClient {
public:
    using json = nlohmann::json;

    struct Response {
        unsigned status{0};
        std::string body;
    };

    DockerClient(DockerEndpoint endpoint, std::chrono::milliseconds api_timeout);

    // Returns nullptr (and logs why) when the runtime does not answer /_ping.
    static std::shared_ptr<const DockerClient> connect(const std::string& docker_host,
                                                       std::chrono::milliseconds api_timeout);

    bool ping() const;

    // Returns the container id.
    std::string create_container(const std::string& name, const json& spec) const;
    void start_container(const std::string& id) const;
    // Exit status, or nullopt when the container is still running at the deadline.
    std::optional<int> wait_container(const std::string& id, std::chrono::milliseconds timeout) const;
    ContainerLogs container_logs(const std::string& id, size_t limit) const;
    void kill_container(const std::string& id) const;
    void remove_container(const std::string& id) const;
    std::vector<std::string> list_containers_with_label(const std::string& label) const;

    Response request(boost::beast::http::verb method, const std::string& target,
                     const std::string& body, std::chrono::milliseconds timeout) const;

private:
    DockerEndpoint endpoint_;
    std::chrono::milliseconds api_timeout_;
};

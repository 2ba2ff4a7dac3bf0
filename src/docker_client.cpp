#include "docker_client.hpp"
#include "executors/result_record.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using local_stream = net::local::stream_protocol;
using json = nlohmann::json;

static const char* kUserAgent = "codeguard-dynamic/1.0";
static constexpr size_t kBodyLimit = 64 * 1024 * 1024;

namespace {

// Runs `ioc` until `finished` is set or `timeout` passes. On expiry
// `abandon` closes what is pending and the aborted handlers are drained
// before returning false, so nothing outlives the caller's frame.
template <class Abandon>
bool run_within(net::io_context& ioc, const bool& finished, std::chrono::milliseconds timeout, Abandon abandon) {
    ioc.restart();
    ioc.run_for(timeout);
    if (finished) return true;
    abandon();
    ioc.restart();
    ioc.run();
    return false;
}

// Writes `req` and reads the response within `timeout`.
template <class Socket>
DockerClient::Response exchange(net::io_context& ioc, Socket& socket,
                                http::request<http::string_body>& req,
                                const std::string& target,
                                std::chrono::milliseconds timeout) {
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kBodyLimit);
    beast::error_code result;
    bool finished = false;

    http::async_write(socket, req, [&](beast::error_code ec, std::size_t) {
        if (ec) {
            result = ec;
            finished = true;
            return;
        }
        http::async_read(socket, buffer, parser, [&](beast::error_code read_ec, std::size_t) {
            result = read_ec;
            finished = true;
        });
    });
    const bool answered = run_within(ioc, finished, timeout, [&socket] {
        beast::error_code ignored;
        socket.close(ignored);
    });
    if (!answered) {
        throw DockerError(BackendFailure::RuntimeUnreachable,
                          "Docker API " + target + " timed out", /*timed_out*/true);
    }
    if (result) {
        throw DockerError(BackendFailure::RuntimeUnreachable,
                          "Docker API " + target + " failed: " + result.message());
    }
    auto res = parser.release();
    DockerClient::Response out;
    out.status = res.result_int();
    out.body = std::move(res.body());
    return out;
}

std::string api_message(const std::string& body) {
    json j = json::parse(body, nullptr, /*allow_exceptions*/false);
    if (j.is_object() && j.contains("message") && j["message"].is_string())
        return j["message"].get<std::string>();
    return body;
}

std::string url_encode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out << c;
        else out << '%' << std::setw(2) << std::setfill('0') << int(c);
    }
    return out.str();
}

} // namespace

DockerEndpoint parse_docker_host(const std::string& docker_host) {
    static const std::string unix_prefix = "unix://";
    static const std::string tcp_prefix = "tcp://";
    DockerEndpoint ep;

    if (docker_host.rfind(unix_prefix, 0) == 0) {
        ep.transport = DockerEndpoint::Transport::Unix;
        ep.socket_path = docker_host.substr(unix_prefix.size());
        if (ep.socket_path.empty()) throw std::invalid_argument("DOCKER_HOST '" + docker_host + "' has no socket path");
        return ep;
    }
    if (docker_host.rfind(tcp_prefix, 0) == 0) {
        std::string rest = docker_host.substr(tcp_prefix.size());
        if (rest.find('/') != std::string::npos) rest = rest.substr(0, rest.find('/'));
        ep.transport = DockerEndpoint::Transport::Tcp;
        auto colon = rest.rfind(':');
        if (colon == std::string::npos) {
            ep.host = rest;
            ep.port = "2375";
        } else {
            ep.host = rest.substr(0, colon);
            ep.port = rest.substr(colon + 1);
        }
        if (ep.host.empty() || ep.port.empty())
            throw std::invalid_argument("DOCKER_HOST '" + docker_host + "' is missing host or port");
        return ep;
    }
    throw std::invalid_argument("unsupported DOCKER_HOST '" + docker_host + "' (expected unix:// or tcp://)");
}

ContainerLogs demux_log_stream(const std::string& raw, size_t limit) {
    ContainerLogs logs;
    auto append = [limit](std::string& dst, const char* p, size_t n) {
        dst.append(p, n);
        if (dst.size() > 2 * limit) keep_tail(dst, limit);
    };
    auto byte_at = [&raw](size_t i) { return static_cast<uint8_t>(raw[i]); };

    const bool framed = raw.size() >= 8 && byte_at(0) <= 2 &&
                        byte_at(1) == 0 && byte_at(2) == 0 && byte_at(3) == 0;
    if (!framed) {
        append(logs.stdout_text, raw.data(), raw.size());
        keep_tail(logs.stdout_text, limit);
        return logs;
    }

    size_t pos = 0;
    while (pos + 8 <= raw.size()) {
        const uint8_t stream = byte_at(pos);
        const uint32_t size = (uint32_t(byte_at(pos + 4)) << 24) | (uint32_t(byte_at(pos + 5)) << 16) |
                              (uint32_t(byte_at(pos + 6)) << 8) | uint32_t(byte_at(pos + 7));
        pos += 8;
        const size_t n = std::min<size_t>(size, raw.size() - pos);
        append(stream == 2 ? logs.stderr_text : logs.stdout_text, raw.data() + pos, n);
        pos += n;
    }
    keep_tail(logs.stdout_text, limit);
    keep_tail(logs.stderr_text, limit);
    return logs;
}

DockerClient::DockerClient(DockerEndpoint endpoint, std::chrono::milliseconds api_timeout)
    : endpoint_(std::move(endpoint)), api_timeout_(api_timeout) {}

std::shared_ptr<const DockerClient> DockerClient::connect(const std::string& docker_host,
                                                          std::chrono::milliseconds api_timeout) {
    DockerEndpoint ep;
    try {
        ep = parse_docker_host(docker_host);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[docker] " << e.what() << std::endl;
        return nullptr;
    }
    std::shared_ptr<const DockerClient> client = std::make_shared<DockerClient>(ep, api_timeout);
    if (!client->ping()) {
        std::cerr << "[docker] runtime at " << docker_host << " is not reachable, container backend disabled" << std::endl;
        return nullptr;
    }
    return client;
}

DockerClient::Response DockerClient::request(http::verb method, const std::string& target,
                                             const std::string& body,
                                             std::chrono::milliseconds timeout) const {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "docker");
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::connection, "close");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    // Connecting is bounded by the API timeout, not the request's own: a wait
    // may legitimately run long, an unreachable daemon may not. A connect
    // timeout is a transport failure, never an execution timeout.
    net::io_context ioc;
    beast::error_code ec;
    bool connected = false;

    if (endpoint_.transport == DockerEndpoint::Transport::Unix) {
        const std::string where = "unix://" + endpoint_.socket_path;
        local_stream::socket socket(ioc);
        socket.async_connect(local_stream::endpoint(endpoint_.socket_path), [&](beast::error_code e) {
            ec = e;
            connected = true;
        });
        const bool done = run_within(ioc, connected, api_timeout_, [&socket] {
            beast::error_code ignored;
            socket.close(ignored);
        });
        if (!done) throw DockerError(BackendFailure::RuntimeUnreachable, "connecting to " + where + " timed out");
        if (ec) throw DockerError(BackendFailure::RuntimeUnreachable, "cannot connect to " + where + ": " + ec.message());
        return exchange(ioc, socket, req, target, timeout);
    }

    const std::string where = "tcp://" + endpoint_.host + ":" + endpoint_.port;
    const char* step = "resolve";
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    resolver.async_resolve(endpoint_.host, endpoint_.port,
                           [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
        if (resolve_ec) {
            ec = resolve_ec;
            connected = true;
            return;
        }
        step = "connect to";
        net::async_connect(socket, results, [&](beast::error_code connect_ec, const tcp::endpoint&) {
            ec = connect_ec;
            connected = true;
        });
    });
    // A resolve already handed to getaddrinfo still finishes before the drain does.
    const bool done = run_within(ioc, connected, api_timeout_, [&] {
        resolver.cancel();
        beast::error_code ignored;
        socket.close(ignored);
    });
    if (!done) {
        throw DockerError(BackendFailure::RuntimeUnreachable,
                          std::string("cannot ") + step + " " + where + ": timed out");
    }
    if (ec) {
        throw DockerError(BackendFailure::RuntimeUnreachable,
                          std::string("cannot ") + step + " " + where + ": " + ec.message());
    }
    return exchange(ioc, socket, req, target, timeout);
}

bool DockerClient::ping() const {
    try {
        return request(http::verb::get, "/_ping", "", api_timeout_).status == 200;
    } catch (const DockerError& e) {
        std::cerr << "[docker] ping failed: " << e.what() << std::endl;
        return false;
    }
}

std::string DockerClient::create_container(const std::string& name, const json& spec) const {
    auto res = request(http::verb::post, "/containers/create?name=" + url_encode(name), spec.dump(), api_timeout_);
    if (res.status == 201) {
        json j = json::parse(res.body, nullptr, /*allow_exceptions*/false);
        if (j.is_object() && j.contains("Id") && j["Id"].is_string()) return j["Id"].get<std::string>();
        throw DockerError(BackendFailure::LaunchError, "malformed container create response: " + res.body);
    }
    if (res.status == 404) {
        const std::string image = spec.value("Image", std::string("<unknown>"));
        throw DockerError(BackendFailure::ImageMissing,
                          "Docker image '" + image + "' not found. Please run: docker pull " + image);
    }
    throw DockerError(BackendFailure::LaunchError,
                      "container create failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
}

void DockerClient::start_container(const std::string& id) const {
    auto res = request(http::verb::post, "/containers/" + id + "/start", "", api_timeout_);
    if (res.status == 204 || res.status == 304) return;
    throw DockerError(BackendFailure::LaunchError,
                      "container start failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
}

std::optional<int> DockerClient::wait_container(const std::string& id, std::chrono::milliseconds timeout) const {
    Response res;
    try {
        res = request(http::verb::post, "/containers/" + id + "/wait", "", timeout);
    } catch (const DockerError& e) {
        if (e.timed_out()) return std::nullopt;
        throw;
    }
    if (res.status != 200) {
        throw DockerError(BackendFailure::LaunchError,
                          "container wait failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
    }
    json j = json::parse(res.body, nullptr, /*allow_exceptions*/false);
    if (j.is_object() && j.contains("StatusCode") && j["StatusCode"].is_number_integer())
        return j["StatusCode"].get<int>();
    return -1;
}

ContainerLogs DockerClient::container_logs(const std::string& id, size_t limit) const {
    auto res = request(http::verb::get, "/containers/" + id + "/logs?stdout=1&stderr=1", "", api_timeout_);
    if (res.status != 200) {
        throw DockerError(BackendFailure::LaunchError,
                          "container logs failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
    }
    return demux_log_stream(res.body, limit);
}

void DockerClient::kill_container(const std::string& id) const {
    auto res = request(http::verb::post, "/containers/" + id + "/kill", "", api_timeout_);
    // 404: already gone, 409: not running
    if (res.status == 204 || res.status == 404 || res.status == 409) return;
    throw DockerError(BackendFailure::LaunchError,
                      "container kill failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
}

void DockerClient::remove_container(const std::string& id) const {
    auto res = request(http::verb::delete_, "/containers/" + id + "?force=1&v=1", "", api_timeout_);
    // 409: removal already in progress
    if (res.status == 204 || res.status == 404 || res.status == 409) return;
    throw DockerError(BackendFailure::LaunchError,
                      "container remove failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
}

std::vector<std::string> DockerClient::list_containers_with_label(const std::string& label) const {
    const json filters = {{"label", json::array({label})}};
    auto res = request(http::verb::get, "/containers/json?all=1&filters=" + url_encode(filters.dump()), "", api_timeout_);
    if (res.status != 200) {
        throw DockerError(BackendFailure::LaunchError,
                          "container list failed (HTTP " + std::to_string(res.status) + "): " + api_message(res.body));
    }
    std::vector<std::string> ids;
    json j = json::parse(res.body, nullptr, /*allow_exceptions*/false);
    if (!j.is_array()) return ids;
    for (const auto& c : j) {
        if (c.is_object() && c.contains("Id") && c["Id"].is_string()) ids.push_back(c["Id"].get<std::string>());
    }
    return ids;
}

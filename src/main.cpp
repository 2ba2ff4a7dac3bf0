#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analyzer_config.hpp"
#include "digest.hpp"
#include "docker_client.hpp"
#include "thread_pool.hpp"
#include "tiered_executor.hpp"

using json = nlohmann::json;

// Very small CLI parser
struct Args {
    std::string config_path;
    std::vector<std::string> files;
    std::chrono::milliseconds timeout{5000};
    int concurrency = 1;
    std::string image;
    bool no_container = false;
    bool verbose = false;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--timeout SECONDS] [--concurrency N] [--image IMAGE]\n"
              << "       [--no-container] [--config FILE.json] [--verbose] FILE... (- for stdin)\n";
    std::cout << "\nRuns each Python snippet (container first, then a restricted subprocess) and\n"
              << "prints a JSON array of runtime bug classifications.\n";
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--timeout" && i + 1 < argc) {
            try {
                a.timeout = analysis_timeout_from_seconds(std::strtod(argv[++i], nullptr));
            } catch (const std::invalid_argument& e) {
                std::cerr << "--" << e.what() << "\n";
                std::exit(2);
            }
        }
        else if (s == "--concurrency" && i + 1 < argc) { a.concurrency = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--image" && i + 1 < argc) { a.image = argv[++i]; }
        else if (s == "--config" && i + 1 < argc) { a.config_path = argv[++i]; }
        else if (s == "--no-container") { a.no_container = true; }
        else if (s == "--verbose") { a.verbose = true; }
        else if (s == "-" || s.rfind("-", 0) != 0) { a.files.push_back(s); }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    if (a.files.empty()) {
        print_help(argv[0]);
        std::exit(2);
    }
    return a;
}

static bool read_source(const std::string& file, std::string& out) {
    if (file == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    AnalyzerConfig cfg;
    try {
        if (!args.config_path.empty()) cfg = load_analyzer_config(args.config_path);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[cli] " << e.what() << "\n";
        return 2;
    }
    if (!args.image.empty()) cfg.image = args.image;
    if (args.no_container) cfg.enable_container = false;
    if (args.verbose) cfg.verbose = true;

    // The runtime handle is acquired once and shared by every request.
    std::shared_ptr<const DockerClient> docker;
    if (cfg.enable_container) {
        docker = DockerClient::connect(effective_docker_host(cfg),
                                       std::chrono::milliseconds(cfg.docker_api_timeout_ms));
    }
    auto executor = TieredExecutor::create(cfg, docker);
    if (cfg.verbose) {
        std::cerr << "[cli] container backend " << (executor->has_container_backend() ? "enabled" : "disabled")
                  << ", " << args.files.size() << " file(s), concurrency " << args.concurrency << std::endl;
    }

    const auto timeout = args.timeout;

    std::vector<json> reports(args.files.size());
    {
        ThreadPool pool(static_cast<size_t>(args.concurrency));
        std::vector<std::future<json>> pending;
        for (const auto& file : args.files) {
            std::string code;
            if (!read_source(file, code)) {
                std::cerr << "[cli] cannot read " << file << "\n";
                return 2;
            }
            pending.push_back(pool.submit([&executor, file, code = std::move(code), timeout] {
                json report;
                report["file"] = file;
                report["code_sha256"] = sha256_hex(code);
                report["classification"] = executor->analyze(code, timeout).to_json();
                return report;
            }));
        }
        for (size_t i = 0; i < pending.size(); ++i) reports[i] = pending[i].get();
    }

    std::cout << json(reports).dump(2) << std::endl;
    return 0;
}

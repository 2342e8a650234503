#include "blobgate/server_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>

namespace blobgate {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: blobgate-server --data-dir <path> [options]\n"
        "\n"
        "Required:\n"
        "  --data-dir <path>                Content store directory\n"
        "\n"
        "Listener:\n"
        "  --listen <address>               Listen address (default: 0.0.0.0)\n"
        "  --port <N>                       Listen port, 0 for ephemeral (default: 8443)\n"
        "  --io-threads <N>                 Connection I/O threads (default: 2)\n"
        "  --worker-threads <N>             Request worker threads (default: 16)\n"
        "  --max-body-mb <N>                Largest accepted request body in MiB (default: 5120)\n"
        "  --request-timeout <secs>         Per-request read/write timeout (default: 300)\n"
        "\n"
        "Responses:\n"
        "  --no-compression                 Never gzip response bodies\n"
        "  --compression-min-bytes <N>      Smallest body worth compressing (default: 1024)\n"
        "\n"
        "Store:\n"
        "  --reconcile                      Sweep orphan bodies and dangling rows at startup\n"
        "\n"
        "Daemon:\n"
        "  --config <path>                  JSON config file\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ServerConfig> ServerConfig::from_args(int argc, char* argv[]) {
    ServerConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--data-dir") {
                auto* v = next_arg(i, "--data-dir");
                if (!v) return std::nullopt;
                config.data_dir = v;
            } else if (arg == "--listen") {
                auto* v = next_arg(i, "--listen");
                if (!v) return std::nullopt;
                config.listen_address = v;
            } else if (arg == "--port") {
                auto* v = next_arg(i, "--port");
                if (!v) return std::nullopt;
                auto port = std::stoul(v);
                if (port > 65535) {
                    std::cerr << "Error: --port out of range: " << v << "\n";
                    return std::nullopt;
                }
                config.port = static_cast<uint16_t>(port);
            } else if (arg == "--io-threads") {
                auto* v = next_arg(i, "--io-threads");
                if (!v) return std::nullopt;
                config.io_threads = std::stoull(v);
            } else if (arg == "--worker-threads") {
                auto* v = next_arg(i, "--worker-threads");
                if (!v) return std::nullopt;
                config.worker_threads = std::stoull(v);
            } else if (arg == "--max-body-mb") {
                auto* v = next_arg(i, "--max-body-mb");
                if (!v) return std::nullopt;
                config.max_body_bytes = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--no-compression") {
                config.enable_compression = false;
            } else if (arg == "--compression-min-bytes") {
                auto* v = next_arg(i, "--compression-min-bytes");
                if (!v) return std::nullopt;
                config.compression_min_bytes = std::stoull(v);
            } else if (arg == "--reconcile") {
                config.reconcile_on_start = true;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        // std::stoull and friends on a non-numeric value
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ServerConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
        if (j.contains("listen_address")) listen_address = j["listen_address"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("io_threads")) io_threads = j["io_threads"].get<size_t>();
        if (j.contains("worker_threads")) worker_threads = j["worker_threads"].get<size_t>();
        if (j.contains("max_body_mb"))
            max_body_bytes = j["max_body_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("request_timeout"))
            request_timeout = std::chrono::seconds(j["request_timeout"].get<int64_t>());
        if (j.contains("enable_compression")) enable_compression = j["enable_compression"].get<bool>();
        if (j.contains("compression_min_bytes"))
            compression_min_bytes = j["compression_min_bytes"].get<size_t>();
        if (j.contains("reconcile_on_start")) reconcile_on_start = j["reconcile_on_start"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServerConfig::apply_defaults() {
    if (io_threads == 0) io_threads = 1;
    if (worker_threads == 0) {
        worker_threads = std::max<size_t>(4, std::thread::hardware_concurrency());
    }
    if (!data_dir.empty()) {
        data_dir = data_dir.lexically_normal();
    }
}

std::string ServerConfig::validate() const {
    if (data_dir.empty()) return "data_dir is required (--data-dir)";
    if (std::filesystem::exists(data_dir) && !std::filesystem::is_directory(data_dir))
        return "data_dir is not a directory: " + data_dir.string();
    if (listen_address.empty()) return "listen_address must not be empty";
    if (max_body_bytes == 0) return "max_body_bytes must be > 0";
    if (request_timeout.count() <= 0) return "request_timeout must be > 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";
    return {};
}

}  // namespace blobgate

#include "blobgate/client_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

namespace blobgate {

namespace {

// Command name -> number of required positional arguments
const std::map<std::string, size_t>& command_arity() {
    static const std::map<std::string, size_t> arity = {
        {"list-buckets", 0},
        {"create-bucket", 1},
        {"delete-bucket", 1},
        {"list-objects", 1},
        {"upload", 3},     // <file> <bucket> <key>
        {"download", 3},   // <bucket> <key> <file>
        {"delete", 2},     // <bucket> <key>
        {"sync", 2},       // <dir> <bucket>
        {"health", 0},
    };
    return arity;
}

void print_usage() {
    std::cerr <<
        "Usage: blobgate-client [options] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  list-buckets\n"
        "  create-bucket <bucket>\n"
        "  delete-bucket <bucket>\n"
        "  list-objects <bucket> [--prefix <p>] [--delimiter <d>]\n"
        "  upload <file> <bucket> <key> [--content-type <type>]\n"
        "  download <bucket> <key> <file>\n"
        "  delete <bucket> <key>\n"
        "  sync <directory> <bucket> [--key-prefix <p>] [--exclude <pattern>]...\n"
        "  health\n"
        "\n"
        "Options:\n"
        "  --server <url>                   Server URL (default: http://localhost:8443)\n"
        "  --config <path>                  JSON config file\n"
        "  --ca-cert <path>                 CA certificate for https servers\n"
        "  --no-verify-ssl                  Skip TLS verification\n"
        "  --connect-timeout <secs>         Connect timeout (default: 30)\n"
        "  --timeout <secs>                 Request timeout (default: BLOBGATE_REQUEST_TIMEOUT or 30)\n"
        "  --retries <N>                    Attempts per request, including the first (default: 4)\n"
        "  --retry-delay-ms <N>             Initial backoff delay (default: 1000)\n"
        "  --retry-max-delay-ms <N>         Backoff ceiling (default: 30000)\n"
        "  --no-progress                    Do not draw transfer progress\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[]) {
    ClientConfig config;

    // Environment first; flags override
    if (const char* url = std::getenv("BLOBGATE_SERVER")) {
        config.server_url = url;
    }

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

            if (arg == "--server") {
                auto* v = next_arg(i, "--server");
                if (!v) return std::nullopt;
                config.server_url = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.ca_cert = v;
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--timeout") {
                auto* v = next_arg(i, "--timeout");
                if (!v) return std::nullopt;
                config.request_timeout = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--retries") {
                auto* v = next_arg(i, "--retries");
                if (!v) return std::nullopt;
                config.retry.max_attempts = std::stoi(v);
            } else if (arg == "--retry-delay-ms") {
                auto* v = next_arg(i, "--retry-delay-ms");
                if (!v) return std::nullopt;
                config.retry.initial_delay = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--retry-max-delay-ms") {
                auto* v = next_arg(i, "--retry-max-delay-ms");
                if (!v) return std::nullopt;
                config.retry.max_delay = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--prefix") {
                auto* v = next_arg(i, "--prefix");
                if (!v) return std::nullopt;
                config.prefix = v;
            } else if (arg == "--delimiter") {
                auto* v = next_arg(i, "--delimiter");
                if (!v) return std::nullopt;
                config.delimiter = v;
            } else if (arg == "--key-prefix") {
                auto* v = next_arg(i, "--key-prefix");
                if (!v) return std::nullopt;
                config.key_prefix = v;
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "--exclude") {
                auto* v = next_arg(i, "--exclude");
                if (!v) return std::nullopt;
                config.exclude_patterns.emplace_back(v);
            } else if (arg == "--no-progress") {
                config.show_progress = false;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("server_url")) server_url = j["server_url"].get<std::string>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_cert")) ca_cert = j["ca_cert"].get<std::string>();
        if (j.contains("connect_timeout"))
            connect_timeout = std::chrono::seconds(j["connect_timeout"].get<int64_t>());
        if (j.contains("request_timeout"))
            request_timeout = std::chrono::seconds(j["request_timeout"].get<int64_t>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("max_attempts")) retry.max_attempts = jr["max_attempts"].get<int>();
            if (jr.contains("initial_delay_ms"))
                retry.initial_delay = std::chrono::milliseconds(jr["initial_delay_ms"].get<int64_t>());
            if (jr.contains("backoff_multiplier"))
                retry.backoff_multiplier = jr["backoff_multiplier"].get<double>();
            if (jr.contains("max_delay_ms"))
                retry.max_delay = std::chrono::milliseconds(jr["max_delay_ms"].get<int64_t>());
            if (jr.contains("retryable_statuses")) {
                retry.retryable_statuses.clear();
                for (auto& s : jr["retryable_statuses"]) {
                    retry.retryable_statuses.insert(s.get<int>());
                }
            }
        }

        if (j.contains("exclude") && j["exclude"].is_array()) {
            for (auto& p : j["exclude"]) {
                exclude_patterns.push_back(p.get<std::string>());
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ClientConfig::apply_defaults() {
    if (request_timeout.count() <= 0) {
        request_timeout = net::get_request_timeout();
    }
    while (server_url.size() > 1 && server_url.back() == '/') {
        server_url.pop_back();
    }
    if (retry.max_attempts < 1) retry.max_attempts = 1;
}

std::string ClientConfig::validate() const {
    auto parsed = net::ParsedUrl::parse(server_url);
    if (!parsed) return "invalid server URL: " + server_url;
    if (parsed->scheme != "http" && parsed->scheme != "https")
        return "server URL must use http or https: " + server_url;
    if (!ca_cert.empty() && !std::filesystem::exists(ca_cert))
        return "CA certificate not found: " + ca_cert.string();

    auto it = command_arity().find(command);
    if (it == command_arity().end()) return "unknown command: " + command;
    if (args.size() != it->second) {
        return command + " expects " + std::to_string(it->second) + " argument(s), got " +
               std::to_string(args.size());
    }
    if (retry.backoff_multiplier < 1.0) return "backoff multiplier must be >= 1";
    return {};
}

}  // namespace blobgate

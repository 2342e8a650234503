#pragma once

#include "blobgate/net/http.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blobgate {

/// Configuration for the transfer client CLI.
struct ClientConfig {
    std::string server_url = "http://localhost:8443";

    // TLS (https server URLs only)
    bool verify_ssl = true;
    std::filesystem::path ca_cert;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::seconds request_timeout{0};   // 0 = BLOBGATE_REQUEST_TIMEOUT / 30s

    net::RetryPolicy retry;

    bool verbose = false;
    bool show_progress = true;

    // Command and its positional arguments
    std::string command;
    std::vector<std::string> args;

    // Command options
    std::string prefix;                        // list-objects
    std::string delimiter;                     // list-objects
    std::string key_prefix;                    // sync
    std::string content_type;                  // upload
    std::vector<std::string> exclude_patterns; // sync (added to the defaults)

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<ClientConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (timeouts from the environment, trailing slash).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace blobgate

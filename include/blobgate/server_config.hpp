#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace blobgate {

/// Configuration for the storage server daemon.
struct ServerConfig {
    // Root of the content store (manifest.db, objects/, staging/)
    std::filesystem::path data_dir;

    // Listener
    std::string listen_address = "0.0.0.0";
    uint16_t port = 8443;
    size_t io_threads = 2;
    size_t worker_threads = 16;
    uint64_t max_body_bytes = 5ULL * 1024 * 1024 * 1024;   // 5 GB
    std::chrono::seconds request_timeout{300};

    // Response compression (full GET bodies only)
    bool enable_compression = true;
    size_t compression_min_bytes = 1024;

    // Sweep orphan bodies and dangling rows before serving
    bool reconcile_on_start = false;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<ServerConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults that depend on other fields.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace blobgate

#include "blobgate/core/log.hpp"
#include "blobgate/facade/protocol_facade.hpp"
#include "blobgate/metrics.hpp"
#include "blobgate/server/http_server.hpp"
#include "blobgate/server_config.hpp"
#include "blobgate/storage/content_store.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    if (open("/dev/null", O_RDONLY) < 0) return false;  // stdin = fd 0

    return true;
}

bool write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << getpid() << "\n";
    return ofs.good();
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = blobgate::ServerConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file: " << config.log_file << std::endl;
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    blobgate::set_verbose(config.verbose);

    blobgate::log_info("blobgate-server starting...");
    blobgate::log_info("  data-dir: %s", config.data_dir.c_str());
    blobgate::log_info("  listen: %s:%u", config.listen_address.c_str(),
                       static_cast<unsigned>(config.port));
    blobgate::log_info("  io-threads: %zu, worker-threads: %zu", config.io_threads,
                       config.worker_threads);
    blobgate::log_info("  max-body: %llu MiB",
                       static_cast<unsigned long long>(config.max_body_bytes / (1024 * 1024)));
    blobgate::log_info("  compression: %s (min %zu bytes)",
                       config.enable_compression ? "on" : "off", config.compression_min_bytes);

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        if (!write_pid_file(config.pid_file)) {
            blobgate::log_warn("Cannot write PID file %s", config.pid_file.c_str());
        }
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<blobgate::ContentStore> store;
    try {
        store = blobgate::ContentStoreFactory::create_local(config.data_dir);
    } catch (const std::exception& e) {
        blobgate::log_error("Failed to open content store: %s", e.what());
        return 1;
    }

    std::unique_ptr<blobgate::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<blobgate::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"data_dir", config.data_dir.string()}});
        metrics->set_store(store.get());
    }

    if (config.reconcile_on_start) {
        blobgate::log_info("Reconciling content store...");
        std::optional<blobgate::ScopedTimer> timer;
        if (metrics) timer.emplace(metrics->reconcile_duration());
        auto report = store->reconcile();
        timer.reset();
        blobgate::log_info("Reconcile: %zu orphan bodies, %zu dangling records, %zu stale staging files",
                           report.orphaned_bodies_removed, report.dangling_records_removed,
                           report.stale_staging_removed);
        if (metrics) {
            metrics->reconcile_repairs_total().Increment(static_cast<double>(
                report.orphaned_bodies_removed + report.dangling_records_removed));
        }
    }

    blobgate::facade::FacadeOptions facade_options;
    facade_options.enable_compression = config.enable_compression;
    facade_options.compression_min_bytes = config.compression_min_bytes;
    blobgate::facade::ProtocolFacade facade(*store, facade_options);

    blobgate::HttpServerOptions server_options;
    server_options.listen_address = config.listen_address;
    server_options.port = config.port;
    server_options.io_threads = config.io_threads;
    server_options.worker_threads = config.worker_threads;
    server_options.max_body_bytes = config.max_body_bytes;
    server_options.request_timeout = config.request_timeout;

    blobgate::HttpServer server(facade, server_options);
    if (metrics) {
        auto* exporter = metrics.get();
        server.set_observer([exporter](const blobgate::RequestRecord& record) {
            exporter->record(record);
        });
    }

    err = server.start();
    if (!err.empty()) {
        blobgate::log_error("Failed to start server: %s", err.c_str());
        return 1;
    }
    if (metrics) metrics->start();

    blobgate::log_info("blobgate-server running on port %u (PID %d)",
                       static_cast<unsigned>(server.port()),
                       static_cast<int>(getpid()));

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();

    auto stats = server.get_stats();
    blobgate::log_info("Served %llu requests on %llu connections (%llu failed)",
                       static_cast<unsigned long long>(stats.requests_handled),
                       static_cast<unsigned long long>(stats.connections_accepted),
                       static_cast<unsigned long long>(stats.requests_failed));

    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    blobgate::log_info("blobgate-server exited cleanly");
    return 0;
}

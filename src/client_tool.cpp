// blobgate-client: command line transfer client for a blobgate server.
//
// Usage: blobgate-client [options] <command> [arguments]
//
// Commands:
//   list-buckets                       Buckets with creation dates
//   create-bucket <bucket>
//   delete-bucket <bucket>             Removes the bucket and all its objects
//   list-objects <bucket>              Keys, sizes and fingerprints
//   upload <file> <bucket> <key>       Skipped when the server already holds it
//   download <bucket> <key> <file>     Resumes a partial local file
//   delete <bucket> <key>
//   sync <directory> <bucket>          Recursive upload with excludes
//   health

#include "blobgate/client_config.hpp"
#include "blobgate/core/log.hpp"
#include "blobgate/net/http.hpp"
#include "blobgate/transfer/transfer_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <unistd.h>

namespace {

constexpr uint64_t kProgressThreshold = 1024 * 1024;  // Only draw progress above 1 MiB

std::atomic<bool> g_cancel{false};

void signal_handler(int sig) {
    (void)sig;
    g_cancel = true;
}

std::string human_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

// Redraws one status line on stderr, at most ten times a second
class ProgressLine {
public:
    explicit ProgressLine(bool enabled) : enabled_(enabled && isatty(STDERR_FILENO)) {}

    void update(const blobgate::transfer::TransferProgress& p) {
        if (!enabled_ || p.total < kProgressThreshold) return;
        auto now = std::chrono::steady_clock::now();
        if (drawn_ && now - last_ < std::chrono::milliseconds(100) && p.done < p.total) return;
        last_ = now;
        drawn_ = true;
        int pct = p.total ? static_cast<int>(p.done * 100 / p.total) : 100;
        fprintf(stderr, "\r  %s  %3d%%  %s / %s   ", p.key.c_str(), pct,
                human_bytes(p.done).c_str(), human_bytes(p.total).c_str());
        fflush(stderr);
    }

    void finish() {
        if (drawn_) {
            fprintf(stderr, "\n");
            drawn_ = false;
        }
    }

private:
    bool enabled_;
    bool drawn_ = false;
    std::chrono::steady_clock::time_point last_{};
};

void print_failure(const char* what, blobgate::ErrorCode error, const std::string& message,
                   int status) {
    if (status != 0) {
        fprintf(stderr, "Error: %s failed [%s, HTTP %d]: %s\n", what,
                blobgate::error_code_name(error), status, message.c_str());
    } else {
        fprintf(stderr, "Error: %s failed [%s]: %s\n", what, blobgate::error_code_name(error),
                message.c_str());
    }
}

int report_transfer(const char* what, const blobgate::transfer::TransferResult& r) {
    using blobgate::transfer::TransferOutcome;
    if (r.outcome == TransferOutcome::Failed) {
        print_failure(what, r.error, r.error_message, r.http_status);
        blobgate::log_debug("state trace: %s", r.trace_string().c_str());
        return 1;
    }
    if (r.outcome == TransferOutcome::Skipped) {
        printf("%s: already satisfied (%s)\n", what, r.fingerprint.c_str());
    } else {
        printf("%s: %s transferred in %d attempt(s), fingerprint %s\n", what,
               human_bytes(r.bytes_transferred).c_str(), r.attempts, r.fingerprint.c_str());
    }
    blobgate::log_debug("state trace: %s", r.trace_string().c_str());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = blobgate::ClientConfig::from_args(argc, argv);
    if (!config_opt) {
        return 2;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        fprintf(stderr, "Error: %s\n", err.c_str());
        return 2;
    }

    blobgate::set_verbose(config.verbose);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    blobgate::net::HttpClientConfig http_config;
    http_config.verify_ssl_by_default = config.verify_ssl;
    http_config.default_ca_bundle = config.ca_cert.string();
    http_config.default_total_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config.request_timeout);
    http_config.verbose = config.verbose;
    blobgate::net::HttpClient http(http_config);

    blobgate::transfer::TransferClientOptions options;
    options.server_url = config.server_url;
    options.retry = config.retry;
    options.connect_timeout = config.connect_timeout;
    options.verify_ssl = config.verify_ssl;
    options.ca_bundle_path = config.ca_cert.string();

    blobgate::transfer::TransferClient client(http, options);
    client.set_cancel_flag(&g_cancel);

    ProgressLine progress(config.show_progress);
    client.set_progress_callback(
        [&progress](const blobgate::transfer::TransferProgress& p) { progress.update(p); });

    const auto& cmd = config.command;
    const auto& args = config.args;

    if (cmd == "list-buckets") {
        auto r = client.list_buckets();
        if (!r.success) {
            print_failure("list-buckets", r.error, r.error_message, r.http_status);
            return 1;
        }
        for (const auto& b : r.buckets) {
            printf("%-24s  %s\n", b.created.c_str(), b.name.c_str());
        }
        return 0;
    }

    if (cmd == "create-bucket" || cmd == "delete-bucket") {
        auto r = cmd == "create-bucket" ? client.create_bucket(args[0])
                                        : client.delete_bucket(args[0]);
        if (!r.success) {
            print_failure(cmd.c_str(), r.error, r.error_message, r.http_status);
            return 1;
        }
        printf("%s: %s\n", cmd.c_str(), args[0].c_str());
        return 0;
    }

    if (cmd == "list-objects") {
        auto r = client.list_objects(args[0], config.prefix, config.delimiter);
        if (!r.success) {
            print_failure("list-objects", r.error, r.error_message, r.http_status);
            return 1;
        }
        for (const auto& p : r.common_prefixes) {
            printf("%-24s  %12s  %-32s  %s\n", "", "PRE", "", p.c_str());
        }
        uint64_t total = 0;
        for (const auto& o : r.objects) {
            printf("%-24s  %12llu  %-32s  %s\n", o.last_modified.c_str(),
                   static_cast<unsigned long long>(o.size), o.fingerprint.c_str(), o.key.c_str());
            total += o.size;
        }
        printf("%zu object(s), %s\n", r.objects.size(), human_bytes(total).c_str());
        return 0;
    }

    if (cmd == "upload") {
        auto r = client.upload_file(args[0], args[1], args[2], config.content_type);
        progress.finish();
        return report_transfer(("upload " + args[1] + "/" + args[2]).c_str(), r);
    }

    if (cmd == "download") {
        auto r = client.download_file(args[0], args[1], args[2]);
        progress.finish();
        return report_transfer(("download " + args[0] + "/" + args[1]).c_str(), r);
    }

    if (cmd == "delete") {
        auto r = client.delete_object(args[0], args[1]);
        if (!r.success) {
            print_failure("delete", r.error, r.error_message, r.http_status);
            return 1;
        }
        printf("delete %s/%s: %s\n", args[0].c_str(), args[1].c_str(),
               r.removed ? "removed" : "nothing to remove");
        return 0;
    }

    if (cmd == "sync") {
        auto r = client.sync_directory(args[0], args[1], config.key_prefix,
                                       config.exclude_patterns);
        progress.finish();
        printf("sync %s -> %s: %zu uploaded, %zu already satisfied, %zu excluded, %zu failed (%s)\n",
               args[0].c_str(), args[1].c_str(), r.uploaded, r.skipped, r.excluded, r.failed,
               human_bytes(r.bytes_transferred).c_str());
        for (const auto& [key, failure] : r.failures) {
            print_failure(key.c_str(), failure.error, failure.error_message, failure.http_status);
        }
        return r.success() ? 0 : 1;
    }

    if (cmd == "health") {
        auto r = client.health();
        if (!r.status.empty()) {
            printf("status:    %s\n", r.status.c_str());
            printf("service:   %s\n", r.service.c_str());
            std::string protocols;
            for (const auto& p : r.protocols) {
                if (!protocols.empty()) protocols += ", ";
                protocols += p;
            }
            printf("protocols: %s\n", protocols.c_str());
            printf("buckets:   %llu\n", static_cast<unsigned long long>(r.buckets));
            printf("objects:   %llu\n", static_cast<unsigned long long>(r.objects));
            printf("bytes:     %s\n", human_bytes(r.bytes).c_str());
        }
        if (!r.success) {
            print_failure("health", r.error, r.error_message, r.http_status);
            return 1;
        }
        return 0;
    }

    fprintf(stderr, "Error: unknown command: %s\n", cmd.c_str());
    return 2;
}

#pragma once

#include "blobgate/core/errors.hpp"
#include "blobgate/net/http.hpp"
#include "blobgate/transfer/negotiator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blobgate::transfer {

// Per-transfer state machine:
//   Init -> Probe -> (Skip | Transfer [-> Retry -> Transfer]...) -> Verify -> Done
// Any step may end in Failed.
enum class TransferState {
    Init,
    Probe,
    Skip,
    Transfer,
    Retry,
    Verify,
    Done,
    Failed
};

const char* transfer_state_name(TransferState state);

enum class TransferOutcome {
    Skipped,      // Remote/local already held the same content
    Transferred,
    Failed
};

const char* transfer_outcome_name(TransferOutcome outcome);

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Failed;
    TransferState state = TransferState::Init;
    uint64_t bytes_transferred = 0;   // Body bytes moved by this call
    int attempts = 0;                 // Body transfer requests made
    ErrorCode error = ErrorCode::None;
    std::string error_message;
    int http_status = 0;              // Last status seen, 0 if none
    std::string fingerprint;          // Content fingerprint after the transfer
    std::vector<TransferState> trace;

    bool success() const { return outcome != TransferOutcome::Failed; }

    // "INIT>PROBE>TRANSFER>VERIFY>DONE"
    std::string trace_string() const;
};

struct TransferProgress {
    std::string key;
    uint64_t done = 0;
    uint64_t total = 0;
};

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

// Outcome of the simple (non-transfer) calls
struct OperationResult {
    bool success = false;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
    int http_status = 0;
    bool removed = false;   // Deletes: whether something was actually removed
};

struct RemoteBucket {
    std::string name;
    std::string created;    // ISO 8601 as reported by the server
};

struct ListBucketsResult : OperationResult {
    std::vector<RemoteBucket> buckets;
};

struct RemoteEntry {
    std::string key;
    uint64_t size = 0;
    std::string fingerprint;
    std::string last_modified;
};

struct ListObjectsResult : OperationResult {
    std::vector<RemoteEntry> objects;
    std::vector<std::string> common_prefixes;
    int pages = 0;
};

struct HealthResult : OperationResult {
    std::string status;
    std::string service;
    std::vector<std::string> protocols;
    uint64_t buckets = 0;
    uint64_t objects = 0;
    uint64_t bytes = 0;
};

struct SyncResult {
    size_t uploaded = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t excluded = 0;
    uint64_t bytes_transferred = 0;
    std::vector<std::pair<std::string, TransferResult>> failures;  // key -> result

    bool success() const { return failed == 0; }
};

struct TransferClientOptions {
    std::string server_url = "http://localhost:8443";
    net::RetryPolicy retry;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds request_timeout{0};   // 0 = transport default
    bool verify_ssl = true;
    std::string ca_bundle_path;
    size_t list_page_size = 1000;
};

/// Default sync exclusions: .DS_Store, __pycache__, *.pyc, .git
const std::vector<std::string>& default_exclude_patterns();

/// True when any path component of `relative` matches one of the glob patterns.
bool is_excluded(const std::string& relative, const std::vector<std::string>& patterns);

/// Remote driver for the S3-style surface of a blobgate server.
///
/// Uploads and downloads run the probe/skip/resume/verify sequence against
/// the server's metadata; transient failures (network errors, 429, 5xx) are
/// retried under the configured RetryPolicy. Not thread-safe: use one client
/// per thread (the transport may be shared if it is thread-safe itself).
class TransferClient {
public:
    TransferClient(net::HttpTransport& transport, TransferClientOptions options);

    /// Polled during body transfers; set it to true to cancel.
    /// The flag is owned by the caller and must outlive the client.
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

    void set_progress_callback(TransferProgressCallback callback) {
        progress_ = std::move(callback);
    }

    TransferResult upload_file(const std::filesystem::path& local, const std::string& bucket,
                               const std::string& key, const std::string& content_type = "");

    TransferResult download_file(const std::string& bucket, const std::string& key,
                                 const std::filesystem::path& local);

    ListBucketsResult list_buckets();
    ListObjectsResult list_objects(const std::string& bucket, const std::string& prefix = "",
                                   const std::string& delimiter = "");

    OperationResult create_bucket(const std::string& bucket);
    OperationResult delete_bucket(const std::string& bucket);
    OperationResult delete_object(const std::string& bucket, const std::string& key);

    /// Upload every regular file below `dir` as `<key_prefix>/<relative path>`.
    /// Each file goes through the upload skip rule.
    SyncResult sync_directory(const std::filesystem::path& dir, const std::string& bucket,
                              const std::string& key_prefix,
                              const std::vector<std::string>& extra_excludes = {});

    HealthResult health();

    std::string bucket_url(const std::string& bucket) const;
    std::string object_url(const std::string& bucket, const std::string& key) const;

private:
    struct Probe {
        bool ok = false;                        // Probe answered (found or not)
        std::optional<RemoteObject> remote;
        net::HttpResponse response;
    };

    Probe probe(const std::string& bucket, const std::string& key);
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const;
    net::HttpResponse execute(const net::HttpRequest& request, int* attempts = nullptr);
    bool cancelled() const;
    void report(const std::string& key, uint64_t done, uint64_t total) const;

    net::HttpTransport& transport_;
    TransferClientOptions options_;
    const std::atomic<bool>* cancel_ = nullptr;
    TransferProgressCallback progress_;
};

}  // namespace blobgate::transfer

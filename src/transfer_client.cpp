#include "blobgate/transfer/transfer_client.hpp"
#include "blobgate/core/log.hpp"
#include "blobgate/facade/xml.hpp"
#include "blobgate/storage/fingerprint.hpp"
#include "blobgate/transfer/byte_range.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fnmatch.h>
#include <thread>
#include <nlohmann/json.hpp>

namespace blobgate::transfer {

namespace fs = std::filesystem;

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Init: return "INIT";
        case TransferState::Probe: return "PROBE";
        case TransferState::Skip: return "SKIP";
        case TransferState::Transfer: return "TRANSFER";
        case TransferState::Retry: return "RETRY";
        case TransferState::Verify: return "VERIFY";
        case TransferState::Done: return "DONE";
        case TransferState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* transfer_outcome_name(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Skipped: return "skipped";
        case TransferOutcome::Transferred: return "transferred";
        case TransferOutcome::Failed: return "failed";
    }
    return "unknown";
}

std::string TransferResult::trace_string() const {
    std::string out;
    for (auto s : trace) {
        if (!out.empty()) out += '>';
        out += transfer_state_name(s);
    }
    return out;
}

const std::vector<std::string>& default_exclude_patterns() {
    static const std::vector<std::string> patterns = {".DS_Store", "__pycache__", "*.pyc", ".git"};
    return patterns;
}

bool is_excluded(const std::string& relative, const std::vector<std::string>& patterns) {
    size_t pos = 0;
    while (pos <= relative.size()) {
        size_t slash = relative.find('/', pos);
        if (slash == std::string::npos) slash = relative.size();
        std::string component = relative.substr(pos, slash - pos);
        if (!component.empty()) {
            for (const auto& pattern : patterns) {
                if (fnmatch(pattern.c_str(), component.c_str(), 0) == 0) return true;
            }
        }
        pos = slash + 1;
    }
    return false;
}

namespace {

// Small helpers that move a result into a terminal state

void enter(TransferResult& r, TransferState s) {
    r.state = s;
    r.trace.push_back(s);
}

TransferResult& fail(TransferResult& r, ErrorCode code, const std::string& message,
                     int http_status = 0) {
    r.outcome = TransferOutcome::Failed;
    r.error = code;
    r.error_message = message;
    if (http_status != 0) r.http_status = http_status;
    enter(r, TransferState::Failed);
    return r;
}

// "HTTP 503: <body excerpt>" or the network error text
std::string describe(const net::HttpResponse& response) {
    if (response.aborted) return "transfer aborted";
    if (response.is_network_error) return response.error;
    std::string text = response.body_string();
    if (text.size() > 512) text.resize(512);
    std::string out = "HTTP " + std::to_string(response.status_code);
    if (!text.empty()) out += ": " + text;
    return out;
}

ErrorCode classify(const net::HttpResponse& response) {
    if (response.is_network_error) return ErrorCode::TransientIO;
    return error_code_from_status(response.status_code);
}

template <typename Result>
Result& fail_op(Result& r, const std::string& what, const net::HttpResponse& response) {
    r.success = false;
    r.http_status = response.status_code;
    r.error = classify(response);
    if (r.error == ErrorCode::None) r.error = ErrorCode::BadRequest;
    r.error_message = what + ": " + describe(response);
    return r;
}

uint64_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

}  // namespace

TransferClient::TransferClient(net::HttpTransport& transport, TransferClientOptions options)
    : transport_(transport), options_(std::move(options)) {
    while (options_.server_url.size() > 1 && options_.server_url.back() == '/') {
        options_.server_url.pop_back();
    }
}

std::string TransferClient::bucket_url(const std::string& bucket) const {
    return options_.server_url + "/" + net::url_encode(bucket);
}

std::string TransferClient::object_url(const std::string& bucket, const std::string& key) const {
    return bucket_url(bucket) + "/" + net::url_encode(key, true);
}

net::HttpRequest TransferClient::make_request(net::HttpMethod method, const std::string& url) const {
    auto req = net::HttpRequest::make(method, url);
    req.connect_timeout = options_.connect_timeout;
    req.total_timeout = options_.request_timeout;
    req.verify_ssl = options_.verify_ssl;
    req.ca_bundle_path = options_.ca_bundle_path;
    return req;
}

bool TransferClient::cancelled() const {
    return cancel_ && cancel_->load();
}

void TransferClient::report(const std::string& key, uint64_t done, uint64_t total) const {
    if (progress_) progress_(TransferProgress{key, done, total});
}

net::HttpResponse TransferClient::execute(const net::HttpRequest& request, int* attempts) {
    return net::execute_with_retry(transport_, request, options_.retry, attempts,
                                   [this]() { return cancelled(); });
}

TransferClient::Probe TransferClient::probe(const std::string& bucket, const std::string& key) {
    Probe p;
    p.response = execute(make_request(net::HttpMethod::HEAD, object_url(bucket, key)));
    if (p.response.status_code == 404) {
        p.ok = true;
        return p;
    }
    if (!p.response.ok()) return p;

    RemoteObject remote;
    remote.size = p.response.headers.content_length().value_or(0);
    remote.fingerprint = unquote_etag(p.response.headers.get("etag").value_or(""));
    remote.content_type = p.response.headers.content_type().value_or("");
    p.remote = remote;
    p.ok = true;
    return p;
}

// ============================================================================
// Upload
// ============================================================================

TransferResult TransferClient::upload_file(const fs::path& local, const std::string& bucket,
                                           const std::string& key, const std::string& content_type) {
    TransferResult result;
    enter(result, TransferState::Init);
    std::string target = bucket + "/" + key;

    if (!fs::is_regular_file(local)) {
        return fail(result, ErrorCode::StorageIO, "upload " + target + ": not a readable file: " +
                                                      local.string());
    }

    enter(result, TransferState::Probe);
    auto p = probe(bucket, key);
    if (!p.ok) {
        return fail(result, classify(p.response),
                    "upload " + target + ": probe failed: " + describe(p.response),
                    p.response.status_code);
    }

    auto plan = plan_upload(local, p.remote);
    if (!plan.local_readable) {
        return fail(result, ErrorCode::StorageIO, "upload " + target + ": " + plan.reason);
    }
    result.fingerprint = plan.local_fingerprint;

    if (plan.skip) {
        enter(result, TransferState::Skip);
        log_debug("upload %s: %s", target.c_str(), plan.reason.c_str());
        result.outcome = TransferOutcome::Skipped;
        result.http_status = p.response.status_code;
        enter(result, TransferState::Done);
        return result;
    }

    enter(result, TransferState::Transfer);
    auto req = make_request(net::HttpMethod::PUT, object_url(bucket, key));
    req.body_file = local;
    if (!content_type.empty()) req.headers.set("Content-Type", content_type);

    uint64_t total = plan.local_size;
    req.progress_callback = [this, &key, total](const net::HttpProgress& progress) {
        if (cancelled()) return false;
        report(key, progress.upload_now, total);
        return true;
    };

    int attempts = 0;
    auto response = execute(req, &attempts);
    result.attempts = attempts;
    for (int i = 1; i < attempts; ++i) {
        enter(result, TransferState::Retry);
        enter(result, TransferState::Transfer);
    }
    result.http_status = response.status_code;

    if (response.aborted && cancelled()) {
        return fail(result, ErrorCode::Cancelled, "upload " + target + ": cancelled");
    }
    if (!response.ok()) {
        return fail(result, classify(response), "upload " + target + ": " + describe(response));
    }
    result.bytes_transferred = total;
    report(key, total, total);

    enter(result, TransferState::Verify);
    auto server_fp = unquote_etag(response.headers.get("etag").value_or(""));
    auto local_fp = fingerprint_file(local);
    if (!local_fp) {
        return fail(result, ErrorCode::StorageIO, "upload " + target + ": cannot re-read " +
                                                      local.string());
    }
    if (server_fp.empty() || server_fp != *local_fp) {
        return fail(result, ErrorCode::IntegrityMismatch,
                    "upload " + target + ": server fingerprint " +
                        (server_fp.empty() ? std::string("<none>") : server_fp) +
                        " does not match local " + *local_fp);
    }

    result.fingerprint = *local_fp;
    result.outcome = TransferOutcome::Transferred;
    enter(result, TransferState::Done);
    log_debug("upload %s: %llu bytes in %d attempt(s)", target.c_str(),
              static_cast<unsigned long long>(total), attempts);
    return result;
}

// ============================================================================
// Download
// ============================================================================

TransferResult TransferClient::download_file(const std::string& bucket, const std::string& key,
                                             const fs::path& local) {
    TransferResult result;
    enter(result, TransferState::Init);
    std::string target = bucket + "/" + key;

    enter(result, TransferState::Probe);
    auto p = probe(bucket, key);
    if (!p.ok) {
        return fail(result, classify(p.response),
                    "download " + target + ": probe failed: " + describe(p.response),
                    p.response.status_code);
    }
    if (!p.remote) {
        return fail(result, ErrorCode::NotFound, "download " + target + ": no such object", 404);
    }
    const RemoteObject remote = *p.remote;

    auto plan = plan_download(local, remote);
    log_debug("download %s: %s (%s)", target.c_str(), download_action_name(plan.action),
              plan.reason.c_str());

    if (plan.action == DownloadAction::Skip) {
        enter(result, TransferState::Skip);
        result.outcome = TransferOutcome::Skipped;
        result.fingerprint = remote.fingerprint;
        result.http_status = p.response.status_code;
        enter(result, TransferState::Done);
        return result;
    }

    if (local.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(local.parent_path(), ec);
    }

    // Fresh and Restart begin by discarding whatever is on disk
    bool truncate_first = plan.action != DownloadAction::Resume;

    enter(result, TransferState::Transfer);
    int attempt = 0;
    while (true) {
        ++attempt;
        result.attempts = attempt;

        uint64_t offset = 0;
        if (!truncate_first) {
            offset = file_size_or_zero(local);
            if (offset > remote.size) offset = 0;
        }

        FILE* out = std::fopen(local.c_str(), offset > 0 ? "ab" : "wb");
        if (!out) {
            return fail(result, ErrorCode::StorageIO,
                        "download " + target + ": cannot open " + local.string());
        }
        truncate_first = false;

        uint64_t written = 0;
        bool write_failed = false;
        uint64_t start_offset = offset;

        net::HttpResponse response;
        if (offset < remote.size) {
            auto req = make_request(net::HttpMethod::GET, object_url(bucket, key));
            if (offset > 0) req.headers.set("Range", open_range_header(offset));

            bool first_chunk = true;
            req.response_sink = [&](int status, const uint8_t* data, size_t size) {
                if (first_chunk) {
                    first_chunk = false;
                    // Range ignored: the body starts at byte 0
                    if (status == 200 && start_offset > 0) {
                        out = std::freopen(local.c_str(), "wb", out);
                        if (!out) {
                            write_failed = true;
                            return false;
                        }
                        start_offset = 0;
                    }
                }
                if (std::fwrite(data, 1, size, out) != size) {
                    write_failed = true;
                    return false;
                }
                written += size;
                return true;
            };
            req.progress_callback = [&](const net::HttpProgress&) {
                if (cancelled()) return false;
                report(key, start_offset + written, remote.size);
                return true;
            };
            response = transport_.execute(req);
        } else {
            response.status_code = 206;
        }

        bool flushed = out && std::fflush(out) == 0;
        if (out) std::fclose(out);
        result.bytes_transferred += written;
        result.http_status = response.status_code;

        if (write_failed || !flushed) {
            return fail(result, ErrorCode::StorageIO,
                        "download " + target + ": write to " + local.string() + " failed");
        }
        if (cancelled()) {
            return fail(result, ErrorCode::Cancelled, "download " + target + ": cancelled");
        }

        bool complete = response.ok() && file_size_or_zero(local) == remote.size;
        if (complete) break;

        bool retryable = options_.retry.is_retryable(response);
        if (response.status_code == 416) {
            // Local file no longer a prefix of the object; start over
            truncate_first = true;
            retryable = true;
        } else if (response.ok()) {
            // Short or long body: the size check failed
            retryable = true;
            if (file_size_or_zero(local) > remote.size) truncate_first = true;
        }

        if (!retryable) {
            return fail(result, classify(response),
                        "download " + target + ": " + describe(response));
        }
        if (attempt >= options_.retry.max_attempts) {
            auto code = response.ok() ? ErrorCode::IntegrityMismatch : ErrorCode::TransientIO;
            return fail(result, code,
                        "download " + target + ": giving up after " + std::to_string(attempt) +
                            " attempt(s): " + (response.ok() ? std::string("size mismatch")
                                                             : describe(response)));
        }

        auto delay = options_.retry.delay_for(attempt);
        log_debug("download %s: attempt %d incomplete, retrying in %lld ms", target.c_str(),
                  attempt, static_cast<long long>(delay.count()));
        enter(result, TransferState::Retry);
        std::this_thread::sleep_for(delay);
        enter(result, TransferState::Transfer);
    }

    enter(result, TransferState::Verify);
    auto local_fp = fingerprint_file(local);
    if (!local_fp) {
        return fail(result, ErrorCode::StorageIO, "download " + target + ": cannot re-read " +
                                                      local.string());
    }
    result.fingerprint = *local_fp;
    if (!same_content(file_size_or_zero(local), *local_fp, remote.size, remote.fingerprint)) {
        return fail(result, ErrorCode::IntegrityMismatch,
                    "download " + target + ": local fingerprint " + *local_fp +
                        " does not match server " + remote.fingerprint);
    }

    result.outcome = TransferOutcome::Transferred;
    enter(result, TransferState::Done);
    return result;
}

// ============================================================================
// Bucket and listing operations
// ============================================================================

ListBucketsResult TransferClient::list_buckets() {
    ListBucketsResult result;
    auto response = execute(make_request(net::HttpMethod::GET, options_.server_url + "/"));
    if (!response.ok()) return fail_op(result, "list-buckets", response);

    std::string body = response.body_string();
    for (const auto& el : xml::find_elements(body, "Bucket")) {
        std::string fragment = body.substr(el.content_start, el.content_end - el.content_start);
        RemoteBucket bucket;
        bucket.name = xml::decode_entities(xml::get_element(fragment, "Name"));
        bucket.created = xml::get_element(fragment, "CreationDate");
        result.buckets.push_back(std::move(bucket));
    }
    result.success = true;
    result.http_status = response.status_code;
    return result;
}

ListObjectsResult TransferClient::list_objects(const std::string& bucket, const std::string& prefix,
                                               const std::string& delimiter) {
    ListObjectsResult result;
    std::string marker;

    while (true) {
        std::string url = bucket_url(bucket) + "?max-keys=" + std::to_string(options_.list_page_size);
        if (!prefix.empty()) url += "&prefix=" + net::url_encode(prefix);
        if (!delimiter.empty()) url += "&delimiter=" + net::url_encode(delimiter);
        if (!marker.empty()) url += "&marker=" + net::url_encode(marker);

        auto response = execute(make_request(net::HttpMethod::GET, url));
        if (!response.ok()) return fail_op(result, "list-objects " + bucket, response);
        result.pages++;

        std::string body = response.body_string();
        std::string last_key;
        for (const auto& el : xml::find_elements(body, "Contents")) {
            std::string fragment = body.substr(el.content_start, el.content_end - el.content_start);
            RemoteEntry entry;
            entry.key = xml::decode_entities(xml::get_element(fragment, "Key"));
            auto size_text = xml::get_element(fragment, "Size");
            entry.size = size_text.empty() ? 0 : std::strtoull(size_text.c_str(), nullptr, 10);
            entry.fingerprint = unquote_etag(xml::decode_entities(xml::get_element(fragment, "ETag")));
            entry.last_modified = xml::get_element(fragment, "LastModified");
            last_key = entry.key;
            result.objects.push_back(std::move(entry));
        }
        for (const auto& el : xml::find_elements(body, "CommonPrefixes")) {
            std::string fragment = body.substr(el.content_start, el.content_end - el.content_start);
            result.common_prefixes.push_back(xml::decode_entities(xml::get_element(fragment, "Prefix")));
        }

        if (xml::get_element(body, "IsTruncated") != "true") break;
        std::string next = xml::decode_entities(xml::get_element(body, "NextMarker"));
        if (next.empty()) next = last_key;
        if (next.empty() || next == marker) break;
        marker = next;
    }

    result.success = true;
    result.http_status = 200;
    return result;
}

OperationResult TransferClient::create_bucket(const std::string& bucket) {
    OperationResult result;
    auto response = execute(make_request(net::HttpMethod::PUT, bucket_url(bucket)));
    if (!response.ok()) return fail_op(result, "create-bucket " + bucket, response);
    result.success = true;
    result.http_status = response.status_code;
    return result;
}

OperationResult TransferClient::delete_bucket(const std::string& bucket) {
    OperationResult result;
    auto response = execute(make_request(net::HttpMethod::DELETE, bucket_url(bucket)));
    if (!response.ok()) return fail_op(result, "delete-bucket " + bucket, response);
    result.success = true;
    result.http_status = response.status_code;
    result.removed = response.headers.get("x-blobgate-removed").value_or("true") == "true";
    return result;
}

OperationResult TransferClient::delete_object(const std::string& bucket, const std::string& key) {
    OperationResult result;
    auto response = execute(make_request(net::HttpMethod::DELETE, object_url(bucket, key)));
    if (response.status_code == 404) {
        // Already absent: not an error, nothing removed
        result.success = true;
        result.http_status = 404;
        return result;
    }
    if (!response.ok()) return fail_op(result, "delete " + bucket + "/" + key, response);
    result.success = true;
    result.http_status = response.status_code;
    result.removed = response.headers.get("x-blobgate-removed").value_or("true") == "true";
    return result;
}

SyncResult TransferClient::sync_directory(const fs::path& dir, const std::string& bucket,
                                          const std::string& key_prefix,
                                          const std::vector<std::string>& extra_excludes) {
    SyncResult result;

    auto patterns = default_exclude_patterns();
    patterns.insert(patterns.end(), extra_excludes.begin(), extra_excludes.end());

    std::string prefix = key_prefix;
    while (!prefix.empty() && prefix.front() == '/') prefix.erase(0, 1);
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';

    // Collect first so uploads run in a stable key order
    std::vector<std::pair<std::string, fs::path>> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        TransferResult r;
        fail(r, ErrorCode::StorageIO, "sync: cannot read " + dir.string() + ": " + ec.message());
        result.failed = 1;
        result.failures.emplace_back(dir.string(), std::move(r));
        return result;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::string relative = it->path().lexically_relative(dir).generic_string();
        std::error_code type_ec;
        if (is_excluded(relative, patterns)) {
            if (it->is_directory(type_ec)) it.disable_recursion_pending();
            result.excluded++;
            continue;
        }
        if (!it->is_regular_file(type_ec)) continue;
        files.emplace_back(prefix + relative, it->path());
    }
    if (ec) {
        log_warn("sync: directory walk stopped early: %s", ec.message().c_str());
    }
    std::sort(files.begin(), files.end());

    for (const auto& [key, path] : files) {
        if (cancelled()) break;
        auto r = upload_file(path, bucket, key);
        switch (r.outcome) {
            case TransferOutcome::Skipped:
                result.skipped++;
                break;
            case TransferOutcome::Transferred:
                result.uploaded++;
                result.bytes_transferred += r.bytes_transferred;
                break;
            case TransferOutcome::Failed:
                result.failed++;
                log_error("%s", r.error_message.c_str());
                result.failures.emplace_back(key, std::move(r));
                break;
        }
    }
    return result;
}

HealthResult TransferClient::health() {
    HealthResult result;
    auto response = execute(make_request(net::HttpMethod::GET, options_.server_url + "/health"));
    result.http_status = response.status_code;

    // 503 still carries the document
    auto doc = nlohmann::json::parse(response.body_string(), nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        result.status = doc.value("status", "");
        result.service = doc.value("service", "");
        result.buckets = doc.value("buckets", uint64_t{0});
        result.objects = doc.value("objects", uint64_t{0});
        result.bytes = doc.value("bytes", uint64_t{0});
        if (doc.contains("protocols") && doc["protocols"].is_array()) {
            for (const auto& p : doc["protocols"]) {
                if (p.is_string()) result.protocols.push_back(p.get<std::string>());
            }
        }
    }

    if (!response.ok()) return fail_op(result, "health", response);
    result.success = true;
    return result;
}

}  // namespace blobgate::transfer

#include "blobgate/net/http.hpp"
#include "blobgate/core/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace blobgate::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

std::chrono::seconds get_request_timeout() {
    if (const char* env = std::getenv("BLOBGATE_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            if (secs >= 1 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_warn("BLOBGATE_REQUEST_TIMEOUT=%s out of range [1,3600], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid BLOBGATE_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return std::chrono::seconds(30);
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::PROPFIND: return "PROPFIND";
        case HttpMethod::MKCOL: return "MKCOL";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str, bool plus_as_space) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Embedded NUL is dropped, never decoded
                if (value != 0) {
                    decoded += static_cast<char>(value);
                }
                i += 2;
                continue;
            }
            // Invalid hex sequence: keep the literal '%'
        } else if (plus_as_space && str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second.back();
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::make(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

void HttpRequest::set_body(const std::string& text, const std::string& content_type) {
    body.assign(text.begin(), text.end());
    headers.set("Content-Type", content_type);
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) return std::nullopt;

    size_t colon_pos = host_port.rfind(':');
    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) return std::nullopt;
        result.host = host_port.substr(1, bracket_end - 1);
        colon_pos = host_port.find(':', bracket_end);
    } else {
        result.host = host_port.substr(0, colon_pos);
    }
    if (colon_pos != std::string::npos) {
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (result.port <= 0 || result.port > 65535) return std::nullopt;
    }

    pos = host_end;
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) path_end = url.size();
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) query_end = url.size();
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

int ParsedUrl::effective_port() const {
    if (port != 0) return port;
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

// ============================================================================
// RetryPolicy
// ============================================================================

bool RetryPolicy::is_retryable(const HttpResponse& response) const {
    if (response.aborted) return false;
    if (response.is_network_error) return true;
    return retryable_statuses.count(response.status_code) > 0;
}

std::chrono::milliseconds RetryPolicy::delay_for(int retry) const {
    if (retry < 1) return std::chrono::milliseconds(0);
    double delay = static_cast<double>(initial_delay.count()) *
                   std::pow(backoff_multiplier, retry - 1);
    delay = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

HttpResponse execute_with_retry(HttpTransport& transport,
                                const HttpRequest& request,
                                const RetryPolicy& policy,
                                int* attempts,
                                const std::function<bool()>& cancelled) {
    int attempt = 0;
    while (true) {
        ++attempt;
        HttpResponse response = transport.execute(request);
        if (attempts) *attempts = attempt;

        // Success or non-retryable error
        if (!policy.is_retryable(response)) {
            return response;
        }

        if (attempt >= policy.max_attempts || (cancelled && cancelled())) {
            return response;
        }

        auto delay = policy.delay_for(attempt);
        log_debug("%s %s: attempt %d failed (%s), retrying in %lld ms",
                  http_method_to_string(request.method), request.url.c_str(), attempt,
                  response.is_network_error ? response.error.c_str()
                                            : std::to_string(response.status_code).c_str(),
                  static_cast<long long>(delay.count()));
        std::this_thread::sleep_for(delay);
    }
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Context for response body delivery: streamed to a sink for 2xx answers,
// otherwise accumulated up to max_size
struct WriteContext {
    CURL* curl = nullptr;
    const ResponseSink* sink = nullptr;
    std::vector<uint8_t>* buffer = nullptr;
    size_t max_size = 0;
    bool size_exceeded = false;
    bool sink_aborted = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);

    if (ctx->sink && *ctx->sink && is_success_status(static_cast<int>(status))) {
        if (!(*ctx->sink)(static_cast<int>(status), reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->sink_aborted = true;
            return 0;
        }
        return bytes;
    }

    if (ctx->max_size > 0 && ctx->buffer->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }
    ctx->buffer->insert(ctx->buffer->end(), ptr, ptr + bytes);
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a fresh header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);
        headers->add(name, value);
    }

    return bytes;
}

struct ReadContext {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
    FILE* file = nullptr;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadContext*>(userdata);
    size_t max_bytes = size * nitems;

    if (rd->file) {
        size_t n = fread(buffer, 1, max_bytes, rd->file);
        if (n == 0 && ferror(rd->file)) return CURL_READFUNC_ABORT;
        return n;
    }

    size_t to_copy = std::min(max_bytes, rd->size - rd->pos);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t ultotal, curl_off_t ulnow) {
    auto* callback = static_cast<const HttpProgressCallback*>(clientp);
    HttpProgress progress;
    progress.download_total = static_cast<uint64_t>(dltotal);
    progress.download_now = static_cast<uint64_t>(dlnow);
    progress.upload_total = static_cast<uint64_t>(ultotal);
    progress.upload_now = static_cast<uint64_t>(ulnow);

    // Non-zero aborts
    return (*callback)(progress) ? 0 : 1;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (config_.default_total_timeout.count() == 0) {
            config_.default_total_timeout =
                std::chrono::duration_cast<std::chrono::milliseconds>(get_request_timeout());
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create connection handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Request body: file, buffer, or nothing
        ReadContext read_ctx{request.body.data(), request.body.size(), 0, nullptr};
        curl_off_t body_size = static_cast<curl_off_t>(request.body.size());
        if (request.body_file) {
            read_ctx.file = fopen(request.body_file->c_str(), "rb");
            if (!read_ctx.file) {
                release_handle(curl);
                response.error = "Cannot open " + request.body_file->string() + ": " +
                                 strerror(errno);
                return response;
            }
            std::error_code ec;
            body_size = static_cast<curl_off_t>(std::filesystem::file_size(*request.body_file, ec));
            if (ec) {
                fclose(read_ctx.file);
                release_handle(curl);
                response.error = "Cannot stat " + request.body_file->string();
                return response;
            }
        }
        bool has_body = request.body_file.has_value() || !request.body.empty();

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            default:
                // DELETE, OPTIONS and the WebDAV verbs
                if (has_body) {
                    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                }
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, http_method_to_string(request.method));
                break;
        }

        if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, body_size);
        } else if (request.method == HttpMethod::PUT || has_body) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, body_size);
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Uploads stream the whole body; no 100-continue round trip
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        if (config_.accept_compressed) {
            // curl decodes gzip bodies transparently
            curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip");
        }

        std::vector<uint8_t> response_body;
        WriteContext write_ctx;
        write_ctx.curl = curl;
        write_ctx.sink = request.response_sink ? &request.response_sink : nullptr;
        write_ctx.buffer = &response_body;
        write_ctx.max_size = config_.max_response_size;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (request.progress_callback) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &request.progress_callback);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // Timeouts. Streamed transfers are bounded by a stall timeout rather than
        // a total one, so large objects are not cut off while still moving.
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        bool streamed = request.body_file.has_value() || static_cast<bool>(request.response_sink);
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request.total_timeout.count()));
        } else if (streamed) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(std::max<long long>(
                                 1, config_.default_total_timeout.count() / 1000)));
        } else {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(config_.default_total_timeout.count()));
        }

        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_warn("SSL verification disabled; connections are open to "
                         "man-in-the-middle attacks");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);

        if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
        } else if (write_ctx.sink_aborted || res == CURLE_ABORTED_BY_CALLBACK) {
            response.error = "Transfer aborted";
            response.aborted = true;
        } else if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }
        response.body = std::move(response_body);

        if (read_ctx.file) fclose(read_ctx.file);
        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace blobgate::net

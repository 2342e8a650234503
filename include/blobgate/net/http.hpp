#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace blobgate::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PROPFIND,
    MKCOL
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// Case-insensitive header map (names are stored lowercase)
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

    void clear() { headers_.clear(); }

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpProgress {
    uint64_t download_total = 0;
    uint64_t download_now = 0;
    uint64_t upload_total = 0;
    uint64_t upload_now = 0;
};

// Return false to abort the transfer
using HttpProgressCallback = std::function<bool(const HttpProgress&)>;

// Receives successful (2xx) response body chunks as they arrive, together with
// the response status. Return false to abort. Non-2xx bodies are collected in
// HttpResponse::body instead.
using ResponseSink = std::function<bool(int status, const uint8_t* data, size_t size)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Stream the request body from this file instead of `body`
    std::optional<std::filesystem::path> body_file;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{0};  // 0 = client default

    bool verify_ssl = true;
    std::string ca_bundle_path;

    HttpProgressCallback progress_callback;
    ResponseSink response_sink;

    static HttpRequest make(HttpMethod method, const std::string& url);
    void set_body(const std::string& text, const std::string& content_type);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string error;
    bool is_network_error = false;
    bool aborted = false;  // Stopped by a progress callback or sink

    std::chrono::milliseconds total_time{0};

    bool ok() const { return !is_network_error && !aborted && is_success_status(status_code); }
    std::string body_string() const;
};

/// Anything that can carry one HTTP exchange. The transfer client only talks
/// to this interface, so tests can drive it without a socket.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    std::string user_agent = "blobgate-client/1.0";
    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;
    std::chrono::milliseconds default_total_timeout{0};  // 0 = environment/default
    size_t max_response_size = 64 * 1024 * 1024;         // Buffered bodies only
    size_t max_idle_handles = 8;
    bool accept_compressed = true;
    bool verbose = false;
};

// libcurl-backed transport with a small pool of reusable easy handles.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Retry behaviour for transient failures: network errors and the
// configured status set.
struct RetryPolicy {
    int max_attempts = 4;  // Including the first attempt
    std::chrono::milliseconds initial_delay{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    std::set<int> retryable_statuses{429, 500, 502, 503, 504};

    bool is_retryable(const HttpResponse& response) const;

    // Delay before retry n (n >= 1): min(initial * multiplier^(n-1), max_delay)
    std::chrono::milliseconds delay_for(int retry) const;
};

/// Execute with retries. `attempts` receives the number of requests made.
/// `cancelled`, when set, is checked between attempts.
HttpResponse execute_with_retry(HttpTransport& transport,
                                const HttpRequest& request,
                                const RetryPolicy& policy,
                                int* attempts = nullptr,
                                const std::function<bool()>& cancelled = {});

// Percent-encoding. With keep_slash, '/' is left as a path separator.
std::string url_encode(const std::string& str, bool keep_slash = false);

// Percent-decoding. '+' becomes a space only in query strings.
std::string url_decode(const std::string& str, bool plus_as_space = false);

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
    int effective_port() const;
};

// Default transfer timeout, overridable via BLOBGATE_REQUEST_TIMEOUT (seconds)
std::chrono::seconds get_request_timeout();

}  // namespace blobgate::net

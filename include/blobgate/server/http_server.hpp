#pragma once

#include "blobgate/facade/protocol_facade.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace blobgate {

struct HttpServerOptions {
    std::string listen_address = "0.0.0.0";
    uint16_t port = 8443;                       // 0 = ephemeral
    size_t io_threads = 2;
    size_t worker_threads = 16;
    uint64_t max_body_bytes = 5ULL * 1024 * 1024 * 1024;
    std::chrono::seconds request_timeout{300};
};

// One completed request, as reported to the observer
struct RequestRecord {
    std::string protocol;
    std::string method;
    int status = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    std::chrono::duration<double> duration{0};
};

using RequestObserver = std::function<void(const RequestRecord&)>;

/// HTTP/1.1 front end for the protocol facade (Boost.Beast).
///
/// Connections are accepted and read on `io_threads`; each decoded request is
/// handed to a pool of `worker_threads` so blocking store work never runs on
/// the I/O threads. Responses are written back on the connection's strand.
class HttpServer {
public:
    HttpServer(const facade::ProtocolFacade& facade, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the threads.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop accepting, finish in-flight work and join all threads.
    void stop();

    /// Block until stop() is called.
    void wait();

    /// Bound port (resolves port 0 after start()).
    uint16_t port() const;

    bool is_running() const;

    /// Called from worker threads after every request; must be thread-safe.
    /// Set before start().
    void set_observer(RequestObserver observer);

    struct Stats {
        uint64_t connections_accepted = 0;
        uint64_t requests_handled = 0;
        uint64_t requests_failed = 0;     // 5xx answers
        uint64_t bytes_received = 0;
        uint64_t bytes_sent = 0;
    };
    Stats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blobgate

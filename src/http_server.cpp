#include "blobgate/server/http_server.hpp"
#include "blobgate/core/log.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace blobgate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

struct Counters {
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> requests_handled{0};
    std::atomic<uint64_t> requests_failed{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> bytes_sent{0};
};

struct SessionContext {
    const facade::ProtocolFacade& facade;
    const HttpServerOptions& options;
    asio::thread_pool& workers;
    Counters& counters;
    const RequestObserver& observer;
};

using RequestBody = http::vector_body<uint8_t>;

// Convert the decoded Beast request into the facade's wire form
facade::WireRequest to_wire(http::request<RequestBody>& req) {
    auto wire = facade::WireRequest::from_target(
        std::string(req.method_string()), std::string(req.target()));
    for (const auto& field : req) {
        wire.headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    wire.body = std::move(req.body());
    return wire;
}

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const SessionContext& ctx)
        : stream_(std::move(socket)), ctx_(ctx) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(ctx_.options.max_body_bytes);
        stream_.expires_after(ctx_.options.request_timeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec == http::error::body_limit) {
            log_warn("Rejecting request body larger than %llu bytes",
                     static_cast<unsigned long long>(ctx_.options.max_body_bytes));
            send_status(http::status::payload_too_large, false);
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != asio::error::operation_aborted &&
                ec != asio::error::connection_reset) {
                log_debug("Read failed: %s", ec.message().c_str());
            }
            do_close();
            return;
        }

        ctx_.counters.bytes_received += bytes;
        auto req = std::make_shared<http::request<RequestBody>>(parser_->release());

        // Store work may block on disk; keep it off the I/O threads
        stream_.expires_never();
        asio::post(ctx_.workers, [self = shared_from_this(), req]() {
            self->handle(std::move(*req));
        });
    }

    void handle(http::request<RequestBody>&& req) {
        auto started = std::chrono::steady_clock::now();
        bool keep_alive = req.keep_alive();
        unsigned version = req.version();
        uint64_t bytes_in = req.body().size();

        auto wire = to_wire(req);
        auto res = ctx_.facade.handle(wire);

        ctx_.counters.requests_handled++;
        if (res.status >= 500) ctx_.counters.requests_failed++;

        if (ctx_.observer) {
            RequestRecord record;
            record.protocol = res.protocol;
            record.method = wire.method;
            record.status = res.status;
            record.bytes_in = bytes_in;
            record.bytes_out = res.head_only ? 0 : res.body.size();
            record.duration = std::chrono::steady_clock::now() - started;
            ctx_.observer(record);
        }

        log_debug("%s %s -> %d (%zu bytes)", wire.method.c_str(), wire.path.c_str(),
                  res.status, res.body.size());

        auto shared_res = std::make_shared<facade::WireResponse>(std::move(res));
        asio::post(stream_.get_executor(),
                   [self = shared_from_this(), shared_res, keep_alive, version]() {
                       self->write_response(*shared_res, keep_alive, version);
                   });
    }

    void write_response(facade::WireResponse& res, bool keep_alive, unsigned version) {
        if (res.head_only) {
            http::response<http::empty_body> msg{static_cast<http::status>(res.status), version};
            uint64_t length = res.body.size();
            for (const auto& [name, value] : res.headers.all()) {
                if (name == "content-length") {
                    length = std::stoull(value);
                    continue;
                }
                msg.insert(name, value);
            }
            msg.set(http::field::server, "blobgate");
            msg.set(http::field::content_length, std::to_string(length));
            msg.keep_alive(keep_alive);
            send(std::move(msg));
            return;
        }

        http::response<RequestBody> msg{static_cast<http::status>(res.status), version};
        for (const auto& [name, value] : res.headers.all()) {
            if (name == "content-length") continue;
            msg.insert(name, value);
        }
        msg.set(http::field::server, "blobgate");
        msg.body() = std::move(res.body);
        msg.keep_alive(keep_alive);
        msg.prepare_payload();
        send(std::move(msg));
    }

    void send_status(http::status status, bool keep_alive) {
        http::response<http::string_body> msg{status, 11};
        msg.set(http::field::server, "blobgate");
        msg.set(http::field::access_control_allow_origin, "*");
        msg.keep_alive(keep_alive);
        msg.prepare_payload();
        send(std::move(msg));
    }

    template <class Body>
    void send(http::response<Body>&& msg) {
        auto sp = std::make_shared<http::response<Body>>(std::move(msg));
        pending_ = sp;
        stream_.expires_after(ctx_.options.request_timeout);
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(),
                                                    sp->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t bytes) {
        pending_.reset();
        if (ec) {
            log_debug("Write failed: %s", ec.message().c_str());
            do_close();
            return;
        }
        ctx_.counters.bytes_sent += bytes;
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<RequestBody>> parser_;
    std::shared_ptr<void> pending_;
    SessionContext ctx_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, const SessionContext& ctx)
        : ioc_(ioc), acceptor_(asio::make_strand(ioc)), ctx_(ctx) {}

    // Returns error message on failure, empty string on success
    std::string open(const tcp::endpoint& endpoint) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) return "open: " + ec.message();
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) return "set_option: " + ec.message();
        acceptor_.bind(endpoint, ec);
        if (ec) return "bind: " + ec.message();
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) return "listen: " + ec.message();
        return "";
    }

    uint16_t local_port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void run() { do_accept(); }

    void close() {
        asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    void do_accept() {
        acceptor_.async_accept(asio::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept,
                                                         shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            log_warn("Accept failed: %s", ec.message().c_str());
        } else {
            ctx_.counters.connections_accepted++;
            std::make_shared<Session>(std::move(socket), ctx_)->run();
        }
        if (acceptor_.is_open()) do_accept();
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    SessionContext ctx_;
};

}  // namespace

class HttpServer::Impl {
public:
    Impl(const facade::ProtocolFacade& facade, HttpServerOptions options)
        : facade_(facade), options_(std::move(options)) {}

    const facade::ProtocolFacade& facade_;
    HttpServerOptions options_;
    // Built per start() so a stopped server can be started again
    std::unique_ptr<asio::io_context> ioc_;
    std::unique_ptr<asio::thread_pool> workers_;
    Counters counters_;
    RequestObserver observer_;
    std::shared_ptr<Listener> listener_;
    std::vector<std::thread> io_threads_;
    uint16_t bound_port_ = 0;

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

HttpServer::HttpServer(const facade::ProtocolFacade& facade, HttpServerOptions options)
    : impl_(std::make_unique<Impl>(facade, std::move(options))) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::start() {
    if (impl_->running_) return "server already running";

    beast::error_code ec;
    auto address = asio::ip::make_address(impl_->options_.listen_address, ec);
    if (ec) {
        return "invalid listen address '" + impl_->options_.listen_address + "': " + ec.message();
    }

    size_t n = std::max<size_t>(1, impl_->options_.io_threads);
    impl_->ioc_ = std::make_unique<asio::io_context>(static_cast<int>(n));
    impl_->workers_ = std::make_unique<asio::thread_pool>(
        std::max<size_t>(1, impl_->options_.worker_threads));

    SessionContext ctx{impl_->facade_, impl_->options_, *impl_->workers_, impl_->counters_,
                       impl_->observer_};
    impl_->listener_ = std::make_shared<Listener>(*impl_->ioc_, ctx);
    auto err = impl_->listener_->open(tcp::endpoint{address, impl_->options_.port});
    if (!err.empty()) {
        impl_->listener_.reset();
        impl_->workers_->join();
        impl_->workers_.reset();
        impl_->ioc_.reset();
        return "Failed to listen on " + impl_->options_.listen_address + ":" +
               std::to_string(impl_->options_.port) + ": " + err;
    }
    impl_->bound_port_ = impl_->listener_->local_port();
    impl_->listener_->run();

    impl_->running_ = true;
    impl_->io_threads_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        impl_->io_threads_.emplace_back([this]() {
            try {
                impl_->ioc_->run();
            } catch (const std::exception& e) {
                log_error("I/O thread stopped: %s", e.what());
            }
        });
    }

    log_info("Listening on %s:%u (%zu I/O threads, %zu workers)",
             impl_->options_.listen_address.c_str(),
             static_cast<unsigned>(impl_->bound_port_), n,
             std::max<size_t>(1, impl_->options_.worker_threads));
    return "";
}

void HttpServer::stop() {
    if (!impl_->running_.exchange(false)) return;

    log_info("Stopping HTTP server...");
    if (impl_->listener_) impl_->listener_->close();

    // I/O stops first so no session can queue new facade work; the pool
    // then drains, and its completions land in the stopped context
    impl_->ioc_->stop();
    for (auto& t : impl_->io_threads_) {
        if (t.joinable()) t.join();
    }
    impl_->io_threads_.clear();
    impl_->workers_->join();

    // Pending handlers own the sessions and their sockets; they go with the context
    impl_->workers_.reset();
    impl_->listener_.reset();
    impl_->ioc_.reset();

    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex_);
    }
    impl_->wait_cv_.notify_all();
    log_info("HTTP server stopped");
}

void HttpServer::wait() {
    std::unique_lock<std::mutex> lock(impl_->wait_mutex_);
    impl_->wait_cv_.wait(lock, [this]() { return !impl_->running_.load(); });
}

uint16_t HttpServer::port() const {
    return impl_->bound_port_;
}

bool HttpServer::is_running() const {
    return impl_->running_;
}

void HttpServer::set_observer(RequestObserver observer) {
    impl_->observer_ = std::move(observer);
}

HttpServer::Stats HttpServer::get_stats() const {
    Stats s;
    s.connections_accepted = impl_->counters_.connections_accepted;
    s.requests_handled = impl_->counters_.requests_handled;
    s.requests_failed = impl_->counters_.requests_failed;
    s.bytes_received = impl_->counters_.bytes_received;
    s.bytes_sent = impl_->counters_.bytes_sent;
    return s;
}

}  // namespace blobgate

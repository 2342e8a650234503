// Configuration, retry policy and metrics exporter tests.

#include "test_harness.hpp"

#include "blobgate/client_config.hpp"
#include "blobgate/metrics.hpp"
#include "blobgate/net/http.hpp"
#include "blobgate/server/http_server.hpp"
#include "blobgate/server_config.hpp"
#include "blobgate/storage/content_store.hpp"

#include <cstdlib>

using namespace blobgate;

namespace {

// Owns argv storage for from_args()
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "prog");
        for (auto& s : storage_) ptrs_.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

template <typename Config>
std::optional<Config> parse(Args args) {
    return Config::from_args(args.argc(), args.argv());
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

static void test_server_config() {
    std::cout << "\n[server config]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-config");

    {
        TEST(defaults);
        auto c = parse<ServerConfig>({"--data-dir", tmpdir.string()});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->port, 8443, "port");
        ASSERT_EQ(c->listen_address, std::string("0.0.0.0"), "listen");
        ASSERT_TRUE(c->enable_compression, "compression on");
        ASSERT_EMPTY(c->validate(), "valid");
        PASS();
    }

    {
        TEST(flags_override_defaults);
        auto c = parse<ServerConfig>({"--data-dir", tmpdir.string(), "--port", "9000", "--listen",
                                      "127.0.0.1", "--io-threads", "4", "--worker-threads", "8",
                                      "--max-body-mb", "10", "--no-compression", "--reconcile",
                                      "--request-timeout", "60"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->port, 9000, "port");
        ASSERT_EQ(c->listen_address, std::string("127.0.0.1"), "listen");
        ASSERT_EQ(c->io_threads, 4u, "io threads");
        ASSERT_EQ(c->worker_threads, 8u, "worker threads");
        ASSERT_EQ(c->max_body_bytes, 10u * 1024 * 1024, "body limit");
        ASSERT_TRUE(!c->enable_compression, "compression off");
        ASSERT_TRUE(c->reconcile_on_start, "reconcile");
        ASSERT_EQ(c->request_timeout.count(), 60, "timeout");
        PASS();
    }

    {
        TEST(bad_arguments_are_rejected);
        ASSERT_TRUE(!parse<ServerConfig>({"--port", "70000"}), "port range");
        ASSERT_TRUE(!parse<ServerConfig>({"--port", "abc"}), "numeric");
        ASSERT_TRUE(!parse<ServerConfig>({"--bogus"}), "unknown flag");
        ASSERT_TRUE(!parse<ServerConfig>({"--data-dir"}), "missing value");
        PASS();
    }

    {
        TEST(validation);
        ServerConfig c;
        ASSERT_TRUE(contains(c.validate(), "data_dir is required"), "data dir required");
        auto file = tmpdir / "plain-file";
        write_file(file, "x");
        c.data_dir = file;
        ASSERT_TRUE(contains(c.validate(), "not a directory"), "file as data dir");
        c.data_dir = tmpdir;
        c.metrics_file = tmpdir / "m.prom";
        c.metrics_interval_secs = 0;
        ASSERT_TRUE(contains(c.validate(), "metrics_interval"), "metrics interval");
        PASS();
    }

    {
        TEST(zero_threads_get_defaults);
        auto c = parse<ServerConfig>({"--data-dir", tmpdir.string() + "/./x/..", "--io-threads",
                                      "0", "--worker-threads", "0"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->io_threads, 1u, "io threads");
        ASSERT_TRUE(c->worker_threads >= 4, "worker threads");
        ASSERT_EQ(c->data_dir, tmpdir.lexically_normal() / "", "normalised data dir");
        PASS();
    }

    {
        TEST(json_config_file);
        auto json_path = tmpdir / "server.json";
        write_file(json_path, R"({
            "data_dir": ")" + tmpdir.string() + R"(",
            "port": 7001,
            "worker_threads": 3,
            "enable_compression": false,
            "compression_min_bytes": 4096,
            "metrics_file": "/tmp/blobgate.prom",
            "metrics_interval": 5
        })");
        auto c = parse<ServerConfig>({"--config", json_path.string(), "--port", "7002"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->port, 7002, "later flag wins");
        ASSERT_EQ(c->worker_threads, 3u, "workers");
        ASSERT_TRUE(!c->enable_compression, "compression");
        ASSERT_EQ(c->compression_min_bytes, 4096u, "min bytes");
        ASSERT_EQ(c->metrics_interval_secs, 5u, "interval");

        write_file(json_path, "{ not json");
        ASSERT_TRUE(!parse<ServerConfig>({"--config", json_path.string()}), "invalid json");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_client_config() {
    std::cout << "\n[client config]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-config");
    unsetenv("BLOBGATE_SERVER");

    {
        TEST(command_and_arguments);
        auto c = parse<ClientConfig>({"--server", "http://host:9000/", "upload", "f.txt", "bk",
                                      "k", "--content-type", "text/plain"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->server_url, std::string("http://host:9000"), "trailing slash stripped");
        ASSERT_EQ(c->command, std::string("upload"), "command");
        ASSERT_EQ(c->args.size(), 3u, "arguments");
        ASSERT_EQ(c->content_type, std::string("text/plain"), "content type");
        ASSERT_TRUE(c->request_timeout.count() > 0, "timeout defaulted");
        ASSERT_EMPTY(c->validate(), "valid");
        PASS();
    }

    {
        TEST(server_from_environment);
        setenv("BLOBGATE_SERVER", "http://env-host:1234", 1);
        auto from_env = parse<ClientConfig>({"health"});
        auto from_flag = parse<ClientConfig>({"--server", "http://flag-host", "health"});
        unsetenv("BLOBGATE_SERVER");
        ASSERT_EQ(from_env->server_url, std::string("http://env-host:1234"), "env");
        ASSERT_EQ(from_flag->server_url, std::string("http://flag-host"), "flag wins");
        PASS();
    }

    {
        TEST(arity_and_url_validation);
        auto c = parse<ClientConfig>({"download", "bk", "k"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->validate(), std::string("download expects 3 argument(s), got 2"), "arity");

        auto unknown = parse<ClientConfig>({"frobnicate"});
        ASSERT_EQ(unknown->validate(), std::string("unknown command: frobnicate"), "unknown");

        auto ftp = parse<ClientConfig>({"--server", "ftp://host", "health"});
        ASSERT_TRUE(contains(ftp->validate(), "http or https"), "scheme");

        auto ca = parse<ClientConfig>({"--ca-cert", "/nonexistent/ca.pem", "health"});
        ASSERT_TRUE(contains(ca->validate(), "CA certificate not found"), "ca cert");

        ASSERT_TRUE(!parse<ClientConfig>({}), "no command");
        ASSERT_TRUE(!parse<ClientConfig>({"--retries", "many", "health"}), "numeric");
        PASS();
    }

    {
        TEST(sync_options);
        auto c = parse<ClientConfig>({"sync", "./dir", "bk", "--key-prefix", "backup",
                                      "--exclude", "*.tmp", "--exclude", "build", "--no-progress"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EMPTY(c->validate(), "valid");
        ASSERT_EQ(c->key_prefix, std::string("backup"), "key prefix");
        ASSERT_EQ(c->exclude_patterns.size(), 2u, "excludes");
        ASSERT_TRUE(!c->show_progress, "progress off");
        PASS();
    }

    {
        TEST(json_retry_settings);
        auto json_path = tmpdir / "client.json";
        write_file(json_path, R"({
            "server_url": "https://store.example:8443",
            "verify_ssl": false,
            "retry": {
                "max_attempts": 6,
                "initial_delay_ms": 250,
                "backoff_multiplier": 3.0,
                "max_delay_ms": 2000,
                "retryable_statuses": [503]
            },
            "exclude": ["*.bak"]
        })");
        auto c = parse<ClientConfig>({"--config", json_path.string(), "list-buckets"});
        ASSERT_TRUE(c.has_value(), "parsed");
        ASSERT_EQ(c->server_url, std::string("https://store.example:8443"), "url");
        ASSERT_TRUE(!c->verify_ssl, "verify off");
        ASSERT_EQ(c->retry.max_attempts, 6, "attempts");
        ASSERT_EQ(c->retry.initial_delay.count(), 250, "initial delay");
        ASSERT_EQ(c->retry.retryable_statuses.size(), 1u, "statuses");
        ASSERT_EQ(c->exclude_patterns.size(), 1u, "excludes");
        ASSERT_EMPTY(c->validate(), "valid");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_retry_policy() {
    std::cout << "\n[retry policy]" << std::endl;

    {
        TEST(exponential_backoff_with_ceiling);
        net::RetryPolicy p;
        p.initial_delay = std::chrono::milliseconds(100);
        p.backoff_multiplier = 2.0;
        p.max_delay = std::chrono::milliseconds(500);
        ASSERT_EQ(p.delay_for(1).count(), 100, "first retry");
        ASSERT_EQ(p.delay_for(2).count(), 200, "second retry");
        ASSERT_EQ(p.delay_for(3).count(), 400, "third retry");
        ASSERT_EQ(p.delay_for(4).count(), 500, "capped");
        ASSERT_EQ(p.delay_for(0).count(), 0, "no delay before first attempt");
        PASS();
    }

    {
        TEST(retryable_responses);
        net::RetryPolicy p;
        net::HttpResponse r;
        r.is_network_error = true;
        ASSERT_TRUE(p.is_retryable(r), "network error");
        r.is_network_error = false;
        for (int status : {429, 500, 502, 503, 504}) {
            r.status_code = status;
            ASSERT_TRUE(p.is_retryable(r), "status " + std::to_string(status));
        }
        for (int status : {200, 206, 400, 404, 416}) {
            r.status_code = status;
            ASSERT_TRUE(!p.is_retryable(r), "status " + std::to_string(status));
        }
        r.status_code = 503;
        r.aborted = true;
        ASSERT_TRUE(!p.is_retryable(r), "aborted transfers are final");
        PASS();
    }

    {
        TEST(url_helpers);
        ASSERT_EQ(net::url_encode("a b/c+d", true), std::string("a%20b/c%2Bd"), "keep slash");
        ASSERT_EQ(net::url_encode("a/b"), std::string("a%2Fb"), "encode slash");
        ASSERT_EQ(net::url_decode("a%20b+c"), std::string("a b+c"), "path decode");
        ASSERT_EQ(net::url_decode("a%20b+c", true), std::string("a b c"), "query decode");
        auto u = net::ParsedUrl::parse("https://example.com:9443/base?x=1");
        ASSERT_TRUE(u.has_value(), "parsed");
        ASSERT_EQ(u->host, std::string("example.com"), "host");
        ASSERT_EQ(u->effective_port(), 9443, "port");
        ASSERT_EQ(u->path, std::string("/base"), "path");
        ASSERT_EQ(u->query, std::string("x=1"), "query");
        ASSERT_TRUE(!net::ParsedUrl::parse("not a url"), "invalid");
        PASS();
    }

    {
        TEST(case_insensitive_headers);
        net::HttpHeaders h;
        h.set("Content-Length", "42");
        h.set("ETag", "\"abc\"");
        ASSERT_EQ(h.get("content-length").value_or(""), std::string("42"), "lookup");
        ASSERT_TRUE(h.content_length() && *h.content_length() == 42u, "content length");
        ASSERT_TRUE(h.has("etag"), "has");
        h.remove("ETAG");
        ASSERT_TRUE(!h.has("etag"), "removed");
        PASS();
    }
}

static void test_metrics() {
    std::cout << "\n[metrics]" << std::endl;
    auto tmpdir = make_temp_dir("blobgate-metrics");

    {
        TEST(status_classes);
        ASSERT_EQ(status_class(200), std::string("2xx"), "2xx");
        ASSERT_EQ(status_class(416), std::string("4xx"), "4xx");
        ASSERT_EQ(status_class(503), std::string("5xx"), "5xx");
        ASSERT_EQ(status_class(0), std::string("other"), "other");
        PASS();
    }

    {
        TEST(prom_file_is_written);
        auto prom = tmpdir / "blobgate.prom";
        MetricsExporter exporter(prom, std::chrono::seconds(60), {{"instance", "test"}});

        RequestRecord ok;
        ok.protocol = "s3";
        ok.method = "PUT";
        ok.status = 200;
        ok.bytes_in = 1000;
        ok.duration = std::chrono::milliseconds(3);
        exporter.record(ok);

        RequestRecord missing = ok;
        missing.protocol = "azure";
        missing.status = 404;
        missing.bytes_in = 0;
        exporter.record(missing);

        ASSERT_TRUE(exporter.write_file(), "write");
        ASSERT_TRUE(!fs::exists(tmpdir / "blobgate.prom.tmp"), "temp file renamed");
        auto text = read_file(prom);
        ASSERT_TRUE(contains(text, "blobgate_requests_total"), "requests family");
        ASSERT_TRUE(contains(text, "protocol=\"s3\""), "protocol label");
        ASSERT_TRUE(contains(text, "class=\"4xx\""), "class label");
        ASSERT_TRUE(contains(text, "instance=\"test\""), "constant label");
        ASSERT_TRUE(contains(text, "blobgate_request_duration_seconds"), "histogram");
        ASSERT_EQ(exporter.bytes_in_total().Value(), 1000.0, "bytes in");
        PASS();
    }

    {
        TEST(final_snapshot_includes_store_gauges);
        auto store = ContentStoreFactory::create_local(tmpdir / "data");
        std::vector<uint8_t> body = to_bytes("twelve bytes");
        ASSERT_TRUE(store->put("bk", "k", body).success, "put");

        auto prom = tmpdir / "gauges.prom";
        MetricsExporter exporter(prom, std::chrono::seconds(60), {});
        exporter.set_store(store.get());
        exporter.stop();
        ASSERT_TRUE(!fs::exists(prom), "stop without start writes nothing");

        exporter.start();
        exporter.stop();
        auto text = read_file(prom);
        ASSERT_TRUE(contains(text, "blobgate_objects 1"), "objects gauge");
        ASSERT_TRUE(contains(text, "blobgate_stored_bytes 12"), "bytes gauge");
        PASS();
    }

    fs::remove_all(tmpdir);
}

int main() {
    std::cout << "blobgate config tests" << std::endl;
    std::cout << "=====================" << std::endl;

    test_server_config();
    test_client_config();
    test_retry_policy();
    test_metrics();

    return print_results("config");
}

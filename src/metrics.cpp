#include "blobgate/metrics.hpp"
#include "blobgate/core/log.hpp"
#include "blobgate/server/http_server.hpp"
#include "blobgate/storage/content_store.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobgate {

namespace {

const prometheus::Histogram::BucketBoundaries kRequestBuckets{
    0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300};

}  // namespace

std::string status_class(int status) {
    if (status < 100 || status > 599) return "other";
    return std::to_string(status / 100) + "xx";
}

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    requests_family_ = &prometheus::BuildCounter()
        .Name("blobgate_requests_total")
        .Help("Requests answered, by protocol family and status class")
        .Labels(labels)
        .Register(*registry_);

    bytes_in_total_ = &prometheus::BuildCounter()
        .Name("blobgate_request_bytes_total")
        .Help("Request body bytes received")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    bytes_out_total_ = &prometheus::BuildCounter()
        .Name("blobgate_response_bytes_total")
        .Help("Response body bytes sent")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    reconcile_repairs_total_ = &prometheus::BuildCounter()
        .Name("blobgate_reconcile_repairs_total")
        .Help("Orphan bodies and dangling records removed by reconciliation")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    objects_total_ = &gauge_reg("blobgate_objects", "Objects in the content store");
    stored_bytes_ = &gauge_reg("blobgate_stored_bytes", "Object bytes in the content store");
    buckets_total_ = &gauge_reg("blobgate_buckets", "Buckets in the content store");

    // --- Histograms ---

    duration_family_ = &prometheus::BuildHistogram()
        .Name("blobgate_request_duration_seconds")
        .Help("Request handling duration in seconds")
        .Labels(labels)
        .Register(*registry_);

    reconcile_duration_ = &prometheus::BuildHistogram()
        .Name("blobgate_reconcile_duration_seconds")
        .Help("Reconciliation sweep duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (!was_running) return;

    cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    // Final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::record(const RequestRecord& record) {
    std::string protocol = record.protocol.empty() ? "unknown" : record.protocol;
    requests_family_->Add({{"protocol", protocol}, {"class", status_class(record.status)}})
        .Increment();
    duration_family_->Add({{"protocol", protocol}}, kRequestBuckets)
        .Observe(record.duration.count());
    if (record.bytes_in > 0) bytes_in_total_->Increment(static_cast<double>(record.bytes_in));
    if (record.bytes_out > 0) bytes_out_total_->Increment(static_cast<double>(record.bytes_out));
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (!store_) return;
    auto s = store_->stats();
    objects_total_->Set(static_cast<double>(s.objects));
    stored_bytes_->Set(static_cast<double>(s.bytes));
    buckets_total_->Set(static_cast<double>(s.buckets));
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot publish metrics file %s: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace blobgate

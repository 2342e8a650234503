#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobgate {

class ContentStore;
struct RequestRecord;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports server metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Store whose object/byte totals feed the gauges (not owned).
    void set_store(ContentStore* store) { store_ = store; }

    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Count one completed request. Thread-safe.
    void record(const RequestRecord& record);

    prometheus::Counter& bytes_in_total() { return *bytes_in_total_; }
    prometheus::Counter& bytes_out_total() { return *bytes_out_total_; }
    prometheus::Counter& reconcile_repairs_total() { return *reconcile_repairs_total_; }
    prometheus::Histogram& reconcile_duration() { return *reconcile_duration_; }

    /// Serialize the registry to the .prom file now.
    bool write_file();

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    ContentStore* store_ = nullptr;

    // Labelled {protocol, class} / {protocol}; children are added on first use
    prometheus::Family<prometheus::Counter>* requests_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;

    prometheus::Counter* bytes_in_total_;
    prometheus::Counter* bytes_out_total_;
    prometheus::Counter* reconcile_repairs_total_;

    prometheus::Gauge* objects_total_;
    prometheus::Gauge* stored_bytes_;
    prometheus::Gauge* buckets_total_;

    prometheus::Histogram* reconcile_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

/// "2xx", "4xx", "5xx" ...
std::string status_class(int status);

}  // namespace blobgate

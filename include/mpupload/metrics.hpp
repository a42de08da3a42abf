#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace mpupload {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename; stop() always writes a final snapshot.
class UploadMetrics {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    UploadMetrics(const std::filesystem::path& prom_file_path,
                  std::chrono::seconds write_interval,
                  const std::map<std::string, std::string>& labels);
    ~UploadMetrics();

    UploadMetrics(const UploadMetrics&) = delete;
    UploadMetrics& operator=(const UploadMetrics&) = delete;

    void start();
    void stop();

    /// Serialize the registry to the textfile now.
    bool write_file();

    // --- Counters ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& parts_success() { return *parts_success_; }
    prometheus::Counter& parts_failure() { return *parts_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& completion_attempts() { return *completion_attempts_; }
    prometheus::Counter& reconcile_head_checks() { return *reconcile_head_checks_; }

    /// Retry counter for one operation ("upload_part", "head_object", ...).
    prometheus::Counter& retries(const std::string& operation);

    // --- Histograms ---
    prometheus::Histogram& part_upload_duration() { return *part_upload_duration_; }

    // --- Gauges ---
    prometheus::Gauge& upload_duration_seconds() { return *upload_duration_seconds_; }
    prometheus::Gauge& upload_throughput_mbps() { return *upload_throughput_mbps_; }
    prometheus::Gauge& parts_planned() { return *parts_planned_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* parts_success_;
    prometheus::Counter* parts_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* completion_attempts_;
    prometheus::Counter* reconcile_head_checks_;
    prometheus::Family<prometheus::Counter>* retries_family_;

    prometheus::Histogram* part_upload_duration_;

    prometheus::Gauge* upload_duration_seconds_;
    prometheus::Gauge* upload_throughput_mbps_;
    prometheus::Gauge* parts_planned_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace mpupload

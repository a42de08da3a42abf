#include "mpupload/metrics.hpp"
#include "mpupload/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace mpupload {

UploadMetrics::UploadMetrics(const std::filesystem::path& prom_file_path,
                             std::chrono::seconds write_interval,
                             const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("mpupload_uploads_total")
        .Help("Multipart uploads finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    auto& parts_family = prometheus::BuildCounter()
        .Name("mpupload_parts_total")
        .Help("Parts uploaded")
        .Labels(labels)
        .Register(*registry_);
    parts_success_ = &parts_family.Add({{"result", "success"}});
    parts_failure_ = &parts_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("mpupload_upload_bytes_total")
        .Help("Total part bytes accepted by the server")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    completion_attempts_ = &prometheus::BuildCounter()
        .Name("mpupload_completion_attempts_total")
        .Help("CompleteMultipartUpload calls issued")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    reconcile_head_checks_ = &prometheus::BuildCounter()
        .Name("mpupload_reconcile_head_checks_total")
        .Help("HeadObject checks made to resolve an ambiguous finalize")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    retries_family_ = &prometheus::BuildCounter()
        .Name("mpupload_request_retries_total")
        .Help("Backoff retries by operation")
        .Labels(labels)
        .Register(*registry_);

    // --- Histograms ---

    part_upload_duration_ = &prometheus::BuildHistogram()
        .Name("mpupload_part_upload_duration_seconds")
        .Help("Part upload duration in seconds, retries included")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    upload_duration_seconds_ = &gauge_reg("mpupload_upload_duration_seconds",
                                          "Wall-clock duration of the last upload");
    upload_throughput_mbps_ = &gauge_reg("mpupload_upload_throughput_mbps",
                                         "Throughput of the last upload in MiB/s");
    parts_planned_ = &gauge_reg("mpupload_parts_planned", "Parts in the current upload plan");
}

UploadMetrics::~UploadMetrics() {
    stop();
}

prometheus::Counter& UploadMetrics::retries(const std::string& operation) {
    // Family::Add is thread-safe and returns the existing child for known labels
    return retries_family_->Add({{"operation", operation}});
}

void UploadMetrics::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&UploadMetrics::writer_loop, this);
}

void UploadMetrics::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        write_file();
    }
}

void UploadMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool UploadMetrics::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("metrics: cannot open %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("metrics: rename to %s failed: %s", prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace mpupload

#include "mpupload/part_uploader.hpp"
#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"
#include "mpupload/metrics.hpp"

#include <fstream>
#include <optional>

namespace mpupload {

PartUploader::PartUploader(ObjectStore& store,
                           const UploadSession& session,
                           std::filesystem::path file_path,
                           const RetryPolicy& retry,
                           ProgressTracker& progress,
                           UploadMetrics* metrics)
    : store_(store)
    , session_(session)
    , file_path_(std::move(file_path))
    , retry_(retry)
    , progress_(progress)
    , metrics_(metrics) {}

std::vector<uint8_t> PartUploader::read_range(const PartTask& task) const {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in) {
        throw UploadError("Part " + std::to_string(task.part_number) +
                          ": cannot open " + file_path_.string());
    }
    in.seekg(static_cast<std::streamoff>(task.byte_offset));

    std::vector<uint8_t> buffer(task.byte_length);
    in.read(reinterpret_cast<char*>(buffer.data()),
            static_cast<std::streamsize>(task.byte_length));
    if (static_cast<uint64_t>(in.gcount()) != task.byte_length) {
        throw UploadError("Part " + std::to_string(task.part_number) + ": short read from " +
                          file_path_.string() + " (" + std::to_string(in.gcount()) + " of " +
                          std::to_string(task.byte_length) + " bytes)");
    }
    return buffer;
}

PartReceipt PartUploader::upload(const PartTask& task) {
    const std::string description = "Part " + std::to_string(task.part_number);
    const uint64_t first = task.byte_offset;
    const uint64_t last = task.byte_offset + task.byte_length - 1;

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->part_upload_duration());

    int attempt = 0;
    std::string etag;
    try {
        etag = retry_.with_retry(description, is_transient_error, [&] {
            ++attempt;
            log_info("%s: reading bytes %llu-%llu (attempt %d)", description.c_str(),
                     static_cast<unsigned long long>(first),
                     static_cast<unsigned long long>(last), attempt);
            return store_.upload_part(session_, task.part_number, read_range(task));
        });
    } catch (...) {
        if (metrics_) metrics_->parts_failure().Increment();
        throw;
    }

    auto snap = progress_.record_part_complete();
    log_info("%s: uploaded, progress: %.1f%%, est time remaining: %s",
             description.c_str(), snap.percent, format_duration(snap.eta_seconds).c_str());

    if (metrics_) {
        metrics_->parts_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(task.byte_length));
    }
    return PartReceipt{task.part_number, etag};
}

}  // namespace mpupload

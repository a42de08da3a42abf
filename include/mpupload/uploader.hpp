#pragma once

#include "mpupload/chunk_planner.hpp"
#include "mpupload/constants.hpp"
#include "mpupload/object_store.hpp"
#include "mpupload/retry.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace mpupload {

class UploadMetrics;

struct UploadRequest {
    std::filesystem::path file_path;
    std::string bucket;
    std::string key;
    std::optional<uint64_t> part_size;
    std::optional<std::string> content_type;
};

struct UploaderOptions {
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    int max_workers = constants::DEFAULT_WORKERS;
    SleepFunction sleep = sleep_seconds;
};

struct UploadReport {
    std::string upload_id;
    uint64_t bytes = 0;
    uint32_t parts = 0;
    double elapsed_seconds = 0.0;
    double mb_per_second = 0.0;  // MB = 1024 * 1024 bytes
};

/// Throughput in MB/s with MB = 1024 * 1024 bytes; 0 when no time elapsed.
double throughput_mb_per_second(uint64_t bytes, double elapsed_seconds);

/// Drives one multipart upload end to end: plan, open the session, upload
/// parts on a bounded worker pool, cross-check the server's part list,
/// finalize through the reconciler and verify the final object size.
///
/// A failed upload is never aborted server-side. The thrown UploadError
/// carries the open upload id so the session can be inspected or resumed.
class MultipartUploader {
public:
    MultipartUploader(ObjectStore& store, UploaderOptions options,
                      UploadMetrics* metrics = nullptr);

    UploadReport upload(const UploadRequest& request);

private:
    UploadSession open_session(const UploadRequest& request, const RetryPolicy& retry);

    std::vector<PartReceipt> upload_parts(const UploadRequest& request,
                                          const UploadSession& session,
                                          const UploadPlan& plan,
                                          const RetryPolicy& retry);

    void verify_part_count(const UploadSession& session, const UploadPlan& plan,
                           const RetryPolicy& retry);

    void verify_object(const UploadSession& session, uint64_t expected_size,
                       const RetryPolicy& retry);

    ObjectStore& store_;
    UploaderOptions options_;
    UploadMetrics* metrics_;
};

}  // namespace mpupload

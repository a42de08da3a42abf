#pragma once

#include "mpupload/chunk_planner.hpp"
#include "mpupload/object_store.hpp"
#include "mpupload/progress.hpp"
#include "mpupload/retry.hpp"

#include <filesystem>

namespace mpupload {

class UploadMetrics;

/// Uploads single parts of one file into an open multipart session.
///
/// Each attempt re-reads the part's byte range from disk, so no part buffer
/// outlives a failed request. Shared by all workers of one upload; upload()
/// is safe to call concurrently for different parts.
class PartUploader {
public:
    PartUploader(ObjectStore& store,
                 const UploadSession& session,
                 std::filesystem::path file_path,
                 const RetryPolicy& retry,
                 ProgressTracker& progress,
                 UploadMetrics* metrics = nullptr);

    /// Upload one part, retrying transient failures with backoff.
    /// Throws StorageExhaustedError at once on 507, UploadError when the
    /// file cannot be read, or the last error once retries run out.
    PartReceipt upload(const PartTask& task);

private:
    std::vector<uint8_t> read_range(const PartTask& task) const;

    ObjectStore& store_;
    const UploadSession& session_;
    std::filesystem::path file_path_;
    const RetryPolicy& retry_;
    ProgressTracker& progress_;
    UploadMetrics* metrics_;
};

}  // namespace mpupload

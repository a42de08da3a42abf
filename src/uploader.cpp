#include "mpupload/uploader.hpp"
#include "mpupload/completion_reconciler.hpp"
#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"
#include "mpupload/metrics.hpp"
#include "mpupload/part_uploader.hpp"
#include "mpupload/progress.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace mpupload {

double throughput_mb_per_second(uint64_t bytes, double elapsed_seconds) {
    if (elapsed_seconds <= 0) return 0.0;
    return static_cast<double>(bytes) / (1024.0 * 1024.0) / elapsed_seconds;
}

MultipartUploader::MultipartUploader(ObjectStore& store, UploaderOptions options,
                                     UploadMetrics* metrics)
    : store_(store)
    , options_(std::move(options))
    , metrics_(metrics) {
    if (options_.max_workers < 1) options_.max_workers = 1;
}

UploadSession MultipartUploader::open_session(const UploadRequest& request,
                                              const RetryPolicy& retry) {
    UploadSession session;
    session.bucket = request.bucket;
    session.key = request.key;
    session.content_type = request.content_type;
    session.upload_id = retry.with_retry("create_multipart_upload", is_timeout_or_overload, [&] {
        return store_.create_multipart_upload(request.bucket, request.key, request.content_type);
    });
    log_info("Created multipart upload %s for s3://%s/%s", session.upload_id.c_str(),
             session.bucket.c_str(), session.key.c_str());
    return session;
}

std::vector<PartReceipt> MultipartUploader::upload_parts(const UploadRequest& request,
                                                         const UploadSession& session,
                                                         const UploadPlan& plan,
                                                         const RetryPolicy& retry) {
    auto tasks = make_part_tasks(plan);
    std::vector<PartReceipt> receipts(tasks.size());

    ProgressTracker progress(plan.total_parts);
    PartUploader part_uploader(store_, session, request.file_path, retry, progress, metrics_);

    std::atomic<size_t> next_task{0};
    std::atomic<bool> abort{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&] {
        while (!abort.load()) {
            size_t index = next_task.fetch_add(1);
            if (index >= tasks.size()) break;
            try {
                receipts[index] = part_uploader.upload(tasks[index]);
            } catch (const std::exception& e) {
                log_error("Part %u failed: %s", tasks[index].part_number, e.what());
                std::lock_guard lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                abort.store(true);
            }
        }
    };

    size_t worker_count = std::min(static_cast<size_t>(options_.max_workers), tasks.size());
    log_info("Uploading %u parts with %zu workers", plan.total_parts, worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return receipts;
}

void MultipartUploader::verify_part_count(const UploadSession& session, const UploadPlan& plan,
                                          const RetryPolicy& retry) {
    auto recorded = retry.with_retry("list_parts", is_timeout_or_overload, [&] {
        return store_.list_parts(session);
    });
    if (recorded.size() != plan.total_parts) {
        throw IncompleteUploadError("server recorded " + std::to_string(recorded.size()) +
                                    " parts, expected " + std::to_string(plan.total_parts));
    }
    log_info("Server recorded all %u parts", plan.total_parts);
}

void MultipartUploader::verify_object(const UploadSession& session, uint64_t expected_size,
                                      const RetryPolicy& retry) {
    auto meta = retry.with_retry("head_object", is_timeout_or_overload, [&] {
        return store_.head_object(session.bucket, session.key);
    });
    if (meta.content_length != expected_size) {
        throw VerificationError("object size " + std::to_string(meta.content_length) +
                                " does not match local file size " +
                                std::to_string(expected_size));
    }
}

UploadReport MultipartUploader::upload(const UploadRequest& request) {
    auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    auto file_size = std::filesystem::file_size(request.file_path, ec);
    if (ec) {
        throw ConfigError("cannot stat " + request.file_path.string() + ": " + ec.message());
    }

    auto plan = plan_upload(file_size, request.part_size);
    log_info("Uploading %s (%llu bytes) as %u parts of %llu bytes",
             request.file_path.c_str(), static_cast<unsigned long long>(plan.file_size),
             plan.total_parts, static_cast<unsigned long long>(plan.part_size));
    if (metrics_) metrics_->parts_planned().Set(plan.total_parts);

    RetryPolicy retry(options_.max_retries, options_.sleep);
    if (metrics_) {
        retry.set_retry_callback([this](const std::string& description, int) {
            auto op = description.rfind("Part ", 0) == 0 ? std::string("upload_part") : description;
            metrics_->retries(op).Increment();
        });
    }

    UploadSession session;
    try {
        session = open_session(request, retry);
        auto receipts = upload_parts(request, session, plan, retry);
        verify_part_count(session, plan, retry);

        std::sort(receipts.begin(), receipts.end(),
                  [](const PartReceipt& a, const PartReceipt& b) {
                      return a.part_number < b.part_number;
                  });

        CompletionReconciler reconciler(store_, retry, metrics_);
        reconciler.complete(session, receipts,
                            std::chrono::seconds(completion_timeout_seconds(plan.file_size)),
                            plan.file_size);

        verify_object(session, plan.file_size, retry);
    } catch (UploadError& e) {
        if (metrics_) metrics_->uploads_failure().Increment();
        if (!session.upload_id.empty()) {
            e.set_upload_id(session.upload_id);
            log_error("UploadId %s left open for resumption", session.upload_id.c_str());
        }
        throw;
    } catch (...) {
        if (metrics_) metrics_->uploads_failure().Increment();
        if (!session.upload_id.empty()) {
            log_error("UploadId %s left open for resumption", session.upload_id.c_str());
        }
        throw;
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    double mb_per_second = throughput_mb_per_second(plan.file_size, elapsed);

    log_info("Upload complete: %llu bytes in %s (%.2f MB/s)",
             static_cast<unsigned long long>(plan.file_size),
             format_duration(elapsed).c_str(), mb_per_second);

    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_duration_seconds().Set(elapsed);
        metrics_->upload_throughput_mbps().Set(mb_per_second);
    }

    return UploadReport{session.upload_id, plan.file_size, plan.total_parts, elapsed, mb_per_second};
}

}  // namespace mpupload

#include "mpupload/completion_reconciler.hpp"
#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"
#include "mpupload/metrics.hpp"

namespace mpupload {

const char* reconcile_state_name(ReconcileState state) {
    switch (state) {
        case ReconcileState::Attempting: return "attempting";
        case ReconcileState::AwaitingServerState: return "awaiting-server-state";
        case ReconcileState::Reconciled: return "reconciled";
        case ReconcileState::Exhausted: return "exhausted";
    }
    return "unknown";
}

CompletionReconciler::CompletionReconciler(ObjectStore& store, const RetryPolicy& retry,
                                           UploadMetrics* metrics)
    : store_(store)
    , retry_(retry)
    , metrics_(metrics) {}

void CompletionReconciler::transition(const UploadSession& session, ReconcileState next) {
    if (next != state_) {
        log_debug("Upload %s: completion %s -> %s", session.upload_id.c_str(),
                  reconcile_state_name(state_), reconcile_state_name(next));
    }
    state_ = next;
}

bool CompletionReconciler::object_matches(const UploadSession& session, uint64_t expected_size) {
    if (metrics_) metrics_->reconcile_head_checks().Increment();
    try {
        auto meta = retry_.with_retry("head_object", is_timeout_or_overload, [&] {
            return store_.head_object(session.bucket, session.key);
        });
        if (meta.content_length == expected_size) {
            return true;
        }
        log_warn("Completion check: object size %llu, expected %llu",
                 static_cast<unsigned long long>(meta.content_length),
                 static_cast<unsigned long long>(expected_size));
    } catch (const StorageExhaustedError&) {
        throw;
    } catch (const RequestError& e) {
        log_warn("Completion check failed: %s", e.what());
    }
    return false;
}

void CompletionReconciler::complete(const UploadSession& session,
                                    const std::vector<PartReceipt>& sorted_receipts,
                                    std::chrono::seconds initial_timeout,
                                    uint64_t expected_size) {
    const int max_attempts = retry_.max_attempts();
    auto timeout = initial_timeout;
    std::string last_error;

    state_ = ReconcileState::Attempting;
    finalize_calls_ = 0;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        transition(session, ReconcileState::Attempting);
        log_info("Completing upload %s (attempt %d/%d, timeout %llds)",
                 session.upload_id.c_str(), attempt, max_attempts,
                 static_cast<long long>(timeout.count()));

        ++finalize_calls_;
        if (metrics_) metrics_->completion_attempts().Increment();

        bool check_now = false;
        try {
            store_.complete_multipart_upload(session, sorted_receipts,
                                             RequestTimeouts{timeout, timeout});
            transition(session, ReconcileState::Reconciled);
            log_info("Upload %s completed", session.upload_id.c_str());
            return;
        } catch (const StorageExhaustedError& e) {
            log_error("Completion failed, storage exhausted: %s", e.what());
            throw;
        } catch (const RequestError& e) {
            last_error = e.what();
            if (is_timeout_error(e)) {
                log_warn("Completion timed out after %llds, merge may still be running",
                         static_cast<long long>(timeout.count()));
                check_now = true;
            } else if (is_no_such_upload(e)) {
                log_warn("Completion reported NoSuchUpload, upload may already be complete");
                check_now = true;
            } else {
                log_warn("Completion attempt %d failed: %s", attempt, e.what());
            }
        }

        transition(session, ReconcileState::AwaitingServerState);
        if (!check_now) {
            log_info("Waiting %llds before checking object state",
                     static_cast<long long>(timeout.count()));
            retry_.sleep(timeout);
        }

        if (object_matches(session, expected_size)) {
            transition(session, ReconcileState::Reconciled);
            log_info("Object %s has the expected size, upload completed",
                     session.key.c_str());
            return;
        }

        timeout *= 2;
    }

    transition(session, ReconcileState::Exhausted);
    log_error("Completion unresolved after %d attempts: %s", max_attempts, last_error.c_str());
    throw CompletionError("complete_multipart_upload unresolved after " +
                          std::to_string(max_attempts) + " attempts: " + last_error);
}

}  // namespace mpupload

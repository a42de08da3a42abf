#pragma once

#include "mpupload/object_store.hpp"
#include "mpupload/retry.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mpupload {

class UploadMetrics;

enum class ReconcileState {
    Attempting,           // finalize request in flight
    AwaitingServerState,  // finalize failed ambiguously, checking object size
    Reconciled,           // object confirmed complete
    Exhausted             // attempts used up without confirmation
};

const char* reconcile_state_name(ReconcileState state);

/// Finalizes a multipart upload and resolves ambiguous finalize failures.
///
/// A failed CompleteMultipartUpload does not mean the merge failed: the
/// object size is checked with HeadObject before another finalize is issued.
/// The finalize timeout doubles after every unresolved attempt.
class CompletionReconciler {
public:
    CompletionReconciler(ObjectStore& store, const RetryPolicy& retry,
                         UploadMetrics* metrics = nullptr);

    /// Throws CompletionError once max_attempts finalize attempts are
    /// unresolved, StorageExhaustedError at once on 507.
    void complete(const UploadSession& session,
                  const std::vector<PartReceipt>& sorted_receipts,
                  std::chrono::seconds initial_timeout,
                  uint64_t expected_size);

    /// State after the last complete() call.
    ReconcileState state() const { return state_; }

    /// Finalize requests issued by the last complete() call.
    int finalize_calls() const { return finalize_calls_; }

private:
    void transition(const UploadSession& session, ReconcileState next);

    // True when HeadObject reports expected_size.
    bool object_matches(const UploadSession& session, uint64_t expected_size);

    ObjectStore& store_;
    const RetryPolicy& retry_;
    UploadMetrics* metrics_;

    ReconcileState state_ = ReconcileState::Attempting;
    int finalize_calls_ = 0;
};

}  // namespace mpupload

#pragma once

#include "mpupload/constants.hpp"
#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>

namespace mpupload {

// Decides whether a failed attempt should be repeated
using RetryPredicate = std::function<bool(const std::exception&)>;

// Blocks the calling worker; injectable so tests can observe backoff
using SleepFunction = std::function<void(std::chrono::seconds)>;

// Called before each backoff sleep with the description and failed attempt
using RetryCallback = std::function<void(const std::string&, int)>;

// --- Error classifiers ---

bool is_timeout_error(const std::exception& e);
bool is_overload_error(const std::exception& e);       // HTTP 524
bool is_timeout_or_overload(const std::exception& e);
bool is_transient_error(const std::exception& e);      // any TransientNetworkError
bool is_no_such_upload(const std::exception& e);
bool is_storage_exhausted(const std::exception& e);

/// Real sleep on the calling thread.
void sleep_seconds(std::chrono::seconds duration);

/// Exponential backoff shared by every network call of an upload.
///
/// Attempt n (1-based) that fails with a retryable error is followed by a
/// sleep of 2^n seconds; the error of the final attempt is rethrown as-is.
/// Storage exhaustion is never retried, whatever the predicate says.
class RetryPolicy {
public:
    explicit RetryPolicy(int max_attempts, SleepFunction sleep = sleep_seconds)
        : max_attempts_(max_attempts < 1 ? 1 : max_attempts)
        , sleep_(std::move(sleep)) {}

    int max_attempts() const { return max_attempts_; }

    void set_retry_callback(RetryCallback callback) { on_retry_ = std::move(callback); }

    void sleep(std::chrono::seconds duration) const {
        if (sleep_) sleep_(duration);
    }

    static std::chrono::seconds backoff_for(int attempt) {
        int exponent = std::clamp(attempt, 0, constants::MAX_BACKOFF_EXPONENT);
        return std::chrono::seconds(1LL << exponent);
    }

    template <typename Fn>
    auto with_retry(const std::string& description,
                    const RetryPredicate& is_retryable,
                    Fn&& operation) const -> decltype(operation()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const StorageExhaustedError& e) {
                log_error("%s: storage exhausted, aborting without retry: %s",
                          description.c_str(), e.what());
                throw;
            } catch (const std::exception& e) {
                if (!is_retryable(e)) {
                    throw;
                }
                log_warn("%s: attempt %d failed: %s", description.c_str(), attempt, e.what());
                if (attempt >= max_attempts_) {
                    log_error("%s: exceeded max_retries (%d)", description.c_str(), max_attempts_);
                    throw;
                }
                auto backoff = backoff_for(attempt);
                log_info("%s: retrying in %llds...", description.c_str(),
                         static_cast<long long>(backoff.count()));
                if (on_retry_) on_retry_(description, attempt);
                sleep(backoff);
            }
        }
    }

private:
    int max_attempts_;
    SleepFunction sleep_;
    RetryCallback on_retry_;
};

}  // namespace mpupload

#pragma once

// In-memory ObjectStore for driving the upload core through scripted
// success and failure sequences. Thread-safe.

#include "mpupload/errors.hpp"
#include "mpupload/object_store.hpp"
#include "mpupload/retry.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mpupload::testing {

// --- Error factories ---

inline std::exception_ptr timeout_error(const std::string& op) {
    return std::make_exception_ptr(TransientNetworkError(
        op, RequestError::Kind::Timeout, 0, "", "Operation timed out"));
}

inline std::exception_ptr overload_error(const std::string& op, int status = 503) {
    return std::make_exception_ptr(TransientNetworkError(
        op, RequestError::Kind::Http, status, "SlowDown", "Please reduce your request rate"));
}

inline std::exception_ptr storage_full_error(const std::string& op) {
    return std::make_exception_ptr(StorageExhaustedError(
        op + ": server reported insufficient storage (HTTP 507)"));
}

inline std::exception_ptr no_such_upload_error(const std::string& op) {
    return std::make_exception_ptr(RequestError(
        op, RequestError::Kind::Http, 404, "NoSuchUpload", "The specified upload does not exist"));
}

inline std::exception_ptr access_denied_error(const std::string& op) {
    return std::make_exception_ptr(RequestError(
        op, RequestError::Kind::Http, 403, "AccessDenied", "Access Denied"));
}

class FakeObjectStore : public ObjectStore {
public:
    // Scripted outcome of one CompleteMultipartUpload call. When applied is
    // true the object is materialized even though the call fails, as when
    // the merge finishes server-side after the client gave up.
    struct CompleteOutcome {
        std::exception_ptr error;
        bool applied = false;
    };

    std::string type_name() const override { return "fake"; }

    // --- Scripting ---

    void fail_next_create(std::exception_ptr e) {
        std::lock_guard lock(mutex_);
        create_failures_.push_back(std::move(e));
    }

    // Fail the next upload of part_number (queued, one per call)
    void fail_part(uint32_t part_number, std::exception_ptr e) {
        std::lock_guard lock(mutex_);
        part_failures_[part_number].push_back(std::move(e));
    }

    // Fail every upload of part_number
    void always_fail_part(uint32_t part_number, std::exception_ptr e) {
        std::lock_guard lock(mutex_);
        permanent_part_failures_[part_number] = std::move(e);
    }

    void script_complete(CompleteOutcome outcome) {
        std::lock_guard lock(mutex_);
        complete_outcomes_.push_back(std::move(outcome));
    }

    void fail_next_head(std::exception_ptr e) {
        std::lock_guard lock(mutex_);
        head_failures_.push_back(std::move(e));
    }

    // ListParts omits this part even though it was uploaded
    void hide_part_from_listing(uint32_t part_number) {
        std::lock_guard lock(mutex_);
        hidden_parts_.insert(part_number);
    }

    // HeadObject reports the real size plus this delta
    void set_head_size_delta(int64_t delta) {
        std::lock_guard lock(mutex_);
        head_size_delta_ = delta;
    }

    // --- ObjectStore ---

    std::string create_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const std::optional<std::string>& content_type) override {
        std::lock_guard lock(mutex_);
        ++create_calls_;
        if (!create_failures_.empty()) {
            auto e = create_failures_.front();
            create_failures_.pop_front();
            std::rethrow_exception(e);
        }
        bucket_ = bucket;
        key_ = key;
        content_type_ = content_type;
        return "fake-upload-" + std::to_string(create_calls_);
    }

    std::string upload_part(const UploadSession& session,
                            uint32_t part_number,
                            std::vector<uint8_t>&& body) override {
        std::lock_guard lock(mutex_);
        ++upload_calls_;
        attempted_parts_.push_back(part_number);
        if (auto it = permanent_part_failures_.find(part_number);
            it != permanent_part_failures_.end()) {
            std::rethrow_exception(it->second);
        }
        if (auto it = part_failures_.find(part_number);
            it != part_failures_.end() && !it->second.empty()) {
            auto e = it->second.front();
            it->second.pop_front();
            std::rethrow_exception(e);
        }
        if (session.upload_id.empty()) {
            std::rethrow_exception(no_such_upload_error("upload_part"));
        }
        parts_[part_number] = std::move(body);
        return "\"etag-" + std::to_string(part_number) + "\"";
    }

    std::vector<RecordedPart> list_parts(const UploadSession&) override {
        std::lock_guard lock(mutex_);
        ++list_calls_;
        std::vector<RecordedPart> result;
        for (const auto& [number, data] : parts_) {
            if (hidden_parts_.count(number)) continue;
            result.push_back({number, "\"etag-" + std::to_string(number) + "\"", data.size()});
        }
        return result;
    }

    void complete_multipart_upload(const UploadSession&,
                                   const std::vector<PartReceipt>& parts,
                                   const RequestTimeouts& timeouts) override {
        std::lock_guard lock(mutex_);
        ++complete_calls_;
        complete_timeouts_.push_back(timeouts.read);
        completed_receipts_ = parts;

        CompleteOutcome outcome;
        if (!complete_outcomes_.empty()) {
            outcome = complete_outcomes_.front();
            complete_outcomes_.pop_front();
        } else {
            outcome.applied = true;
        }
        if (outcome.applied) {
            materialize();
        }
        if (outcome.error) {
            std::rethrow_exception(outcome.error);
        }
    }

    ObjectMetadata head_object(const std::string&, const std::string&) override {
        std::lock_guard lock(mutex_);
        ++head_calls_;
        if (!head_failures_.empty()) {
            auto e = head_failures_.front();
            head_failures_.pop_front();
            std::rethrow_exception(e);
        }
        if (!object_) {
            throw RequestError("head_object", RequestError::Kind::Http, 404, "NotFound", "");
        }
        ObjectMetadata meta;
        meta.content_length = static_cast<uint64_t>(
            static_cast<int64_t>(object_->size()) + head_size_delta_);
        meta.etag = "\"fake-etag\"";
        return meta;
    }

    // --- Inspection ---

    int create_calls() const { std::lock_guard lock(mutex_); return create_calls_; }
    int upload_calls() const { std::lock_guard lock(mutex_); return upload_calls_; }
    int list_calls() const { std::lock_guard lock(mutex_); return list_calls_; }
    int complete_calls() const { std::lock_guard lock(mutex_); return complete_calls_; }
    int head_calls() const { std::lock_guard lock(mutex_); return head_calls_; }

    std::vector<uint32_t> attempted_parts() const {
        std::lock_guard lock(mutex_);
        return attempted_parts_;
    }

    std::vector<std::chrono::seconds> complete_timeouts() const {
        std::lock_guard lock(mutex_);
        return complete_timeouts_;
    }

    std::vector<PartReceipt> completed_receipts() const {
        std::lock_guard lock(mutex_);
        return completed_receipts_;
    }

    // Bytes received for one part, if it was uploaded
    std::optional<std::vector<uint8_t>> part_bytes(uint32_t part_number) const {
        std::lock_guard lock(mutex_);
        auto it = parts_.find(part_number);
        if (it == parts_.end()) return std::nullopt;
        return it->second;
    }

    // Object bytes after a successful finalize
    std::optional<std::vector<uint8_t>> object() const {
        std::lock_guard lock(mutex_);
        return object_;
    }

    // Seed an already-complete object (e.g. finalized by an earlier attempt)
    void put_object(std::vector<uint8_t> data) {
        std::lock_guard lock(mutex_);
        object_ = std::move(data);
    }

    std::optional<std::string> content_type() const {
        std::lock_guard lock(mutex_);
        return content_type_;
    }

private:
    void materialize() {
        std::vector<uint8_t> data;
        for (const auto& [number, bytes] : parts_) {
            data.insert(data.end(), bytes.begin(), bytes.end());
        }
        object_ = std::move(data);
    }

    mutable std::mutex mutex_;

    std::deque<std::exception_ptr> create_failures_;
    std::map<uint32_t, std::deque<std::exception_ptr>> part_failures_;
    std::map<uint32_t, std::exception_ptr> permanent_part_failures_;
    std::deque<CompleteOutcome> complete_outcomes_;
    std::deque<std::exception_ptr> head_failures_;
    std::set<uint32_t> hidden_parts_;
    int64_t head_size_delta_ = 0;

    std::string bucket_;
    std::string key_;
    std::optional<std::string> content_type_;
    std::map<uint32_t, std::vector<uint8_t>> parts_;
    std::optional<std::vector<uint8_t>> object_;

    int create_calls_ = 0;
    int upload_calls_ = 0;
    int list_calls_ = 0;
    int complete_calls_ = 0;
    int head_calls_ = 0;
    std::vector<uint32_t> attempted_parts_;
    std::vector<std::chrono::seconds> complete_timeouts_;
    std::vector<PartReceipt> completed_receipts_;
};

// Holds each part for longer the lower its number, so with one worker per
// part the last part finishes first and part 1 finishes last.
class SlowLowPartsStore : public FakeObjectStore {
public:
    SlowLowPartsStore(uint32_t total_parts, std::chrono::milliseconds step)
        : total_parts_(total_parts), step_(step) {}

    std::string upload_part(const UploadSession& session,
                            uint32_t part_number,
                            std::vector<uint8_t>&& body) override {
        std::this_thread::sleep_for(step_ * (total_parts_ + 1 - part_number));
        auto etag = FakeObjectStore::upload_part(session, part_number, std::move(body));
        std::lock_guard lock(order_mutex_);
        finish_order_.push_back(part_number);
        return etag;
    }

    std::vector<uint32_t> finish_order() const {
        std::lock_guard lock(order_mutex_);
        return finish_order_;
    }

private:
    uint32_t total_parts_;
    std::chrono::milliseconds step_;
    mutable std::mutex order_mutex_;
    std::vector<uint32_t> finish_order_;
};

// Records backoff sleeps instead of blocking
class SleepRecorder {
public:
    SleepFunction function() {
        return [this](std::chrono::seconds d) {
            std::lock_guard lock(mutex_);
            sleeps_.push_back(d.count());
        };
    }

    std::vector<long long> sleeps() const {
        std::lock_guard lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<long long> sleeps_;
};

}  // namespace mpupload::testing

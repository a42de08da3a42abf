#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace mpupload {

struct ProgressSnapshot {
    uint32_t completed = 0;
    uint32_t total = 0;
    double percent = 0.0;
    double eta_seconds = 0.0;  // rough linear extrapolation
};

/// Parts-completed counter shared by all upload workers of one upload.
///
/// The ETA extrapolates elapsed time from the number of completed parts,
/// not from the number of the part that just finished, so it stays sane
/// when parts complete out of order.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(uint32_t total_parts, Clock::time_point start = Clock::now())
        : total_(total_parts), start_(start) {}

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /// Count one more finished part and return the state right after it.
    ProgressSnapshot record_part_complete(Clock::time_point now = Clock::now());

    uint32_t completed() const;
    uint32_t total() const { return total_; }

private:
    const uint32_t total_;
    const Clock::time_point start_;

    mutable std::mutex mutex_;
    uint32_t completed_ = 0;
};

}  // namespace mpupload

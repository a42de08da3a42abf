#include "mpupload/progress.hpp"

#include <algorithm>

namespace mpupload {

ProgressSnapshot ProgressTracker::record_part_complete(Clock::time_point now) {
    ProgressSnapshot snap;
    {
        std::lock_guard lock(mutex_);
        ++completed_;
        snap.completed = completed_;
    }
    snap.total = total_;
    if (total_ == 0) return snap;

    snap.percent = 100.0 * snap.completed / total_;

    double elapsed = std::chrono::duration<double>(now - start_).count();
    double fraction = static_cast<double>(snap.completed) / total_;
    snap.eta_seconds = std::max(0.0, elapsed * (1.0 / fraction - 1.0));
    return snap;
}

uint32_t ProgressTracker::completed() const {
    std::lock_guard lock(mutex_);
    return completed_;
}

}  // namespace mpupload

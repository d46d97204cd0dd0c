#include "ferry/transfer/progress.hpp"

#include <algorithm>
#include <cmath>

namespace ferry::transfer {

ProgressTracker::ProgressTracker(std::uint64_t total_bytes, std::uint32_t total_files, core::Clock clock)
    : clock_(std::move(clock)) {
    progress_.total_bytes = total_bytes;
    progress_.total_files = total_files;
    started_at_ = clock_();
    progress_.last_update = started_at_;
    samples_.emplace_back(started_at_, 0);
}

void ProgressTracker::add_bytes(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    progress_.bytes_transferred = std::min(progress_.total_bytes, progress_.bytes_transferred + bytes);
    record(clock_());
}

void ProgressTracker::set_bytes(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    progress_.bytes_transferred = std::min(progress_.total_bytes, bytes);
    // Bytes the peer already had do not count towards speed.
    baseline_bytes_ = progress_.bytes_transferred;
    started_at_ = clock_();
    samples_.clear();
    samples_.emplace_back(started_at_, progress_.bytes_transferred);
    progress_.last_update = started_at_;
}

void ProgressTracker::file_completed() {
    std::lock_guard lock(mutex_);
    progress_.files_completed = std::min(progress_.total_files, progress_.files_completed + 1);
    progress_.last_update = clock_();
}

void ProgressTracker::set_files_completed(std::uint32_t files) {
    std::lock_guard lock(mutex_);
    progress_.files_completed = std::min(progress_.total_files, files);
}

void ProgressTracker::record(core::TimePoint now) {
    samples_.emplace_back(now, progress_.bytes_transferred);
    while (samples_.size() > kSpeedSamples) {
        samples_.pop_front();
    }

    const auto& first = samples_.front();
    const double window = std::chrono::duration<double>(now - first.first).count();
    if (window > 0.0) {
        progress_.current_speed = static_cast<double>(progress_.bytes_transferred - first.second) / window;
    }

    const double elapsed = std::chrono::duration<double>(now - started_at_).count();
    if (elapsed > 0.0) {
        progress_.average_speed = static_cast<double>(progress_.bytes_transferred - baseline_bytes_) / elapsed;
    }

    const std::uint64_t remaining = progress_.total_bytes - progress_.bytes_transferred;
    if (remaining == 0) {
        progress_.eta_seconds = 0;
    } else if (progress_.current_speed > 0.0) {
        progress_.eta_seconds = static_cast<std::uint64_t>(
            std::ceil(static_cast<double>(remaining) / progress_.current_speed));
    } else {
        progress_.eta_seconds.reset();
    }
    progress_.last_update = now;
}

TransferProgress ProgressTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    return progress_;
}

} // namespace ferry::transfer

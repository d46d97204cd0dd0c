#include "ferry/transfer/bandwidth.hpp"

#include <algorithm>

namespace ferry::transfer {

BandwidthController::BandwidthController(std::optional<std::uint64_t> bytes_per_second,
                                         std::chrono::milliseconds refill_interval)
    : limit_(bytes_per_second),
      refill_interval_(refill_interval.count() > 0 ? refill_interval : std::chrono::milliseconds{100}),
      last_refill_(std::chrono::steady_clock::now()) {
    if (limit_ && *limit_ == 0) {
        limit_.reset();
    }
    tokens_ = capacity();
}

double BandwidthController::capacity() const {
    if (!limit_) {
        return 0.0;
    }
    return static_cast<double>(*limit_) * std::chrono::duration<double>(refill_interval_).count();
}

void BandwidthController::refill(std::chrono::steady_clock::time_point now) {
    if (!limit_) {
        last_refill_ = now;
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(tokens_ + elapsed * static_cast<double>(*limit_), capacity());
        last_refill_ = now;
    }
}

ferry::Result<void> BandwidthController::acquire(std::uint64_t bytes) {
    std::unique_lock lock(mutex_);
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        if (interrupted_) {
            return ferry::Err<void>(ferry::Error::cancelled("bandwidth wait interrupted"));
        }
        if (!limit_) {
            break;
        }

        refill(std::chrono::steady_clock::now());
        const double needed = std::min(static_cast<double>(bytes), capacity());
        if (tokens_ >= needed) {
            break;
        }

        const double seconds = (needed - tokens_) / static_cast<double>(*limit_);
        const auto wait = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::duration<double>(seconds));
        cv_.wait_for(lock, std::max(wait, std::chrono::microseconds{100}));
    }

    if (limit_) {
        tokens_ -= static_cast<double>(bytes);
    }
    bytes_granted_ += bytes;
    wait_ms_ += static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    return ferry::Ok();
}

void BandwidthController::set_limit(std::optional<std::uint64_t> bytes_per_second) {
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        refill(now);
        limit_ = (bytes_per_second && *bytes_per_second == 0) ? std::nullopt : bytes_per_second;
        if (limit_) {
            tokens_ = std::min(tokens_, capacity());
        } else {
            tokens_ = 0.0;
        }
        last_refill_ = now;
    }
    cv_.notify_all();
}

std::optional<std::uint64_t> BandwidthController::limit() const {
    std::lock_guard lock(mutex_);
    return limit_;
}

void BandwidthController::interrupt() {
    {
        std::lock_guard lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

void BandwidthController::clear_interrupt() {
    std::lock_guard lock(mutex_);
    interrupted_ = false;
}

} // namespace ferry::transfer

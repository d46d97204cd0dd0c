#pragma once

#include "ferry/core/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace ferry::transfer {

/**
 * @brief Token bucket shared by every stream of one session
 *
 * The bucket holds at most one refill interval's worth of bytes, so the
 * burst above the configured rate is bounded by limit * refill_interval.
 * A request larger than the bucket is granted as soon as the bucket is
 * full and leaves it in debt, which later requests pay back.
 *
 * No limit means acquire() never waits.
 */
class BandwidthController {
public:
    explicit BandwidthController(std::optional<std::uint64_t> bytes_per_second = std::nullopt,
                                 std::chrono::milliseconds refill_interval = std::chrono::milliseconds{100});

    BandwidthController(const BandwidthController&) = delete;
    BandwidthController& operator=(const BandwidthController&) = delete;

    /// Blocks until `bytes` may be sent; Cancelled error once interrupt() was called.
    ferry::Result<void> acquire(std::uint64_t bytes);

    /// Takes effect for the next acquisition; waiters re-evaluate immediately.
    void set_limit(std::optional<std::uint64_t> bytes_per_second);
    std::optional<std::uint64_t> limit() const;

    /// Wakes every waiter with a Cancelled error; used for cooperative cancel.
    void interrupt();
    void clear_interrupt();

    [[nodiscard]] std::uint64_t bytes_granted() const noexcept { return bytes_granted_.load(); }
    [[nodiscard]] std::chrono::milliseconds total_wait() const noexcept {
        return std::chrono::milliseconds{wait_ms_.load()};
    }

private:
    void refill(std::chrono::steady_clock::time_point now);
    double capacity() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::uint64_t> limit_;
    std::chrono::milliseconds refill_interval_;
    double tokens_ = 0.0;
    std::chrono::steady_clock::time_point last_refill_;
    bool interrupted_ = false;

    std::atomic<std::uint64_t> bytes_granted_{0};
    std::atomic<std::uint64_t> wait_ms_{0};
};

} // namespace ferry::transfer

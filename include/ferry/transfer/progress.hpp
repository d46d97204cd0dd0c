#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/transfer/types.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace ferry::transfer {

/**
 * @brief Running TransferProgress for one session
 *
 * Current speed is measured over the last kSpeedSamples acknowledgments;
 * ETA is derived from it. Thread-safe.
 */
class ProgressTracker {
public:
    static constexpr std::size_t kSpeedSamples = 10;

    ProgressTracker(std::uint64_t total_bytes, std::uint32_t total_files,
                    core::Clock clock = core::system_clock());

    void add_bytes(std::uint64_t bytes);

    /// Replaces the byte count, e.g. after the peer reported what it already holds.
    void set_bytes(std::uint64_t bytes);

    void file_completed();
    void set_files_completed(std::uint32_t files);

    TransferProgress snapshot() const;

private:
    void record(core::TimePoint now);

    mutable std::mutex mutex_;
    core::Clock clock_;
    TransferProgress progress_;
    core::TimePoint started_at_;
    std::uint64_t baseline_bytes_ = 0;  ///< bytes already present when tracking started
    std::deque<std::pair<core::TimePoint, std::uint64_t>> samples_;
};

} // namespace ferry::transfer

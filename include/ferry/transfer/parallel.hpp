#pragma once

#include "ferry/transfer/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace ferry::transfer {

/// A run of consecutive chunks of one file that a single stream sends.
struct WorkUnit {
    std::uint32_t file_index = 0;
    std::uint64_t first_sequence = 0;
    std::uint64_t chunk_count = 0;
    std::uint64_t bytes = 0;

    bool operator==(const WorkUnit& other) const noexcept {
        return file_index == other.file_index && first_sequence == other.first_sequence &&
               chunk_count == other.chunk_count;
    }
};

struct StreamStats {
    std::uint64_t outstanding_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t units_completed = 0;
};

/**
 * @brief Spreads one transfer's chunks over up to kMaxParallelStreams streams
 *
 * Small files travel whole on one stream; larger files are cut into
 * single-chunk units so several streams can share them. Streams pull the
 * next unit when they go idle, which hands work to whichever stream has the
 * fewest outstanding bytes. Units returned with requeue() go to the front.
 *
 * Thread-safe.
 */
class ParallelStreamManager {
public:
    explicit ParallelStreamManager(std::size_t streams);

    /// Units for every file with a start position; nullopt skips the file.
    static std::vector<WorkUnit> plan(const TransferManifest& manifest,
                                      const std::vector<std::optional<std::uint64_t>>& start_chunks,
                                      std::uint64_t small_file_threshold);

    /// Units covering one file from chunk 0, used to resend a corrupt file.
    static std::vector<WorkUnit> plan_file(const TransferManifest& manifest, std::uint32_t file_index,
                                           std::uint64_t small_file_threshold);

    /// Static greedy distribution: each unit goes to the least-loaded stream.
    static std::vector<std::vector<WorkUnit>> assign(const std::vector<WorkUnit>& units, std::size_t streams);

    void load(std::vector<WorkUnit> units);

    /**
     * @brief Next unit for `stream`
     *
     * Blocks while the queue is empty but other streams still hold units
     * that may come back. Returns nullopt when all work is done or after
     * close().
     */
    std::optional<WorkUnit> next(std::size_t stream);

    void complete(std::size_t stream, const WorkUnit& unit, std::uint64_t bytes_sent);
    void requeue(std::size_t stream, const WorkUnit& unit);

    void close();

    [[nodiscard]] bool drained() const;
    [[nodiscard]] std::size_t stream_count() const noexcept { return stats_.size(); }
    [[nodiscard]] std::uint64_t bytes_transferred() const;
    [[nodiscard]] std::vector<StreamStats> stats() const;

private:
    void release(std::size_t stream, const WorkUnit& unit);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkUnit> pending_;
    std::vector<StreamStats> stats_;
    std::size_t in_flight_ = 0;
    bool closed_ = false;
};

} // namespace ferry::transfer

#include "ferry/transfer/parallel.hpp"

#include "ferry/transfer/chunk_engine.hpp"

#include <algorithm>

namespace ferry::transfer {

ParallelStreamManager::ParallelStreamManager(std::size_t streams)
    : stats_(std::clamp<std::size_t>(streams, 1, kMaxParallelStreams)) {}

std::vector<WorkUnit> ParallelStreamManager::plan(const TransferManifest& manifest,
                                                  const std::vector<std::optional<std::uint64_t>>& start_chunks,
                                                  std::uint64_t small_file_threshold) {
    std::vector<WorkUnit> units;
    for (std::uint32_t index = 0; index < manifest.files.size(); ++index) {
        if (index >= start_chunks.size() || !start_chunks[index]) {
            continue;
        }
        const auto& file = manifest.files[index];
        const std::uint64_t start = *start_chunks[index];
        if (start >= file.chunk_count) {
            continue;
        }

        if (start == 0 && file.size <= small_file_threshold) {
            units.push_back(WorkUnit{index, 0, file.chunk_count, file.size});
            continue;
        }
        for (std::uint64_t seq = start; seq < file.chunk_count; ++seq) {
            units.push_back(WorkUnit{index, seq, 1, chunk_length(file.size, seq)});
        }
    }
    return units;
}

std::vector<WorkUnit> ParallelStreamManager::plan_file(const TransferManifest& manifest, std::uint32_t file_index,
                                                       std::uint64_t small_file_threshold) {
    std::vector<std::optional<std::uint64_t>> starts(manifest.files.size());
    if (file_index < starts.size()) {
        starts[file_index] = 0;
    }
    return plan(manifest, starts, small_file_threshold);
}

std::vector<std::vector<WorkUnit>> ParallelStreamManager::assign(const std::vector<WorkUnit>& units,
                                                                 std::size_t streams) {
    const std::size_t count = std::clamp<std::size_t>(streams, 1, kMaxParallelStreams);
    std::vector<std::vector<WorkUnit>> lanes(count);
    std::vector<std::uint64_t> load(count, 0);

    for (const auto& unit : units) {
        const auto lightest = static_cast<std::size_t>(
            std::min_element(load.begin(), load.end()) - load.begin());
        lanes[lightest].push_back(unit);
        load[lightest] += unit.bytes;
    }
    return lanes;
}

void ParallelStreamManager::load(std::vector<WorkUnit> units) {
    {
        std::lock_guard lock(mutex_);
        for (auto& unit : units) {
            pending_.push_back(unit);
        }
    }
    cv_.notify_all();
}

std::optional<WorkUnit> ParallelStreamManager::next(std::size_t stream) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !pending_.empty() || in_flight_ == 0; });
    if (closed_ || pending_.empty()) {
        return std::nullopt;
    }

    WorkUnit unit = pending_.front();
    pending_.pop_front();
    stats_.at(stream).outstanding_bytes += unit.bytes;
    ++in_flight_;
    return unit;
}

void ParallelStreamManager::release(std::size_t stream, const WorkUnit& unit) {
    auto& stat = stats_.at(stream);
    stat.outstanding_bytes -= std::min(stat.outstanding_bytes, unit.bytes);
    if (in_flight_ > 0) {
        --in_flight_;
    }
}

void ParallelStreamManager::complete(std::size_t stream, const WorkUnit& unit, std::uint64_t bytes_sent) {
    {
        std::lock_guard lock(mutex_);
        release(stream, unit);
        stats_.at(stream).bytes_transferred += bytes_sent;
        ++stats_.at(stream).units_completed;
    }
    cv_.notify_all();
}

void ParallelStreamManager::requeue(std::size_t stream, const WorkUnit& unit) {
    {
        std::lock_guard lock(mutex_);
        release(stream, unit);
        pending_.push_front(unit);
    }
    cv_.notify_all();
}

void ParallelStreamManager::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ParallelStreamManager::drained() const {
    std::lock_guard lock(mutex_);
    return pending_.empty() && in_flight_ == 0;
}

std::uint64_t ParallelStreamManager::bytes_transferred() const {
    std::lock_guard lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& stat : stats_) {
        total += stat.bytes_transferred;
    }
    return total;
}

std::vector<StreamStats> ParallelStreamManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace ferry::transfer

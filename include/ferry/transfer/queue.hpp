#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/engine.hpp"
#include "ferry/transfer/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ferry::transfer {

/// One JSON document per item under <state_dir>/queue/.
class QueueStore {
public:
    explicit QueueStore(std::filesystem::path state_dir);

    ferry::Result<void> save(const QueueItem& item);
    ferry::Result<void> remove(const std::string& queue_id);

    /// Unreadable documents are logged and skipped.
    ferry::Result<std::vector<QueueItem>> load_all() const;

    [[nodiscard]] std::filesystem::path path_for(const std::string& queue_id) const;

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

/**
 * @brief Priority queue of transfer requests feeding the engine
 *
 * Items are ordered Urgent > High > Normal > Low, FIFO within a priority.
 * A scheduler thread admits the head of the queue while fewer than
 * max_concurrent_transfers sessions run and, when a total bandwidth budget
 * is configured, while each session would still get at least
 * min_bandwidth_per_transfer. Every admitted session gets an equal share of
 * the budget; shares are recomputed whenever a session starts or ends.
 *
 * Every change is persisted. start() replays pending and paused items
 * left by a previous run; items that were running are queued again.
 */
class QueueManager {
public:
    explicit QueueManager(TransferEngine& engine, core::Clock clock = core::system_clock());
    ~QueueManager();

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    /// Loads persisted items and starts the scheduler.
    ferry::Result<void> start();
    void stop();

    ferry::Result<std::string> enqueue(TransferRequest request, Priority priority = Priority::Normal);

    /**
     * @brief Moves a pending item to `new_position` in admission order
     *
     * The item takes the priority of its new successor (or predecessor when
     * moved to the end) so the priority order still holds.
     */
    ferry::Result<void> reorder(const std::string& queue_id, std::size_t new_position);
    ferry::Result<void> change_priority(const std::string& queue_id, Priority priority);
    ferry::Result<void> pause(const std::string& queue_id);
    ferry::Result<void> resume(const std::string& queue_id);
    ferry::Result<void> cancel(const std::string& queue_id);
    ferry::Result<QueueItem> status(const std::string& queue_id) const;

    std::vector<QueueItem> items() const;
    /// Pending items in admission order.
    std::vector<QueueItem> pending() const;
    std::optional<QueueItem> next() const;
    std::size_t active_count() const;

    /// Drops failed items; returns how many were removed.
    std::size_t clear_finished();

    void set_total_bandwidth(std::optional<std::uint64_t> bytes_per_second);
    [[nodiscard]] std::optional<std::uint64_t> bandwidth_share() const;

    /// One admission pass; returns the number of sessions started.
    std::size_t schedule_once();

private:
    struct Admission {
        QueueItem item;
        std::optional<std::uint64_t> share;
    };

    std::optional<Admission> admit_next();
    void attach_session(const std::string& queue_id, ferry::Result<std::shared_ptr<TransferSession>> session);
    void on_session_state(const std::string& session_id, TransferState state, const std::optional<Error>& error);
    void finish_item(QueueItem& item, TransferState state, const std::optional<Error>& error);
    void rebalance_bandwidth();
    void scheduler_loop();
    void wake();

    std::vector<QueueItem*> pending_locked();
    std::size_t active_locked() const;
    void refresh_estimates_locked();
    void persist_locked(const QueueItem& item);
    void announce(const QueueItem& item);
    ferry::Result<QueueItem*> find_locked(const std::string& queue_id);

    TransferEngine& engine_;
    core::Clock clock_;
    QueueStore store_;
    std::uint32_t max_concurrent_;
    std::uint64_t min_bandwidth_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::map<std::string, QueueItem> items_;
    std::map<std::string, core::TimePoint> admitted_at_;
    std::optional<std::uint64_t> total_bandwidth_;
    std::uint64_t next_sequence_ = 0;
    std::chrono::seconds average_duration_{300};
    std::uint32_t finished_count_ = 0;
    bool wake_pending_ = false;
    bool running_ = false;
    bool stopping_ = false;
    std::thread scheduler_;
    std::size_t subscription_ = 0;
};

} // namespace ferry::transfer

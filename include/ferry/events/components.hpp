/**
 * @file components.hpp
 * @brief Event-driven observers shipped with the engine
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every engine event is now logged and counted
 */

#pragma once

#include "ferry/events/event_bus.hpp"
#include "ferry/events/events.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace ferry::events {

/**
 * @brief Logs every engine event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts transfers, files, bytes and recovery actions
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> transfers_cancelled{0};
        std::atomic<uint64_t> files_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> files_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> chunks_retransmitted{0};
        std::atomic<uint64_t> transport_fallbacks{0};
        std::atomic<uint64_t> checkpoints{0};
        std::atomic<uint64_t> incoming_rejected{0};
    };

    explicit MetricsComponent(EventBus& bus);
    ~MetricsComponent();

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

    void print_stats() const;

private:
    EventBus& bus_;
    Stats stats_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace ferry::events

#pragma once

#include "ferry/events/event_bus.hpp"
#include "ferry/events/event_queue.hpp"
#include "ferry/events/events.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace ferry::events {

using StreamEvent = std::variant<TransferStateChangedEvent, TransferProgressEvent, FileCompletedEvent,
                                 FileFailedEvent>;

/**
 * @brief Pull-based view of the event bus
 *
 * Buffers state changes, progress snapshots and per-file outcomes until the
 * caller polls them. An optional session filter restricts the stream to one
 * session.
 */
class EventStream {
public:
    explicit EventStream(EventBus& bus, std::optional<std::string> session_id = std::nullopt,
                         bool include_progress = true);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Blocks up to `timeout`; nullopt on timeout or after close() once drained.
    std::optional<StreamEvent> next(std::chrono::milliseconds timeout);
    std::optional<StreamEvent> try_next();

    void close();

    [[nodiscard]] size_t pending() const { return queue_.size(); }

private:
    bool wanted(const std::string& session_id) const;

    EventBus& bus_;
    std::optional<std::string> session_id_;
    ThreadSafeQueue<StreamEvent> queue_;

    size_t state_sub_ = 0;
    std::optional<size_t> progress_sub_;
    size_t completed_sub_ = 0;
    size_t failed_sub_ = 0;
};

} // namespace ferry::events

#include "ferry/events/event_stream.hpp"

namespace ferry::events {

EventStream::EventStream(EventBus& bus, std::optional<std::string> session_id, bool include_progress)
    : bus_(bus), session_id_(std::move(session_id)) {
    state_sub_ = bus_.subscribe<TransferStateChangedEvent>([this](const TransferStateChangedEvent& e) {
        if (wanted(e.session_id)) {
            queue_.push(e);
        }
    });
    if (include_progress) {
        progress_sub_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            if (wanted(e.session_id)) {
                queue_.push(e);
            }
        });
    }
    completed_sub_ = bus_.subscribe<FileCompletedEvent>([this](const FileCompletedEvent& e) {
        if (wanted(e.session_id)) {
            queue_.push(e);
        }
    });
    failed_sub_ = bus_.subscribe<FileFailedEvent>([this](const FileFailedEvent& e) {
        if (wanted(e.session_id)) {
            queue_.push(e);
        }
    });
}

EventStream::~EventStream() {
    bus_.unsubscribe<TransferStateChangedEvent>(state_sub_);
    if (progress_sub_) {
        bus_.unsubscribe<TransferProgressEvent>(*progress_sub_);
    }
    bus_.unsubscribe<FileCompletedEvent>(completed_sub_);
    bus_.unsubscribe<FileFailedEvent>(failed_sub_);
    queue_.shutdown();
}

bool EventStream::wanted(const std::string& session_id) const {
    return !session_id_ || *session_id_ == session_id;
}

std::optional<StreamEvent> EventStream::next(std::chrono::milliseconds timeout) {
    return queue_.pop_for(timeout);
}

std::optional<StreamEvent> EventStream::try_next() {
    return queue_.try_pop();
}

void EventStream::close() {
    queue_.shutdown();
}

} // namespace ferry::events

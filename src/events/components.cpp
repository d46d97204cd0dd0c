#include "ferry/events/components.hpp"

#include <spdlog/spdlog.h>

namespace ferry::events {
namespace {

template<typename EventType, typename Handler>
void track(EventBus& bus, std::vector<std::function<void()>>& unsubscribers, Handler handler) {
    auto id = bus.subscribe<EventType>(std::function<void(const EventType&)>(std::move(handler)));
    unsubscribers.push_back([&bus, id] { bus.unsubscribe<EventType>(id); });
}

} // namespace

LoggerComponent::LoggerComponent(EventBus& bus) : bus_(bus) {
    track<TransferStateChangedEvent>(bus_, unsubscribers_, [](const TransferStateChangedEvent& e) {
        if (e.error) {
            spdlog::error("[StateChanged] session={} transfer={} {} -> {} error={}", e.session_id, e.transfer_id,
                          transfer::to_string(e.from), transfer::to_string(e.to), e.error->to_string());
        } else {
            spdlog::info("[StateChanged] session={} transfer={} {} -> {}", e.session_id, e.transfer_id,
                         transfer::to_string(e.from), transfer::to_string(e.to));
        }
    });

    track<TransferProgressEvent>(bus_, unsubscribers_, [](const TransferProgressEvent& e) {
        spdlog::debug("[Progress] session={} {}/{} bytes {}/{} files {:.1f}%", e.session_id,
                      e.progress.bytes_transferred, e.progress.total_bytes, e.progress.files_completed,
                      e.progress.total_files, e.progress.percentage());
    });

    track<FileCompletedEvent>(bus_, unsubscribers_, [](const FileCompletedEvent& e) {
        spdlog::info("[FileCompleted] {} session={} path={} bytes={}", to_string(e.direction), e.session_id,
                     e.path, e.bytes);
    });

    track<FileFailedEvent>(bus_, unsubscribers_, [](const FileFailedEvent& e) {
        spdlog::error("[FileFailed] session={} path={} error={}", e.session_id, e.path, e.error.to_string());
    });

    track<ChunkRetransmittedEvent>(bus_, unsubscribers_, [](const ChunkRetransmittedEvent& e) {
        spdlog::warn("[ChunkRetransmitted] session={} file={} chunk={} attempt={}", e.session_id, e.file_index,
                     e.sequence, e.attempt);
    });

    track<TransportFallbackEvent>(bus_, unsubscribers_, [](const TransportFallbackEvent& e) {
        spdlog::warn("[TransportFallback] session={} peer={} {} -> {} ({})", e.session_id, e.peer_id,
                     transport::to_string(e.from), transport::to_string(e.to), e.reason);
    });

    track<CheckpointEvent>(bus_, unsubscribers_, [](const CheckpointEvent& e) {
        spdlog::debug("[Checkpoint] session={} transfer={} file={} chunk={} bytes={}", e.session_id,
                      e.token.transfer_id, e.token.last_completed_file, e.token.last_completed_chunk,
                      e.token.bytes_completed);
    });

    track<IncomingTransferEvent>(bus_, unsubscribers_, [](const IncomingTransferEvent& e) {
        if (e.accepted) {
            spdlog::info("[Incoming] transfer={} from={} files={} bytes={}{}", e.transfer_id, e.sender_id,
                         e.file_count, e.total_size, e.resumed ? " (resumed)" : "");
        } else {
            spdlog::warn("[Incoming] transfer={} from={} refused: {}", e.transfer_id, e.sender_id, e.reason);
        }
    });

    track<IncomingTransferFinishedEvent>(bus_, unsubscribers_, [](const IncomingTransferFinishedEvent& e) {
        spdlog::info("[IncomingFinished] transfer={} completed={} {}", e.transfer_id, e.completed, e.reason);
    });

    track<QueueChangedEvent>(bus_, unsubscribers_, [](const QueueChangedEvent& e) {
        spdlog::info("[Queue] item={} state={} priority={}", e.queue_id, transfer::to_string(e.state),
                     transfer::to_string(e.priority));
    });
}

LoggerComponent::~LoggerComponent() {
    for (auto& unsubscribe : unsubscribers_) {
        unsubscribe();
    }
}

MetricsComponent::MetricsComponent(EventBus& bus) : bus_(bus) {
    track<TransferStateChangedEvent>(bus_, unsubscribers_, [this](const TransferStateChangedEvent& e) {
        switch (e.to) {
        case transfer::TransferState::Negotiating:
            if (e.from == transfer::TransferState::Pending) {
                stats_.transfers_started++;
            }
            break;
        case transfer::TransferState::Completed:
            stats_.transfers_completed++;
            break;
        case transfer::TransferState::Failed:
            stats_.transfers_failed++;
            break;
        case transfer::TransferState::Cancelled:
            stats_.transfers_cancelled++;
            break;
        default:
            break;
        }
    });

    track<FileCompletedEvent>(bus_, unsubscribers_, [this](const FileCompletedEvent& e) {
        if (e.direction == Direction::Outgoing) {
            stats_.files_sent++;
            stats_.bytes_sent += e.bytes;
        } else {
            stats_.files_received++;
            stats_.bytes_received += e.bytes;
        }
    });

    track<FileFailedEvent>(bus_, unsubscribers_, [this](const FileFailedEvent&) { stats_.files_failed++; });
    track<ChunkRetransmittedEvent>(bus_, unsubscribers_,
                                   [this](const ChunkRetransmittedEvent&) { stats_.chunks_retransmitted++; });
    track<TransportFallbackEvent>(bus_, unsubscribers_,
                                  [this](const TransportFallbackEvent&) { stats_.transport_fallbacks++; });
    track<CheckpointEvent>(bus_, unsubscribers_, [this](const CheckpointEvent&) { stats_.checkpoints++; });
    track<IncomingTransferEvent>(bus_, unsubscribers_, [this](const IncomingTransferEvent& e) {
        if (!e.accepted) {
            stats_.incoming_rejected++;
        }
    });
}

MetricsComponent::~MetricsComponent() {
    for (auto& unsubscribe : unsubscribers_) {
        unsubscribe();
    }
}

void MetricsComponent::print_stats() const {
    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Transfer Statistics:");
    spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
    spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
    spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
    spdlog::info("  Transfers cancelled: {}", stats_.transfers_cancelled.load());
    spdlog::info("  Files sent:          {}", stats_.files_sent.load());
    spdlog::info("  Bytes sent:          {}", stats_.bytes_sent.load());
    spdlog::info("  Files received:      {}", stats_.files_received.load());
    spdlog::info("  Bytes received:      {}", stats_.bytes_received.load());
    spdlog::info("  Files failed:        {}", stats_.files_failed.load());
    spdlog::info("  Retransmissions:     {}", stats_.chunks_retransmitted.load());
    spdlog::info("  Transport fallbacks: {}", stats_.transport_fallbacks.load());
    spdlog::info("  Checkpoints:         {}", stats_.checkpoints.load());
    spdlog::info("═══════════════════════════════════════");
}

} // namespace ferry::events

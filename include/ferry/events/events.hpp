/**
 * @file events.hpp
 * @brief Event types emitted by the transfer engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense facts: TransferStateChangedEvent, FileCompletedEvent
 */

#pragma once

#include "ferry/core/error.hpp"
#include "ferry/transfer/types.hpp"
#include "ferry/transport/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ferry::events {

enum class Direction {
    Outgoing,
    Incoming
};

inline const char* to_string(Direction direction) noexcept {
    return direction == Direction::Outgoing ? "outgoing" : "incoming";
}

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every state machine transition of a sending session
 *
 * WHO EMITS:
 * - TransferSession
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent, MetricsComponent, EventStream
 * - QueueManager (frees the slot on a terminal state)
 */
struct TransferStateChangedEvent {
    std::string session_id;
    std::string transfer_id;
    transfer::TransferState from = transfer::TransferState::Pending;
    transfer::TransferState to = transfer::TransferState::Pending;
    std::optional<Error> error; ///< Set when `to` is Failed
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Progress snapshot, emitted after each acknowledged chunk
 */
struct TransferProgressEvent {
    std::string session_id;
    transfer::TransferProgress progress;
};

struct FileCompletedEvent {
    std::string session_id; ///< Transfer id on the receiving side
    Direction direction = Direction::Outgoing;
    std::uint32_t file_index = 0;
    std::string path;
    std::uint64_t bytes = 0;
};

/**
 * @brief A file exhausted its retries; sibling files keep going
 */
struct FileFailedEvent {
    std::string session_id;
    std::uint32_t file_index = 0;
    std::string path;
    Error error;
};

struct ChunkRetransmittedEvent {
    std::string session_id;
    std::uint32_t file_index = 0;
    std::uint64_t sequence = 0;
    std::uint32_t attempt = 0;
};

/**
 * @brief The session migrated to another transport after a failure
 */
struct TransportFallbackEvent {
    std::string session_id;
    std::string peer_id;
    transport::TransportProtocol from = transport::TransportProtocol::Multiplexed;
    transport::TransportProtocol to = transport::TransportProtocol::SimpleStream;
    std::string reason;
};

struct CheckpointEvent {
    std::string session_id;
    transfer::ResumeToken token;
};

// ════════════════════════════════════════════════════════
// Receiver and Queue Events
// ════════════════════════════════════════════════════════

/**
 * @brief A remote peer offered a transfer to this node
 *
 * WHO EMITS:
 * - TransferReceiver, after the PeerTrust decision
 */
struct IncomingTransferEvent {
    std::string transfer_id;
    std::string sender_id;
    std::uint64_t total_size = 0;
    std::uint64_t file_count = 0;
    bool accepted = false;
    bool resumed = false;
    std::string reason;
};

struct IncomingTransferFinishedEvent {
    std::string transfer_id;
    bool completed = false;
    std::string reason;
};

struct QueueChangedEvent {
    std::string queue_id;
    transfer::QueueState state = transfer::QueueState::Pending;
    transfer::Priority priority = transfer::Priority::Normal;
    std::string session_id;
};

} // namespace ferry::events

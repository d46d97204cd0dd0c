#pragma once

/**
 * @file frames.hpp
 * @brief Messages exchanged on a transfer stream
 *
 * Every frame is [u8 version][u8 type][body]. A transfer opens with an
 * Offer on its first stream; extra parallel streams introduce themselves
 * with Attach. Data flows as ChunkData, each answered by exactly one
 * ChunkAck on the same stream.
 */

#include "ferry/core/error.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/types.hpp"
#include "ferry/transport/protocol.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ferry::wire {

constexpr std::uint8_t kProtocolVersion = 1;

enum class FrameType : std::uint8_t {
    CapabilityQuery = 1,
    CapabilityReply = 2,
    Offer = 3,
    Attach = 4,
    Accept = 5,
    Reject = 6,
    ChunkData = 7,
    ChunkAck = 8,
    Complete = 9,
    Cancel = 10
};

struct CapabilityQuery {};

struct CapabilityReply {
    transport::TransportCapabilities capabilities;
};

struct Offer {
    std::string session_id;
    transfer::TransferManifest manifest;  ///< source paths are not carried
    bool resume = false;
    transfer::ResumePosition position;
    std::vector<std::uint32_t> verified_files;
};

struct Attach {
    std::string transfer_id;
    std::uint32_t stream_index = 0;
};

struct Accept {
    std::vector<std::uint32_t> verified_files;
    std::vector<std::uint64_t> next_expected;  ///< one entry per manifest file
};

struct Reject {
    ErrorKind kind = ErrorKind::Rejected;
    std::string reason;
};

struct ChunkData {
    std::uint32_t file_index = 0;
    std::uint64_t sequence = 0;
    std::uint64_t offset = 0;
    std::uint32_t raw_length = 0;
    bool compressed = false;
    core::Digest payload_checksum{};
    std::vector<std::uint8_t> payload;
};

enum class AckStatus : std::uint8_t {
    Written = 0,       ///< appended to the staged file
    Buffered = 1,      ///< held in the reorder window
    Duplicate = 2,     ///< already written, nothing to do
    Corrupt = 3,       ///< payload checksum mismatch, resend this chunk
    OutOfWindow = 4,   ///< too far ahead; next_expected names the gap
    StorageFailure = 5 ///< receiver cannot persist data, fatal
};

enum class FileState : std::uint8_t {
    InProgress = 0,
    Verified = 1,
    Corrupt = 2  ///< full-file digest mismatch, file was reset to chunk 0
};

struct ChunkAck {
    std::uint32_t file_index = 0;
    std::uint64_t sequence = 0;
    AckStatus status = AckStatus::Written;
    std::uint64_t next_expected = 0;
    FileState file_state = FileState::InProgress;
    std::string detail;
};

struct Complete {
    std::string transfer_id;
};

struct Cancel {
    std::string transfer_id;
    std::string reason;
};

using Frame = std::variant<CapabilityQuery, CapabilityReply, Offer, Attach, Accept, Reject,
                           ChunkData, ChunkAck, Complete, Cancel>;

FrameType frame_type(const Frame& frame) noexcept;
const char* to_string(FrameType type) noexcept;
const char* to_string(AckStatus status) noexcept;

std::vector<std::uint8_t> encode(const Frame& frame);

/// Protocol error on truncated, trailing or unknown input.
ferry::Result<Frame> decode(const std::vector<std::uint8_t>& bytes);

/// Canonical manifest entry encoding: files then directories, in stored order.
std::vector<std::uint8_t> serialize_entries(const transfer::TransferManifest& manifest);

/// SHA-256 of serialize_entries(); identity fields do not contribute.
core::Digest manifest_digest(const transfer::TransferManifest& manifest);

} // namespace ferry::wire

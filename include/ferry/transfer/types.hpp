#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/digest.hpp"
#include "ferry/transport/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

constexpr std::uint64_t kChunkSize = 64 * 1024;
constexpr std::uint32_t kMaxParallelStreams = 4;
constexpr std::chrono::hours kResumeTokenTtl{24};

[[nodiscard]] constexpr std::uint64_t chunk_count_for(std::uint64_t size) noexcept {
    return (size + kChunkSize - 1) / kChunkSize;
}

enum class EntryKind : std::uint8_t {
    Regular = 0,
    Symlink = 1  ///< typed link marker, only produced under SymlinkPolicy::Preserve
};

struct FileEntry {
    std::string path;  ///< relative, '/'-separated
    std::uint64_t size = 0;
    core::Digest checksum{};
    std::uint32_t permissions = 0644;
    core::TimePoint modified_at{};
    std::uint64_t chunk_count = 0;
    EntryKind kind = EntryKind::Regular;
    std::string link_target;

    std::filesystem::path source;  ///< sender-local location, never sent on the wire
};

struct DirectoryEntry {
    std::string path;
    std::uint32_t permissions = 0755;
    core::TimePoint created_at{};
};

struct TransferManifest {
    std::string transfer_id;
    std::string sender_id;
    core::TimePoint created_at{};
    std::uint64_t total_size = 0;
    std::uint32_t file_count = 0;
    std::vector<FileEntry> files;
    std::vector<DirectoryEntry> directories;
    core::Digest checksum{};
};

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

struct Chunk {
    std::uint32_t file_index = 0;
    std::uint64_t sequence = 0;
    ByteRange byte_range;
    std::vector<std::uint8_t> payload;  ///< raw, or LZ4 when compressed is set
    core::Digest payload_checksum{};    ///< always over the raw bytes
    bool compressed = false;
};

enum class TransferState {
    Pending,
    Negotiating,
    Transferring,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(TransferState state) noexcept;
std::optional<TransferState> parse_transfer_state(const std::string& name) noexcept;

[[nodiscard]] inline bool is_terminal(TransferState state) noexcept {
    return state == TransferState::Completed || state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

struct TransferProgress {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint32_t files_completed = 0;
    std::uint32_t total_files = 0;
    double current_speed = 0.0;  ///< bytes/s over the recent sample window
    double average_speed = 0.0;  ///< bytes/s since the session started
    std::optional<std::uint64_t> eta_seconds;
    core::TimePoint last_update{};

    [[nodiscard]] double percentage() const noexcept {
        if (total_bytes == 0) {
            return files_completed >= total_files ? 100.0 : 0.0;
        }
        return static_cast<double>(bytes_transferred) * 100.0 / static_cast<double>(total_bytes);
    }
};

/**
 * @brief Checkpoint handed back to callers for a later resume
 *
 * last_completed_file/last_completed_chunk name the final chunk of the
 * contiguous prefix (manifest order) the receiver has durably written;
 * -1 in both means nothing is written yet.
 */
struct ResumeToken {
    std::string transfer_id;
    std::string session_id;
    std::int64_t last_completed_file = -1;
    std::int64_t last_completed_chunk = -1;
    std::uint64_t bytes_completed = 0;
    core::TimePoint created_at{};
    core::TimePoint expires_at{};

    [[nodiscard]] bool is_expired(core::TimePoint now) const noexcept { return now > expires_at; }
};

/// Position of the first chunk a resumed session still has to deliver.
struct ResumePosition {
    std::uint32_t file_index = 0;
    std::uint64_t chunk = 0;
};

ResumePosition position_after(const ResumeToken& token, const TransferManifest& manifest);

enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

const char* to_string(Priority priority) noexcept;
std::optional<Priority> parse_priority(const std::string& name) noexcept;

enum class QueueState {
    Pending,
    Scheduled,
    Paused,
    Cancelled,
    Completed,
    Failed
};

const char* to_string(QueueState state) noexcept;
std::optional<QueueState> parse_queue_state(const std::string& name) noexcept;

struct TransferOptions {
    std::optional<transport::TransportProtocol> preferred_transport;
    std::optional<std::uint64_t> bandwidth_limit;  ///< bytes/s
    std::optional<core::CompressionMode> compression;
};

struct TransferRequest {
    std::vector<std::filesystem::path> paths;
    std::string peer_id;
    TransferOptions options;
};

struct QueueItem {
    std::string queue_id;
    TransferRequest transfer_request;
    Priority priority = Priority::Normal;
    std::optional<core::TimePoint> estimated_start;
    QueueState state = QueueState::Pending;
    core::TimePoint created_at{};
    std::uint64_t sequence = 0;  ///< FIFO order within a priority
    std::string session_id;      ///< set once admitted
    std::string last_error;
};

} // namespace ferry::transfer

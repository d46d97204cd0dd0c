#pragma once

#include "ferry/core/digest.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace ferry::transfer {

/// Length of chunk `sequence` in a file of `file_size` bytes.
[[nodiscard]] std::uint64_t chunk_length(std::uint64_t file_size, std::uint64_t sequence) noexcept;

/**
 * @brief Lazy, restartable producer of a file's chunks
 *
 * Nothing is read until next() or read() is called; seek() restarts the
 * sequence at any chunk. Payloads are raw and carry their checksum.
 */
class ChunkReader {
public:
    ChunkReader(std::filesystem::path source, std::uint32_t file_index, std::uint64_t file_size,
                std::uint64_t start_sequence = 0);

    /// Next chunk in sequence order, or nullopt once the file is exhausted.
    ferry::Result<std::optional<Chunk>> next();

    ferry::Result<Chunk> read(std::uint64_t sequence);

    void seek(std::uint64_t sequence) noexcept { next_sequence_ = sequence; }

    [[nodiscard]] std::uint64_t chunk_count() const noexcept { return chunk_count_for(file_size_); }
    [[nodiscard]] std::uint64_t position() const noexcept { return next_sequence_; }

private:
    ferry::Result<void> ensure_open();

    std::filesystem::path source_;
    std::uint32_t file_index_;
    std::uint64_t file_size_;
    std::uint64_t next_sequence_;
    std::ifstream input_;
};

ChunkReader split(const FileEntry& entry, std::uint32_t file_index, std::uint64_t start_sequence = 0);

enum class AcceptStatus {
    Written,
    Buffered,
    Duplicate,
    Corrupt,     ///< payload did not match its checksum or expected length
    OutOfWindow
};

enum class FileStatus {
    InProgress,
    Verified,
    Corrupt  ///< full-file digest mismatch; the assembler has been reset
};

struct AcceptResult {
    AcceptStatus status = AcceptStatus::Written;
    std::uint64_t next_expected = 0;
    FileStatus file_status = FileStatus::InProgress;
};

/**
 * @brief Receiver-side, in-order writer for one file
 *
 * Chunks are written to the staging file strictly in sequence order.
 * Chunks that arrive early are held in memory up to `window` sequences
 * ahead of the next expected one. Once every chunk is written the staged
 * file is re-read and its digest compared with the manifest entry.
 *
 * Not thread-safe; callers serialize access per file.
 */
class FileAssembler {
public:
    /// Opens (or truncates to `resume_from` chunks) the staging file.
    static ferry::Result<std::unique_ptr<FileAssembler>> open(std::filesystem::path staging,
                                                              std::uint64_t file_size,
                                                              core::Digest expected,
                                                              std::uint32_t window,
                                                              std::uint64_t resume_from = 0);

    /// `chunk.payload` must be raw (already decompressed).
    ferry::Result<AcceptResult> accept(const Chunk& chunk);

    /// Discards buffered chunks and rewinds the staged file to `sequence`.
    ferry::Result<void> rewind(std::uint64_t sequence);

    /// Drops out-of-order chunks held in memory; written data is kept.
    void drop_buffered() { buffered_.clear(); }

    /// Verifies a file with no chunks (zero length).
    ferry::Result<AcceptResult> finish_empty();

    [[nodiscard]] std::uint64_t next_expected() const noexcept { return next_expected_; }
    [[nodiscard]] std::uint64_t chunk_count() const noexcept { return chunk_count_for(file_size_); }
    [[nodiscard]] std::size_t buffered() const noexcept { return buffered_.size(); }
    [[nodiscard]] std::uint64_t duplicates() const noexcept { return duplicates_; }
    [[nodiscard]] const std::filesystem::path& staging_path() const noexcept { return staging_; }

    /// Closes the staging file handle so it can be renamed.
    void close();

private:
    FileAssembler(std::filesystem::path staging, std::uint64_t file_size, core::Digest expected,
                  std::uint32_t window);

    ferry::Result<void> write_chunk(std::uint64_t sequence, const std::vector<std::uint8_t>& payload);
    ferry::Result<FileStatus> verify();

    std::filesystem::path staging_;
    std::uint64_t file_size_;
    core::Digest expected_;
    std::uint32_t window_;
    std::uint64_t next_expected_ = 0;
    std::uint64_t duplicates_ = 0;
    std::map<std::uint64_t, std::vector<std::uint8_t>> buffered_;
    std::fstream output_;
};

/**
 * @brief Writes a complete chunk set to `output` in sequence order
 *
 * Chunks may be given in any order but must cover sequences 0..N-1 of a
 * single file exactly once; every payload is checked against its checksum.
 */
ferry::Result<void> reassemble(std::vector<Chunk> chunks, const std::filesystem::path& output);

} // namespace ferry::transfer

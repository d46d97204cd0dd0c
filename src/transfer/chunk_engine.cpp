#include "ferry/transfer/chunk_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry::transfer {
namespace fs = std::filesystem;

std::uint64_t chunk_length(std::uint64_t file_size, std::uint64_t sequence) noexcept {
    const std::uint64_t offset = sequence * kChunkSize;
    if (offset >= file_size) {
        return 0;
    }
    return std::min<std::uint64_t>(kChunkSize, file_size - offset);
}

ChunkReader::ChunkReader(fs::path source, std::uint32_t file_index, std::uint64_t file_size,
                         std::uint64_t start_sequence)
    : source_(std::move(source)),
      file_index_(file_index),
      file_size_(file_size),
      next_sequence_(start_sequence) {}

ferry::Result<void> ChunkReader::ensure_open() {
    if (input_.is_open()) {
        return ferry::Ok();
    }
    input_.open(source_, std::ios::binary);
    if (!input_) {
        return ferry::Err<void>(ferry::Error::storage("failed to open source file", source_.string()));
    }
    return ferry::Ok();
}

ferry::Result<std::optional<Chunk>> ChunkReader::next() {
    if (next_sequence_ >= chunk_count()) {
        return ferry::Ok(std::optional<Chunk>{});
    }
    auto chunk = read(next_sequence_);
    if (chunk.is_error()) {
        return ferry::Err<std::optional<Chunk>>(chunk.error());
    }
    ++next_sequence_;
    return ferry::Ok(std::optional<Chunk>{std::move(chunk.value())});
}

ferry::Result<Chunk> ChunkReader::read(std::uint64_t sequence) {
    if (sequence >= chunk_count()) {
        return ferry::Err<Chunk>(ferry::Error::storage("chunk sequence past end of file", source_.string()));
    }
    if (auto res = ensure_open(); res.is_error()) {
        return ferry::Err<Chunk>(res.error());
    }

    Chunk chunk;
    chunk.file_index = file_index_;
    chunk.sequence = sequence;
    chunk.byte_range.offset = sequence * kChunkSize;
    chunk.byte_range.length = chunk_length(file_size_, sequence);
    chunk.payload.resize(static_cast<std::size_t>(chunk.byte_range.length));

    input_.clear();
    input_.seekg(static_cast<std::streamoff>(chunk.byte_range.offset));
    input_.read(reinterpret_cast<char*>(chunk.payload.data()),
                static_cast<std::streamsize>(chunk.payload.size()));
    if (static_cast<std::uint64_t>(input_.gcount()) != chunk.byte_range.length) {
        return ferry::Err<Chunk>(ferry::Error::storage("short read from source file", source_.string()));
    }

    chunk.payload_checksum = core::sha256(chunk.payload);
    return ferry::Ok(std::move(chunk));
}

ChunkReader split(const FileEntry& entry, std::uint32_t file_index, std::uint64_t start_sequence) {
    return ChunkReader(entry.source, file_index, entry.size, start_sequence);
}

FileAssembler::FileAssembler(fs::path staging, std::uint64_t file_size, core::Digest expected,
                             std::uint32_t window)
    : staging_(std::move(staging)), file_size_(file_size), expected_(expected), window_(window) {}

ferry::Result<std::unique_ptr<FileAssembler>> FileAssembler::open(fs::path staging, std::uint64_t file_size,
                                                                  core::Digest expected, std::uint32_t window,
                                                                  std::uint64_t resume_from) {
    std::unique_ptr<FileAssembler> assembler(
        new FileAssembler(std::move(staging), file_size, expected, window == 0 ? 1 : window));

    std::error_code ec;
    fs::create_directories(assembler->staging_.parent_path(), ec);
    if (ec) {
        return ferry::Err<std::unique_ptr<FileAssembler>>(
            ferry::Error::storage("cannot create staging directory", assembler->staging_.parent_path().string()));
    }
    if (auto res = assembler->rewind(resume_from); res.is_error()) {
        return ferry::Err<std::unique_ptr<FileAssembler>>(res.error());
    }
    return ferry::Ok(std::move(assembler));
}

void FileAssembler::close() {
    if (output_.is_open()) {
        output_.close();
    }
}

ferry::Result<void> FileAssembler::rewind(std::uint64_t sequence) {
    close();
    buffered_.clear();

    std::error_code ec;
    const std::uint64_t keep = std::min(sequence * kChunkSize, file_size_);
    const bool exists = fs::exists(staging_, ec);
    const std::uint64_t current = exists ? fs::file_size(staging_, ec) : 0;
    if (!exists || current < keep) {
        // Nothing usable on disk past what we can prove; restart the file.
        std::ofstream create(staging_, std::ios::binary | std::ios::trunc);
        if (!create) {
            return ferry::Err<void>(ferry::Error::storage("failed to create staging file", staging_.string()));
        }
        next_expected_ = 0;
    } else {
        fs::resize_file(staging_, keep, ec);
        if (ec) {
            return ferry::Err<void>(ferry::Error::storage("failed to truncate staging file", staging_.string()));
        }
        next_expected_ = std::min(sequence, chunk_count());
    }

    output_.open(staging_, std::ios::in | std::ios::out | std::ios::binary);
    if (!output_) {
        return ferry::Err<void>(ferry::Error::storage("failed to open staging file", staging_.string()));
    }
    return ferry::Ok();
}

ferry::Result<void> FileAssembler::write_chunk(std::uint64_t sequence, const std::vector<std::uint8_t>& payload) {
    if (!output_.is_open()) {
        output_.open(staging_, std::ios::in | std::ios::out | std::ios::binary);
    }
    output_.seekp(static_cast<std::streamoff>(sequence * kChunkSize));
    output_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    output_.flush();
    if (!output_) {
        return ferry::Err<void>(ferry::Error::storage("failed to write staging file", staging_.string()));
    }
    return ferry::Ok();
}

ferry::Result<FileStatus> FileAssembler::verify() {
    close();
    auto digest = core::sha256_file(staging_);
    if (digest.is_error()) {
        return ferry::Err<FileStatus>(digest.error());
    }
    if (digest.value() == expected_) {
        return ferry::Ok(FileStatus::Verified);
    }

    spdlog::warn("Digest mismatch for staged file {}; restarting it", staging_.string());
    if (auto res = rewind(0); res.is_error()) {
        return ferry::Err<FileStatus>(res.error());
    }
    return ferry::Ok(FileStatus::Corrupt);
}

ferry::Result<AcceptResult> FileAssembler::accept(const Chunk& chunk) {
    AcceptResult result;
    const std::uint64_t total = chunk_count();

    if (chunk.sequence >= total ||
        chunk.payload.size() != chunk_length(file_size_, chunk.sequence) ||
        core::sha256(chunk.payload) != chunk.payload_checksum) {
        result.status = AcceptStatus::Corrupt;
        result.next_expected = next_expected_;
        return ferry::Ok(result);
    }

    if (chunk.sequence < next_expected_ || buffered_.count(chunk.sequence) != 0) {
        ++duplicates_;
        result.status = AcceptStatus::Duplicate;
        result.next_expected = next_expected_;
        return ferry::Ok(result);
    }

    if (chunk.sequence > next_expected_) {
        if (chunk.sequence - next_expected_ >= window_) {
            result.status = AcceptStatus::OutOfWindow;
        } else {
            buffered_.emplace(chunk.sequence, chunk.payload);
            result.status = AcceptStatus::Buffered;
        }
        result.next_expected = next_expected_;
        return ferry::Ok(result);
    }

    if (auto res = write_chunk(chunk.sequence, chunk.payload); res.is_error()) {
        return ferry::Err<AcceptResult>(res.error());
    }
    ++next_expected_;

    for (auto it = buffered_.find(next_expected_); it != buffered_.end(); it = buffered_.find(next_expected_)) {
        if (auto res = write_chunk(it->first, it->second); res.is_error()) {
            return ferry::Err<AcceptResult>(res.error());
        }
        buffered_.erase(it);
        ++next_expected_;
    }

    result.status = AcceptStatus::Written;
    if (next_expected_ == total) {
        auto status = verify();
        if (status.is_error()) {
            return ferry::Err<AcceptResult>(status.error());
        }
        result.file_status = status.value();
    }
    result.next_expected = next_expected_;
    return ferry::Ok(result);
}

ferry::Result<AcceptResult> FileAssembler::finish_empty() {
    AcceptResult result;
    auto status = verify();
    if (status.is_error()) {
        return ferry::Err<AcceptResult>(status.error());
    }
    result.file_status = status.value();
    return ferry::Ok(result);
}

ferry::Result<void> reassemble(std::vector<Chunk> chunks, const fs::path& output) {
    std::sort(chunks.begin(), chunks.end(),
              [](const Chunk& a, const Chunk& b) { return a.sequence < b.sequence; });

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return ferry::Err<void>(ferry::Error::storage("failed to open output file", output.string()));
    }

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.sequence != i) {
            return ferry::Err<void>(ferry::Error::integrity(
                "missing or duplicate chunk at sequence " + std::to_string(i), output.string()));
        }
        if (chunk.compressed) {
            return ferry::Err<void>(ferry::Error::integrity("chunk payload still compressed", output.string()));
        }
        if (core::sha256(chunk.payload) != chunk.payload_checksum) {
            return ferry::Err<void>(ferry::Error::integrity(
                "payload checksum mismatch at sequence " + std::to_string(i), output.string()));
        }
        out.write(reinterpret_cast<const char*>(chunk.payload.data()),
                  static_cast<std::streamsize>(chunk.payload.size()));
    }

    out.flush();
    if (!out) {
        return ferry::Err<void>(ferry::Error::storage("failed writing output file", output.string()));
    }
    return ferry::Ok();
}

} // namespace ferry::transfer

#include "ferry/wire/frames.hpp"

#include "ferry/core/platform.hpp"
#include "ferry/wire/codec.hpp"

#include <string>

namespace ferry::wire {
namespace {

void write_entries(ByteWriter& out, const transfer::TransferManifest& manifest) {
    out.u32(static_cast<std::uint32_t>(manifest.files.size()));
    for (const auto& file : manifest.files) {
        out.string(file.path);
        out.u64(file.size);
        out.digest(file.checksum);
        out.u32(file.permissions);
        out.i64(core::to_unix_millis(file.modified_at));
        out.u8(static_cast<std::uint8_t>(file.kind));
        out.string(file.link_target);
    }
    out.u32(static_cast<std::uint32_t>(manifest.directories.size()));
    for (const auto& dir : manifest.directories) {
        out.string(dir.path);
        out.u32(dir.permissions);
        out.i64(core::to_unix_millis(dir.created_at));
    }
}

bool read_entries(ByteReader& in, transfer::TransferManifest& manifest) {
    const std::uint32_t file_count = in.u32();
    for (std::uint32_t i = 0; i < file_count && !in.failed(); ++i) {
        transfer::FileEntry file;
        file.path = in.string();
        file.size = in.u64();
        file.checksum = in.digest();
        file.permissions = in.u32();
        file.modified_at = core::from_unix_millis(in.i64());
        const std::uint8_t kind = in.u8();
        if (kind > static_cast<std::uint8_t>(transfer::EntryKind::Symlink)) {
            return false;
        }
        file.kind = static_cast<transfer::EntryKind>(kind);
        file.link_target = in.string();
        file.chunk_count = transfer::chunk_count_for(file.size);
        manifest.files.push_back(std::move(file));
    }
    const std::uint32_t dir_count = in.u32();
    for (std::uint32_t i = 0; i < dir_count && !in.failed(); ++i) {
        transfer::DirectoryEntry dir;
        dir.path = in.string();
        dir.permissions = in.u32();
        dir.created_at = core::from_unix_millis(in.i64());
        manifest.directories.push_back(std::move(dir));
    }
    return !in.failed();
}

void write_indices(ByteWriter& out, const std::vector<std::uint32_t>& values) {
    out.u32(static_cast<std::uint32_t>(values.size()));
    for (auto value : values) {
        out.u32(value);
    }
}

std::vector<std::uint32_t> read_indices(ByteReader& in) {
    std::vector<std::uint32_t> values;
    const std::uint32_t count = in.u32();
    for (std::uint32_t i = 0; i < count && !in.failed(); ++i) {
        values.push_back(in.u32());
    }
    return values;
}

struct Encoder {
    ByteWriter& out;

    void operator()(const CapabilityQuery&) const {}

    void operator()(const CapabilityReply& frame) const {
        out.boolean(frame.capabilities.multiplexed);
        out.boolean(frame.capabilities.simple_stream);
        out.boolean(frame.capabilities.browser_channel);
        out.u32(frame.capabilities.max_parallel_streams);
    }

    void operator()(const Offer& frame) const {
        const auto& manifest = frame.manifest;
        out.string(frame.session_id);
        out.string(manifest.transfer_id);
        out.string(manifest.sender_id);
        out.i64(core::to_unix_millis(manifest.created_at));
        out.digest(manifest.checksum);
        out.u64(manifest.total_size);
        out.u32(manifest.file_count);
        out.bytes(serialize_entries(manifest));
        out.boolean(frame.resume);
        out.u32(frame.position.file_index);
        out.u64(frame.position.chunk);
        write_indices(out, frame.verified_files);
    }

    void operator()(const Attach& frame) const {
        out.string(frame.transfer_id);
        out.u32(frame.stream_index);
    }

    void operator()(const Accept& frame) const {
        write_indices(out, frame.verified_files);
        out.u32(static_cast<std::uint32_t>(frame.next_expected.size()));
        for (auto value : frame.next_expected) {
            out.u64(value);
        }
    }

    void operator()(const Reject& frame) const {
        out.string(error_kind_name(frame.kind));
        out.string(frame.reason);
    }

    void operator()(const ChunkData& frame) const {
        out.u32(frame.file_index);
        out.u64(frame.sequence);
        out.u64(frame.offset);
        out.u32(frame.raw_length);
        out.boolean(frame.compressed);
        out.digest(frame.payload_checksum);
        out.bytes(frame.payload);
    }

    void operator()(const ChunkAck& frame) const {
        out.u32(frame.file_index);
        out.u64(frame.sequence);
        out.u8(static_cast<std::uint8_t>(frame.status));
        out.u64(frame.next_expected);
        out.u8(static_cast<std::uint8_t>(frame.file_state));
        out.string(frame.detail);
    }

    void operator()(const Complete& frame) const {
        out.string(frame.transfer_id);
    }

    void operator()(const Cancel& frame) const {
        out.string(frame.transfer_id);
        out.string(frame.reason);
    }
};

ferry::Result<Frame> malformed(const std::string& what) {
    return ferry::Err<Frame>(ferry::Error::protocol("malformed frame: " + what));
}

ferry::Result<Frame> decode_body(FrameType type, ByteReader& in) {
    switch (type) {
        case FrameType::CapabilityQuery:
            return ferry::Ok<Frame>(CapabilityQuery{});

        case FrameType::CapabilityReply: {
            CapabilityReply frame;
            frame.capabilities.multiplexed = in.boolean();
            frame.capabilities.simple_stream = in.boolean();
            frame.capabilities.browser_channel = in.boolean();
            frame.capabilities.max_parallel_streams = in.u32();
            return ferry::Ok<Frame>(frame);
        }

        case FrameType::Offer: {
            Offer frame;
            auto& manifest = frame.manifest;
            frame.session_id = in.string();
            manifest.transfer_id = in.string();
            manifest.sender_id = in.string();
            manifest.created_at = core::from_unix_millis(in.i64());
            manifest.checksum = in.digest();
            manifest.total_size = in.u64();
            manifest.file_count = in.u32();
            const auto entries = in.bytes();
            if (in.failed()) {
                return malformed("offer header");
            }
            ByteReader entry_reader(entries);
            if (!read_entries(entry_reader, manifest) || !entry_reader.at_end()) {
                return malformed("manifest entries");
            }
            frame.resume = in.boolean();
            frame.position.file_index = in.u32();
            frame.position.chunk = in.u64();
            frame.verified_files = read_indices(in);
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::Attach: {
            Attach frame;
            frame.transfer_id = in.string();
            frame.stream_index = in.u32();
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::Accept: {
            Accept frame;
            frame.verified_files = read_indices(in);
            const std::uint32_t count = in.u32();
            for (std::uint32_t i = 0; i < count && !in.failed(); ++i) {
                frame.next_expected.push_back(in.u64());
            }
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::Reject: {
            Reject frame;
            const auto kind = parse_error_kind(in.string());
            frame.reason = in.string();
            if (!in.failed() && !kind) {
                return malformed("unknown reject kind");
            }
            frame.kind = kind.value_or(ErrorKind::Rejected);
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::ChunkData: {
            ChunkData frame;
            frame.file_index = in.u32();
            frame.sequence = in.u64();
            frame.offset = in.u64();
            frame.raw_length = in.u32();
            frame.compressed = in.boolean();
            frame.payload_checksum = in.digest();
            frame.payload = in.bytes();
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::ChunkAck: {
            ChunkAck frame;
            frame.file_index = in.u32();
            frame.sequence = in.u64();
            const std::uint8_t status = in.u8();
            frame.next_expected = in.u64();
            const std::uint8_t file_state = in.u8();
            frame.detail = in.string();
            if (status > static_cast<std::uint8_t>(AckStatus::StorageFailure) ||
                file_state > static_cast<std::uint8_t>(FileState::Corrupt)) {
                return malformed("ack enum out of range");
            }
            frame.status = static_cast<AckStatus>(status);
            frame.file_state = static_cast<FileState>(file_state);
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::Complete: {
            Complete frame;
            frame.transfer_id = in.string();
            return ferry::Ok<Frame>(std::move(frame));
        }

        case FrameType::Cancel: {
            Cancel frame;
            frame.transfer_id = in.string();
            frame.reason = in.string();
            return ferry::Ok<Frame>(std::move(frame));
        }
    }
    return malformed("unknown frame type");
}

} // namespace

FrameType frame_type(const Frame& frame) noexcept {
    return static_cast<FrameType>(frame.index() + 1);
}

const char* to_string(FrameType type) noexcept {
    switch (type) {
        case FrameType::CapabilityQuery: return "CapabilityQuery";
        case FrameType::CapabilityReply: return "CapabilityReply";
        case FrameType::Offer: return "Offer";
        case FrameType::Attach: return "Attach";
        case FrameType::Accept: return "Accept";
        case FrameType::Reject: return "Reject";
        case FrameType::ChunkData: return "ChunkData";
        case FrameType::ChunkAck: return "ChunkAck";
        case FrameType::Complete: return "Complete";
        case FrameType::Cancel: return "Cancel";
    }
    return "Unknown";
}

const char* to_string(AckStatus status) noexcept {
    switch (status) {
        case AckStatus::Written: return "written";
        case AckStatus::Buffered: return "buffered";
        case AckStatus::Duplicate: return "duplicate";
        case AckStatus::Corrupt: return "corrupt";
        case AckStatus::OutOfWindow: return "out-of-window";
        case AckStatus::StorageFailure: return "storage-failure";
    }
    return "unknown";
}

std::vector<std::uint8_t> encode(const Frame& frame) {
    ByteWriter out;
    out.u8(kProtocolVersion);
    out.u8(static_cast<std::uint8_t>(frame_type(frame)));
    std::visit(Encoder{out}, frame);
    return out.take();
}

ferry::Result<Frame> decode(const std::vector<std::uint8_t>& bytes) {
    ByteReader in(bytes);
    const std::uint8_t version = in.u8();
    const std::uint8_t type = in.u8();
    if (in.failed()) {
        return malformed("missing header");
    }
    if (version != kProtocolVersion) {
        return ferry::Err<Frame>(
            ferry::Error::protocol("unsupported protocol version " + std::to_string(version)));
    }
    if (type < static_cast<std::uint8_t>(FrameType::CapabilityQuery) ||
        type > static_cast<std::uint8_t>(FrameType::Cancel)) {
        return malformed("unknown frame type " + std::to_string(type));
    }

    const auto frame_kind = static_cast<FrameType>(type);
    auto frame = decode_body(frame_kind, in);
    if (frame.is_error()) {
        return frame;
    }
    if (in.failed()) {
        return malformed(std::string("truncated ") + to_string(frame_kind));
    }
    if (!in.at_end()) {
        return malformed(std::string("trailing bytes after ") + to_string(frame_kind));
    }
    return frame;
}

std::vector<std::uint8_t> serialize_entries(const transfer::TransferManifest& manifest) {
    ByteWriter out;
    write_entries(out, manifest);
    return out.take();
}

core::Digest manifest_digest(const transfer::TransferManifest& manifest) {
    return core::sha256(serialize_entries(manifest));
}

} // namespace ferry::wire

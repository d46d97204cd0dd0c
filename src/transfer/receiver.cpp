#include "ferry/transfer/receiver.hpp"

#include "ferry/core/digest.hpp"
#include "ferry/events/events.hpp"
#include "ferry/transfer/compression.hpp"
#include "ferry/transfer/manifest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <optional>
#include <system_error>

namespace ferry::transfer {

namespace fs = std::filesystem;

namespace {

wire::AckStatus to_ack_status(AcceptStatus status) {
    switch (status) {
    case AcceptStatus::Written: return wire::AckStatus::Written;
    case AcceptStatus::Buffered: return wire::AckStatus::Buffered;
    case AcceptStatus::Duplicate: return wire::AckStatus::Duplicate;
    case AcceptStatus::Corrupt: return wire::AckStatus::Corrupt;
    case AcceptStatus::OutOfWindow: return wire::AckStatus::OutOfWindow;
    }
    return wire::AckStatus::Corrupt;
}

wire::FileState to_file_state(FileStatus status) {
    switch (status) {
    case FileStatus::InProgress: return wire::FileState::InProgress;
    case FileStatus::Verified: return wire::FileState::Verified;
    case FileStatus::Corrupt: return wire::FileState::Corrupt;
    }
    return wire::FileState::InProgress;
}

void apply_permissions(const fs::path& path, std::uint32_t mode) {
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & 07777), fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not set permissions {:o} on {}: {}", mode, path.string(), ec.message());
    }
}

// Fails when `location`, with links resolved, is not inside `root`.
ferry::Result<void> ensure_confined(const fs::path& root, const fs::path& location) {
    std::error_code ec;
    const auto base = fs::weakly_canonical(root, ec);
    if (ec) {
        return ferry::Err<void>(Error::storage("cannot resolve download root: " + ec.message(), root.string()));
    }
    const auto resolved = fs::weakly_canonical(location, ec);
    if (ec) {
        return ferry::Err<void>(Error::storage("cannot resolve path: " + ec.message(), location.string()));
    }
    const auto relative = resolved.lexically_relative(base);
    if (relative.empty() || *relative.begin() == "..") {
        return ferry::Err<void>(Error::rejected("path escapes the download root: " + location.string()));
    }
    return ferry::Ok();
}

bool is_capability_query(const std::vector<std::uint8_t>& bytes) {
    auto frame = wire::decode(bytes);
    return frame.is_ok() && std::holds_alternative<wire::CapabilityQuery>(frame.value());
}

/// Replays a frame already read from the wrapped stream before reading further.
class PrefetchedStream : public transport::Stream {
public:
    PrefetchedStream(std::unique_ptr<transport::Stream> inner, std::vector<std::uint8_t> first)
        : inner_(std::move(inner)), first_(std::move(first)) {}

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override {
        return inner_->send(frame);
    }

    ferry::Result<std::vector<std::uint8_t>> recv(std::optional<std::chrono::milliseconds> timeout) override {
        if (first_) {
            auto frame = std::move(*first_);
            first_.reset();
            return ferry::Ok(std::move(frame));
        }
        return inner_->recv(timeout);
    }

    void close() override {
        inner_->close();
    }

    [[nodiscard]] transport::TransportProtocol protocol() const noexcept override {
        return inner_->protocol();
    }

private:
    std::unique_ptr<transport::Stream> inner_;
    std::optional<std::vector<std::uint8_t>> first_;
};

void reject(transport::Stream& stream, ErrorKind kind, const std::string& reason) {
    if (auto sent = transport::send_frame(stream, wire::Reject{kind, reason}); sent.is_error()) {
        spdlog::debug("Reject not delivered: {}", sent.error().message);
    }
}

} // namespace

TransferReceiver::TransferReceiver(security::PeerTrust& trust, security::SecurityLayer& security,
                                   core::ComputePool& pool, Options options, events::EventBus* bus)
    : trust_(trust), security_(security), pool_(pool), options_(std::move(options)), bus_(bus) {}

TransferReceiver::~TransferReceiver() {
    shutdown();
}

transport::StreamHandler TransferReceiver::handler() {
    return [this](std::unique_ptr<transport::Stream> stream) { handle(std::move(stream)); };
}

std::vector<std::string> TransferReceiver::active_transfers() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, incoming] : transfers_) {
        ids.push_back(id);
    }
    return ids;
}

bool TransferReceiver::has_transfer(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    return transfers_.count(transfer_id) != 0;
}

void TransferReceiver::shutdown() {
    std::lock_guard lock(mutex_);
    shut_down_ = true;
    for (auto* stream : live_streams_) {
        stream->close();
    }
}

void TransferReceiver::handle(std::unique_ptr<transport::Stream> raw) {
    auto* channel = raw.get();
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) {
            raw->close();
            return;
        }
        live_streams_.push_back(channel);
    }

    // Capability queries travel unsealed; every other stream goes through the security layer.
    std::unique_ptr<transport::Stream> stream;
    auto opening = raw->recv();
    if (opening.is_error()) {
        spdlog::debug("Inbound stream closed before its first frame: {}", opening.error().message);
        raw->close();
    } else if (is_capability_query(opening.value())) {
        if (auto sent = transport::send_frame(*raw, wire::CapabilityReply{options_.capabilities}); sent.is_error()) {
            spdlog::debug("Capability reply not delivered: {}", sent.error().message);
        }
        raw->close();
    } else {
        stream = security_.wrap(std::make_unique<PrefetchedStream>(std::move(raw), std::move(opening.value())), "");
        serve_first(*stream);
        stream->close();
    }

    std::lock_guard lock(mutex_);
    live_streams_.erase(std::remove(live_streams_.begin(), live_streams_.end(), channel), live_streams_.end());
}

void TransferReceiver::serve_first(transport::Stream& stream) {
    auto first = transport::recv_frame(stream);
    if (first.is_error()) {
        spdlog::debug("Inbound stream sent an unreadable first frame: {}", first.error().message);
    } else if (std::holds_alternative<wire::CapabilityQuery>(first.value())) {
        if (auto sent = transport::send_frame(stream, wire::CapabilityReply{options_.capabilities}); sent.is_error()) {
            spdlog::debug("Capability reply not delivered: {}", sent.error().message);
        }
    } else if (auto* offer = std::get_if<wire::Offer>(&first.value())) {
        negotiate(stream, *offer);
    } else if (auto* join = std::get_if<wire::Attach>(&first.value())) {
        attach(stream, *join);
    } else {
        reject(stream, ErrorKind::Protocol,
               std::string("unexpected ") + wire::to_string(wire::frame_type(first.value())) + " on a new stream");
    }
}

// ════════════════════════════════════════════════════════
// Negotiation
// ════════════════════════════════════════════════════════

void TransferReceiver::negotiate(transport::Stream& stream, const wire::Offer& offer) {
    const auto& manifest = offer.manifest;
    if (auto valid = ManifestValidator::validate(manifest); valid.is_error()) {
        spdlog::warn("Rejecting transfer {}: {}", manifest.transfer_id, valid.error().to_string());
        reject(stream, ErrorKind::Manifest, valid.error().message);
        return;
    }

    std::shared_ptr<Incoming> incoming;
    bool known = false;
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(manifest.transfer_id);
        if (it != transfers_.end()) {
            incoming = it->second;
            known = true;
        } else {
            auto admitted = admit(offer);
            if (admitted.is_error()) {
                const auto& error = admitted.error();
                spdlog::warn("Refused transfer {} from {}: {}", manifest.transfer_id, manifest.sender_id,
                             error.to_string());
                if (bus_) {
                    bus_->emit(events::IncomingTransferEvent{manifest.transfer_id, manifest.sender_id,
                                                             manifest.total_size, manifest.file_count, false,
                                                             offer.resume, error.message});
                }
                reject(stream, error.kind, error.message);
                return;
            }
            incoming = admitted.value();
            transfers_[manifest.transfer_id] = incoming;
        }
    }

    if (known) {
        if (incoming->manifest.checksum != manifest.checksum) {
            reject(stream, ErrorKind::Manifest, "manifest does not match the transfer in progress");
            return;
        }
        if (auto reconciled = reconcile(*incoming, offer, false); reconciled.is_error()) {
            reject(stream, reconciled.error().kind, reconciled.error().message);
            return;
        }
    }

    const auto epoch = incoming->epoch.load();
    auto accept = accept_for(*incoming);
    spdlog::info("Accepted {} transfer {} from {} ({} files, {} bytes)", known || offer.resume ? "resumed" : "new",
                 manifest.transfer_id, manifest.sender_id, manifest.file_count, manifest.total_size);
    if (bus_) {
        bus_->emit(events::IncomingTransferEvent{manifest.transfer_id, manifest.sender_id, manifest.total_size,
                                                 manifest.file_count, true, known || offer.resume, ""});
    }
    if (auto sent = transport::send_frame(stream, accept); sent.is_error()) {
        spdlog::debug("Accept for {} not delivered: {}", manifest.transfer_id, sent.error().message);
        return;
    }
    serve(stream, incoming, epoch);
}

void TransferReceiver::attach(transport::Stream& stream, const wire::Attach& join) {
    std::shared_ptr<Incoming> incoming;
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(join.transfer_id);
        if (it != transfers_.end()) {
            incoming = it->second;
        }
    }
    if (!incoming) {
        reject(stream, ErrorKind::Protocol, "unknown transfer " + join.transfer_id);
        return;
    }

    const auto epoch = incoming->epoch.load();
    if (auto sent = transport::send_frame(stream, wire::Accept{}); sent.is_error()) {
        return;
    }
    spdlog::debug("Stream {} attached to transfer {}", join.stream_index, join.transfer_id);
    serve(stream, incoming, epoch);
}

ferry::Result<std::shared_ptr<TransferReceiver::Incoming>> TransferReceiver::admit(const wire::Offer& offer) {
    const auto& manifest = offer.manifest;
    security::TransferOffer request{manifest.transfer_id, manifest.sender_id, manifest.total_size,
                                    manifest.file_count};
    auto root = trust_.authorize(request);
    if (root.is_error()) {
        return ferry::Err<std::shared_ptr<Incoming>>(root.error());
    }

    auto incoming = std::make_shared<Incoming>();
    incoming->manifest = manifest;
    incoming->root = root.value();
    incoming->staging_root = root.value() / options_.staging_dir / manifest.transfer_id;
    for (std::size_t f = 0; f < manifest.files.size(); ++f) {
        incoming->slots.push_back(std::make_unique<FileSlot>());
    }

    if (auto prepared = prepare_entries(*incoming); prepared.is_error()) {
        return ferry::Err<std::shared_ptr<Incoming>>(prepared.error());
    }
    if (offer.resume) {
        if (auto reconciled = reconcile(*incoming, offer, true); reconciled.is_error()) {
            return ferry::Err<std::shared_ptr<Incoming>>(reconciled.error());
        }
    }
    return ferry::Ok(std::move(incoming));
}

ferry::Result<void> TransferReceiver::prepare_entries(Incoming& incoming) {
    std::error_code ec;
    for (const auto& dir : incoming.manifest.directories) {
        const auto target = incoming.root / fs::path(dir.path);
        if (auto confined = ensure_confined(incoming.root, target); confined.is_error()) {
            return confined;
        }
        fs::create_directories(target, ec);
        if (ec) {
            return ferry::Err<void>(Error::storage("cannot create directory: " + ec.message(), target.string()));
        }
        apply_permissions(target, dir.permissions);
    }

    static const auto empty_digest = core::sha256(std::vector<std::uint8_t>{});
    for (std::size_t f = 0; f < incoming.manifest.files.size(); ++f) {
        const auto& file = incoming.manifest.files[f];
        const auto target = incoming.root / fs::path(file.path);
        if (auto confined = ensure_confined(incoming.root, target.parent_path()); confined.is_error()) {
            return confined;
        }

        if (file.kind == EntryKind::Symlink) {
            fs::create_directories(target.parent_path(), ec);
            fs::remove(target, ec);
            fs::create_symlink(file.link_target, target, ec);
            if (ec) {
                return ferry::Err<void>(Error::storage("cannot create symlink: " + ec.message(), target.string()));
            }
            incoming.slots[f]->verified = true;
            continue;
        }
        if (file.chunk_count != 0) {
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        std::ofstream create(target, std::ios::binary | std::ios::trunc);
        if (!create) {
            return ferry::Err<void>(Error::storage("cannot create file", target.string()));
        }
        create.close();
        apply_permissions(target, file.permissions);
        incoming.slots[f]->verified = file.checksum == empty_digest;
    }
    return ferry::Ok();
}

ferry::Result<void> TransferReceiver::reconcile(Incoming& incoming, const wire::Offer& offer, bool fresh) {
    const auto& files = incoming.manifest.files;

    if (fresh) {
        for (auto index : offer.verified_files) {
            if (index >= files.size() || files[index].chunk_count == 0) {
                continue;
            }
            std::error_code ec;
            const auto target = incoming.root / fs::path(files[index].path);
            if (fs::is_regular_file(target, ec) && fs::file_size(target, ec) == files[index].size && !ec) {
                incoming.slots[index]->verified = true;
            }
        }
        const auto& position = offer.position;
        if (position.file_index < files.size() && !incoming.slots[position.file_index]->verified &&
            position.chunk > 0) {
            auto& slot = *incoming.slots[position.file_index];
            const auto& file = files[position.file_index];
            auto opened = FileAssembler::open(incoming.staging_root / fs::path(file.path), file.size, file.checksum,
                                              options_.reorder_window, position.chunk);
            if (opened.is_error()) {
                return ferry::Err<void>(opened.error());
            }
            slot.assembler = std::move(opened.value());
        }
    } else {
        ++incoming.epoch;
        for (auto& slot : incoming.slots) {
            std::lock_guard lock(slot->mutex);
            if (slot->assembler) {
                slot->assembler->drop_buffered();
            }
        }
    }

    if (offer.resume) {
        return recheck_last_verified(incoming, offer.position);
    }
    return ferry::Ok();
}

ferry::Result<void> TransferReceiver::recheck_last_verified(Incoming& incoming, const ResumePosition& position) {
    const auto& files = incoming.manifest.files;
    const auto limit = std::min<std::size_t>(position.file_index + 1, files.size());

    for (std::size_t f = limit; f-- > 0;) {
        auto& slot = *incoming.slots[f];
        const auto& file = files[f];
        std::lock_guard lock(slot.mutex);
        if (!slot.verified || file.kind != EntryKind::Regular || file.chunk_count == 0) {
            continue;
        }

        const auto target = incoming.root / fs::path(file.path);
        auto digest = core::sha256_file(target);
        if (digest.is_ok() && digest.value() == file.checksum) {
            return ferry::Ok();
        }
        spdlog::warn("{} no longer matches its manifest digest; receiving it again", target.string());
        auto opened = FileAssembler::open(incoming.staging_root / fs::path(file.path), file.size, file.checksum,
                                          options_.reorder_window, 0);
        if (opened.is_error()) {
            return ferry::Err<void>(opened.error());
        }
        slot.assembler = std::move(opened.value());
        slot.verified = false;
        slot.start = 0;
        return ferry::Ok();
    }
    return ferry::Ok();
}

wire::Accept TransferReceiver::accept_for(Incoming& incoming) {
    wire::Accept accept;
    for (std::uint32_t f = 0; f < incoming.slots.size(); ++f) {
        auto& slot = *incoming.slots[f];
        std::lock_guard lock(slot.mutex);
        if (slot.verified) {
            accept.verified_files.push_back(f);
            accept.next_expected.push_back(incoming.manifest.files[f].chunk_count);
        } else {
            accept.next_expected.push_back(slot.assembler ? slot.assembler->next_expected() : slot.start);
        }
    }
    return accept;
}

// ════════════════════════════════════════════════════════
// Data path
// ════════════════════════════════════════════════════════

void TransferReceiver::serve(transport::Stream& stream, const std::shared_ptr<Incoming>& incoming,
                             std::uint64_t epoch) {
    const auto& transfer_id = incoming->manifest.transfer_id;

    while (true) {
        auto frame = transport::recv_frame(stream);
        if (frame.is_error()) {
            spdlog::debug("Stream for transfer {} ended: {}", transfer_id, frame.error().message);
            return;
        }
        if (incoming->epoch.load() != epoch) {
            spdlog::debug("Stream for transfer {} superseded by a newer offer", transfer_id);
            return;
        }

        if (auto* data = std::get_if<wire::ChunkData>(&frame.value())) {
            auto ack = on_chunk(*incoming, std::move(*data), epoch);
            if (!ack) {
                return;
            }
            if (auto sent = transport::send_frame(stream, *ack); sent.is_error()) {
                spdlog::debug("Ack for transfer {} not delivered: {}", transfer_id, sent.error().message);
                return;
            }
        } else if (std::holds_alternative<wire::Complete>(frame.value())) {
            if (!all_verified(*incoming)) {
                reject(stream, ErrorKind::Integrity, "transfer incomplete: not every file verified");
                continue;
            }
            finish(incoming, true, "");
            if (auto sent = transport::send_frame(stream, wire::Complete{transfer_id}); sent.is_error()) {
                spdlog::debug("Completion echo for {} not delivered: {}", transfer_id, sent.error().message);
            }
            return;
        } else if (auto* cancel = std::get_if<wire::Cancel>(&frame.value())) {
            finish(incoming, false, cancel->reason);
            return;
        } else {
            reject(stream, ErrorKind::Protocol,
                   std::string("unexpected ") + wire::to_string(wire::frame_type(frame.value())) + " during transfer");
            return;
        }
    }
}

std::optional<wire::ChunkAck> TransferReceiver::on_chunk(Incoming& incoming, wire::ChunkData data,
                                                         std::uint64_t epoch) {
    wire::ChunkAck ack;
    ack.file_index = data.file_index;
    ack.sequence = data.sequence;

    if (data.file_index >= incoming.manifest.files.size()) {
        ack.status = wire::AckStatus::Corrupt;
        ack.detail = "file index outside the manifest";
        return ack;
    }
    const auto& file = incoming.manifest.files[data.file_index];
    if (data.sequence >= file.chunk_count) {
        ack.status = wire::AckStatus::Corrupt;
        ack.detail = "sequence outside the file";
        return ack;
    }
    if (data.raw_length != chunk_length(file.size, data.sequence)) {
        ack.status = wire::AckStatus::Corrupt;
        ack.detail = "chunk length does not match the manifest";
        return ack;
    }

    Chunk chunk;
    chunk.file_index = data.file_index;
    chunk.sequence = data.sequence;
    chunk.byte_range = ByteRange{data.offset, data.raw_length};
    chunk.payload_checksum = data.payload_checksum;
    if (data.compressed) {
        const auto raw_length = data.raw_length;
        auto raw = pool_.submit([&data, raw_length] {
            return CompressionStage::decompress(data.payload, raw_length);
        }).get();
        if (raw.is_error()) {
            auto& slot = *incoming.slots[data.file_index];
            std::lock_guard lock(slot.mutex);
            ack.status = wire::AckStatus::Corrupt;
            ack.next_expected = slot.assembler ? slot.assembler->next_expected() : slot.start;
            ack.detail = raw.error().message;
            return ack;
        }
        chunk.payload = std::move(raw.value());
    } else {
        chunk.payload = std::move(data.payload);
    }

    auto& slot = *incoming.slots[data.file_index];
    bool completed = false;
    {
        std::lock_guard lock(slot.mutex);
        if (incoming.epoch.load() != epoch) {
            return std::nullopt;
        }
        if (slot.verified) {
            ack.status = wire::AckStatus::Duplicate;
            ack.next_expected = file.chunk_count;
            ack.file_state = wire::FileState::Verified;
            return ack;
        }

        if (!slot.assembler) {
            auto opened = FileAssembler::open(incoming.staging_root / fs::path(file.path), file.size, file.checksum,
                                              options_.reorder_window, slot.start);
            if (opened.is_error()) {
                ack.status = wire::AckStatus::StorageFailure;
                ack.detail = opened.error().message;
                return ack;
            }
            slot.assembler = std::move(opened.value());
        }

        auto accepted = slot.assembler->accept(chunk);
        if (accepted.is_error()) {
            spdlog::error("Cannot store chunk {} of {}: {}", data.sequence, file.path, accepted.error().to_string());
            ack.status = wire::AckStatus::StorageFailure;
            ack.detail = accepted.error().message;
            return ack;
        }

        const auto& result = accepted.value();
        ack.status = to_ack_status(result.status);
        ack.next_expected = result.next_expected;
        ack.file_state = to_file_state(result.file_status);

        if (result.file_status == FileStatus::Verified) {
            if (auto placed = place_file(incoming, data.file_index, slot); placed.is_error()) {
                ack.status = wire::AckStatus::StorageFailure;
                ack.file_state = wire::FileState::InProgress;
                ack.detail = placed.error().message;
                return ack;
            }
            completed = true;
        }
    }

    if (completed && bus_) {
        bus_->emit(events::FileCompletedEvent{incoming.manifest.transfer_id, events::Direction::Incoming,
                                              data.file_index, file.path, file.size});
    }
    return ack;
}

ferry::Result<void> TransferReceiver::place_file(Incoming& incoming, std::uint32_t file_index, FileSlot& slot) {
    const auto& file = incoming.manifest.files[file_index];
    const auto staged = slot.assembler->staging_path();
    const auto target = incoming.root / fs::path(file.path);
    slot.assembler->close();

    std::error_code ec;
    if (auto confined = ensure_confined(incoming.root, target.parent_path()); confined.is_error()) {
        return confined;
    }
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return ferry::Err<void>(Error::storage("cannot create directory: " + ec.message(),
                                               target.parent_path().string()));
    }
    if (auto confined = ensure_confined(incoming.root, target.parent_path()); confined.is_error()) {
        return confined;
    }
    fs::rename(staged, target, ec);
    if (ec) {
        return ferry::Err<void>(Error::storage("cannot move file into place: " + ec.message(), target.string()));
    }
    apply_permissions(target, file.permissions);

    slot.assembler.reset();
    slot.verified = true;
    spdlog::debug("Received {} ({} bytes)", target.string(), file.size);
    return ferry::Ok();
}

bool TransferReceiver::all_verified(Incoming& incoming) {
    for (auto& slot : incoming.slots) {
        std::lock_guard lock(slot->mutex);
        if (!slot->verified) {
            return false;
        }
    }
    return true;
}

void TransferReceiver::finish(const std::shared_ptr<Incoming>& incoming, bool completed, const std::string& reason) {
    const auto& transfer_id = incoming->manifest.transfer_id;
    {
        std::lock_guard lock(mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || it->second != incoming) {
            return;
        }
        transfers_.erase(it);
    }

    for (auto& slot : incoming->slots) {
        std::lock_guard lock(slot->mutex);
        if (slot->assembler) {
            slot->assembler->close();
            slot->assembler.reset();
        }
    }
    std::error_code ec;
    fs::remove_all(incoming->staging_root, ec);
    if (ec) {
        spdlog::warn("Could not remove staging data {}: {}", incoming->staging_root.string(), ec.message());
    }
    fs::remove(incoming->staging_root.parent_path(), ec);

    if (completed) {
        spdlog::info("Transfer {} received completely", transfer_id);
    } else {
        spdlog::warn("Transfer {} cancelled by sender: {}", transfer_id, reason);
    }
    if (bus_) {
        bus_->emit(events::IncomingTransferFinishedEvent{transfer_id, completed, reason});
    }
}

} // namespace ferry::transfer

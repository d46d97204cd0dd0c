#include "ferry/transfer/session.hpp"

#include "ferry/core/ids.hpp"
#include "ferry/events/events.hpp"
#include "ferry/transfer/chunk_engine.hpp"
#include "ferry/wire/frames.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry::transfer {
namespace {

std::uint64_t prefix_bytes(const FileEntry& file, std::uint64_t chunks) {
    return std::min(chunks * kChunkSize, file.size);
}

std::uint64_t range_bytes(const FileEntry& file, std::uint64_t first, std::uint64_t end) {
    std::uint64_t bytes = 0;
    for (auto seq = first; seq < end; ++seq) {
        bytes += chunk_length(file.size, seq);
    }
    return bytes;
}

std::optional<CompressionDecision> restored_decision(const std::optional<ResumeRecord>& record) {
    if (!record || record->compression == CompressionDecision::Undecided) {
        return std::nullopt;
    }
    return record->compression;
}

} // namespace

TransferSession::TransferSession(SessionServices services, TransferManifest manifest, std::string peer_id,
                                 TransferOptions options, std::optional<ResumeRecord> resumed)
    : services_(services),
      session_id_(core::generate_id()),
      manifest_(std::move(manifest)),
      peer_id_(std::move(peer_id)),
      options_(std::move(options)),
      resumed_(resumed.has_value()),
      compression_(options_.compression.value_or(services_.config.compression), manifest_.total_size,
                   services_.config.compression_min_size, services_.config.compression_min_reduction,
                   restored_decision(resumed)),
      bandwidth_(options_.bandwidth_limit, services_.config.bandwidth_refill_interval),
      progress_(manifest_.total_size, manifest_.file_count, services_.clock),
      machine_(services_.clock),
      verified_(manifest_.files.size(), false),
      failed_(manifest_.files.size(), false),
      written_prefix_(manifest_.files.size(), 0),
      file_retries_(manifest_.files.size(), 0) {
    if (!resumed) {
        return;
    }

    const auto& token = resumed->token;
    for (std::int64_t f = 0; f <= token.last_completed_file && f < static_cast<std::int64_t>(manifest_.files.size());
         ++f) {
        const auto& file = manifest_.files[static_cast<std::size_t>(f)];
        written_prefix_[f] = f < token.last_completed_file
                                 ? file.chunk_count
                                 : std::min<std::uint64_t>(token.last_completed_chunk + 1, file.chunk_count);
        if (written_prefix_[f] == file.chunk_count && file.chunk_count > 0) {
            verified_[f] = true;
        }
    }
    for (auto index : resumed->verified_files) {
        if (index < manifest_.files.size()) {
            verified_[index] = true;
            written_prefix_[index] = manifest_.files[index].chunk_count;
        }
    }

    std::uint64_t bytes = 0;
    std::uint32_t files = 0;
    for (std::size_t f = 0; f < manifest_.files.size(); ++f) {
        bytes += prefix_bytes(manifest_.files[f], written_prefix_[f]);
        files += verified_[f] ? 1 : 0;
    }
    progress_.set_bytes(bytes);
    progress_.set_files_completed(files);
}

TransferSession::~TransferSession() {
    bool running = false;
    {
        std::lock_guard lock(mutex_);
        running = started_ && !is_terminal(machine_.state());
    }
    if (running) {
        if (auto cancelled = cancel(); cancelled.is_error()) {
            spdlog::debug("Session {} finished while shutting down: {}", session_id_, cancelled.error().message);
        }
    }
    if (driver_.joinable()) {
        if (driver_.get_id() == std::this_thread::get_id()) {
            driver_.detach();
        } else {
            driver_.join();
        }
    }
}

void TransferSession::start() {
    std::lock_guard lock(mutex_);
    if (started_ || is_terminal(machine_.state())) {
        return;
    }
    started_ = true;
    driver_ = std::thread([this] { run(); });
}

TransferState TransferSession::wait() {
    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return is_terminal(machine_.state()); });
    return machine_.state();
}

bool TransferSession::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return is_terminal(machine_.state()); });
}

// ════════════════════════════════════════════════════════
// Control
// ════════════════════════════════════════════════════════

ferry::Result<void> TransferSession::pause() {
    TransferState from;
    {
        std::lock_guard lock(mutex_);
        from = machine_.state();
        if (from != TransferState::Transferring) {
            return ferry::Err<void>(ferry::Error::state(std::string("cannot pause a session that is ") + to_string(from)));
        }
        if (auto moved = machine_.transition_to(TransferState::Paused); moved.is_error()) {
            return moved;
        }
        paused_ = true;
    }
    spdlog::info("Session {} paused", session_id_);
    if (services_.bus) {
        services_.bus->emit(events::TransferStateChangedEvent{session_id_, manifest_.transfer_id, from,
                                                              TransferState::Paused, std::nullopt});
    }
    checkpoint();
    return ferry::Ok();
}

ferry::Result<void> TransferSession::resume() {
    {
        std::lock_guard lock(mutex_);
        const auto current = machine_.state();
        if (current != TransferState::Paused) {
            return ferry::Err<void>(ferry::Error::state(std::string("cannot resume a session that is ") + to_string(current)));
        }
        if (auto moved = machine_.transition_to(TransferState::Transferring); moved.is_error()) {
            return moved;
        }
        paused_ = false;
    }
    control_cv_.notify_all();
    spdlog::info("Session {} resumed", session_id_);
    if (services_.bus) {
        services_.bus->emit(events::TransferStateChangedEvent{session_id_, manifest_.transfer_id,
                                                              TransferState::Paused, TransferState::Transferring,
                                                              std::nullopt});
    }
    return ferry::Ok();
}

ferry::Result<void> TransferSession::cancel() {
    return request_stop(false);
}

ferry::Result<void> TransferSession::suspend() {
    return request_stop(true);
}

ferry::Result<void> TransferSession::request_stop(bool keep_checkpoint) {
    const TransferState terminal = keep_checkpoint ? TransferState::Failed : TransferState::Cancelled;
    std::optional<Error> error;
    bool cancelled_directly = false;
    TransferState from;
    {
        std::lock_guard lock(mutex_);
        from = machine_.state();
        if (is_terminal(from)) {
            return ferry::Err<void>(ferry::Error::state(std::string("session already ") + to_string(from)));
        }
        if (cancel_requested_) {
            return ferry::Ok();
        }
        cancel_requested_ = true;
        suspend_requested_ = keep_checkpoint;
        paused_ = false;
        if (!started_) {
            auto moved = keep_checkpoint ? machine_.fail(Error::cancelled("engine shut down"))
                                         : machine_.transition_to(TransferState::Cancelled);
            if (moved.is_error()) {
                return moved;
            }
            error = machine_.error();
            finished_at_ = services_.clock();
            cancelled_directly = true;
        } else if (active_streams_ != nullptr) {
            active_streams_->close();
        }
    }
    bandwidth_.interrupt();
    control_cv_.notify_all();

    spdlog::info("Session {} {} requested", session_id_, keep_checkpoint ? "suspension" : "cancellation");
    if (cancelled_directly) {
        if (services_.bus) {
            services_.bus->emit(events::TransferStateChangedEvent{session_id_, manifest_.transfer_id, from,
                                                                  terminal, error});
        }
        done_cv_.notify_all();
    }
    return ferry::Ok();
}

void TransferSession::set_bandwidth_limit(std::optional<std::uint64_t> bytes_per_second) {
    bandwidth_.set_limit(bytes_per_second);
}

// ════════════════════════════════════════════════════════
// Accessors
// ════════════════════════════════════════════════════════

TransferState TransferSession::state() const {
    std::lock_guard lock(mutex_);
    return machine_.state();
}

std::optional<Error> TransferSession::error() const {
    std::lock_guard lock(mutex_);
    return machine_.error();
}

std::optional<ResumeToken> TransferSession::resume_token() const {
    std::lock_guard lock(mutex_);
    return token_;
}

std::optional<transport::TransportProtocol> TransferSession::transport() const {
    std::lock_guard lock(mutex_);
    return protocol_;
}

std::optional<core::TimePoint> TransferSession::finished_at() const {
    std::lock_guard lock(mutex_);
    return finished_at_;
}

SessionInfo TransferSession::info() const {
    SessionInfo info;
    info.session_id = session_id_;
    info.transfer_id = manifest_.transfer_id;
    info.peer_id = peer_id_;
    info.progress = progress_.snapshot();
    info.bandwidth_limit = bandwidth_.limit();
    info.compression = compression_.decision();

    std::lock_guard lock(mutex_);
    info.state = machine_.state();
    info.transport = protocol_;
    info.parallel_streams = stream_count_;
    info.resume_token = token_;
    info.error = machine_.error();
    for (std::uint32_t f = 0; f < failed_.size(); ++f) {
        if (failed_[f]) {
            info.failed_files.push_back(f);
        }
    }
    return info;
}

// ════════════════════════════════════════════════════════
// Driver
// ════════════════════════════════════════════════════════

void TransferSession::run() {
    if (auto moved = set_state(TransferState::Negotiating); moved.is_error()) {
        spdlog::debug("Session {} not started: {}", session_id_, moved.error().message);
        return;
    }
    if (resumed_) {
        // The consumed token is replaced by one naming this session.
        checkpoint();
    }

    auto chosen = services_.negotiator.negotiate(peer_id_, manifest_.total_size, options_.preferred_transport);
    if (chosen.is_error()) {
        finish(TransferState::Failed, chosen.error());
        return;
    }

    auto protocol = chosen.value();
    bool resuming = resumed_;
    spdlog::info("Session {} sending {} files ({} bytes) to {} over {}", session_id_, manifest_.file_count,
                 manifest_.total_size, peer_id_, transport::to_string(protocol));

    while (true) {
        {
            std::lock_guard lock(mutex_);
            if (cancel_requested_) {
                break;
            }
            protocol_ = protocol;
            abort_ = false;
            transport_error_.reset();
        }
        bandwidth_.clear_interrupt();

        const auto outcome = run_attempt(protocol, resuming);
        resuming = true;

        if (outcome == Outcome::Done) {
            finish(TransferState::Completed, std::nullopt);
            return;
        }
        if (outcome == Outcome::Cancelled) {
            break;
        }
        if (outcome == Outcome::Fatal) {
            std::optional<Error> error;
            {
                std::lock_guard lock(mutex_);
                error = fatal_error_;
            }
            checkpoint();
            finish(TransferState::Failed, error);
            return;
        }

        Error cause = Error::transport("transport failed");
        {
            std::lock_guard lock(mutex_);
            if (transport_error_) {
                cause = *transport_error_;
            }
        }
        checkpoint();

        auto next = services_.negotiator.fallback(peer_id_, protocol);
        if (!next) {
            finish(TransferState::Failed,
                   Error::transport(std::string(transport::to_string(protocol)) +
                                    " failed and no fallback transport remains: " + cause.message));
            return;
        }
        if (services_.bus) {
            services_.bus->emit(events::TransportFallbackEvent{session_id_, peer_id_, protocol, *next, cause.message});
        }
        protocol = *next;
    }

    bool suspended = false;
    {
        std::lock_guard lock(mutex_);
        suspended = suspend_requested_;
    }
    if (suspended) {
        checkpoint();
        finish(TransferState::Failed, Error::cancelled("engine shut down"));
        return;
    }
    finish(TransferState::Cancelled, std::nullopt);
}

TransferSession::Outcome TransferSession::run_attempt(transport::TransportProtocol protocol, bool resuming) {
    auto transport = services_.negotiator.transport_for(protocol);
    if (!transport) {
        report_transport_failure(Error::transport(std::string("no local transport for ") + transport::to_string(protocol)));
        return Outcome::TransportFailed;
    }

    std::size_t stream_limit = services_.config.max_parallel_streams;
    if (auto caps = services_.negotiator.capabilities(peer_id_); caps.is_ok()) {
        stream_limit = std::min<std::size_t>(stream_limit, caps.value().max_parallel_streams);
    }
    stream_limit = std::clamp<std::size_t>(stream_limit, 1, kMaxParallelStreams);

    auto opened = transport->open_stream(peer_id_);
    if (opened.is_error()) {
        report_transport_failure(opened.error());
        return Outcome::TransportFailed;
    }

    std::vector<std::unique_ptr<transport::Stream>> lanes;
    lanes.push_back(services_.security.wrap(std::move(opened.value()), peer_id_));
    auto close_lanes = [&lanes] {
        for (auto& lane : lanes) {
            lane->close();
        }
    };

    wire::Offer offer;
    {
        std::lock_guard lock(mutex_);
        offer.session_id = session_id_;
        offer.manifest = manifest_;
        offer.resume = resuming;
        offer.position = position_after(watermark_locked(), manifest_);
        for (std::uint32_t f = 0; f < verified_.size(); ++f) {
            if (verified_[f]) {
                offer.verified_files.push_back(f);
            }
        }
    }

    if (auto sent = transport::send_frame(*lanes[0], offer); sent.is_error()) {
        close_lanes();
        report_transport_failure(sent.error());
        return Outcome::TransportFailed;
    }
    auto reply = transport::recv_frame(*lanes[0], services_.config.negotiation_timeout);
    if (reply.is_error()) {
        close_lanes();
        report_transport_failure(reply.error());
        return Outcome::TransportFailed;
    }
    if (auto* reject = std::get_if<wire::Reject>(&reply.value())) {
        close_lanes();
        report_fatal(Error(reject->kind, reject->reason));
        return Outcome::Fatal;
    }
    auto* accept = std::get_if<wire::Accept>(&reply.value());
    if (accept == nullptr) {
        close_lanes();
        report_fatal(Error::protocol(std::string("unexpected ") + wire::to_string(wire::frame_type(reply.value())) +
                                     " in reply to offer"));
        return Outcome::Fatal;
    }
    if (auto applied = apply_accept(accept->verified_files, accept->next_expected); applied.is_error()) {
        close_lanes();
        report_fatal(applied.error());
        return Outcome::Fatal;
    }

    if (state() == TransferState::Negotiating) {
        if (auto moved = set_state(TransferState::Transferring); moved.is_error()) {
            spdlog::debug("Session {}: {}", session_id_, moved.error().message);
        }
    }

    auto units = pending_units();
    const std::size_t wanted = std::clamp<std::size_t>(units.size(), 1, stream_limit);
    ParallelStreamManager manager(wanted);
    manager.load(units);

    for (std::uint32_t index = 1; index < wanted; ++index) {
        auto extra = transport->open_stream(peer_id_);
        if (extra.is_error()) {
            close_lanes();
            report_transport_failure(extra.error());
            return Outcome::TransportFailed;
        }
        auto lane = services_.security.wrap(std::move(extra.value()), peer_id_);
        auto attached = transport::send_frame(*lane, wire::Attach{manifest_.transfer_id, index});
        ferry::Result<wire::Frame> answer = attached.is_ok()
            ? transport::recv_frame(*lane, services_.config.negotiation_timeout)
            : ferry::Err<wire::Frame>(attached.error());
        if (answer.is_error()) {
            lane->close();
            close_lanes();
            report_transport_failure(answer.error());
            return Outcome::TransportFailed;
        }
        if (!std::holds_alternative<wire::Accept>(answer.value())) {
            spdlog::warn("Peer {} refused parallel stream {}; continuing with {}", peer_id_, index, lanes.size());
            lane->close();
            break;
        }
        lanes.push_back(std::move(lane));
    }

    // Lanes beyond the ones the peer accepted are simply idle slots in the manager.
    {
        std::lock_guard lock(mutex_);
        stream_count_ = lanes.size();
        live_streams_.clear();
        for (auto& lane : lanes) {
            live_streams_.push_back(lane.get());
        }
        active_streams_ = &manager;
        if (cancel_requested_ || abort_) {
            manager.close();
        }
    }
    spdlog::debug("Session {}: {} units over {} streams", session_id_, units.size(), lanes.size());

    std::vector<std::thread> workers;
    for (std::size_t index = 0; index < lanes.size(); ++index) {
        workers.emplace_back([this, index, &lanes, &manager] { worker(index, *lanes[index], manager); });
    }
    for (auto& thread : workers) {
        thread.join();
    }

    Outcome outcome = Outcome::Done;
    {
        std::lock_guard lock(mutex_);
        active_streams_ = nullptr;
        live_streams_.clear();
        if (cancel_requested_) {
            outcome = Outcome::Cancelled;
        } else if (fatal_error_) {
            outcome = Outcome::Fatal;
        } else if (transport_error_) {
            outcome = Outcome::TransportFailed;
        }
    }

    if (outcome == Outcome::Done) {
        for (std::size_t index = 1; index < lanes.size(); ++index) {
            lanes[index]->close();
        }
        outcome = finish_attempt(*lanes[0]);
    } else if (outcome == Outcome::Cancelled || outcome == Outcome::Fatal) {
        std::string reason = "cancelled";
        bool notify = true;
        {
            std::lock_guard lock(mutex_);
            if (outcome == Outcome::Fatal) {
                reason = fatal_error_ ? fatal_error_->to_string() : "failed";
            } else {
                notify = !suspend_requested_;
            }
        }
        if (!notify) {
            spdlog::debug("Session {}: suspended, receiver keeps its partial data", session_id_);
        } else if (auto sent = transport::send_frame(*lanes[0], wire::Cancel{manifest_.transfer_id, reason}); sent.is_error()) {
            spdlog::debug("Session {}: cancel notice not delivered: {}", session_id_, sent.error().message);
        }
    }

    close_lanes();
    return outcome;
}

TransferSession::Outcome TransferSession::finish_attempt(transport::Stream& control) {
    std::optional<Error> unresolved;
    {
        std::lock_guard lock(mutex_);
        if (first_file_error_) {
            unresolved = first_file_error_;
        } else {
            for (std::size_t f = 0; f < verified_.size(); ++f) {
                if (!verified_[f]) {
                    unresolved = Error::integrity("file was not verified by the peer", manifest_.files[f].path);
                    break;
                }
            }
        }
    }

    if (unresolved) {
        if (auto sent = transport::send_frame(control, wire::Cancel{manifest_.transfer_id, unresolved->to_string()});
            sent.is_error()) {
            spdlog::debug("Session {}: cancel notice not delivered: {}", session_id_, sent.error().message);
        }
        report_fatal(*unresolved);
        return Outcome::Fatal;
    }

    if (auto sent = transport::send_frame(control, wire::Complete{manifest_.transfer_id}); sent.is_error()) {
        report_transport_failure(sent.error());
        return Outcome::TransportFailed;
    }
    auto reply = transport::recv_frame(control, services_.config.stall_timeout);
    if (reply.is_error()) {
        report_transport_failure(reply.error());
        return Outcome::TransportFailed;
    }
    if (std::holds_alternative<wire::Complete>(reply.value())) {
        return Outcome::Done;
    }
    if (auto* reject = std::get_if<wire::Reject>(&reply.value())) {
        report_fatal(Error(reject->kind, reject->reason));
    } else {
        report_fatal(Error::protocol("unexpected reply to complete"));
    }
    return Outcome::Fatal;
}

ferry::Result<void> TransferSession::apply_accept(const std::vector<std::uint32_t>& verified,
                                                  const std::vector<std::uint64_t>& next_expected) {
    if (next_expected.size() != manifest_.files.size()) {
        return ferry::Err<void>(Error::protocol("accept does not cover every manifest file"));
    }

    std::uint64_t bytes = 0;
    std::uint32_t files = 0;
    {
        std::lock_guard lock(mutex_);
        std::fill(verified_.begin(), verified_.end(), false);
        for (auto index : verified) {
            if (index >= verified_.size()) {
                return ferry::Err<void>(Error::protocol("accept names a file outside the manifest"));
            }
            verified_[index] = true;
        }
        for (std::size_t f = 0; f < manifest_.files.size(); ++f) {
            const auto& file = manifest_.files[f];
            written_prefix_[f] = verified_[f] ? file.chunk_count : std::min(next_expected[f], file.chunk_count);
            bytes += prefix_bytes(file, written_prefix_[f]);
            files += verified_[f] ? 1 : 0;
        }
    }
    progress_.set_bytes(bytes);
    progress_.set_files_completed(files);
    return ferry::Ok();
}

std::vector<WorkUnit> TransferSession::pending_units() const {
    std::vector<std::optional<std::uint64_t>> starts(manifest_.files.size());
    {
        std::lock_guard lock(mutex_);
        for (std::size_t f = 0; f < manifest_.files.size(); ++f) {
            if (!verified_[f] && !failed_[f]) {
                starts[f] = written_prefix_[f];
            }
        }
    }
    return ParallelStreamManager::plan(manifest_, starts, services_.config.small_file_threshold);
}

// ════════════════════════════════════════════════════════
// Stream workers
// ════════════════════════════════════════════════════════

void TransferSession::worker(std::size_t index, transport::Stream& stream, ParallelStreamManager& streams) {
    while (auto unit = streams.next(index)) {
        WorkUnit remaining = *unit;
        std::uint64_t bytes_sent = 0;
        const auto result = send_unit(stream, streams, remaining, bytes_sent);

        if (result == UnitResult::Requeue) {
            streams.load({remaining});
        }
        streams.complete(index, *unit, bytes_sent);
        if (result == UnitResult::Abort) {
            return;
        }
    }
}

TransferSession::UnitResult TransferSession::send_unit(transport::Stream& stream, ParallelStreamManager& streams,
                                                       WorkUnit& unit, std::uint64_t& bytes_sent) {
    const auto& config = services_.config;
    const auto file_index = unit.file_index;
    const auto& file = manifest_.files[file_index];
    const std::uint64_t end = unit.first_sequence + unit.chunk_count;
    ChunkReader reader(file.source, file_index, file.size, unit.first_sequence);

    std::uint32_t attempt = 0;
    std::uint64_t seq = unit.first_sequence;
    while (seq < end) {
        if (!at_chunk_boundary()) {
            return UnitResult::Abort;
        }
        if (file_failed(file_index)) {
            return UnitResult::Finished;
        }

        auto chunk = reader.read(seq);
        if (chunk.is_error()) {
            fail_file(file_index, Error::storage(chunk.error().message, file.path));
            return UnitResult::Finished;
        }
        const auto& raw = chunk.value().payload;
        auto output = services_.pool.submit([this, &raw] { return compression_.maybe_compress(raw); }).get();

        if (auto granted = bandwidth_.acquire(output.payload.size()); granted.is_error()) {
            return UnitResult::Abort;
        }

        wire::ChunkData data;
        data.file_index = file_index;
        data.sequence = seq;
        data.offset = chunk.value().byte_range.offset;
        data.raw_length = static_cast<std::uint32_t>(raw.size());
        data.compressed = output.compressed;
        data.payload_checksum = chunk.value().payload_checksum;
        data.payload = std::move(output.payload);

        if (auto sent = transport::send_frame(stream, data); sent.is_error()) {
            report_transport_failure(sent.error());
            return UnitResult::Abort;
        }
        auto reply = transport::recv_frame(stream, config.stall_timeout);
        if (reply.is_error()) {
            report_transport_failure(Error::transport("no acknowledgment for chunk " + std::to_string(seq) + " of " +
                                                      file.path + ": " + reply.error().message));
            return UnitResult::Abort;
        }
        auto* ack = std::get_if<wire::ChunkAck>(&reply.value());
        if (ack == nullptr || ack->file_index != file_index || ack->sequence != seq) {
            report_fatal(Error::protocol("unexpected reply to chunk " + std::to_string(seq) + " of " + file.path));
            return UnitResult::Abort;
        }

        switch (ack->status) {
        case wire::AckStatus::Written:
        case wire::AckStatus::Buffered:
            bytes_sent += raw.size();
            progress_.add_bytes(raw.size());
            if (ack->file_state == wire::FileState::Corrupt) {
                on_file_corrupt(file_index, streams);
                return UnitResult::Finished;
            }
            on_written(file_index, ack->next_expected);
            if (ack->file_state == wire::FileState::Verified) {
                on_file_verified(file_index);
            }
            emit_progress();
            if (++acks_since_checkpoint_ >= config.checkpoint_interval_chunks) {
                checkpoint();
            }
            attempt = 0;
            ++seq;
            break;

        case wire::AckStatus::Duplicate:
            on_written(file_index, ack->next_expected);
            if (ack->file_state == wire::FileState::Verified) {
                on_file_verified(file_index);
            }
            attempt = 0;
            ++seq;
            break;

        case wire::AckStatus::Corrupt:
            if (++attempt > config.max_chunk_retries) {
                fail_file(file_index, Error::integrity("chunk " + std::to_string(seq) + " failed verification after " +
                                                           std::to_string(config.max_chunk_retries) + " retries",
                                                       file.path));
                return UnitResult::Finished;
            }
            if (services_.bus) {
                services_.bus->emit(events::ChunkRetransmittedEvent{session_id_, file_index, seq, attempt});
            }
            std::this_thread::sleep_for(config.retry_backoff * (1u << (attempt - 1)));
            break;

        case wire::AckStatus::OutOfWindow:
            spdlog::debug("Session {}: chunk {} of {} outside the receive window (next {})", session_id_, seq,
                          file.path, ack->next_expected);
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
            unit.first_sequence = seq;
            unit.chunk_count = end - seq;
            unit.bytes = range_bytes(file, seq, end);
            return UnitResult::Requeue;

        case wire::AckStatus::StorageFailure:
            report_fatal(Error::storage(ack->detail, file.path));
            return UnitResult::Abort;
        }
    }
    return UnitResult::Finished;
}

bool TransferSession::at_chunk_boundary() {
    std::unique_lock lock(mutex_);
    control_cv_.wait(lock, [this] { return !paused_ || cancel_requested_ || abort_; });
    return !cancel_requested_ && !abort_;
}

void TransferSession::abort_attempt() {
    {
        std::lock_guard lock(mutex_);
        abort_ = true;
        if (active_streams_ != nullptr) {
            active_streams_->close();
        }
        for (auto* stream : live_streams_) {
            stream->close();
        }
    }
    bandwidth_.interrupt();
    control_cv_.notify_all();
}

void TransferSession::report_transport_failure(const Error& error) {
    {
        std::lock_guard lock(mutex_);
        if (abort_ || cancel_requested_) {
            return;
        }
        transport_error_ = error;
    }
    spdlog::warn("Session {}: transport failure: {}", session_id_, error.message);
    abort_attempt();
}

void TransferSession::report_fatal(const Error& error) {
    {
        std::lock_guard lock(mutex_);
        if (!fatal_error_) {
            fatal_error_ = error;
        }
    }
    spdlog::error("Session {}: {}", session_id_, error.to_string());
    abort_attempt();
}

// ════════════════════════════════════════════════════════
// File bookkeeping
// ════════════════════════════════════════════════════════

void TransferSession::on_written(std::uint32_t file_index, std::uint64_t next_expected) {
    std::lock_guard lock(mutex_);
    const auto chunks = manifest_.files[file_index].chunk_count;
    written_prefix_[file_index] = std::max(written_prefix_[file_index], std::min(next_expected, chunks));
}

void TransferSession::on_file_verified(std::uint32_t file_index) {
    const auto& file = manifest_.files[file_index];
    {
        std::lock_guard lock(mutex_);
        if (verified_[file_index]) {
            return;
        }
        verified_[file_index] = true;
        written_prefix_[file_index] = file.chunk_count;
    }
    progress_.file_completed();
    if (services_.bus) {
        services_.bus->emit(events::FileCompletedEvent{session_id_, events::Direction::Outgoing, file_index,
                                                       file.path, file.size});
    }
    checkpoint();
}

void TransferSession::on_file_corrupt(std::uint32_t file_index, ParallelStreamManager& streams) {
    const auto& file = manifest_.files[file_index];
    std::uint32_t attempts = 0;
    std::uint64_t bytes = 0;
    {
        std::lock_guard lock(mutex_);
        written_prefix_[file_index] = 0;
        attempts = ++file_retries_[file_index];
        for (std::size_t f = 0; f < manifest_.files.size(); ++f) {
            bytes += prefix_bytes(manifest_.files[f], verified_[f] ? manifest_.files[f].chunk_count : written_prefix_[f]);
        }
    }
    progress_.set_bytes(bytes);

    if (attempts > services_.config.max_file_retries) {
        fail_file(file_index, Error::integrity("file digest mismatch after " + std::to_string(attempts) + " attempts",
                                               file.path));
        return;
    }
    spdlog::warn("Session {}: {} failed its digest check, resending (attempt {})", session_id_, file.path, attempts);
    streams.load(ParallelStreamManager::plan_file(manifest_, file_index, services_.config.small_file_threshold));
}

void TransferSession::fail_file(std::uint32_t file_index, const Error& error) {
    {
        std::lock_guard lock(mutex_);
        if (failed_[file_index]) {
            return;
        }
        failed_[file_index] = true;
        if (!first_file_error_) {
            first_file_error_ = error;
        }
    }
    spdlog::error("Session {}: file {} failed: {}", session_id_, manifest_.files[file_index].path, error.to_string());
    if (services_.bus) {
        services_.bus->emit(events::FileFailedEvent{session_id_, file_index, manifest_.files[file_index].path, error});
    }
}

bool TransferSession::file_failed(std::uint32_t file_index) const {
    std::lock_guard lock(mutex_);
    return failed_[file_index];
}

// ════════════════════════════════════════════════════════
// Checkpoints and state
// ════════════════════════════════════════════════════════

ResumeToken TransferSession::watermark_locked() const {
    ResumeToken token;
    token.transfer_id = manifest_.transfer_id;
    token.session_id = session_id_;

    for (std::size_t f = 0; f < manifest_.files.size(); ++f) {
        const auto& file = manifest_.files[f];
        const auto prefix = verified_[f] ? file.chunk_count : written_prefix_[f];
        if (prefix >= file.chunk_count) {
            if (file.chunk_count > 0) {
                token.last_completed_file = static_cast<std::int64_t>(f);
                token.last_completed_chunk = static_cast<std::int64_t>(file.chunk_count) - 1;
            }
            token.bytes_completed += file.size;
            continue;
        }
        if (prefix > 0) {
            token.last_completed_file = static_cast<std::int64_t>(f);
            token.last_completed_chunk = static_cast<std::int64_t>(prefix) - 1;
            token.bytes_completed += prefix_bytes(file, prefix);
        }
        break;
    }
    return token;
}

ResumeRecord TransferSession::snapshot_record() const {
    ResumeRecord record;
    record.manifest = manifest_;
    record.peer_id = peer_id_;
    record.options = options_;
    record.compression = compression_.decision();
    record.compression_reduction = compression_.sampled_reduction();

    std::lock_guard lock(mutex_);
    record.token = watermark_locked();
    record.last_transport = protocol_;
    for (std::uint32_t f = 0; f < verified_.size(); ++f) {
        if (verified_[f]) {
            record.verified_files.push_back(f);
        }
    }
    return record;
}

void TransferSession::checkpoint() {
    std::lock_guard serial(checkpoint_mutex_);
    acks_since_checkpoint_ = 0;

    auto token = services_.resume.checkpoint(snapshot_record());
    if (token.is_error()) {
        spdlog::error("Session {}: checkpoint failed: {}", session_id_, token.error().to_string());
        return;
    }
    {
        std::lock_guard lock(mutex_);
        token_ = token.value();
    }
    if (services_.bus) {
        services_.bus->emit(events::CheckpointEvent{session_id_, token.value()});
    }
}

void TransferSession::finish(TransferState terminal, std::optional<Error> error) {
    const bool drop_token = terminal == TransferState::Completed || terminal == TransferState::Cancelled ||
                            (error && error->kind == ErrorKind::Rejected);
    if (drop_token) {
        std::lock_guard serial(checkpoint_mutex_);
        if (auto removed = services_.resume.discard(manifest_.transfer_id); removed.is_error()) {
            spdlog::warn("Session {}: {}", session_id_, removed.error().to_string());
        }
        std::lock_guard lock(mutex_);
        token_.reset();
    }

    TransferState from;
    {
        std::lock_guard lock(mutex_);
        from = machine_.state();
        if (terminal == TransferState::Completed && from == TransferState::Paused) {
            paused_ = false;
            if (auto moved = machine_.transition_to(TransferState::Transferring); moved.is_error()) {
                spdlog::debug("Session {}: {}", session_id_, moved.error().message);
            }
        }
        ferry::Result<void> moved = terminal == TransferState::Failed
            ? machine_.fail(error.value_or(Error::transport("transfer failed")))
            : machine_.transition_to(terminal);
        if (moved.is_error()) {
            spdlog::error("Session {}: {}", session_id_, moved.error().message);
        }
        finished_at_ = services_.clock();
        error = machine_.error();
    }

    if (terminal == TransferState::Failed) {
        spdlog::error("Session {} failed: {}", session_id_, error ? error->to_string() : "unknown");
    } else {
        spdlog::info("Session {} {}", session_id_, to_string(terminal));
    }
    if (services_.bus) {
        services_.bus->emit(events::TransferStateChangedEvent{
            session_id_, manifest_.transfer_id, from, terminal,
            terminal == TransferState::Failed ? error : std::nullopt});
    }
    done_cv_.notify_all();
}

ferry::Result<void> TransferSession::set_state(TransferState next) {
    TransferState from;
    {
        std::lock_guard lock(mutex_);
        from = machine_.state();
        if (auto moved = machine_.transition_to(next); moved.is_error()) {
            return moved;
        }
    }
    if (from != next && services_.bus) {
        services_.bus->emit(events::TransferStateChangedEvent{session_id_, manifest_.transfer_id, from, next,
                                                              std::nullopt});
    }
    return ferry::Ok();
}

void TransferSession::emit_progress() {
    if (services_.bus) {
        services_.bus->emit(events::TransferProgressEvent{session_id_, progress_.snapshot()});
    }
}

} // namespace ferry::transfer

#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/compute_pool.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/result.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/security/security_layer.hpp"
#include "ferry/transfer/bandwidth.hpp"
#include "ferry/transfer/compression.hpp"
#include "ferry/transfer/parallel.hpp"
#include "ferry/transfer/progress.hpp"
#include "ferry/transfer/resume.hpp"
#include "ferry/transfer/state_machine.hpp"
#include "ferry/transfer/types.hpp"
#include "ferry/transport/negotiator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ferry::transfer {

/// Engine-owned collaborators a session borrows for its lifetime.
struct SessionServices {
    const core::EngineConfig& config;
    transport::TransportNegotiator& negotiator;
    security::SecurityLayer& security;
    ResumeManager& resume;
    core::ComputePool& pool;
    events::EventBus* bus = nullptr;
    core::Clock clock = core::system_clock();
};

/// Point-in-time view of a session, safe to hand out.
struct SessionInfo {
    std::string session_id;
    std::string transfer_id;
    std::string peer_id;
    TransferState state = TransferState::Pending;
    std::optional<transport::TransportProtocol> transport;
    TransferProgress progress;
    std::optional<std::uint64_t> bandwidth_limit;
    std::size_t parallel_streams = 0;
    std::optional<ResumeToken> resume_token;
    std::optional<Error> error;
    CompressionDecision compression = CompressionDecision::Undecided;
    std::vector<std::uint32_t> failed_files;
};

/**
 * @brief Sends one manifest to one peer
 *
 * start() runs the pipeline on a driver thread: negotiate a transport,
 * offer the manifest, then move chunks over up to four parallel streams,
 * each stop-and-wait (ChunkData, then ChunkAck). Compression runs on the
 * compute pool and every send first draws from the session's token bucket.
 *
 * Recovery:
 * - a chunk acknowledged Corrupt is resent with exponential backoff
 * - a file whose full digest mismatches is resent from chunk 0
 * - a transport failure checkpoints, asks the negotiator for the next
 *   protocol and re-offers with the resume position; already-written
 *   chunks are not resent
 *
 * pause(), resume(), cancel() and suspend() take effect at the next chunk
 * boundary.
 */
class TransferSession {
public:
    TransferSession(SessionServices services, TransferManifest manifest, std::string peer_id,
                    TransferOptions options, std::optional<ResumeRecord> resumed = std::nullopt);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void start();

    /// Blocks until the session is terminal.
    TransferState wait();
    bool wait_for(std::chrono::milliseconds timeout);

    ferry::Result<void> pause();
    ferry::Result<void> resume();
    ferry::Result<void> cancel();
    /// Like cancel(), but keeps the resume checkpoint and leaves the receiver's
    /// partial data alone. The session ends Failed with a Cancelled error.
    ferry::Result<void> suspend();
    void set_bandwidth_limit(std::optional<std::uint64_t> bytes_per_second);

    [[nodiscard]] const std::string& id() const noexcept { return session_id_; }
    [[nodiscard]] const TransferManifest& manifest() const noexcept { return manifest_; }
    [[nodiscard]] const std::string& peer_id() const noexcept { return peer_id_; }

    [[nodiscard]] TransferState state() const;
    [[nodiscard]] std::optional<Error> error() const;
    [[nodiscard]] TransferProgress progress() const { return progress_.snapshot(); }
    [[nodiscard]] std::optional<ResumeToken> resume_token() const;
    [[nodiscard]] std::optional<transport::TransportProtocol> transport() const;
    [[nodiscard]] CompressionDecision compression_decision() const { return compression_.decision(); }
    [[nodiscard]] std::optional<core::TimePoint> finished_at() const;
    [[nodiscard]] SessionInfo info() const;

private:
    enum class Outcome {
        Done,
        TransportFailed,
        Fatal,
        Cancelled
    };

    enum class UnitResult {
        Finished,
        Requeue,
        Abort
    };

    void run();
    Outcome run_attempt(transport::TransportProtocol protocol, bool resuming);
    ferry::Result<void> apply_accept(const std::vector<std::uint32_t>& verified,
                                     const std::vector<std::uint64_t>& next_expected);
    std::vector<WorkUnit> pending_units() const;
    void worker(std::size_t index, transport::Stream& stream, ParallelStreamManager& streams);
    ferry::Result<void> request_stop(bool keep_checkpoint);
    UnitResult send_unit(transport::Stream& stream, ParallelStreamManager& streams,
                         WorkUnit& unit, std::uint64_t& bytes_sent);
    Outcome finish_attempt(transport::Stream& control);

    bool at_chunk_boundary();
    void abort_attempt();
    void report_transport_failure(const Error& error);
    void report_fatal(const Error& error);
    void on_written(std::uint32_t file_index, std::uint64_t next_expected);
    void on_file_verified(std::uint32_t file_index);
    void on_file_corrupt(std::uint32_t file_index, ParallelStreamManager& streams);
    void fail_file(std::uint32_t file_index, const Error& error);
    bool file_failed(std::uint32_t file_index) const;

    ResumeToken watermark_locked() const;
    ResumeRecord snapshot_record() const;
    void checkpoint();
    void finish(TransferState terminal, std::optional<Error> error);
    ferry::Result<void> set_state(TransferState next);
    void emit_progress();

    SessionServices services_;
    std::string session_id_;
    TransferManifest manifest_;
    std::string peer_id_;
    TransferOptions options_;
    bool resumed_ = false;

    CompressionStage compression_;
    BandwidthController bandwidth_;
    ProgressTracker progress_;

    mutable std::mutex mutex_;
    std::condition_variable control_cv_;
    std::condition_variable done_cv_;
    SessionStateMachine machine_;
    std::optional<core::TimePoint> finished_at_;
    std::optional<transport::TransportProtocol> protocol_;
    std::size_t stream_count_ = 0;
    bool started_ = false;
    bool paused_ = false;
    bool cancel_requested_ = false;
    bool suspend_requested_ = false;
    bool abort_ = false;
    std::optional<Error> transport_error_;
    std::optional<Error> fatal_error_;
    std::optional<Error> first_file_error_;
    std::vector<bool> verified_;
    std::vector<bool> failed_;
    std::vector<std::uint64_t> written_prefix_;
    std::vector<std::uint32_t> file_retries_;
    std::optional<ResumeToken> token_;
    std::vector<transport::Stream*> live_streams_;
    ParallelStreamManager* active_streams_ = nullptr;

    std::mutex checkpoint_mutex_;
    std::atomic<std::uint64_t> acks_since_checkpoint_{0};

    std::thread driver_;
};

} // namespace ferry::transfer

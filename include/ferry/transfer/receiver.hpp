#pragma once

#include "ferry/core/compute_pool.hpp"
#include "ferry/core/result.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/security/peer_trust.hpp"
#include "ferry/security/security_layer.hpp"
#include "ferry/transfer/chunk_engine.hpp"
#include "ferry/transfer/types.hpp"
#include "ferry/transport/transport.hpp"
#include "ferry/wire/frames.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * @brief Receiving end of the transfer protocol
 *
 * Plugged into a listener as its StreamHandler. Capability queries are
 * answered unsealed; every other stream is wrapped by the SecurityLayer
 * before its first frame is read. The first stream of a
 * transfer carries an Offer; the receiver validates the manifest, asks
 * PeerTrust once, creates directories and empty entries, then answers with
 * Accept and serves ChunkData on that stream. Extra streams join with
 * Attach. Data is staged under <download>/.ferry-partial/<transfer_id>/
 * and each file is renamed into place once its digest matches.
 *
 * A transfer offered again (fallback or resume) keeps its in-memory state,
 * so the Accept reports what is already written. Streams from before the
 * re-offer stop being served.
 */
class TransferReceiver {
public:
    struct Options {
        std::uint32_t reorder_window = 32;
        transport::TransportCapabilities capabilities;
        std::string staging_dir = ".ferry-partial";
    };

    TransferReceiver(security::PeerTrust& trust,
                     security::SecurityLayer& security,
                     core::ComputePool& pool,
                     Options options,
                     events::EventBus* bus = nullptr);
    ~TransferReceiver();

    TransferReceiver(const TransferReceiver&) = delete;
    TransferReceiver& operator=(const TransferReceiver&) = delete;

    /// Serves one inbound stream until it closes.
    void handle(std::unique_ptr<transport::Stream> stream);

    /// Handler bound to this receiver, for LoopbackNetwork::listen or TcpListener.
    transport::StreamHandler handler();

    std::vector<std::string> active_transfers() const;
    bool has_transfer(const std::string& transfer_id) const;

    /// Closes every stream being served; later streams are refused.
    void shutdown();

private:
    struct FileSlot {
        std::mutex mutex;
        std::unique_ptr<FileAssembler> assembler;
        std::uint64_t start = 0;
        bool verified = false;
    };

    struct Incoming {
        TransferManifest manifest;
        std::filesystem::path root;
        std::filesystem::path staging_root;
        std::atomic<std::uint64_t> epoch{0};
        std::vector<std::unique_ptr<FileSlot>> slots;
    };

    void serve_first(transport::Stream& stream);
    void negotiate(transport::Stream& stream, const wire::Offer& offer);
    void attach(transport::Stream& stream, const wire::Attach& attach);
    void serve(transport::Stream& stream, const std::shared_ptr<Incoming>& incoming, std::uint64_t epoch);

    ferry::Result<std::shared_ptr<Incoming>> admit(const wire::Offer& offer);
    ferry::Result<void> prepare_entries(Incoming& incoming);
    ferry::Result<void> reconcile(Incoming& incoming, const wire::Offer& offer, bool fresh);
    ferry::Result<void> recheck_last_verified(Incoming& incoming, const ResumePosition& position);
    wire::Accept accept_for(Incoming& incoming);

    std::optional<wire::ChunkAck> on_chunk(Incoming& incoming, wire::ChunkData data, std::uint64_t epoch);
    ferry::Result<void> place_file(Incoming& incoming, std::uint32_t file_index, FileSlot& slot);
    bool all_verified(Incoming& incoming);
    void finish(const std::shared_ptr<Incoming>& incoming, bool completed, const std::string& reason);

    security::PeerTrust& trust_;
    security::SecurityLayer& security_;
    core::ComputePool& pool_;
    Options options_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Incoming>> transfers_;
    std::vector<transport::Stream*> live_streams_;
    bool shut_down_ = false;
};

} // namespace ferry::transfer

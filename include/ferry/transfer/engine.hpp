#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/compute_pool.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/result.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/security/security_layer.hpp"
#include "ferry/transfer/resume.hpp"
#include "ferry/transfer/session.hpp"
#include "ferry/transfer/types.hpp"
#include "ferry/transport/negotiator.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * @brief Owns every sending session of one engine
 *
 * Terminal sessions stay listed until prune() drops those finished longer
 * than the retention window ago.
 */
class SessionRegistry {
public:
    void add(std::shared_ptr<TransferSession> session);
    [[nodiscard]] std::shared_ptr<TransferSession> find(const std::string& session_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<TransferSession>> all() const;
    [[nodiscard]] std::size_t running() const;

    /// Returns the sessions removed so the caller can destroy them outside the lock.
    std::vector<std::shared_ptr<TransferSession>> prune(core::TimePoint now, std::chrono::seconds retention);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TransferSession>> sessions_;
};

/**
 * @brief Sending-side facade
 *
 * Builds manifests, starts and resumes sessions, and exposes control over
 * running ones. Transports are registered by the embedding application;
 * an engine with no transport cannot negotiate anything.
 */
class TransferEngine {
public:
    explicit TransferEngine(core::EngineConfig config,
                            std::shared_ptr<security::SecurityLayer> security = nullptr,
                            core::Clock clock = core::system_clock());
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void register_transport(std::shared_ptr<transport::Transport> transport);

    ferry::Result<TransferManifest> build_manifest(const std::vector<std::filesystem::path>& paths) const;

    ferry::Result<std::shared_ptr<TransferSession>> start_transfer(TransferManifest manifest,
                                                                   const std::string& peer_id,
                                                                   TransferOptions options = {});
    ferry::Result<std::shared_ptr<TransferSession>> start_transfer(const TransferRequest& request);
    ferry::Result<std::shared_ptr<TransferSession>> resume_transfer(const ResumeToken& token);

    ferry::Result<void> cancel_transfer(const std::string& session_id);
    ferry::Result<void> pause_transfer(const std::string& session_id);
    ferry::Result<void> resume_paused_transfer(const std::string& session_id);
    ferry::Result<void> set_bandwidth_limit(const std::string& session_id, std::optional<std::uint64_t> limit);

    /// Sessions that are not terminal.
    std::vector<SessionInfo> get_active_transfers();
    ferry::Result<SessionInfo> get_transfer(const std::string& session_id);
    std::shared_ptr<TransferSession> session(const std::string& session_id) const;

    /// Suspends every running session, keeping its resume checkpoint, and waits for all of them.
    void shutdown();

    [[nodiscard]] const core::EngineConfig& config() const noexcept { return config_; }
    events::EventBus& events() noexcept { return bus_; }
    transport::TransportNegotiator& negotiator() noexcept { return negotiator_; }
    ResumeManager& resume_manager() noexcept { return resume_; }
    core::ComputePool& compute_pool() noexcept { return pool_; }
    security::SecurityLayer& security() noexcept { return *security_; }

private:
    ferry::Result<std::shared_ptr<TransferSession>> launch(TransferManifest manifest, const std::string& peer_id,
                                                           TransferOptions options,
                                                           std::optional<ResumeRecord> resumed);
    ferry::Result<std::shared_ptr<TransferSession>> find(const std::string& session_id) const;
    void prune();

    core::EngineConfig config_;
    core::Clock clock_;
    events::EventBus bus_;
    std::shared_ptr<security::SecurityLayer> security_;
    core::ComputePool pool_;
    transport::TransportNegotiator negotiator_;
    ResumeStore store_;
    ResumeManager resume_;
    SessionRegistry registry_;

    std::mutex lifecycle_mutex_;
    bool shut_down_ = false;
};

} // namespace ferry::transfer

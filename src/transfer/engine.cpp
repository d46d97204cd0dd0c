#include "ferry/transfer/engine.hpp"

#include "ferry/core/ids.hpp"
#include "ferry/transfer/manifest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry::transfer {

// ════════════════════════════════════════════════════════
// SessionRegistry
// ════════════════════════════════════════════════════════

void SessionRegistry::add(std::shared_ptr<TransferSession> session) {
    std::lock_guard lock(mutex_);
    const auto id = session->id();
    sessions_.emplace(id, std::move(session));
}

std::shared_ptr<TransferSession> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TransferSession>> SessionRegistry::all() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<TransferSession>> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

std::size_t SessionRegistry::running() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const auto& entry) {
        return !is_terminal(entry.second->state());
    }));
}

std::vector<std::shared_ptr<TransferSession>> SessionRegistry::prune(core::TimePoint now,
                                                                     std::chrono::seconds retention) {
    std::vector<std::shared_ptr<TransferSession>> removed;
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto finished = it->second->finished_at();
        if (finished && now - *finished > retention) {
            removed.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

// ════════════════════════════════════════════════════════
// TransferEngine
// ════════════════════════════════════════════════════════

namespace {

transport::TransportNegotiator::Options negotiator_options(const core::EngineConfig& config) {
    transport::TransportNegotiator::Options options;
    options.cache_ttl = config.capability_cache_ttl;
    options.query_timeout = config.negotiation_timeout;
    options.large_file_threshold = config.large_file_threshold;
    return options;
}

core::EngineConfig with_node_id(core::EngineConfig config) {
    if (config.node_id.empty()) {
        config.node_id = core::generate_id();
    }
    return config;
}

} // namespace

TransferEngine::TransferEngine(core::EngineConfig config, std::shared_ptr<security::SecurityLayer> security,
                               core::Clock clock)
    : config_(with_node_id(std::move(config))),
      clock_(std::move(clock)),
      security_(security ? std::move(security) : std::make_shared<security::PassthroughSecurity>()),
      pool_(config_.compute_threads),
      negotiator_(negotiator_options(config_), clock_),
      store_(config_.state_dir),
      resume_(store_, clock_) {
    const auto purged = resume_.purge_expired();
    if (purged > 0) {
        spdlog::info("Dropped {} expired resume checkpoints", purged);
    }
    spdlog::info("Transfer engine {} ready (state in {})", config_.node_id, config_.state_dir.string());
}

TransferEngine::~TransferEngine() {
    shutdown();
}

void TransferEngine::register_transport(std::shared_ptr<transport::Transport> transport) {
    negotiator_.register_transport(std::move(transport));
}

ferry::Result<TransferManifest> TransferEngine::build_manifest(const std::vector<std::filesystem::path>& paths) const {
    return ManifestBuilder(config_.node_id, config_.symlink_policy, clock_).build(paths);
}

ferry::Result<std::shared_ptr<TransferSession>> TransferEngine::start_transfer(TransferManifest manifest,
                                                                              const std::string& peer_id,
                                                                              TransferOptions options) {
    if (auto valid = ManifestValidator::validate(manifest); valid.is_error()) {
        return ferry::Err<std::shared_ptr<TransferSession>>(valid.error());
    }
    return launch(std::move(manifest), peer_id, std::move(options), std::nullopt);
}

ferry::Result<std::shared_ptr<TransferSession>> TransferEngine::start_transfer(const TransferRequest& request) {
    auto manifest = build_manifest(request.paths);
    if (manifest.is_error()) {
        return ferry::Err<std::shared_ptr<TransferSession>>(manifest.error());
    }
    return launch(std::move(manifest.value()), request.peer_id, request.options, std::nullopt);
}

ferry::Result<std::shared_ptr<TransferSession>> TransferEngine::resume_transfer(const ResumeToken& token) {
    auto record = resume_.resume(token);
    if (record.is_error()) {
        spdlog::warn("Cannot resume transfer {}: {}", token.transfer_id, record.error().to_string());
        return ferry::Err<std::shared_ptr<TransferSession>>(record.error());
    }
    auto manifest = record.value().manifest;
    auto peer_id = record.value().peer_id;
    auto options = record.value().options;
    return launch(std::move(manifest), peer_id, std::move(options), std::move(record.value()));
}

ferry::Result<std::shared_ptr<TransferSession>> TransferEngine::launch(TransferManifest manifest,
                                                                      const std::string& peer_id,
                                                                      TransferOptions options,
                                                                      std::optional<ResumeRecord> resumed) {
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (shut_down_) {
            return ferry::Err<std::shared_ptr<TransferSession>>(ferry::Error::state("engine is shut down"));
        }
    }
    prune();

    SessionServices services{config_, negotiator_, *security_, resume_, pool_, &bus_, clock_};
    auto session = std::make_shared<TransferSession>(services, std::move(manifest), peer_id, std::move(options),
                                                     std::move(resumed));
    registry_.add(session);
    session->start();
    return ferry::Ok(std::move(session));
}

ferry::Result<std::shared_ptr<TransferSession>> TransferEngine::find(const std::string& session_id) const {
    auto session = registry_.find(session_id);
    if (!session) {
        return ferry::Err<std::shared_ptr<TransferSession>>(ferry::Error::state("unknown session " + session_id));
    }
    return ferry::Ok(std::move(session));
}

std::shared_ptr<TransferSession> TransferEngine::session(const std::string& session_id) const {
    return registry_.find(session_id);
}

ferry::Result<void> TransferEngine::cancel_transfer(const std::string& session_id) {
    auto session = find(session_id);
    if (session.is_error()) {
        return ferry::Err<void>(session.error());
    }
    return session.value()->cancel();
}

ferry::Result<void> TransferEngine::pause_transfer(const std::string& session_id) {
    auto session = find(session_id);
    if (session.is_error()) {
        return ferry::Err<void>(session.error());
    }
    return session.value()->pause();
}

ferry::Result<void> TransferEngine::resume_paused_transfer(const std::string& session_id) {
    auto session = find(session_id);
    if (session.is_error()) {
        return ferry::Err<void>(session.error());
    }
    return session.value()->resume();
}

ferry::Result<void> TransferEngine::set_bandwidth_limit(const std::string& session_id,
                                                        std::optional<std::uint64_t> limit) {
    auto session = find(session_id);
    if (session.is_error()) {
        return ferry::Err<void>(session.error());
    }
    if (limit && *limit == 0) {
        return ferry::Err<void>(ferry::Error::config("bandwidth limit must be > 0 or unlimited"));
    }
    session.value()->set_bandwidth_limit(limit);
    return ferry::Ok();
}

std::vector<SessionInfo> TransferEngine::get_active_transfers() {
    prune();
    std::vector<SessionInfo> active;
    for (const auto& session : registry_.all()) {
        auto info = session->info();
        if (!is_terminal(info.state)) {
            active.push_back(std::move(info));
        }
    }
    return active;
}

ferry::Result<SessionInfo> TransferEngine::get_transfer(const std::string& session_id) {
    prune();
    auto session = find(session_id);
    if (session.is_error()) {
        return ferry::Err<SessionInfo>(session.error());
    }
    return ferry::Ok(session.value()->info());
}

void TransferEngine::prune() {
    auto removed = registry_.prune(clock_(), config_.history_retention);
    if (!removed.empty()) {
        spdlog::debug("Dropped {} finished sessions from history", removed.size());
    }
}

void TransferEngine::shutdown() {
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }

    const auto sessions = registry_.all();
    for (const auto& session : sessions) {
        if (is_terminal(session->state())) {
            continue;
        }
        if (auto suspended = session->suspend(); suspended.is_error()) {
            spdlog::debug("Session {}: {}", session->id(), suspended.error().message);
        }
    }
    for (const auto& session : sessions) {
        session->wait();
    }
    spdlog::info("Transfer engine {} shut down", config_.node_id);
}

} // namespace ferry::transfer

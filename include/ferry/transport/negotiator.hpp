#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry::transport {

/**
 * @brief Picks and falls back between the registered transports per peer
 *
 * Selection, in order:
 * 1. a caller preference the peer and this node both support
 * 2. the browser channel when the peer is browser-only
 * 3. the multiplexed transport for transfers >= large_file_threshold
 * 4. simple stream, then multiplexed, then browser channel
 *
 * Protocols that failed for a peer are avoided for degraded_ttl unless
 * nothing else is left. Peer capabilities are cached for cache_ttl.
 *
 * Thread-safe.
 */
class TransportNegotiator {
public:
    struct Options {
        std::chrono::seconds cache_ttl{300};
        std::chrono::seconds degraded_ttl{300};
        std::chrono::milliseconds query_timeout{5000};
        std::uint64_t large_file_threshold = 10ULL * 1024 * 1024;
    };

    explicit TransportNegotiator(Options options, core::Clock clock = core::system_clock());

    void register_transport(std::shared_ptr<Transport> transport);

    [[nodiscard]] std::shared_ptr<Transport> transport_for(TransportProtocol protocol) const;
    [[nodiscard]] std::vector<TransportProtocol> local_protocols() const;

    ferry::Result<TransportCapabilities> capabilities(const std::string& peer_id);

    ferry::Result<TransportProtocol> negotiate(const std::string& peer_id, std::uint64_t file_size,
                                               std::optional<TransportProtocol> preferred = std::nullopt);

    /// Marks `current` degraded and returns the next candidate in the fallback chain.
    std::optional<TransportProtocol> fallback(const std::string& peer_id, TransportProtocol current);

    void mark_degraded(const std::string& peer_id, TransportProtocol protocol);
    [[nodiscard]] bool is_degraded(const std::string& peer_id, TransportProtocol protocol) const;

    void invalidate(const std::string& peer_id);

    /// Pure selection over a candidate set; nullopt when nothing is usable.
    static std::optional<TransportProtocol> select(const TransportCapabilities& peer,
                                                   const std::vector<TransportProtocol>& candidates,
                                                   std::uint64_t file_size,
                                                   std::uint64_t large_file_threshold,
                                                   std::optional<TransportProtocol> preferred);

private:
    struct CacheEntry {
        TransportCapabilities capabilities;
        core::TimePoint fetched_at;
    };

    bool is_degraded_locked(const std::string& peer_id, TransportProtocol protocol) const;

    Options options_;
    core::Clock clock_;

    mutable std::mutex mutex_;
    std::map<TransportProtocol, std::shared_ptr<Transport>> transports_;
    std::map<std::string, CacheEntry> cache_;
    std::map<std::pair<std::string, TransportProtocol>, core::TimePoint> degraded_;
};

} // namespace ferry::transport

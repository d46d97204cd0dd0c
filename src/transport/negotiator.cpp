#include "ferry/transport/negotiator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry::transport {
namespace {

// Order in which transports are tried for the capability probe.
const std::vector<TransportProtocol>& probe_order() {
    static const std::vector<TransportProtocol> order{
        TransportProtocol::SimpleStream,
        TransportProtocol::Multiplexed,
        TransportProtocol::BrowserChannel,
    };
    return order;
}

bool contains(const std::vector<TransportProtocol>& list, TransportProtocol protocol) {
    return std::find(list.begin(), list.end(), protocol) != list.end();
}

} // namespace

TransportNegotiator::TransportNegotiator(Options options, core::Clock clock)
    : options_(options), clock_(std::move(clock)) {}

void TransportNegotiator::register_transport(std::shared_ptr<Transport> transport) {
    std::lock_guard lock(mutex_);
    const auto protocol = transport->protocol();
    transports_[protocol] = std::move(transport);
}

std::shared_ptr<Transport> TransportNegotiator::transport_for(TransportProtocol protocol) const {
    std::lock_guard lock(mutex_);
    auto it = transports_.find(protocol);
    return it == transports_.end() ? nullptr : it->second;
}

std::vector<TransportProtocol> TransportNegotiator::local_protocols() const {
    std::lock_guard lock(mutex_);
    std::vector<TransportProtocol> protocols;
    for (const auto& [protocol, transport] : transports_) {
        protocols.push_back(protocol);
    }
    return protocols;
}

ferry::Result<TransportCapabilities> TransportNegotiator::capabilities(const std::string& peer_id) {
    std::vector<std::shared_ptr<Transport>> probes;
    {
        std::lock_guard lock(mutex_);
        auto it = cache_.find(peer_id);
        if (it != cache_.end() && clock_() - it->second.fetched_at < options_.cache_ttl) {
            return ferry::Ok(it->second.capabilities);
        }
        for (auto protocol : probe_order()) {
            auto transport = transports_.find(protocol);
            if (transport != transports_.end()) {
                probes.push_back(transport->second);
            }
        }
    }

    if (probes.empty()) {
        return ferry::Err<TransportCapabilities>(ferry::Error::transport("no transports registered"));
    }

    ferry::Error last_error = ferry::Error::transport("capability query failed");
    for (const auto& transport : probes) {
        auto caps = transport->query_capabilities(peer_id, options_.query_timeout);
        if (caps.is_ok()) {
            spdlog::debug("Peer {} capabilities: multiplexed={} simple={} browser={} streams={}",
                          peer_id, caps.value().multiplexed, caps.value().simple_stream,
                          caps.value().browser_channel, caps.value().max_parallel_streams);
            std::lock_guard lock(mutex_);
            cache_[peer_id] = CacheEntry{caps.value(), clock_()};
            return caps;
        }
        spdlog::debug("Capability query to {} over {} failed: {}", peer_id, to_string(transport->protocol()),
                      caps.error().message);
        last_error = caps.error();
    }
    return ferry::Err<TransportCapabilities>(
        ferry::Error::transport("capability query to " + peer_id + " failed: " + last_error.message));
}

std::optional<TransportProtocol> TransportNegotiator::select(const TransportCapabilities& peer,
                                                            const std::vector<TransportProtocol>& candidates,
                                                            std::uint64_t file_size,
                                                            std::uint64_t large_file_threshold,
                                                            std::optional<TransportProtocol> preferred) {
    auto usable = [&](TransportProtocol protocol) {
        return peer.supports(protocol) && contains(candidates, protocol);
    };

    if (preferred && usable(*preferred)) {
        return preferred;
    }
    if (peer.browser_only() && usable(TransportProtocol::BrowserChannel)) {
        return TransportProtocol::BrowserChannel;
    }
    if (file_size >= large_file_threshold && usable(TransportProtocol::Multiplexed)) {
        return TransportProtocol::Multiplexed;
    }
    for (auto protocol : probe_order()) {
        if (usable(protocol)) {
            return protocol;
        }
    }
    return std::nullopt;
}

ferry::Result<TransportProtocol> TransportNegotiator::negotiate(const std::string& peer_id, std::uint64_t file_size,
                                                                std::optional<TransportProtocol> preferred) {
    auto caps = capabilities(peer_id);
    if (caps.is_error()) {
        return ferry::Err<TransportProtocol>(caps.error());
    }

    std::vector<TransportProtocol> healthy;
    std::vector<TransportProtocol> all;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [protocol, transport] : transports_) {
            all.push_back(protocol);
            if (!is_degraded_locked(peer_id, protocol)) {
                healthy.push_back(protocol);
            }
        }
    }

    auto choice = select(caps.value(), healthy, file_size, options_.large_file_threshold, preferred);
    if (!choice) {
        choice = select(caps.value(), all, file_size, options_.large_file_threshold, preferred);
    }
    if (!choice) {
        return ferry::Err<TransportProtocol>(
            ferry::Error::transport("no transport in common with peer " + peer_id));
    }

    spdlog::info("Negotiated {} with {} for {} bytes", to_string(*choice), peer_id, file_size);
    return ferry::Ok(*choice);
}

std::optional<TransportProtocol> TransportNegotiator::fallback(const std::string& peer_id, TransportProtocol current) {
    mark_degraded(peer_id, current);

    TransportCapabilities caps;
    {
        std::lock_guard lock(mutex_);
        auto it = cache_.find(peer_id);
        if (it == cache_.end()) {
            return std::nullopt;
        }
        caps = it->second.capabilities;
    }

    const auto& chain = fallback_chain();
    auto it = std::find(chain.begin(), chain.end(), current);
    if (it == chain.end()) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    for (++it; it != chain.end(); ++it) {
        if (caps.supports(*it) && transports_.count(*it) != 0 && !is_degraded_locked(peer_id, *it)) {
            spdlog::warn("Falling back from {} to {} for {}", to_string(current), to_string(*it), peer_id);
            return *it;
        }
    }
    spdlog::warn("No fallback transport after {} for {}", to_string(current), peer_id);
    return std::nullopt;
}

void TransportNegotiator::mark_degraded(const std::string& peer_id, TransportProtocol protocol) {
    std::lock_guard lock(mutex_);
    degraded_[{peer_id, protocol}] = clock_();
}

bool TransportNegotiator::is_degraded_locked(const std::string& peer_id, TransportProtocol protocol) const {
    auto it = degraded_.find({peer_id, protocol});
    return it != degraded_.end() && clock_() - it->second < options_.degraded_ttl;
}

bool TransportNegotiator::is_degraded(const std::string& peer_id, TransportProtocol protocol) const {
    std::lock_guard lock(mutex_);
    return is_degraded_locked(peer_id, protocol);
}

void TransportNegotiator::invalidate(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    cache_.erase(peer_id);
}

} // namespace ferry::transport

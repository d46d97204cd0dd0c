#pragma once

#include "ferry/transport/transport.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ferry::transport {

namespace detail {
struct Channel;
struct FaultState;
} // namespace detail

/**
 * @brief In-process switchboard connecting loopback transports to listeners
 *
 * Each listener registers the capabilities it advertises; a connection over
 * a protocol the listener does not support is refused. Every accepted
 * stream is handed to the listener's handler on its own thread; shutdown()
 * closes all live channels and joins those threads.
 *
 * Must outlive every LoopbackTransport created over it.
 */
class LoopbackNetwork {
public:
    LoopbackNetwork() = default;
    ~LoopbackNetwork();

    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

    void listen(const std::string& peer_id, TransportCapabilities capabilities, StreamHandler handler);
    void unlisten(const std::string& peer_id);

    ferry::Result<std::unique_ptr<Stream>> connect(const std::string& peer_id, TransportProtocol protocol,
                                                   const std::shared_ptr<detail::FaultState>& fault);

    void shutdown();

    [[nodiscard]] std::size_t connections_opened() const noexcept { return connections_.load(); }

private:
    struct Listener {
        TransportCapabilities capabilities;
        StreamHandler handler;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Listener> listeners_;
    std::vector<std::weak_ptr<detail::Channel>> channels_;
    std::vector<std::thread> workers_;
    bool shut_down_ = false;
    std::atomic<std::size_t> connections_{0};
};

/**
 * @brief Transport over a LoopbackNetwork impersonating one protocol variant
 *
 * Supports fault injection: after fail_after_frames(n) the transport
 * delivers n more frames, then every stream it opened breaks and further
 * opens fail until heal().
 */
class LoopbackTransport : public Transport {
public:
    LoopbackTransport(LoopbackNetwork& network, TransportProtocol protocol);

    [[nodiscard]] TransportProtocol protocol() const noexcept override { return protocol_; }

    ferry::Result<TransportCapabilities> query_capabilities(const std::string& peer_id,
                                                            std::chrono::milliseconds timeout) override;

    ferry::Result<std::unique_ptr<Stream>> open_stream(const std::string& peer_id) override;

    void fail_after_frames(std::uint64_t frames);
    void fail_now();
    void heal();

    [[nodiscard]] std::uint64_t frames_sent() const;
    [[nodiscard]] bool failed() const;

private:
    LoopbackNetwork& network_;
    TransportProtocol protocol_;
    std::shared_ptr<detail::FaultState> fault_;
};

} // namespace ferry::transport

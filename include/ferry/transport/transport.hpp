#pragma once

#include "ferry/core/result.hpp"
#include "ferry/transport/protocol.hpp"
#include "ferry/wire/frames.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transport {

/**
 * @brief One bidirectional, message-oriented channel to a peer
 *
 * send() and recv() move whole frames. A stream is driven by one thread at
 * a time; close() may be called from any thread and wakes a blocked recv().
 */
class Stream {
public:
    virtual ~Stream() = default;

    virtual ferry::Result<void> send(const std::vector<std::uint8_t>& frame) = 0;

    /// Transport error on close or when `timeout` elapses; nullopt waits forever.
    virtual ferry::Result<std::vector<std::uint8_t>> recv(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual TransportProtocol protocol() const noexcept = 0;
};

/// Capability the engine consumes to reach peers over one protocol variant.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual TransportProtocol protocol() const noexcept = 0;

    virtual ferry::Result<TransportCapabilities> query_capabilities(const std::string& peer_id,
                                                                    std::chrono::milliseconds timeout) = 0;

    virtual ferry::Result<std::unique_ptr<Stream>> open_stream(const std::string& peer_id) = 0;
};

/// Receives every inbound stream accepted by a listener.
using StreamHandler = std::function<void(std::unique_ptr<Stream>)>;

ferry::Result<void> send_frame(Stream& stream, const wire::Frame& frame);
ferry::Result<wire::Frame> recv_frame(Stream& stream,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/// CapabilityQuery/CapabilityReply round trip on a fresh stream.
ferry::Result<TransportCapabilities> probe_capabilities(Transport& transport, const std::string& peer_id,
                                                        std::chrono::milliseconds timeout);

} // namespace ferry::transport

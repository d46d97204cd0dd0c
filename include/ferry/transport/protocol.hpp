#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transport {

/// Wire protocol variants the negotiator chooses between.
enum class TransportProtocol : std::uint8_t {
    Multiplexed = 0,    ///< stream-multiplexed, resumable (QUIC-like)
    SimpleStream = 1,   ///< one byte stream per channel (TCP)
    BrowserChannel = 2  ///< browser data channel (WebRTC-like)
};

const char* to_string(TransportProtocol protocol) noexcept;
std::optional<TransportProtocol> parse_protocol(const std::string& name) noexcept;

/// Fallback order used when the active transport fails.
const std::vector<TransportProtocol>& fallback_chain();

struct TransportCapabilities {
    bool multiplexed = false;
    bool simple_stream = true;
    bool browser_channel = false;
    std::uint32_t max_parallel_streams = 4;

    [[nodiscard]] bool supports(TransportProtocol protocol) const noexcept;

    /// True when the peer can only be reached through a browser data channel.
    [[nodiscard]] bool browser_only() const noexcept {
        return browser_channel && !multiplexed && !simple_stream;
    }

    bool operator==(const TransportCapabilities& other) const noexcept {
        return multiplexed == other.multiplexed && simple_stream == other.simple_stream &&
               browser_channel == other.browser_channel &&
               max_parallel_streams == other.max_parallel_streams;
    }
};

} // namespace ferry::transport

#include "ferry/transport/protocol.hpp"

namespace ferry::transport {

const char* to_string(TransportProtocol protocol) noexcept {
    switch (protocol) {
        case TransportProtocol::Multiplexed: return "multiplexed";
        case TransportProtocol::SimpleStream: return "simple-stream";
        case TransportProtocol::BrowserChannel: return "browser-channel";
    }
    return "unknown";
}

std::optional<TransportProtocol> parse_protocol(const std::string& name) noexcept {
    if (name == "multiplexed") return TransportProtocol::Multiplexed;
    if (name == "simple-stream") return TransportProtocol::SimpleStream;
    if (name == "browser-channel") return TransportProtocol::BrowserChannel;
    return std::nullopt;
}

const std::vector<TransportProtocol>& fallback_chain() {
    static const std::vector<TransportProtocol> chain{
        TransportProtocol::Multiplexed,
        TransportProtocol::SimpleStream,
        TransportProtocol::BrowserChannel,
    };
    return chain;
}

bool TransportCapabilities::supports(TransportProtocol protocol) const noexcept {
    switch (protocol) {
        case TransportProtocol::Multiplexed: return multiplexed;
        case TransportProtocol::SimpleStream: return simple_stream;
        case TransportProtocol::BrowserChannel: return browser_channel;
    }
    return false;
}

} // namespace ferry::transport

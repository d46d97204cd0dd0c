#include "ferry/transport/transport.hpp"

namespace ferry::transport {

ferry::Result<void> send_frame(Stream& stream, const wire::Frame& frame) {
    return stream.send(wire::encode(frame));
}

ferry::Result<wire::Frame> recv_frame(Stream& stream, std::optional<std::chrono::milliseconds> timeout) {
    auto bytes = stream.recv(timeout);
    if (bytes.is_error()) {
        return ferry::Err<wire::Frame>(bytes.error());
    }
    return wire::decode(bytes.value());
}

ferry::Result<TransportCapabilities> probe_capabilities(Transport& transport, const std::string& peer_id,
                                                        std::chrono::milliseconds timeout) {
    auto stream = transport.open_stream(peer_id);
    if (stream.is_error()) {
        return ferry::Err<TransportCapabilities>(stream.error());
    }
    auto& channel = *stream.value();

    if (auto sent = send_frame(channel, wire::CapabilityQuery{}); sent.is_error()) {
        channel.close();
        return ferry::Err<TransportCapabilities>(sent.error());
    }
    auto reply = recv_frame(channel, timeout);
    channel.close();
    if (reply.is_error()) {
        return ferry::Err<TransportCapabilities>(reply.error());
    }
    if (const auto* caps = std::get_if<wire::CapabilityReply>(&reply.value())) {
        return ferry::Ok(caps->capabilities);
    }
    return ferry::Err<TransportCapabilities>(ferry::Error::protocol(
        std::string("expected CapabilityReply, got ") + wire::to_string(wire::frame_type(reply.value()))));
}

} // namespace ferry::transport

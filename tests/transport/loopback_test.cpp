#include "ferry/transport/loopback.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <variant>

using namespace ferry::transport;
namespace wire = ferry::wire;

namespace {

/// Answers capability queries and echoes every other frame.
StreamHandler echo_handler(TransportCapabilities caps, std::atomic<int>* served = nullptr) {
    return [caps, served](std::unique_ptr<Stream> stream) {
        if (served) {
            ++*served;
        }
        while (true) {
            auto frame = recv_frame(*stream);
            if (frame.is_error()) {
                return;
            }
            if (std::holds_alternative<wire::CapabilityQuery>(frame.value())) {
                if (send_frame(*stream, wire::CapabilityReply{caps}).is_error()) {
                    return;
                }
                continue;
            }
            if (send_frame(*stream, frame.value()).is_error()) {
                return;
            }
        }
    };
}

} // namespace

TEST(LoopbackTransport, FramesRoundTrip) {
    LoopbackNetwork network;
    network.listen("peer", TransportCapabilities{}, echo_handler(TransportCapabilities{}));
    LoopbackTransport transport(network, TransportProtocol::SimpleStream);

    auto stream = transport.open_stream("peer");
    ASSERT_TRUE(stream.is_ok()) << stream.error().to_string();
    ASSERT_TRUE(send_frame(*stream.value(), wire::Complete{"transfer-1"}).is_ok());

    auto reply = recv_frame(*stream.value(), std::chrono::milliseconds{1000});
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(std::holds_alternative<wire::Complete>(reply.value()));
    EXPECT_EQ(std::get<wire::Complete>(reply.value()).transfer_id, "transfer-1");
    EXPECT_EQ(stream.value()->protocol(), TransportProtocol::SimpleStream);

    stream.value()->close();
    network.shutdown();
}

TEST(LoopbackTransport, QueriesCapabilities) {
    TransportCapabilities advertised;
    advertised.multiplexed = true;
    advertised.max_parallel_streams = 2;

    LoopbackNetwork network;
    network.listen("peer", advertised, echo_handler(advertised));
    LoopbackTransport transport(network, TransportProtocol::Multiplexed);

    auto caps = transport.query_capabilities("peer", std::chrono::milliseconds{1000});
    ASSERT_TRUE(caps.is_ok()) << caps.error().to_string();
    EXPECT_EQ(caps.value(), advertised);
    network.shutdown();
}

TEST(LoopbackTransport, RefusesUnsupportedProtocolAndUnknownPeer) {
    LoopbackNetwork network;
    network.listen("peer", TransportCapabilities{}, echo_handler(TransportCapabilities{}));

    LoopbackTransport multiplexed(network, TransportProtocol::Multiplexed);
    auto refused = multiplexed.open_stream("peer");
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ferry::ErrorKind::Transport);

    LoopbackTransport simple(network, TransportProtocol::SimpleStream);
    EXPECT_TRUE(simple.open_stream("nobody").is_error());
    network.shutdown();
}

TEST(LoopbackTransport, RecvTimesOut) {
    LoopbackNetwork network;
    network.listen("peer", TransportCapabilities{}, [](std::unique_ptr<Stream> stream) {
        // Never answers; waits until the dialer closes.
        stream->recv();
    });
    LoopbackTransport transport(network, TransportProtocol::SimpleStream);
    auto stream = transport.open_stream("peer");
    ASSERT_TRUE(stream.is_ok());

    auto reply = stream.value()->recv(std::chrono::milliseconds{50});
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().kind, ferry::ErrorKind::Transport);

    stream.value()->close();
    network.shutdown();
}

TEST(LoopbackTransport, InjectedFailureBreaksStreamsUntilHealed) {
    LoopbackNetwork network;
    network.listen("peer", TransportCapabilities{}, echo_handler(TransportCapabilities{}));
    LoopbackTransport transport(network, TransportProtocol::SimpleStream);

    auto stream = transport.open_stream("peer");
    ASSERT_TRUE(stream.is_ok());
    transport.fail_after_frames(2);

    EXPECT_TRUE(send_frame(*stream.value(), wire::Complete{"a"}).is_ok());
    EXPECT_TRUE(send_frame(*stream.value(), wire::Complete{"b"}).is_ok());
    EXPECT_TRUE(send_frame(*stream.value(), wire::Complete{"c"}).is_error());
    EXPECT_TRUE(transport.failed());
    EXPECT_EQ(transport.frames_sent(), 2u);

    EXPECT_TRUE(stream.value()->recv(std::chrono::milliseconds{50}).is_error());
    EXPECT_TRUE(transport.open_stream("peer").is_error());

    transport.heal();
    auto fresh = transport.open_stream("peer");
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_TRUE(send_frame(*fresh.value(), wire::Complete{"d"}).is_ok());
    network.shutdown();
}

TEST(LoopbackNetwork, EachConnectionGetsItsOwnHandler) {
    std::atomic<int> served{0};
    LoopbackNetwork network;
    network.listen("peer", TransportCapabilities{}, echo_handler(TransportCapabilities{}, &served));
    LoopbackTransport transport(network, TransportProtocol::SimpleStream);

    auto a = transport.open_stream("peer");
    auto b = transport.open_stream("peer");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(network.connections_opened(), 2u);

    network.shutdown();
    EXPECT_EQ(served.load(), 2);
    EXPECT_TRUE(transport.open_stream("peer").is_error());
}

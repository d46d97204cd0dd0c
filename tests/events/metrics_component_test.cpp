#include "ferry/events/components.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/events/events.hpp"

#include <gtest/gtest.h>

using namespace ferry::events;
using ferry::transfer::TransferState;

TEST(MetricsComponentTest, TracksTransferLifecycle) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Negotiating, TransferState::Transferring, {}});
    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Transferring, TransferState::Completed, {}});

    bus.emit(TransferStateChangedEvent{"s2", "t2", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferStateChangedEvent{"s2", "t2", TransferState::Negotiating, TransferState::Failed,
                                       ferry::Error::transport("unreachable")});

    bus.emit(TransferStateChangedEvent{"s3", "t3", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferStateChangedEvent{"s3", "t3", TransferState::Negotiating, TransferState::Cancelled, {}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 3u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.transfers_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, ResumedSessionIsNotCountedTwice) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Transferring, TransferState::Paused, {}});
    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Paused, TransferState::Transferring, {}});

    EXPECT_EQ(metrics.get_stats().transfers_started.load(), 1u);
}

TEST(MetricsComponentTest, TracksFilesAndRecovery) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileCompletedEvent{"s1", Direction::Outgoing, 0, "a.txt", 1024});
    bus.emit(FileCompletedEvent{"t9", Direction::Incoming, 1, "b.txt", 2048});
    bus.emit(FileFailedEvent{"s1", 2, "c.txt", ferry::Error::storage("disk full")});
    bus.emit(ChunkRetransmittedEvent{"s1", 0, 4, 1});
    bus.emit(ChunkRetransmittedEvent{"s1", 0, 4, 2});
    bus.emit(TransportFallbackEvent{"s1", "peer", ferry::transport::TransportProtocol::Multiplexed,
                                    ferry::transport::TransportProtocol::SimpleStream, "reset"});
    bus.emit(CheckpointEvent{"s1", {}});
    bus.emit(IncomingTransferEvent{"t5", "stranger", 10, 1, false, false, "not trusted"});
    bus.emit(IncomingTransferEvent{"t6", "friend", 10, 1, true, false, ""});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_sent.load(), 1u);
    EXPECT_EQ(stats.bytes_sent.load(), 1024u);
    EXPECT_EQ(stats.files_received.load(), 1u);
    EXPECT_EQ(stats.bytes_received.load(), 2048u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.chunks_retransmitted.load(), 2u);
    EXPECT_EQ(stats.transport_fallbacks.load(), 1u);
    EXPECT_EQ(stats.checkpoints.load(), 1u);
    EXPECT_EQ(stats.incoming_rejected.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<FileCompletedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<FileCompletedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferStateChangedEvent>(), 0u);
}

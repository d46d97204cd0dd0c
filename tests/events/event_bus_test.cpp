#include "ferry/events/event_bus.hpp"
#include "ferry/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ferry::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received_bytes = 0;

    bus.subscribe<FileCompletedEvent>([&](const FileCompletedEvent& e) {
        handler_called = true;
        received_bytes = e.bytes;
    });

    bus.emit(FileCompletedEvent{"session", Direction::Outgoing, 0, "a.txt", 42});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_bytes, 42u);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int completed = 0;
    int retransmitted = 0;

    bus.subscribe<FileCompletedEvent>([&](const FileCompletedEvent&) { completed++; });
    bus.subscribe<ChunkRetransmittedEvent>([&](const ChunkRetransmittedEvent&) { retransmitted++; });

    bus.emit(FileCompletedEvent{});
    bus.emit(ChunkRetransmittedEvent{"session", 0, 3, 1});
    bus.emit(FileCompletedEvent{});

    EXPECT_EQ(completed, 2);
    EXPECT_EQ(retransmitted, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<CheckpointEvent>([&](const CheckpointEvent&) { count++; });

    bus.emit(CheckpointEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<CheckpointEvent>(id);

    bus.emit(CheckpointEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(TransportFallbackEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int reached = 0;

    bus.subscribe<FileFailedEvent>([](const FileFailedEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe<FileFailedEvent>([&](const FileFailedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(FileFailedEvent{}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;
    int count = 0;
    std::size_t id = 0;
    id = bus.subscribe<QueueChangedEvent>([&](const QueueChangedEvent&) {
        count++;
        bus.unsubscribe<QueueChangedEvent>(id);
    });

    bus.emit(QueueChangedEvent{});
    bus.emit(QueueChangedEvent{});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<QueueChangedEvent>(), 0u);
}

TEST(EventBus, ConcurrentSubscribeAndEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<TransferProgressEvent>([&count](const TransferProgressEvent&) { count++; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    threads.clear();

    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&bus]() { bus.emit(TransferProgressEvent{}); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 200);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<IncomingTransferEvent>([](const IncomingTransferEvent&) {});
    bus.subscribe<IncomingTransferFinishedEvent>([](const IncomingTransferFinishedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<IncomingTransferEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<IncomingTransferEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<IncomingTransferFinishedEvent>(), 0u);
}

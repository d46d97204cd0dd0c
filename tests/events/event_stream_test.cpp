#include "ferry/events/event_stream.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <variant>

using namespace ferry::events;
using ferry::transfer::TransferState;

TEST(EventStream, DeliversInEmitOrder) {
    EventBus bus;
    EventStream stream(bus);

    bus.emit(TransferStateChangedEvent{"s1", "t1", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferProgressEvent{"s1", {}});
    bus.emit(FileCompletedEvent{"s1", Direction::Outgoing, 0, "a", 1});
    bus.emit(FileFailedEvent{"s1", 1, "b", ferry::Error::storage("x")});

    EXPECT_EQ(stream.pending(), 4u);
    auto first = stream.try_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<TransferStateChangedEvent>(*first));
    EXPECT_TRUE(std::holds_alternative<TransferProgressEvent>(*stream.try_next()));
    EXPECT_TRUE(std::holds_alternative<FileCompletedEvent>(*stream.try_next()));
    EXPECT_TRUE(std::holds_alternative<FileFailedEvent>(*stream.try_next()));
    EXPECT_FALSE(stream.try_next().has_value());
}

TEST(EventStream, FiltersBySessionAndProgress) {
    EventBus bus;
    EventStream stream(bus, std::string{"mine"}, false);

    bus.emit(TransferProgressEvent{"mine", {}});
    bus.emit(TransferStateChangedEvent{"other", "t", TransferState::Pending, TransferState::Negotiating, {}});
    bus.emit(TransferStateChangedEvent{"mine", "t", TransferState::Pending, TransferState::Negotiating, {}});

    EXPECT_EQ(stream.pending(), 1u);
    auto event = stream.try_next();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<TransferStateChangedEvent>(*event).session_id, "mine");
}

TEST(EventStream, NextWaitsForEmitter) {
    EventBus bus;
    EventStream stream(bus);

    std::thread emitter([&bus]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        bus.emit(FileCompletedEvent{"s", Direction::Incoming, 0, "x", 5});
    });
    auto event = stream.next(std::chrono::milliseconds{2000});
    emitter.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<FileCompletedEvent>(*event).bytes, 5u);
    EXPECT_FALSE(stream.next(std::chrono::milliseconds{10}).has_value());
}

TEST(EventStream, CloseStopsDelivery) {
    EventBus bus;
    {
        EventStream stream(bus);
        stream.close();
        bus.emit(FileCompletedEvent{});
        EXPECT_EQ(stream.pending(), 0u);
    }
    EXPECT_EQ(bus.subscriber_count<FileCompletedEvent>(), 0u);
}

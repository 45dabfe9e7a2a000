#include <gtest/gtest.h>
#include "reasm/events/event_bus.hpp"
#include "reasm/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace reasm::events;
using reasm::reassembly::ChunkState;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::uint32_t received_index = 0;
    ChunkState received_state = ChunkState::Unrequested;

    bus.subscribe<ChunkStateChangedEvent>([&](const ChunkStateChangedEvent& e) {
        received_index = e.index;
        received_state = e.state;
    });

    bus.emit(ChunkStateChangedEvent{"t1", 7, ChunkState::Received});

    EXPECT_EQ(received_index, 7u);
    EXPECT_EQ(received_state, ChunkState::Received);
}

TEST(EventBus, HandlersRunInRegistrationOrder) {
    EventBus bus;

    std::vector<int> order;
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { order.push_back(1); });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { order.push_back(2); });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { order.push_back(3); });

    bus.emit(TransferProgressEvent{"t1", 10, 100});

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int chunk_count = 0;
    int progress_count = 0;

    bus.subscribe<ChunkStateChangedEvent>([&](const ChunkStateChangedEvent&) { chunk_count++; });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { progress_count++; });

    bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Requested});
    bus.emit(TransferProgressEvent{"t1", 1, 2});
    bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Received});

    EXPECT_EQ(chunk_count, 2);
    EXPECT_EQ(progress_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TransferCancelledEvent>([&](const TransferCancelledEvent&) { count++; });

    bus.emit(TransferCancelledEvent{"t1"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<TransferCancelledEvent>(id);

    bus.emit(TransferCancelledEvent{"t2"});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent&) {
        throw std::runtime_error("observer failure");
    });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(TransferProgressEvent{"t1", 1, 1}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, SubscribeFromHandlerTakesEffectNextEmit) {
    EventBus bus;

    int late_calls = 0;
    bool subscribed = false;
    bus.subscribe<TransferCancelledEvent>([&](const TransferCancelledEvent&) {
        if (!subscribed) {
            subscribed = true;
            bus.subscribe<TransferCancelledEvent>([&](const TransferCancelledEvent&) { late_calls++; });
        }
    });

    bus.emit(TransferCancelledEvent{"t1"});
    EXPECT_EQ(late_calls, 0);

    bus.emit(TransferCancelledEvent{"t1"});
    EXPECT_EQ(late_calls, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(TransferCancelledEvent{"t1"}));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> total{0};

    bus.subscribe<TransferProgressEvent>([&total](const TransferProgressEvent& e) {
        total += e.bytes_received;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(TransferProgressEvent{"t1", 2, 100});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 0u);

    auto id1 = bus.subscribe<ChunkStateChangedEvent>([](const ChunkStateChangedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 1u);

    bus.subscribe<ChunkStateChangedEvent>([](const ChunkStateChangedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 2u);

    bus.unsubscribe<ChunkStateChangedEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 0u);
}

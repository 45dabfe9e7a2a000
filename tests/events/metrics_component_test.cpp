#include "reasm/events/event_bus.hpp"
#include "reasm/events/components.hpp"
#include "reasm/events/events.hpp"

#include <gtest/gtest.h>

using reasm::events::ChunkStateChangedEvent;
using reasm::events::EventBus;
using reasm::events::LoggerComponent;
using reasm::events::MetricsComponent;
using reasm::events::TransferCancelledEvent;
using reasm::events::TransferFinalizedEvent;
using reasm::events::TransferProgressEvent;
using reasm::reassembly::ChunkState;

TEST(MetricsComponentTest, TracksChunkAndTransferCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Requested});
    bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Received});
    bus.emit(ChunkStateChangedEvent{"t1", 1, ChunkState::Corrupted});
    bus.emit(ChunkStateChangedEvent{"t1", 2, ChunkState::Requested});
    bus.emit(ChunkStateChangedEvent{"t1", 2, ChunkState::Unrequested});
    bus.emit(TransferProgressEvent{"t1", 100, 300});
    bus.emit(TransferFinalizedEvent{"t1", "/out/file", 300});
    bus.emit(TransferCancelledEvent{"t2"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.chunks_requested.load(), 2u);
    EXPECT_EQ(stats.chunks_received.load(), 1u);
    EXPECT_EQ(stats.chunks_corrupted.load(), 1u);
    EXPECT_EQ(stats.chunks_reverted.load(), 1u);
    EXPECT_EQ(stats.progress_updates.load(), 1u);
    EXPECT_EQ(stats.transfers_finalized.load(), 1u);
    EXPECT_EQ(stats.bytes_finalized.load(), 300u);
    EXPECT_EQ(stats.transfers_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, ComponentsUnsubscribeOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 2u);
        EXPECT_EQ(bus.subscriber_count<TransferFinalizedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<ChunkStateChangedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferProgressEvent>(), 0u);

    EXPECT_NO_THROW(bus.emit(ChunkStateChangedEvent{"t1", 0, ChunkState::Received}));
}

#include "reasm/reassembly/write_scheduler.hpp"

#include <gtest/gtest.h>

#include <vector>

using reasm::ErrorCode;
using reasm::reassembly::WriteJob;
using reasm::reassembly::WriteLimits;
using reasm::reassembly::WriteScheduler;

namespace {

WriteJob make_job(std::uint32_t index) {
    WriteJob job;
    job.index = index;
    job.offset = index * 100u;
    job.bytes = {static_cast<std::uint8_t>(index)};
    return job;
}

} // namespace

TEST(WriteSchedulerTest, DispatchesWhileSlotsFree) {
    std::vector<std::uint32_t> dispatched;
    WriteScheduler scheduler(WriteLimits{2, 8}, [&](WriteJob&& job) { dispatched.push_back(job.index); });

    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(1)).is_ok());

    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_EQ(scheduler.in_flight(), 2u);
    EXPECT_EQ(scheduler.queued(), 0u);
}

TEST(WriteSchedulerTest, QueuesBeyondConcurrencyAndDrainsInOrder) {
    std::vector<std::uint32_t> dispatched;
    WriteScheduler scheduler(WriteLimits{1, 8}, [&](WriteJob&& job) { dispatched.push_back(job.index); });

    for (std::uint32_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(scheduler.admit(make_job(i)).is_ok());
    }
    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0}));
    EXPECT_EQ(scheduler.in_flight(), 1u);
    EXPECT_EQ(scheduler.queued(), 2u);

    scheduler.on_job_complete();
    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_EQ(scheduler.in_flight(), 1u);
    EXPECT_EQ(scheduler.queued(), 1u);

    scheduler.on_job_complete();
    scheduler.on_job_complete();
    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0, 1, 2}));
    EXPECT_TRUE(scheduler.idle());
}

TEST(WriteSchedulerTest, RejectsAtHardCap) {
    int dispatched = 0;
    WriteScheduler scheduler(WriteLimits{1, 2}, [&](WriteJob&&) { ++dispatched; });

    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(1)).is_ok());
    EXPECT_FALSE(scheduler.has_capacity());

    auto rejected = scheduler.admit(make_job(2));
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::Backpressure);
    EXPECT_EQ(dispatched, 1);
    EXPECT_EQ(scheduler.in_flight() + scheduler.queued(), 2u);
}

TEST(WriteSchedulerTest, CapBelowConcurrencyStillBoundsDispatch) {
    int dispatched = 0;
    WriteScheduler scheduler(WriteLimits{4, 1}, [&](WriteJob&&) { ++dispatched; });

    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    EXPECT_TRUE(scheduler.admit(make_job(1)).is_error());
    EXPECT_EQ(dispatched, 1);
}

TEST(WriteSchedulerTest, ReentrantCompletionDispatchesNext) {
    std::vector<std::uint32_t> dispatched;
    WriteScheduler* self = nullptr;
    WriteScheduler scheduler(WriteLimits{1, 4}, [&](WriteJob&& job) {
        dispatched.push_back(job.index);
        if (job.index == 0) {
            self->on_job_complete();
        }
    });
    self = &scheduler;

    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(1)).is_ok());

    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_EQ(scheduler.in_flight(), 1u);
    EXPECT_EQ(scheduler.queued(), 0u);
}

TEST(WriteSchedulerTest, ReleasedSlotWaitsForExplicitDispatch) {
    std::vector<std::uint32_t> dispatched;
    WriteScheduler scheduler(WriteLimits{1, 4}, [&](WriteJob&& job) { dispatched.push_back(job.index); });
    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(1)).is_ok());

    scheduler.release_slot();
    EXPECT_EQ(scheduler.in_flight(), 0u);
    EXPECT_EQ(scheduler.queued(), 1u);
    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0}));

    // A job arriving in between lines up behind the queued one
    ASSERT_TRUE(scheduler.admit(make_job(2)).is_ok());
    EXPECT_EQ(scheduler.queued(), 2u);

    scheduler.dispatch_pending();
    EXPECT_EQ(dispatched, (std::vector<std::uint32_t>{0, 1}));
    EXPECT_EQ(scheduler.in_flight(), 1u);
    EXPECT_EQ(scheduler.queued(), 1u);
}

TEST(WriteSchedulerTest, DrainRemovesQueuedJobsOnly) {
    WriteScheduler scheduler(WriteLimits{1, 4}, [](WriteJob&&) {});
    ASSERT_TRUE(scheduler.admit(make_job(0)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(1)).is_ok());
    ASSERT_TRUE(scheduler.admit(make_job(2)).is_ok());

    auto drained = scheduler.drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained.front().index, 1u);
    EXPECT_EQ(scheduler.queued(), 0u);
    EXPECT_EQ(scheduler.in_flight(), 1u);

    scheduler.on_job_complete();
    EXPECT_TRUE(scheduler.idle());
}

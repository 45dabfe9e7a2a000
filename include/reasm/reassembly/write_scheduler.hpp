#pragma once

#include "reasm/core/result.hpp"
#include "reasm/reassembly/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace reasm::reassembly {

/**
 * @brief A chunk payload waiting to be written at its offset
 */
struct WriteJob {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::vector<std::uint8_t> bytes;
    AcceptHandler on_done;
};

/**
 * @brief Admission control for one transfer's disk writes
 *
 * Up to max_concurrent_writes jobs are dispatched at once; further jobs
 * wait in a FIFO queue. The sum of queued and in-flight jobs never exceeds
 * max_queue_length: once there, admit() rejects with Backpressure.
 *
 * Not thread-safe. The dispatcher may complete a job re-entrantly; counters
 * are updated before it is invoked.
 */
class WriteScheduler {
public:
    using Dispatcher = std::function<void(WriteJob&&)>;

    WriteScheduler(WriteLimits limits, Dispatcher dispatcher);

    WriteScheduler(const WriteScheduler&) = delete;
    WriteScheduler& operator=(const WriteScheduler&) = delete;

    /// True if admit() would currently accept a job.
    [[nodiscard]] bool has_capacity() const noexcept;

    /// Dispatch immediately, queue, or reject with Backpressure.
    Result<void> admit(WriteJob job);

    /**
     * @brief Release the slot of a finished job
     *
     * Fills the freed slot from the queue.
     */
    void on_job_complete();

    /// First half of on_job_complete(): free the slot, dispatch nothing.
    void release_slot() noexcept;

    /// Move queued jobs into free slots.
    void dispatch_pending();

    /// Remove every queued job without dispatching it.
    std::deque<WriteJob> drain();

    [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] std::size_t queued() const noexcept { return queue_.size(); }
    [[nodiscard]] bool idle() const noexcept { return in_flight_ == 0 && queue_.empty(); }
    [[nodiscard]] const WriteLimits& limits() const noexcept { return limits_; }

private:
    WriteLimits limits_;
    Dispatcher dispatcher_;
    std::deque<WriteJob> queue_;
    std::size_t in_flight_ = 0;
};

} // namespace reasm::reassembly

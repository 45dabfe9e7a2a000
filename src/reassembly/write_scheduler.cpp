#include "reasm/reassembly/write_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace reasm::reassembly {

WriteScheduler::WriteScheduler(WriteLimits limits, Dispatcher dispatcher)
    : limits_(limits),
      dispatcher_(std::move(dispatcher)) {}

bool WriteScheduler::has_capacity() const noexcept {
    return queue_.size() + in_flight_ < limits_.max_queue_length;
}

Result<void> WriteScheduler::admit(WriteJob job) {
    // The hard cap also bounds dispatch when it is configured below the
    // concurrency limit. Queued jobs keep their turn over new arrivals.
    if (queue_.empty() && in_flight_ < limits_.max_concurrent_writes && has_capacity()) {
        ++in_flight_;
        dispatcher_(std::move(job));
        return Ok();
    }

    if (has_capacity()) {
        spdlog::debug("Queueing write for chunk {} ({} in flight, {} queued)",
                      job.index, in_flight_, queue_.size());
        queue_.push_back(std::move(job));
        return Ok();
    }

    return Err<void>(ErrorCode::Backpressure,
                     "Write queue full (" + std::to_string(in_flight_) + " in flight, " +
                     std::to_string(queue_.size()) + " queued, cap " +
                     std::to_string(limits_.max_queue_length) + ")");
}

void WriteScheduler::on_job_complete() {
    release_slot();
    dispatch_pending();
}

void WriteScheduler::release_slot() noexcept {
    if (in_flight_ > 0) {
        --in_flight_;
    }
}

void WriteScheduler::dispatch_pending() {
    // The dispatcher may complete jobs re-entrantly, so re-check every round
    while (!queue_.empty() && in_flight_ < limits_.max_concurrent_writes) {
        WriteJob next = std::move(queue_.front());
        queue_.pop_front();
        ++in_flight_;
        dispatcher_(std::move(next));
    }
}

std::deque<WriteJob> WriteScheduler::drain() {
    std::deque<WriteJob> drained;
    drained.swap(queue_);
    return drained;
}

} // namespace reasm::reassembly

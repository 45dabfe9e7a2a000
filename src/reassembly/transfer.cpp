#include "reasm/reassembly/transfer.hpp"
#include "reasm/events/events.hpp"
#include "reasm/reassembly/integrity.hpp"
#include "reasm/reassembly/layout.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace reasm::reassembly {
namespace fs = std::filesystem;

Transfer::Transfer(std::string transfer_id,
                   Manifest manifest,
                   fs::path destination_path,
                   WriteLimits limits,
                   storage::ChunkWriter& writer,
                   events::EventBus& bus)
    : transfer_id_(std::move(transfer_id)),
      manifest_(std::move(manifest)),
      destination_path_(std::move(destination_path)),
      writer_(writer),
      bus_(bus),
      offsets_(compute_offsets(manifest_.chunks)),
      chunk_states_(manifest_.chunks.size(), ChunkState::Unrequested),
      total_bytes_(total_span(manifest_.chunks)),
      scheduler_(limits, [this](WriteJob&& job) { dispatch(std::move(job)); }) {}

Result<void> Transfer::accept_chunk(std::uint32_t index, std::vector<std::uint8_t> bytes, AcceptHandler on_done) {
    if (index >= chunk_states_.size()) {
        return Err<void>(ErrorCode::InvalidIndex,
                         "Invalid chunk index " + std::to_string(index) + " for transfer " + transfer_id_ +
                         " (" + std::to_string(chunk_states_.size()) + " chunks)");
    }

    const ChunkState previous = chunk_states_[index];
    if (previous == ChunkState::Requested) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Chunk " + std::to_string(index) + " of transfer " + transfer_id_ +
                         " already has a pending write");
    }

    // A payload that does not span exactly its descriptor would spill into a
    // neighbouring chunk's byte range, so it is treated like a bad checksum.
    const ChunkDescriptor& descriptor = manifest_.chunks[index];
    const bool size_matches = bytes.size() == descriptor.encrypted_size;
    if (!size_matches || !verify_chunk(bytes, descriptor.checksum)) {
        if (previous == ChunkState::Received) {
            spdlog::warn("Ignoring bad redelivery of chunk {} for transfer {}; written copy kept",
                         index, transfer_id_);
            on_done(Ok(false));
            return Ok();
        }
        if (!size_matches) {
            spdlog::warn("Size mismatch for chunk {} of transfer {}: got {} bytes, expected {}",
                         index, transfer_id_, bytes.size(), descriptor.encrypted_size);
        } else {
            spdlog::warn("Checksum mismatch for chunk {} of transfer {}", index, transfer_id_);
        }
        corrupted_.insert(index);
        // Every rejected delivery is reported, even a repeat on a CORRUPTED chunk
        chunk_states_[index] = ChunkState::Corrupted;
        bus_.emit(events::ChunkStateChangedEvent{transfer_id_, index, ChunkState::Corrupted});
        on_done(Ok(false));
        return Ok();
    }

    if (previous == ChunkState::Received) {
        spdlog::debug("Duplicate delivery of chunk {} for transfer {}", index, transfer_id_);
        on_done(Ok(true));
        return Ok();
    }

    if (!scheduler_.has_capacity()) {
        spdlog::warn("Backpressure on transfer {}: rejecting chunk {} ({} in flight, {} queued)",
                     transfer_id_, index, scheduler_.in_flight(), scheduler_.queued());
        return Err<void>(ErrorCode::Backpressure,
                         "Write queue for transfer " + transfer_id_ + " is full");
    }

    set_state(index, ChunkState::Requested);

    WriteJob job;
    job.index = index;
    job.offset = offsets_[index];
    job.bytes = std::move(bytes);
    job.on_done = std::move(on_done);

    auto admitted = scheduler_.admit(std::move(job));
    if (admitted.is_error()) {
        // A subscriber of the REQUESTED event filled the queue re-entrantly
        set_state(index, previous);
        return admitted;
    }
    return Ok();
}

Result<void> Transfer::mark_chunk_received(std::uint32_t index) {
    if (index >= chunk_states_.size()) {
        return Err<void>(ErrorCode::InvalidIndex,
                         "Invalid chunk index " + std::to_string(index) + " for transfer " + transfer_id_);
    }

    if (received_.insert(index).second) {
        bytes_received_ += manifest_.chunks[index].encrypted_size;
    }
    set_state(index, ChunkState::Received);
    return Ok();
}

Result<void> Transfer::mark_chunk_corrupt(std::uint32_t index) {
    if (index >= chunk_states_.size()) {
        return Err<void>(ErrorCode::InvalidIndex,
                         "Invalid chunk index " + std::to_string(index) + " for transfer " + transfer_id_);
    }
    if (chunk_states_[index] == ChunkState::Requested) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Chunk " + std::to_string(index) + " of transfer " + transfer_id_ +
                         " has a pending write");
    }
    if (finalizing_) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Transfer " + transfer_id_ + " is being finalized");
    }

    if (received_.erase(index) > 0) {
        bytes_received_ -= manifest_.chunks[index].encrypted_size;
    }
    corrupted_.insert(index);
    spdlog::warn("Chunk {} of transfer {} marked corrupt", index, transfer_id_);
    set_state(index, ChunkState::Corrupted);
    return Ok();
}

bool Transfer::is_complete() const noexcept {
    return std::all_of(chunk_states_.begin(), chunk_states_.end(),
                       [](ChunkState state) { return state == ChunkState::Received; });
}

void Transfer::abort(const std::string& reason) {
    auto dropped = scheduler_.drain();
    if (!dropped.empty()) {
        spdlog::info("Dropping {} queued writes for transfer {}: {}", dropped.size(), transfer_id_, reason);
    }
    for (auto& job : dropped) {
        set_state(job.index, ChunkState::Unrequested);
        job.on_done(Err<bool>(ErrorCode::NotFound,
                              "Transfer " + transfer_id_ + " released before chunk " +
                              std::to_string(job.index) + " was written: " + reason));
    }
}

Result<storage::FinalizeRequest> Transfer::prepare_finalize(const fs::path& final_path) const {
    if (finalizing_) {
        return Err<storage::FinalizeRequest>(ErrorCode::FinalizeFailure,
                                             "Finalize already in progress for transfer " + transfer_id_);
    }
    if (!scheduler_.idle()) {
        return Err<storage::FinalizeRequest>(ErrorCode::FinalizeFailure,
                                             "Transfer " + transfer_id_ + " still has pending writes");
    }
    if (!is_complete()) {
        return Err<storage::FinalizeRequest>(ErrorCode::FinalizeFailure,
                                             "Transfer " + transfer_id_ + " not complete: " +
                                             std::to_string(received_.size()) + "/" +
                                             std::to_string(chunk_states_.size()) + " chunks received");
    }

    storage::FinalizeRequest request;
    request.transfer_id = transfer_id_;
    request.temp_path = destination_path_;
    request.final_path = final_path;
    request.expected_root = manifest_.merkle_root;
    request.total_bytes = total_bytes_;
    return Ok(std::move(request));
}

TransferSnapshot Transfer::snapshot() const {
    TransferSnapshot snapshot;
    snapshot.transfer_id = transfer_id_;
    snapshot.destination_path = destination_path_;
    snapshot.file_size = manifest_.file_size;
    snapshot.total_bytes = total_bytes_;
    snapshot.bytes_received = bytes_received_;
    snapshot.offsets = offsets_;
    snapshot.chunk_states = chunk_states_;
    snapshot.received_chunks = received_;
    snapshot.corrupted_chunks = corrupted_;
    snapshot.max_concurrent_writes = scheduler_.limits().max_concurrent_writes;
    snapshot.max_queue_length = scheduler_.limits().max_queue_length;
    snapshot.write_in_flight = scheduler_.in_flight();
    snapshot.write_queue_length = scheduler_.queued();
    return snapshot;
}

void Transfer::dispatch(WriteJob&& job) {
    std::weak_ptr<Transfer> weak = weak_from_this();
    const std::uint32_t index = job.index;
    const std::string transfer_id = transfer_id_;

    spdlog::debug("Dispatching chunk {} of transfer {} ({} bytes at offset {})",
                  index, transfer_id_, job.bytes.size(), job.offset);

    writer_.async_write(destination_path_, job.offset, std::move(job.bytes),
        [weak, index, transfer_id, on_done = std::move(job.on_done)](Result<void> result) {
            if (auto self = weak.lock()) {
                self->on_write_complete(index, std::move(result), on_done);
                return;
            }
            on_done(Err<bool>(ErrorCode::NotFound,
                              "Transfer " + transfer_id + " released before chunk " +
                              std::to_string(index) + " was written"));
        });
}

void Transfer::on_write_complete(std::uint32_t index, Result<void> result, const AcceptHandler& on_done) {
    // Subscribers of the events below must already see the slot as free
    scheduler_.release_slot();

    if (result.is_ok()) {
        if (received_.insert(index).second) {
            bytes_received_ += manifest_.chunks[index].encrypted_size;
        }
        set_state(index, ChunkState::Received);
        bus_.emit(events::TransferProgressEvent{transfer_id_, bytes_received_, total_bytes_});
    } else {
        spdlog::error("Write of chunk {} for transfer {} failed: {}",
                      index, transfer_id_, result.error().message);
        if (chunk_states_[index] == ChunkState::Requested) {
            set_state(index, ChunkState::Unrequested);
        }
    }

    scheduler_.dispatch_pending();

    if (result.is_ok()) {
        on_done(Ok(true));
    } else {
        on_done(Err<bool>(ErrorCode::WriteFailure, result.error().message));
    }
}

void Transfer::set_state(std::uint32_t index, ChunkState state) {
    if (chunk_states_[index] == state) {
        return;
    }
    chunk_states_[index] = state;
    bus_.emit(events::ChunkStateChangedEvent{transfer_id_, index, state});
}

} // namespace reasm::reassembly

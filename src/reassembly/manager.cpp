#include "reasm/reassembly/manager.hpp"
#include "reasm/events/events.hpp"
#include "reasm/reassembly/manifest_codec.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace reasm::reassembly {
namespace fs = std::filesystem;

ReassemblyManager::ReassemblyManager(storage::ChunkWriter& writer,
                                     storage::TransferFinalizer& finalizer,
                                     events::EventBus& bus,
                                     ReassemblyConfig config)
    : writer_(writer),
      finalizer_(finalizer),
      event_bus_(bus),
      config_(std::move(config)) {}

ReassemblyManager::~ReassemblyManager() {
    for (auto& [id, transfer] : transfers_) {
        transfer->abort("manager shutting down");
    }
}

Result<void> ReassemblyManager::init_reassembly(const std::string& transfer_id,
                                                Manifest manifest,
                                                fs::path destination_path,
                                                std::optional<std::size_t> max_concurrent_writes,
                                                std::optional<std::size_t> max_queue_length) {
    WriteLimits limits = config_.limits();
    if (max_concurrent_writes) {
        limits.max_concurrent_writes = *max_concurrent_writes;
    }
    if (max_queue_length) {
        limits.max_queue_length = *max_queue_length;
    }
    if (auto valid = validate_limits(limits); valid.is_error()) {
        return valid;
    }
    if (auto valid = validate_manifest(manifest); valid.is_error()) {
        return valid;
    }

    auto existing = transfers_.find(transfer_id);
    if (existing != transfers_.end()) {
        spdlog::warn("Re-initialising transfer {}; previous state discarded", transfer_id);
        existing->second->abort("transfer re-initialised");
        transfers_.erase(existing);
    }

    const auto chunk_count = manifest.chunks.size();
    auto transfer = std::make_shared<Transfer>(transfer_id, std::move(manifest), std::move(destination_path),
                                               limits, writer_, event_bus_);
    transfers_.emplace(transfer_id, std::move(transfer));

    spdlog::info("Initialised transfer {} ({} chunks, concurrency={}, queue={})",
                 transfer_id, chunk_count, limits.max_concurrent_writes, limits.max_queue_length);
    return Ok();
}

Result<void> ReassemblyManager::accept_chunk(const std::string& transfer_id,
                                             std::uint32_t index,
                                             std::vector<std::uint8_t> bytes,
                                             AcceptHandler on_done) {
    auto transfer = find_transfer(transfer_id);
    if (transfer.is_error()) {
        return Err<void>(transfer.error());
    }
    return transfer.value()->accept_chunk(index, std::move(bytes), std::move(on_done));
}

Result<void> ReassemblyManager::mark_chunk_received(const std::string& transfer_id, std::uint32_t index) {
    auto transfer = find_transfer(transfer_id);
    if (transfer.is_error()) {
        return Err<void>(transfer.error());
    }
    return transfer.value()->mark_chunk_received(index);
}

Result<void> ReassemblyManager::mark_chunk_corrupt(const std::string& transfer_id, std::uint32_t index) {
    auto transfer = find_transfer(transfer_id);
    if (transfer.is_error()) {
        return Err<void>(transfer.error());
    }
    return transfer.value()->mark_chunk_corrupt(index);
}

Result<void> ReassemblyManager::resume(const std::string& transfer_id,
                                       const std::vector<std::uint32_t>& received_chunks) {
    auto transfer = find_transfer(transfer_id);
    if (transfer.is_error()) {
        return Err<void>(transfer.error());
    }
    for (auto index : received_chunks) {
        if (auto res = transfer.value()->mark_chunk_received(index); res.is_error()) {
            return res;
        }
    }
    spdlog::info("Resumed transfer {} with {} chunks already on disk", transfer_id, received_chunks.size());
    return Ok();
}

bool ReassemblyManager::is_complete(const std::string& transfer_id) const {
    auto transfer = find_transfer(transfer_id);
    return transfer.is_ok() && transfer.value()->is_complete();
}

Result<void> ReassemblyManager::finalize(const std::string& transfer_id,
                                         fs::path final_path,
                                         FinalizeHandler on_done) {
    auto found = find_transfer(transfer_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto transfer = found.value();

    auto request = transfer->prepare_finalize(final_path);
    if (request.is_error()) {
        spdlog::warn("Refusing to finalize transfer {}: {}", transfer_id, request.error().message);
        return Err<void>(request.error());
    }

    transfer->set_finalizing(true);
    std::weak_ptr<Transfer> weak = transfer;
    const auto total_bytes = transfer->total_bytes();

    finalizer_.async_finalize(std::move(request.value()),
        [this, weak, transfer_id, final_path, total_bytes, on_done = std::move(on_done)](Result<void> result) {
            auto self = weak.lock();
            if (!self) {
                // Cancelled or replaced while the finalizer ran
                on_done(std::move(result));
                return;
            }

            if (result.is_error()) {
                self->set_finalizing(false);
                spdlog::error("Finalize of transfer {} failed: {}", transfer_id, result.error().message);
                on_done(Err<void>(ErrorCode::FinalizeFailure, result.error().message));
                return;
            }

            auto it = transfers_.find(transfer_id);
            if (it != transfers_.end() && it->second == self) {
                transfers_.erase(it);
            }
            event_bus_.emit(events::TransferFinalizedEvent{transfer_id, final_path.string(), total_bytes});
            on_done(Ok());
        });
    return Ok();
}

Result<void> ReassemblyManager::cancel(const std::string& transfer_id) {
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return Err<void>(ErrorCode::NotFound, "Unknown transfer: " + transfer_id);
    }

    auto transfer = std::move(it->second);
    transfers_.erase(it);
    transfer->abort("transfer cancelled");

    spdlog::info("Cancelled transfer {}", transfer_id);
    event_bus_.emit(events::TransferCancelledEvent{transfer_id});
    return Ok();
}

std::optional<TransferSnapshot> ReassemblyManager::get_state(const std::string& transfer_id) const {
    auto transfer = find_transfer(transfer_id);
    if (transfer.is_error()) {
        return std::nullopt;
    }
    return transfer.value()->snapshot();
}

Result<std::shared_ptr<Transfer>> ReassemblyManager::find_transfer(const std::string& transfer_id) const {
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return Err<std::shared_ptr<Transfer>>(ErrorCode::NotFound, "Unknown transfer: " + transfer_id);
    }
    return Ok(it->second);
}

} // namespace reasm::reassembly

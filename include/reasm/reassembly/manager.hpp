#pragma once

#include "reasm/core/result.hpp"
#include "reasm/events/event_bus.hpp"
#include "reasm/reassembly/config.hpp"
#include "reasm/reassembly/transfer.hpp"
#include "reasm/reassembly/types.hpp"
#include "reasm/storage/chunk_writer.hpp"
#include "reasm/storage/finalizer.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reasm::reassembly {

/**
 * @brief Entry point for the network and UI layers
 *
 * Owns every in-flight Transfer, keyed by the caller's transfer id.
 * Synchronous failures (unknown transfer, bad index, backpressure,
 * unfinished transfer) are returned directly and the completion handler is
 * not called. Everything else is reported through the handler.
 *
 * Single-threaded: call it from the thread that runs the io_context the
 * collaborators post completions to. The manager must outlive any
 * finalize still in progress.
 */
class ReassemblyManager {
public:
    ReassemblyManager(storage::ChunkWriter& writer,
                      storage::TransferFinalizer& finalizer,
                      events::EventBus& bus,
                      ReassemblyConfig config = {});

    ~ReassemblyManager();

    ReassemblyManager(const ReassemblyManager&) = delete;
    ReassemblyManager& operator=(const ReassemblyManager&) = delete;

    /**
     * @brief Register a transfer, replacing any existing one with the same id
     *
     * Bounds default to the config values when not given.
     */
    Result<void> init_reassembly(const std::string& transfer_id,
                                 Manifest manifest,
                                 std::filesystem::path destination_path,
                                 std::optional<std::size_t> max_concurrent_writes = std::nullopt,
                                 std::optional<std::size_t> max_queue_length = std::nullopt);

    /// See Transfer::accept_chunk. Unknown id fails with NotFound.
    Result<void> accept_chunk(const std::string& transfer_id,
                              std::uint32_t index,
                              std::vector<std::uint8_t> bytes,
                              AcceptHandler on_done);

    Result<void> mark_chunk_received(const std::string& transfer_id, std::uint32_t index);

    /// See Transfer::mark_chunk_corrupt. Unknown id fails with NotFound.
    Result<void> mark_chunk_corrupt(const std::string& transfer_id, std::uint32_t index);

    /// Mark every listed chunk RECEIVED, e.g. from a saved bitmap.
    Result<void> resume(const std::string& transfer_id, const std::vector<std::uint32_t>& received_chunks);

    /// False for unknown transfers.
    [[nodiscard]] bool is_complete(const std::string& transfer_id) const;

    /**
     * @brief Verify and commit a fully received transfer to final_path
     *
     * Fails synchronously with FinalizeFailure if chunks are missing, writes
     * are still outstanding or a finalize is already running. On success the
     * transfer is released; on failure it is kept unchanged for a retry.
     */
    Result<void> finalize(const std::string& transfer_id,
                          std::filesystem::path final_path,
                          FinalizeHandler on_done);

    /// Release a transfer without committing it.
    Result<void> cancel(const std::string& transfer_id);

    /// std::nullopt for unknown or already finalized transfers.
    [[nodiscard]] std::optional<TransferSnapshot> get_state(const std::string& transfer_id) const;

    [[nodiscard]] std::size_t active_transfers() const noexcept { return transfers_.size(); }

    [[nodiscard]] const ReassemblyConfig& config() const noexcept { return config_; }

private:
    Result<std::shared_ptr<Transfer>> find_transfer(const std::string& transfer_id) const;

    storage::ChunkWriter& writer_;
    storage::TransferFinalizer& finalizer_;
    events::EventBus& event_bus_;
    ReassemblyConfig config_;

    std::unordered_map<std::string, std::shared_ptr<Transfer>> transfers_;
};

} // namespace reasm::reassembly

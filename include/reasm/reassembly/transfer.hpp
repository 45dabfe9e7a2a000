#pragma once

#include "reasm/core/result.hpp"
#include "reasm/events/event_bus.hpp"
#include "reasm/reassembly/types.hpp"
#include "reasm/reassembly/write_scheduler.hpp"
#include "reasm/storage/chunk_writer.hpp"
#include "reasm/storage/finalizer.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace reasm::reassembly {

/**
 * @brief Bookkeeping and write pipeline for one in-flight transfer
 *
 * Owns the per-chunk state array, the received/corrupted index sets and
 * the WriteScheduler that bounds outstanding writes. Offsets are computed
 * once at construction.
 *
 * Lifecycle:
 * 1. Created by ReassemblyManager::init_reassembly (always via make_shared)
 * 2. accept_chunk() verifies, admits and dispatches writes
 * 3. Write completions re-enter through a weak reference, so completions
 *    arriving after the transfer was dropped resolve with NotFound
 * 4. Released by the manager after finalize succeeds or on cancel
 *
 * Not thread-safe: drive it from a single thread (the io_context thread
 * when used with FileChunkWriter).
 */
class Transfer : public std::enable_shared_from_this<Transfer> {
public:
    Transfer(std::string transfer_id,
             Manifest manifest,
             std::filesystem::path destination_path,
             WriteLimits limits,
             storage::ChunkWriter& writer,
             events::EventBus& bus);

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    /**
     * @brief Submit a chunk payload
     *
     * Returns an error, without invoking on_done, for an out-of-range index,
     * a chunk whose write is already pending, or a full write queue
     * (Backpressure). Otherwise on_done receives:
     * - false right away if the payload size or checksum does not match the
     *   descriptor; a RECEIVED chunk stays RECEIVED, any other becomes CORRUPTED
     * - true right away if the chunk is already RECEIVED
     * - true once the write lands, or WriteFailure if it does not
     */
    Result<void> accept_chunk(std::uint32_t index, std::vector<std::uint8_t> bytes, AcceptHandler on_done);

    /// Mark a chunk RECEIVED without writing it (e.g. data already on disk).
    Result<void> mark_chunk_received(std::uint32_t index);

    /**
     * @brief Flag a chunk as bad after the fact so it is fetched again
     *
     * A RECEIVED chunk loses its received status and bytes. Rejected with
     * InvalidArgument while the chunk has a pending write or a finalize runs.
     */
    Result<void> mark_chunk_corrupt(std::uint32_t index);

    /// Every chunk is RECEIVED.
    [[nodiscard]] bool is_complete() const noexcept;

    /**
     * @brief Drop queued writes, resolving their handlers with NotFound
     *
     * Writes already dispatched complete on their own.
     */
    void abort(const std::string& reason);

    /// Checks the commit preconditions and builds the finalizer request.
    Result<storage::FinalizeRequest> prepare_finalize(const std::filesystem::path& final_path) const;

    [[nodiscard]] TransferSnapshot snapshot() const;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }

    void set_finalizing(bool value) noexcept { finalizing_ = value; }

private:
    void dispatch(WriteJob&& job);
    void on_write_complete(std::uint32_t index, Result<void> result, const AcceptHandler& on_done);
    void set_state(std::uint32_t index, ChunkState state);

    std::string transfer_id_;
    Manifest manifest_;
    std::filesystem::path destination_path_;
    storage::ChunkWriter& writer_;
    events::EventBus& bus_;

    std::vector<std::uint64_t> offsets_;
    std::vector<ChunkState> chunk_states_;
    std::set<std::uint32_t> received_;
    std::set<std::uint32_t> corrupted_;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t bytes_received_ = 0;
    bool finalizing_ = false;

    WriteScheduler scheduler_;
};

} // namespace reasm::reassembly

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "reasm/core/result.hpp"

namespace reasm::reassembly {

/**
 * @brief One entry of the upstream manifest
 *
 * encrypted_size is the byte length written to disk for this chunk and is
 * authoritative for offsets. An absent or empty checksum means the chunk is
 * accepted without digest verification.
 */
struct ChunkDescriptor {
    std::uint32_t index = 0;
    std::uint64_t encrypted_size = 0;
    std::optional<std::string> checksum; ///< hex SHA-256
};

/**
 * @brief Externally supplied layout of a file's chunk stream
 */
struct Manifest {
    std::uint64_t file_size = 0;          ///< Informational, used for display only
    std::vector<ChunkDescriptor> chunks;
    std::optional<std::string> merkle_root; ///< Expected digest of the assembled file
};

/**
 * @brief Per-chunk lifecycle
 *
 * STATE TRANSITIONS:
 * UNREQUESTED → REQUESTED (admitted for write)
 * REQUESTED   → RECEIVED  (write completed)
 * REQUESTED   → UNREQUESTED (write failed, chunk may be retried)
 * UNREQUESTED → CORRUPTED (checksum mismatch, nothing written)
 * CORRUPTED   → REQUESTED (retry from another source)
 */
enum class ChunkState {
    Unrequested,
    Requested,
    Received,
    Corrupted
};

const char* to_string(ChunkState state) noexcept;

/**
 * @brief Concurrency and queue bounds for one transfer's writes
 */
struct WriteLimits {
    std::size_t max_concurrent_writes = 4;
    std::size_t max_queue_length = 64; ///< Hard cap on queued + in-flight jobs
};

/**
 * @brief Read-only copy of a transfer's bookkeeping
 */
struct TransferSnapshot {
    std::string transfer_id;
    std::filesystem::path destination_path;
    std::uint64_t file_size = 0;
    std::uint64_t total_bytes = 0;     ///< Sum of encrypted_size
    std::uint64_t bytes_received = 0;
    std::vector<std::uint64_t> offsets;
    std::vector<ChunkState> chunk_states;
    std::set<std::uint32_t> received_chunks;
    std::set<std::uint32_t> corrupted_chunks;
    std::size_t max_concurrent_writes = 0;
    std::size_t max_queue_length = 0;
    std::size_t write_in_flight = 0;
    std::size_t write_queue_length = 0;
};

/// Eventual outcome of accept_chunk: true once written, false on checksum mismatch.
using AcceptHandler = std::function<void(Result<bool>)>;

/// Eventual outcome of finalize.
using FinalizeHandler = std::function<void(Result<void>)>;

} // namespace reasm::reassembly

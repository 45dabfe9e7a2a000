/**
 * @file events.hpp
 * @brief Events published by the reassembly engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ChunkStateChangedEvent, TransferFinalizedEvent
 */

#pragma once

#include "reasm/reassembly/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace reasm::events {

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every chunk state transition
 *
 * WHO EMITS:
 * - Transfer (accept, write completion, mark received)
 *
 * WHO SUBSCRIBES:
 * - UI (per-chunk map)
 * - LoggerComponent, MetricsComponent
 */
struct ChunkStateChangedEvent {
    std::string transfer_id;
    std::uint32_t index;
    reassembly::ChunkState state;
    std::chrono::system_clock::time_point timestamp;

    ChunkStateChangedEvent(std::string id, std::uint32_t chunk_index, reassembly::ChunkState s)
        : transfer_id(std::move(id)),
          index(chunk_index),
          state(s),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted after every successful chunk write
 *
 * total_bytes is the sum of the manifest's encrypted sizes.
 */
struct TransferProgressEvent {
    std::string transfer_id;
    std::uint64_t bytes_received;
    std::uint64_t total_bytes;
    std::chrono::system_clock::time_point timestamp;

    TransferProgressEvent(std::string id, std::uint64_t received, std::uint64_t total)
        : transfer_id(std::move(id)),
          bytes_received(received),
          total_bytes(total),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Transfer Lifecycle Events
// ════════════════════════════════════════════════════════

struct TransferFinalizedEvent {
    std::string transfer_id;
    std::string final_path;
    std::uint64_t total_bytes;
    std::chrono::system_clock::time_point timestamp;

    TransferFinalizedEvent(std::string id, std::string path, std::uint64_t total)
        : transfer_id(std::move(id)),
          final_path(std::move(path)),
          total_bytes(total),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct TransferCancelledEvent {
    std::string transfer_id;
    std::chrono::system_clock::time_point timestamp;

    explicit TransferCancelledEvent(std::string id)
        : transfer_id(std::move(id)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace reasm::events

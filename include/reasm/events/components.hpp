/**
 * @file components.hpp
 * @brief Ready-made subscribers for reassembly events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // ... run transfers ...
 * metrics.print_stats();
 */

#pragma once

#include "reasm/events/event_bus.hpp"
#include "reasm/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace reasm::events {

/**
 * @brief Logs every reassembly event through spdlog
 *
 * Chunk transitions and progress go to debug, corruption to warn,
 * lifecycle events to info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        chunk_state_id_ = bus_.subscribe<ChunkStateChangedEvent>([this](const ChunkStateChangedEvent& e) {
            on_chunk_state(e);
        });

        progress_id_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            on_progress(e);
        });

        finalized_id_ = bus_.subscribe<TransferFinalizedEvent>([this](const TransferFinalizedEvent& e) {
            on_finalized(e);
        });

        cancelled_id_ = bus_.subscribe<TransferCancelledEvent>([this](const TransferCancelledEvent& e) {
            on_cancelled(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<ChunkStateChangedEvent>(chunk_state_id_);
        bus_.unsubscribe<TransferProgressEvent>(progress_id_);
        bus_.unsubscribe<TransferFinalizedEvent>(finalized_id_);
        bus_.unsubscribe<TransferCancelledEvent>(cancelled_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_chunk_state(const ChunkStateChangedEvent& e) {
        if (e.state == reassembly::ChunkState::Corrupted) {
            spdlog::warn("[ChunkCorrupted] transfer={} chunk={}", e.transfer_id, e.index);
            return;
        }
        spdlog::debug("[ChunkState] transfer={} chunk={} state={}",
                      e.transfer_id, e.index, reassembly::to_string(e.state));
    }

    void on_progress(const TransferProgressEvent& e) {
        spdlog::debug("[Progress] transfer={} bytes={}/{}", e.transfer_id, e.bytes_received, e.total_bytes);
    }

    void on_finalized(const TransferFinalizedEvent& e) {
        spdlog::info("[TransferFinalized] transfer={} path={} bytes={}",
                     e.transfer_id, e.final_path, e.total_bytes);
    }

    void on_cancelled(const TransferCancelledEvent& e) {
        spdlog::info("[TransferCancelled] transfer={}", e.transfer_id);
    }

    EventBus& bus_;
    EventBus::HandlerId chunk_state_id_ = 0;
    EventBus::HandlerId progress_id_ = 0;
    EventBus::HandlerId finalized_id_ = 0;
    EventBus::HandlerId cancelled_id_ = 0;
};

/**
 * @brief Counts chunk outcomes and transfer lifecycle events
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> chunks_requested{0};
        std::atomic<uint64_t> chunks_received{0};
        std::atomic<uint64_t> chunks_corrupted{0};
        std::atomic<uint64_t> chunks_reverted{0};
        std::atomic<uint64_t> progress_updates{0};
        std::atomic<uint64_t> transfers_finalized{0};
        std::atomic<uint64_t> transfers_cancelled{0};
        std::atomic<uint64_t> bytes_finalized{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        chunk_state_id_ = bus_.subscribe<ChunkStateChangedEvent>([this](const ChunkStateChangedEvent& e) {
            on_chunk_state(e);
        });

        progress_id_ = bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent&) {
            stats_.progress_updates++;
        });

        finalized_id_ = bus_.subscribe<TransferFinalizedEvent>([this](const TransferFinalizedEvent& e) {
            stats_.transfers_finalized++;
            stats_.bytes_finalized += e.total_bytes;
        });

        cancelled_id_ = bus_.subscribe<TransferCancelledEvent>([this](const TransferCancelledEvent&) {
            stats_.transfers_cancelled++;
        });
    }

    ~MetricsComponent() {
        bus_.unsubscribe<ChunkStateChangedEvent>(chunk_state_id_);
        bus_.unsubscribe<TransferProgressEvent>(progress_id_);
        bus_.unsubscribe<TransferFinalizedEvent>(finalized_id_);
        bus_.unsubscribe<TransferCancelledEvent>(cancelled_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Reassembly Statistics:");
        spdlog::info("  Chunks requested:    {}", stats_.chunks_requested.load());
        spdlog::info("  Chunks received:     {}", stats_.chunks_received.load());
        spdlog::info("  Chunks corrupted:    {}", stats_.chunks_corrupted.load());
        spdlog::info("  Chunks reverted:     {}", stats_.chunks_reverted.load());
        spdlog::info("  Progress updates:    {}", stats_.progress_updates.load());
        spdlog::info("  Transfers finalized: {}", stats_.transfers_finalized.load());
        spdlog::info("  Transfers cancelled: {}", stats_.transfers_cancelled.load());
        spdlog::info("  Bytes finalized:     {}", stats_.bytes_finalized.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_chunk_state(const ChunkStateChangedEvent& e) {
        switch (e.state) {
            case reassembly::ChunkState::Requested: stats_.chunks_requested++; break;
            case reassembly::ChunkState::Received: stats_.chunks_received++; break;
            case reassembly::ChunkState::Corrupted: stats_.chunks_corrupted++; break;
            case reassembly::ChunkState::Unrequested: stats_.chunks_reverted++; break;
        }
    }

    EventBus& bus_;
    Stats stats_;
    EventBus::HandlerId chunk_state_id_ = 0;
    EventBus::HandlerId progress_id_ = 0;
    EventBus::HandlerId finalized_id_ = 0;
    EventBus::HandlerId cancelled_id_ = 0;
};

} // namespace reasm::events

/**
 * @file reassembly_demo.cpp
 * @brief Receive a file chunk by chunk and commit it to disk
 *
 * WHAT IT SHOWS:
 * - Manifest with per-chunk SHA-256 checksums and a whole-file root
 * - Out-of-order delivery through FileChunkWriter on a thread pool
 * - A corrupted delivery being rejected and retried
 * - Backpressure: senders back off and resume from write completions
 * - Finalize with integrity check, then metrics
 *
 * USAGE:
 *   reassembly_demo <input> <output> [chunk_size]
 */

#include "reasm/core/platform.hpp"
#include "reasm/events/components.hpp"
#include "reasm/events/event_bus.hpp"
#include "reasm/reassembly/config.hpp"
#include "reasm/reassembly/integrity.hpp"
#include "reasm/reassembly/manager.hpp"
#include "reasm/reassembly/manifest_codec.hpp"
#include "reasm/reassembly/resume.hpp"
#include "reasm/storage/chunk_writer.hpp"
#include "reasm/storage/finalizer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace reasm;
using namespace reasm::reassembly;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} <input> <output> [chunk_size]", program);
}

Result<std::vector<std::uint8_t>> read_input(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "Cannot open input: " + path.string());
    }
    return Ok(std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()));
}

/**
 * @brief Plays the sender: shuffled delivery, one corrupted copy, retries
 */
class Sender {
public:
    Sender(ReassemblyManager& manager, std::string transfer_id,
           std::vector<std::vector<std::uint8_t>> chunks, std::uint32_t corrupt_index)
        : manager_(manager),
          transfer_id_(std::move(transfer_id)),
          chunks_(std::move(chunks)),
          corrupt_index_(corrupt_index) {
        for (std::uint32_t i = 0; i < chunks_.size(); ++i) {
            pending_.push_back(i);
        }
        std::mt19937 rng(42);
        std::shuffle(pending_.begin(), pending_.end(), rng);
    }

    void pump() {
        while (!pending_.empty() && !failed_) {
            const auto index = pending_.front();
            pending_.pop_front();

            auto bytes = chunks_[index];
            if (index == corrupt_index_ && !corrupted_once_ && !bytes.empty()) {
                corrupted_once_ = true;
                bytes[0] ^= 0x5A;
                spdlog::info("Sending a damaged copy of chunk {}", index);
            }

            auto accepted = manager_.accept_chunk(transfer_id_, index, std::move(bytes),
                [this, index](Result<bool> result) { on_chunk_done(index, std::move(result)); });

            if (accepted.is_error()) {
                pending_.push_front(index);
                if (accepted.error().code == ErrorCode::Backpressure) {
                    ++backpressure_hits_;
                    // Resume from the next write completion
                    return;
                }
                spdlog::error("Chunk {} rejected ({}): {}", index,
                              to_string(accepted.error().code), accepted.error().message);
                failed_ = true;
                return;
            }
        }
    }

    [[nodiscard]] bool failed() const { return failed_; }
    [[nodiscard]] std::size_t backpressure_hits() const { return backpressure_hits_; }

private:
    void on_chunk_done(std::uint32_t index, Result<bool> result) {
        if (result.is_error()) {
            spdlog::error("Chunk {} failed ({}): {}", index,
                          to_string(result.error().code), result.error().message);
            if (result.error().code == ErrorCode::WriteFailure) {
                pending_.push_back(index);
            } else {
                failed_ = true;
            }
        } else if (!result.value()) {
            spdlog::info("Chunk {} failed verification; resending", index);
            pending_.push_back(index);
        }
        pump();
    }

    ReassemblyManager& manager_;
    std::string transfer_id_;
    std::vector<std::vector<std::uint8_t>> chunks_;
    std::deque<std::uint32_t> pending_;
    std::uint32_t corrupt_index_;
    bool corrupted_once_ = false;
    bool failed_ = false;
    std::size_t backpressure_hits_ = 0;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const fs::path input_path = argv[1];
    const fs::path output_path = argv[2];
    std::size_t chunk_size = 64 * 1024;
    if (argc > 3) {
        try {
            chunk_size = std::stoul(argv[3]);
        } catch (const std::exception&) {
            spdlog::error("Invalid chunk size: {}", argv[3]);
            return 1;
        }
        if (chunk_size == 0) {
            spdlog::error("Chunk size must be positive");
            return 1;
        }
    }

    auto input = read_input(input_path);
    if (input.is_error()) {
        spdlog::error("{}", input.error().message);
        return 1;
    }
    const auto& data = input.value();

    // ════════════════════════════════════════════════════════
    // Sender side: split and describe
    // ════════════════════════════════════════════════════════

    std::vector<std::vector<std::uint8_t>> chunks;
    Manifest manifest;
    manifest.file_size = data.size();
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto end = std::min(data.size(), offset + chunk_size);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(end));
        ChunkDescriptor descriptor;
        descriptor.index = static_cast<std::uint32_t>(chunks.size() - 1);
        descriptor.encrypted_size = chunks.back().size();
        descriptor.checksum = sha256_hex(chunks.back());
        manifest.chunks.push_back(descriptor);
    }
    manifest.merkle_root = sha256_hex(data);

    spdlog::info("Manifest for {} ({} bytes, {} chunks)", input_path.string(), data.size(), chunks.size());
    spdlog::debug("{}", manifest_to_json(manifest));

    // ════════════════════════════════════════════════════════
    // Receiver side
    // ════════════════════════════════════════════════════════

    spdlog::info("Receiver running on {}", platform_name());

    ReassemblyConfig config;
    config.max_concurrent_writes = 2;
    config.max_queue_length = 4;

    boost::asio::io_context io_context;
    boost::asio::thread_pool pool(config.max_concurrent_writes);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    storage::FileChunkWriter writer(io_context, pool, config.fsync_writes);
    storage::FileTransferFinalizer finalizer(io_context, pool);
    ReassemblyManager manager(writer, finalizer, bus, config);

    const std::string transfer_id = "demo-" + std::to_string(std::hash<std::string>{}(input_path.string()));
    const auto temp_path = temp_file_path(config.temp_root, transfer_id);

    if (auto res = cleanup_transfer_temp(config.temp_root, transfer_id); res.is_error()) {
        spdlog::warn("Stale temp files not removed: {}", res.error().message);
    }

    if (auto res = manager.init_reassembly(transfer_id, manifest, temp_path); res.is_error()) {
        spdlog::error("Init failed: {}", res.error().message);
        return 1;
    }

    const std::uint32_t corrupt_index = chunks.empty() ? 0 : static_cast<std::uint32_t>(chunks.size() / 2);
    Sender sender(manager, transfer_id, std::move(chunks), corrupt_index);
    sender.pump();
    io_context.run();
    io_context.restart();

    if (sender.failed() || !manager.is_complete(transfer_id)) {
        spdlog::error("Transfer {} incomplete", transfer_id);
        pool.join();
        return 1;
    }
    spdlog::info("All chunks written ({} backpressure retries)", sender.backpressure_hits());

    bool ok = false;
    auto started = manager.finalize(transfer_id, output_path, [&](Result<void> result) {
        if (result.is_error()) {
            spdlog::error("Finalize failed: {}", result.error().message);
            return;
        }
        ok = true;
    });
    if (started.is_error()) {
        spdlog::error("Finalize refused: {}", started.error().message);
        pool.join();
        return 1;
    }
    io_context.run();
    pool.join();

    metrics.print_stats();

    if (!ok) {
        return 1;
    }
    spdlog::info("Reassembled {} -> {}", input_path.string(), output_path.string());
    return 0;
}

#pragma once

#include "reasm/storage/chunk_writer.hpp"
#include "reasm/storage/finalizer.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace reasm::test_support {

/**
 * @brief ChunkWriter that records writes and completes them on demand
 *
 * With auto_complete set, every write succeeds inside async_write.
 */
class FakeChunkWriter : public storage::ChunkWriter {
public:
    struct Call {
        std::filesystem::path path;
        std::uint64_t offset = 0;
        std::vector<std::uint8_t> bytes;
        storage::WriteHandler handler;
    };

    void async_write(const std::filesystem::path& path,
                     std::uint64_t offset,
                     std::vector<std::uint8_t> bytes,
                     storage::WriteHandler handler) override {
        calls.push_back(Call{path, offset, std::move(bytes), std::move(handler)});
        if (auto_complete) {
            complete(calls.size() - 1);
        }
    }

    // Handler is moved out first: completing may dispatch another write
    void complete(std::size_t call_index, Result<void> result = Ok()) {
        auto handler = std::move(calls.at(call_index).handler);
        calls.at(call_index).handler = nullptr;
        handler(std::move(result));
    }

    void fail(std::size_t call_index, const std::string& message) {
        complete(call_index, Err<void>(ErrorCode::WriteFailure, message));
    }

    [[nodiscard]] bool pending(std::size_t call_index) const {
        return static_cast<bool>(calls.at(call_index).handler);
    }

    std::vector<Call> calls;
    bool auto_complete = false;
};

class FakeFinalizer : public storage::TransferFinalizer {
public:
    struct Call {
        storage::FinalizeRequest request;
        storage::FinalizeCompletion handler;
    };

    void async_finalize(storage::FinalizeRequest request, storage::FinalizeCompletion handler) override {
        calls.push_back(Call{std::move(request), std::move(handler)});
    }

    void complete(std::size_t call_index, Result<void> result = Ok()) {
        auto handler = std::move(calls.at(call_index).handler);
        calls.at(call_index).handler = nullptr;
        handler(std::move(result));
    }

    std::vector<Call> calls;
};

inline std::filesystem::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    static const auto run_id = std::random_device{}();
    const auto id = counter.fetch_add(1);
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(run_id) + "_" + std::to_string(id));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace reasm::test_support

#include "reasm/storage/finalizer.hpp"
#include "reasm/reassembly/integrity.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace reasm::storage {
namespace fs = std::filesystem;

FileTransferFinalizer::FileTransferFinalizer(asio::io_context& io_context, asio::thread_pool& pool)
    : io_context_(io_context),
      pool_(pool) {}

void FileTransferFinalizer::async_finalize(FinalizeRequest request, FinalizeCompletion handler) {
    auto work = asio::make_work_guard(io_context_);

    asio::post(pool_,
        [this, request = std::move(request), handler = std::move(handler),
         work = std::move(work)]() mutable {
            auto result = verify_and_finalize(request);

            asio::post(io_context_,
                [handler = std::move(handler), result = std::move(result)]() mutable {
                    handler(std::move(result));
                });
            work.reset();
        });
}

Result<void> FileTransferFinalizer::verify_and_finalize(const FinalizeRequest& request) {
    std::error_code ec;
    if (!fs::exists(request.temp_path, ec)) {
        return Err<void>(ErrorCode::FinalizeFailure,
                         "Temp file not found for transfer " + request.transfer_id);
    }

    const auto size = fs::file_size(request.temp_path, ec);
    if (ec) {
        return Err<void>(ErrorCode::FinalizeFailure,
                         "Failed to stat temp file: " + request.temp_path.string());
    }
    if (size < request.total_bytes) {
        return Err<void>(ErrorCode::FinalizeFailure,
                         "Temp file for transfer " + request.transfer_id + " is short: " +
                         std::to_string(size) + " < " + std::to_string(request.total_bytes));
    }

    if (request.expected_root && !request.expected_root->empty()) {
        auto digest = reassembly::sha256_file(request.temp_path);
        if (digest.is_error()) {
            return Err<void>(ErrorCode::FinalizeFailure,
                             "File integrity verification error: " + digest.error().message);
        }
        if (digest.value() != reassembly::normalize_digest(*request.expected_root)) {
            spdlog::warn("Integrity check failed for transfer {}: expected {} got {}",
                         request.transfer_id, *request.expected_root, digest.value());
            return Err<void>(ErrorCode::FinalizeFailure,
                             "File integrity verification failed - hash mismatch");
        }
        spdlog::debug("File integrity verified for transfer {}", request.transfer_id);
    }

    const auto parent = request.final_path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(ErrorCode::FinalizeFailure,
                             "Failed to create destination directory: " + parent.string());
        }
    }

    fs::rename(request.temp_path, request.final_path, ec);
    if (ec) {
        return Err<void>(ErrorCode::FinalizeFailure,
                         "Failed to move file to final location " + request.final_path.string() +
                         ": " + ec.message());
    }

    spdlog::info("Finalized transfer {} to {}", request.transfer_id, request.final_path.string());
    return Ok();
}

} // namespace reasm::storage

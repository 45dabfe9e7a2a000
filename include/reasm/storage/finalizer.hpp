#pragma once

#include "reasm/core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace reasm::storage {

namespace asio = boost::asio;

/**
 * @brief Everything the finalizer needs to commit one transfer
 */
struct FinalizeRequest {
    std::string transfer_id;
    std::filesystem::path temp_path;
    std::filesystem::path final_path;
    std::optional<std::string> expected_root; ///< SHA-256 of the assembled file
    std::uint64_t total_bytes = 0;
};

using FinalizeCompletion = std::function<void(Result<void>)>;

/**
 * @brief Cross-chunk verification and atomic commit of an assembled file
 */
class TransferFinalizer {
public:
    virtual ~TransferFinalizer() = default;

    virtual void async_finalize(FinalizeRequest request, FinalizeCompletion handler) = 0;
};

/**
 * @brief Disk-backed TransferFinalizer
 *
 * Checks the temp file exists and, when an expected root is given, that its
 * SHA-256 matches (case-insensitive). Then renames it into final_path,
 * creating the destination directory. On failure the temp file is left in
 * place so finalize can be retried.
 */
class FileTransferFinalizer : public TransferFinalizer {
public:
    FileTransferFinalizer(asio::io_context& io_context, asio::thread_pool& pool);

    void async_finalize(FinalizeRequest request, FinalizeCompletion handler) override;

    static Result<void> verify_and_finalize(const FinalizeRequest& request);

private:
    asio::io_context& io_context_;
    asio::thread_pool& pool_;
};

} // namespace reasm::storage

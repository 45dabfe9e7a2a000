#pragma once

#include "reasm/core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace reasm::storage {

namespace asio = boost::asio;

using WriteHandler = std::function<void(Result<void>)>;

/**
 * @brief Asynchronous positional write into a destination file
 *
 * Implementations must accept concurrent calls that target disjoint byte
 * ranges of the same path. The handler is invoked exactly once.
 */
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    virtual void async_write(const std::filesystem::path& path,
                             std::uint64_t offset,
                             std::vector<std::uint8_t> bytes,
                             WriteHandler handler) = 0;
};

/**
 * @brief Disk-backed ChunkWriter
 *
 * The blocking write runs on `pool`; the handler is posted back to
 * `io_context`, so reassembly bookkeeping stays on the io_context thread.
 * Each pending write holds work on the io_context, keeping run() alive
 * until its handler has been delivered.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * asio::thread_pool pool(4);
 * FileChunkWriter writer(io_context, pool);
 * ```
 */
class FileChunkWriter : public ChunkWriter {
public:
    FileChunkWriter(asio::io_context& io_context, asio::thread_pool& pool, bool fsync_writes = true);

    void async_write(const std::filesystem::path& path,
                     std::uint64_t offset,
                     std::vector<std::uint8_t> bytes,
                     WriteHandler handler) override;

    /**
     * @brief Synchronous positional write
     *
     * Creates the parent directory and the file when missing; never
     * truncates. Writes past the current end extend the file sparsely.
     */
    static Result<void> write_at(const std::filesystem::path& path,
                                 std::uint64_t offset,
                                 const std::vector<std::uint8_t>& bytes,
                                 bool fsync_writes);

private:
    asio::io_context& io_context_;
    asio::thread_pool& pool_;
    bool fsync_writes_;
};

} // namespace reasm::storage

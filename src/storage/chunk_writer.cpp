#include "reasm/storage/chunk_writer.hpp"
#include "reasm/core/platform.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

namespace reasm::storage {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorCode::WriteFailure, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

#ifdef REASM_PLATFORM_WINDOWS

Result<void> positional_write(const fs::path& path, std::uint64_t offset,
                              const std::vector<std::uint8_t>& bytes, bool fsync_writes) {
    HANDLE handle = CreateFileW(path.c_str(), GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return Err<void>(ErrorCode::WriteFailure, "Failed to open temp file: " + path.string());
    }

    std::size_t written = 0;
    while (written < bytes.size()) {
        const std::uint64_t position = offset + written;
        OVERLAPPED overlapped{};
        overlapped.Offset = static_cast<DWORD>(position & 0xFFFFFFFFULL);
        overlapped.OffsetHigh = static_cast<DWORD>(position >> 32);

        const auto remaining = bytes.size() - written;
        const DWORD request = static_cast<DWORD>(remaining > 0x40000000 ? 0x40000000 : remaining);
        DWORD count = 0;
        if (!WriteFile(handle, bytes.data() + written, request, &count, &overlapped) || count == 0) {
            CloseHandle(handle);
            return Err<void>(ErrorCode::WriteFailure,
                             "Failed to write chunk data at offset " + std::to_string(position));
        }
        written += count;
    }

    if (fsync_writes && !FlushFileBuffers(handle)) {
        CloseHandle(handle);
        return Err<void>(ErrorCode::WriteFailure, "Failed to flush chunk data: " + path.string());
    }
    CloseHandle(handle);
    return Ok();
}

#else

Result<void> positional_write(const fs::path& path, std::uint64_t offset,
                              const std::vector<std::uint8_t>& bytes, bool fsync_writes) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT, 0644);
    if (fd < 0) {
        return Err<void>(ErrorCode::WriteFailure,
                         "Failed to open temp file " + path.string() + ": " + std::strerror(errno));
    }

    std::size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t count = ::pwrite(fd, bytes.data() + written, bytes.size() - written,
                                       static_cast<off_t>(offset + written));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::close(fd);
            return Err<void>(ErrorCode::WriteFailure,
                             "Failed to write chunk data at offset " +
                             std::to_string(offset + written) + ": " + reason);
        }
        written += static_cast<std::size_t>(count);
    }

    if (fsync_writes && ::fsync(fd) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        return Err<void>(ErrorCode::WriteFailure, "Failed to fsync " + path.string() + ": " + reason);
    }

    if (::close(fd) != 0) {
        return Err<void>(ErrorCode::WriteFailure,
                         "Failed to close " + path.string() + ": " + std::strerror(errno));
    }
    return Ok();
}

#endif

} // namespace

FileChunkWriter::FileChunkWriter(asio::io_context& io_context, asio::thread_pool& pool, bool fsync_writes)
    : io_context_(io_context),
      pool_(pool),
      fsync_writes_(fsync_writes) {}

void FileChunkWriter::async_write(const fs::path& path,
                                  std::uint64_t offset,
                                  std::vector<std::uint8_t> bytes,
                                  WriteHandler handler) {
    auto work = asio::make_work_guard(io_context_);

    asio::post(pool_,
        [this, path, offset, bytes = std::move(bytes), handler = std::move(handler),
         work = std::move(work)]() mutable {
            auto result = write_at(path, offset, bytes, fsync_writes_);

            asio::post(io_context_,
                [handler = std::move(handler), result = std::move(result)]() mutable {
                    handler(std::move(result));
                });
            work.reset();
        });
}

Result<void> FileChunkWriter::write_at(const fs::path& path,
                                       std::uint64_t offset,
                                       const std::vector<std::uint8_t>& bytes,
                                       bool fsync_writes) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    auto result = positional_write(path, offset, bytes, fsync_writes);
    if (result.is_error()) {
        spdlog::error("Chunk write failed: {}", result.error().message);
        return result;
    }

    spdlog::debug("Wrote {} bytes at offset {} to {}", bytes.size(), offset, path.string());
    return Ok();
}

} // namespace reasm::storage

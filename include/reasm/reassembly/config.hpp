#pragma once

#include "reasm/core/result.hpp"
#include "reasm/reassembly/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace reasm::reassembly {

/**
 * @brief Manager-wide defaults
 *
 * JSON form (all keys optional):
 * {
 *   "max_concurrent_writes": 4,
 *   "max_queue_length": 64,
 *   "temp_root": "/tmp/reasm_transfers",
 *   "fsync_writes": true
 * }
 */
struct ReassemblyConfig {
    std::size_t max_concurrent_writes = 4;
    std::size_t max_queue_length = 64;
    std::filesystem::path temp_root = std::filesystem::temp_directory_path() / "reasm_transfers";
    bool fsync_writes = true;

    [[nodiscard]] WriteLimits limits() const { return WriteLimits{max_concurrent_writes, max_queue_length}; }
};

Result<void> validate_limits(const WriteLimits& limits);

Result<ReassemblyConfig> parse_config(const std::string& json_text);

Result<ReassemblyConfig> load_config(const std::filesystem::path& path);

/// Scratch file a transfer is assembled into before finalize.
std::filesystem::path temp_file_path(const std::filesystem::path& temp_root, const std::string& transfer_id);

} // namespace reasm::reassembly

#pragma once

#include "reasm/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reasm::reassembly {

/// Sidecar file recording which chunks of a transfer are already on disk.
std::filesystem::path bitmap_path(const std::filesystem::path& temp_root, const std::string& transfer_id);

/**
 * @brief Persist the received-chunk list for resuming in a later session
 *
 * Format: { "transfer_id", "total_chunks", "received_chunks": [...], "saved_at" }
 */
Result<void> save_chunk_bitmap(const std::filesystem::path& path,
                               const std::string& transfer_id,
                               const std::vector<std::uint32_t>& received_chunks,
                               std::uint32_t total_chunks);

/// std::nullopt when no bitmap exists.
Result<std::optional<std::vector<std::uint32_t>>> load_chunk_bitmap(const std::filesystem::path& path);

/// Remove the temp file and bitmap of a transfer; missing files are not an error.
Result<void> cleanup_transfer_temp(const std::filesystem::path& temp_root, const std::string& transfer_id);

} // namespace reasm::reassembly

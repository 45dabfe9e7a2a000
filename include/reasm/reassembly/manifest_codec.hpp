#pragma once

#include "reasm/core/result.hpp"
#include "reasm/reassembly/types.hpp"

#include <string>

namespace reasm::reassembly {

/**
 * @brief Structural checks applied before a transfer starts
 *
 * Indices must be zero-based and contiguous in manifest order, and every
 * encrypted_size must be positive.
 */
Result<void> validate_manifest(const Manifest& manifest);

/**
 * @brief Parse the upstream manifest format
 *
 * { "fileSize": 3000,
 *   "chunks": [ { "index": 0, "encryptedSize": 1000, "checksum": "ab12..." } ],
 *   "merkleRoot": "..." }
 */
Result<Manifest> parse_manifest(const std::string& json_text);

std::string manifest_to_json(const Manifest& manifest);

} // namespace reasm::reassembly

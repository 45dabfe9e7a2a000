#pragma once

#include "reasm/reassembly/types.hpp"

#include <cstdint>
#include <vector>

namespace reasm::reassembly {

/**
 * @brief Byte offset of every chunk in the destination file
 *
 * offsets[0] = 0, offsets[i] = offsets[i-1] + encrypted_size[i-1].
 * An empty manifest yields an empty vector.
 */
std::vector<std::uint64_t> compute_offsets(const std::vector<ChunkDescriptor>& chunks);

/// Total byte span covered by the chunks.
std::uint64_t total_span(const std::vector<ChunkDescriptor>& chunks);

} // namespace reasm::reassembly

#include "reasm/reassembly/layout.hpp"

namespace reasm::reassembly {

std::vector<std::uint64_t> compute_offsets(const std::vector<ChunkDescriptor>& chunks) {
    std::vector<std::uint64_t> offsets;
    offsets.reserve(chunks.size());
    std::uint64_t cursor = 0;
    for (const auto& chunk : chunks) {
        offsets.push_back(cursor);
        cursor += chunk.encrypted_size;
    }
    return offsets;
}

std::uint64_t total_span(const std::vector<ChunkDescriptor>& chunks) {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.encrypted_size;
    }
    return total;
}

} // namespace reasm::reassembly

#include "reasm/reassembly/types.hpp"

namespace reasm::reassembly {

const char* to_string(ChunkState state) noexcept {
    switch (state) {
        case ChunkState::Unrequested: return "UNREQUESTED";
        case ChunkState::Requested: return "REQUESTED";
        case ChunkState::Received: return "RECEIVED";
        case ChunkState::Corrupted: return "CORRUPTED";
    }
    return "UNKNOWN";
}

} // namespace reasm::reassembly

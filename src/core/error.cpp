#include "reasm/core/error.hpp"

namespace reasm {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::InvalidIndex: return "invalid-index";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IntegrityFailure: return "integrity-failure";
        case ErrorCode::Backpressure: return "backpressure";
        case ErrorCode::WriteFailure: return "write-failure";
        case ErrorCode::FinalizeFailure: return "finalize-failure";
        case ErrorCode::Io: return "io";
    }
    return "unknown";
}

} // namespace reasm

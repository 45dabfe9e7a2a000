#pragma once

#include <string>
#include <utility>

namespace reasm {

/**
 * @brief Failure categories surfaced by the reassembly engine
 *
 * NotFound, InvalidIndex and InvalidArgument are contract errors.
 * IntegrityFailure is recorded per chunk and is normally reported as a
 * `false` acceptance rather than an error. Backpressure is returned
 * synchronously so callers can throttle. WriteFailure, FinalizeFailure and
 * Io come from the disk collaborators; the transfer stays resumable.
 */
enum class ErrorCode {
    NotFound,
    InvalidIndex,
    InvalidArgument,
    IntegrityFailure,
    Backpressure,
    WriteFailure,
    FinalizeFailure,
    Io
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

const char* to_string(ErrorCode code) noexcept;

} // namespace reasm

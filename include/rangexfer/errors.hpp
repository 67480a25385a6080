#pragma once

#include <stdexcept>
#include <string>

namespace rangexfer {

enum class ErrorKind {
    None,
    ProbeFailed,
    EndpointUnreachable,
    RangeUnsupportedMidTransfer,
    WorkerIOFailure,
    CorruptProgressRecord,
    OutputWriteFailure,
    SourceReadFailure,
    TransferFailed
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Failure that aborts a whole operation; per-range failures travel as WorkerOutcome values instead.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Raised by HttpClient implementations when a request cannot be completed at the transport level.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rangexfer

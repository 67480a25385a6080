#include "rangexfer/errors.hpp"

namespace rangexfer {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::ProbeFailed:
        return "probe failed";
    case ErrorKind::EndpointUnreachable:
        return "endpoint unreachable";
    case ErrorKind::RangeUnsupportedMidTransfer:
        return "range unsupported mid-transfer";
    case ErrorKind::WorkerIOFailure:
        return "worker I/O failure";
    case ErrorKind::CorruptProgressRecord:
        return "corrupt progress record";
    case ErrorKind::OutputWriteFailure:
        return "output write failure";
    case ErrorKind::SourceReadFailure:
        return "source read failure";
    case ErrorKind::TransferFailed:
        return "transfer failed";
    }
    return "unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace rangexfer

#include "rangexfer/transfer_state.hpp"
#include "rangexfer/progress.hpp"

#include <algorithm>

namespace rangexfer {

const char* toString(Direction direction) noexcept {
    return direction == Direction::Upload ? "upload" : "download";
}

const char* toString(RangeStatus status) noexcept {
    switch (status) {
    case RangeStatus::Pending:
        return "pending";
    case RangeStatus::Running:
        return "running";
    case RangeStatus::Complete:
        return "complete";
    case RangeStatus::Failed:
        return "failed";
    case RangeStatus::Paused:
        return "paused";
    }
    return "unknown";
}

const char* toString(TransferMode mode) noexcept {
    return mode == TransferMode::SingleStream ? "single-stream" : "multi-range";
}

const char* toString(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Probing:
        return "probing";
    case TransferStatus::Running:
        return "running";
    case TransferStatus::Paused:
        return "paused";
    case TransferStatus::Complete:
        return "complete";
    case TransferStatus::Failed:
        return "failed";
    case TransferStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::vector<std::size_t> TransferResult::failedRanges() const {
    std::vector<std::size_t> indices;
    indices.reserve(failures.size());
    for (const auto& failure : failures) {
        indices.push_back(failure.index);
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

double percentOf(std::int64_t transferred, std::int64_t total, bool complete) {
    if (total > 0) {
        const double ratio = static_cast<double>(transferred) / static_cast<double>(total);
        return std::clamp(ratio * 100.0, 0.0, 100.0);
    }
    return complete ? 100.0 : 0.0;
}

} // namespace rangexfer

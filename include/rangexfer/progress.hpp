#pragma once

#include "errors.hpp"
#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rangexfer {

struct ProgressSample {
    double percent{0.0};
    double rate{0.0};               // bytes per second over the last sample window
    std::int64_t transferred{0};
    std::int64_t total{-1};
};

// Invoked from worker threads; implementations must be thread-safe.
using ProgressSink = std::function<void(const ProgressSample&)>;

struct RangeFailure {
    std::size_t index{0};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

struct TransferResult {
    TransferStatus status{TransferStatus::Running};
    std::vector<RangeFailure> failures;
    ErrorKind error{ErrorKind::None};
    std::string message;
    double percent{0.0};
    std::int64_t transferred{0};
    std::int64_t total{-1};

    [[nodiscard]] std::vector<std::size_t> failedRanges() const;
};

[[nodiscard]] double percentOf(std::int64_t transferred, std::int64_t total, bool complete);

} // namespace rangexfer

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangexfer {

enum class Direction { Download, Upload };

enum class RangeStatus { Pending, Running, Complete, Failed, Paused };

enum class TransferMode { SingleStream, MultiRange };

enum class TransferStatus { Probing, Running, Paused, Complete, Failed, Cancelled };

// Byte span [start, end] owned by one worker. An empty range has end == start - 1; so does the
// single range of a whole-stream download until the stream length is known.
struct TransferRange {
    std::size_t index{0};
    std::int64_t start{0};
    std::int64_t end{-1};
    std::int64_t completed{0};
    RangeStatus status{RangeStatus::Pending};

    [[nodiscard]] std::int64_t length() const { return end - start + 1; }
    [[nodiscard]] std::int64_t remaining() const { return length() - completed; }
    [[nodiscard]] bool done() const { return status == RangeStatus::Complete; }
};

struct TransferState {
    std::int64_t total_size{-1};    // -1 until known
    std::vector<TransferRange> ranges;
    std::int64_t transferred_total{0};
    TransferMode mode{TransferMode::MultiRange};
    TransferStatus status{TransferStatus::Probing};
};

[[nodiscard]] const char* toString(Direction direction) noexcept;
[[nodiscard]] const char* toString(RangeStatus status) noexcept;
[[nodiscard]] const char* toString(TransferMode mode) noexcept;
[[nodiscard]] const char* toString(TransferStatus status) noexcept;

} // namespace rangexfer

#include "rangexfer/range_partitioner.hpp"

#include <algorithm>

namespace rangexfer {

std::vector<TransferRange> partitionRanges(std::int64_t total_size, int worker_count) {
    std::vector<TransferRange> ranges;

    if (total_size <= 0) {
        TransferRange empty;
        empty.index = 0;
        empty.start = 0;
        empty.end = -1;
        empty.status = RangeStatus::Complete;
        ranges.push_back(empty);
        return ranges;
    }

    // Every range holds at least one byte.
    const std::int64_t count = std::min<std::int64_t>(std::max(1, worker_count), total_size);
    const std::int64_t part_size = total_size / count;

    ranges.reserve(static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        TransferRange range;
        range.index = static_cast<std::size_t>(i);
        range.start = i * part_size;
        range.end = (i == count - 1) ? total_size - 1 : range.start + part_size - 1;
        ranges.push_back(range);
    }
    return ranges;
}

int uploadWorkerCount(std::int64_t total_size, int workers, std::int64_t min_range_bytes) {
    const int requested = std::max(1, workers);
    if (total_size <= 0) {
        return 1;
    }
    if (min_range_bytes <= 0) {
        return static_cast<int>(std::min<std::int64_t>(requested, total_size));
    }
    const std::int64_t slices = (total_size + min_range_bytes - 1) / min_range_bytes;
    return static_cast<int>(std::clamp<std::int64_t>(slices, 1, requested));
}

} // namespace rangexfer

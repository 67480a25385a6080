#pragma once

#include "transfer_state.hpp"

#include <cstdint>
#include <vector>

namespace rangexfer {

// Splits [0, total_size - 1] into contiguous ranges; the last one absorbs the remainder.
[[nodiscard]] std::vector<TransferRange> partitionRanges(std::int64_t total_size, int worker_count);

// Upload parallelism: never more workers than min_range_bytes-sized slices.
[[nodiscard]] int uploadWorkerCount(std::int64_t total_size, int workers, std::int64_t min_range_bytes);

} // namespace rangexfer

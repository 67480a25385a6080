#pragma once

#include "progress.hpp"
#include "transfer_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace rangexfer {

// Shared state of one transfer. Workers publish byte counts here; the counters and the range
// table sit behind a single mutex held only for the update, never across I/O. Progress samples
// and checkpoints are emitted by whichever worker crosses the configured cadence.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;
    using CheckpointFn = std::function<void(const std::vector<TransferRange>&)>;

    ProgressTracker(TransferState initial,
                    ProgressSink sink,
                    CheckpointFn checkpoint,
                    std::chrono::milliseconds progress_interval,
                    std::chrono::milliseconds checkpoint_interval);

    // Bytes durably placed within a range.
    void addCompleted(std::size_t index, std::int64_t bytes);
    // Bytes sent for an all-or-nothing range; they count toward the aggregate only.
    void addInFlight(std::int64_t bytes);
    void rollbackInFlight(std::int64_t bytes);
    // Marks a whole range completed; `in_flight` is what addInFlight already counted for it.
    void commitRange(std::size_t index, std::int64_t in_flight);
    // Forgets everything a range has written (whole-stream restart).
    void resetRange(std::size_t index);

    void setRangeStatus(std::size_t index, RangeStatus status);
    void setStatus(TransferStatus status);
    // Fixes the size of a whole-stream transfer once the stream has ended.
    void resolveTotalSize(std::int64_t total_size);

    [[nodiscard]] TransferRange range(std::size_t index) const;
    [[nodiscard]] TransferState snapshot() const;
    [[nodiscard]] ProgressSample lastSample() const;

    // Emits a sample now; also writes a checkpoint when requested.
    void flush(bool checkpoint);

private:
    void publish();
    void emitSample(bool force);
    void writeCheckpoint(bool force);

    mutable std::mutex state_mutex_;
    TransferState state_;

    ProgressSink sink_;
    CheckpointFn checkpoint_;
    std::chrono::milliseconds progress_interval_;
    std::chrono::milliseconds checkpoint_interval_;

    mutable std::mutex emit_mutex_;
    Clock::time_point last_emit_;
    std::int64_t last_emit_bytes_{0};
    ProgressSample last_sample_;

    std::mutex checkpoint_mutex_;
    Clock::time_point last_checkpoint_;
};

} // namespace rangexfer

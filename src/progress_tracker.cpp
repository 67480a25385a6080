#include "rangexfer/progress_tracker.hpp"

#include <algorithm>
#include <utility>

namespace rangexfer {

ProgressTracker::ProgressTracker(TransferState initial,
                                 ProgressSink sink,
                                 CheckpointFn checkpoint,
                                 std::chrono::milliseconds progress_interval,
                                 std::chrono::milliseconds checkpoint_interval)
    : state_(std::move(initial)),
      sink_(std::move(sink)),
      checkpoint_(std::move(checkpoint)),
      progress_interval_(progress_interval),
      checkpoint_interval_(checkpoint_interval),
      last_emit_(Clock::now()),
      last_emit_bytes_(state_.transferred_total),
      last_checkpoint_(last_emit_) {
    last_sample_.transferred = state_.transferred_total;
    last_sample_.total = state_.total_size;
    last_sample_.percent = percentOf(state_.transferred_total, state_.total_size, false);
}

void ProgressTracker::addCompleted(std::size_t index, std::int64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& range = state_.ranges.at(index);
        range.completed += bytes;
        state_.transferred_total += bytes;
    }
    publish();
}

void ProgressTracker::addInFlight(std::int64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.transferred_total += bytes;
    }
    publish();
}

void ProgressTracker::rollbackInFlight(std::int64_t bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.transferred_total -= bytes;
}

void ProgressTracker::commitRange(std::size_t index, std::int64_t in_flight) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& range = state_.ranges.at(index);
        state_.transferred_total += range.length() - range.completed - in_flight;
        range.completed = range.length();
    }
    publish();
}

void ProgressTracker::resetRange(std::size_t index) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& range = state_.ranges.at(index);
    state_.transferred_total -= range.completed;
    range.completed = 0;
}

void ProgressTracker::setRangeStatus(std::size_t index, RangeStatus status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.ranges.at(index).status = status;
}

void ProgressTracker::setStatus(TransferStatus status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.status = status;
}

void ProgressTracker::resolveTotalSize(std::int64_t total_size) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.total_size = total_size;
    if (state_.mode == TransferMode::SingleStream && state_.ranges.size() == 1) {
        auto& range = state_.ranges.front();
        range.end = range.start + total_size - 1;
    }
}

TransferRange ProgressTracker::range(std::size_t index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.ranges.at(index);
}

TransferState ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

ProgressSample ProgressTracker::lastSample() const {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    return last_sample_;
}

void ProgressTracker::flush(bool checkpoint) {
    emitSample(true);
    if (checkpoint) {
        writeCheckpoint(true);
    }
}

void ProgressTracker::publish() {
    emitSample(false);
    writeCheckpoint(false);
}

void ProgressTracker::emitSample(bool force) {
    // A worker that finds another one emitting skips this round instead of waiting.
    std::unique_lock<std::mutex> emit_lock(emit_mutex_, std::defer_lock);
    if (force) {
        emit_lock.lock();
    } else if (!emit_lock.try_lock()) {
        return;
    }

    const auto now = Clock::now();
    if (!force && now - last_emit_ < progress_interval_) {
        return;
    }

    ProgressSample sample;
    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        sample.transferred = state_.transferred_total;
        sample.total = state_.total_size;
        complete = state_.status == TransferStatus::Complete;
    }
    sample.percent = percentOf(sample.transferred, sample.total, complete);

    const double seconds = std::chrono::duration<double>(now - last_emit_).count();
    if (seconds >= 0.001) {
        const auto delta = std::max<std::int64_t>(0, sample.transferred - last_emit_bytes_);
        sample.rate = static_cast<double>(delta) / seconds;
    } else {
        sample.rate = last_sample_.rate;
    }

    last_emit_ = now;
    last_emit_bytes_ = sample.transferred;
    last_sample_ = sample;

    if (sink_) {
        sink_(sample);
    }
}

void ProgressTracker::writeCheckpoint(bool force) {
    if (!checkpoint_) {
        return;
    }

    std::unique_lock<std::mutex> checkpoint_lock(checkpoint_mutex_, std::defer_lock);
    if (force) {
        checkpoint_lock.lock();
    } else if (!checkpoint_lock.try_lock()) {
        return;
    }

    const auto now = Clock::now();
    if (!force && now - last_checkpoint_ < checkpoint_interval_) {
        return;
    }

    std::vector<TransferRange> ranges;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ranges = state_.ranges;
    }
    last_checkpoint_ = now;
    checkpoint_(ranges);
}

} // namespace rangexfer

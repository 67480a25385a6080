#include "rangexfer/progress_tracker.hpp"
#include "rangexfer/range_partitioner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace rangexfer {
namespace {

using namespace std::chrono_literals;

TransferState makeState(std::int64_t total, int ranges) {
    TransferState state;
    state.total_size = total;
    state.ranges = partitionRanges(total, ranges);
    state.status = TransferStatus::Running;
    return state;
}

TEST(ProgressTrackerTest, CompletedBytesFeedRangeAndTotal) {
    ProgressTracker tracker(makeState(1000, 4), {}, {}, 0ms, 1h);

    tracker.addCompleted(0, 100);
    tracker.addCompleted(2, 50);

    const auto state = tracker.snapshot();
    EXPECT_EQ(state.transferred_total, 150);
    EXPECT_EQ(state.ranges[0].completed, 100);
    EXPECT_EQ(state.ranges[2].completed, 50);
    EXPECT_EQ(tracker.range(1).completed, 0);
}

TEST(ProgressTrackerTest, InFlightBytesCountOnlyTowardTheTotal) {
    ProgressTracker tracker(makeState(1000, 2), {}, {}, 0ms, 1h);

    tracker.addInFlight(300);
    EXPECT_EQ(tracker.snapshot().transferred_total, 300);
    EXPECT_EQ(tracker.range(0).completed, 0);

    tracker.rollbackInFlight(300);
    EXPECT_EQ(tracker.snapshot().transferred_total, 0);

    tracker.addInFlight(500);
    tracker.commitRange(0, 500);
    EXPECT_EQ(tracker.range(0).completed, 500);
    EXPECT_EQ(tracker.snapshot().transferred_total, 500);
}

TEST(ProgressTrackerTest, ResetRangeForgetsItsBytes) {
    ProgressTracker tracker(makeState(1000, 1), {}, {}, 0ms, 1h);
    tracker.addCompleted(0, 400);

    tracker.resetRange(0);

    EXPECT_EQ(tracker.range(0).completed, 0);
    EXPECT_EQ(tracker.snapshot().transferred_total, 0);
}

TEST(ProgressTrackerTest, SamplesCarryPercentAndStayMonotonic) {
    std::vector<ProgressSample> samples;
    ProgressTracker tracker(makeState(1000, 4), [&samples](const ProgressSample& s) { samples.push_back(s); },
                            {}, 0ms, 1h);

    for (int i = 0; i < 10; ++i) {
        tracker.addCompleted(static_cast<std::size_t>(i % 4), 25);
    }
    tracker.flush(false);

    ASSERT_FALSE(samples.empty());
    for (std::size_t i = 1; i < samples.size(); ++i) {
        EXPECT_GE(samples[i].percent, samples[i - 1].percent);
    }
    EXPECT_DOUBLE_EQ(samples.back().percent, 25.0);
    EXPECT_EQ(samples.back().transferred, 250);
    EXPECT_EQ(samples.back().total, 1000);
    EXPECT_EQ(tracker.lastSample().transferred, 250);
}

TEST(ProgressTrackerTest, SamplingIsRateLimited) {
    int emitted = 0;
    ProgressTracker tracker(makeState(100000, 1), [&emitted](const ProgressSample&) { ++emitted; }, {}, 1h, 1h);

    for (int i = 0; i < 1000; ++i) {
        tracker.addCompleted(0, 10);
    }
    EXPECT_EQ(emitted, 0);

    tracker.flush(false);
    EXPECT_EQ(emitted, 1);
}

TEST(ProgressTrackerTest, RateReflectsRecentThroughput) {
    ProgressTracker tracker(makeState(1000000, 1), {}, {}, 0ms, 1h);

    std::this_thread::sleep_for(20ms);
    tracker.addCompleted(0, 10000);

    const auto sample = tracker.lastSample();
    EXPECT_GT(sample.rate, 0.0);
    EXPECT_LT(sample.rate, 10000.0 / 0.019);
}

TEST(ProgressTrackerTest, CheckpointsFollowTheirOwnCadence) {
    std::vector<std::vector<TransferRange>> checkpoints;
    ProgressTracker tracker(makeState(1000, 2), {},
                            [&checkpoints](const std::vector<TransferRange>& r) { checkpoints.push_back(r); },
                            0ms, 1h);

    tracker.addCompleted(1, 10);
    EXPECT_TRUE(checkpoints.empty());

    tracker.flush(true);
    ASSERT_EQ(checkpoints.size(), 1u);
    EXPECT_EQ(checkpoints[0][1].completed, 10);

    tracker.flush(false);
    EXPECT_EQ(checkpoints.size(), 1u);
}

TEST(ProgressTrackerTest, ZeroCheckpointIntervalSavesOnEveryUpdate) {
    int saved = 0;
    ProgressTracker tracker(makeState(1000, 2), {}, [&saved](const std::vector<TransferRange>&) { ++saved; },
                            1h, 0ms);

    tracker.addCompleted(0, 1);
    tracker.addCompleted(1, 1);

    EXPECT_EQ(saved, 2);
}

TEST(ProgressTrackerTest, ResolveTotalSizeFixesTheStreamRange) {
    TransferState state;
    state.mode = TransferMode::SingleStream;
    state.ranges.push_back(TransferRange{});
    ProgressTracker tracker(state, {}, {}, 0ms, 1h);

    tracker.addCompleted(0, 777);
    tracker.resolveTotalSize(777);

    const auto snapshot = tracker.snapshot();
    EXPECT_EQ(snapshot.total_size, 777);
    EXPECT_EQ(snapshot.ranges[0].end, 776);
    EXPECT_EQ(snapshot.ranges[0].remaining(), 0);
}

TEST(ProgressTrackerTest, ConcurrentWorkersKeepTheTotalExact) {
    ProgressTracker tracker(makeState(8 * 10000, 8), [](const ProgressSample&) {}, [](const auto&) {}, 0ms, 0ms);

    std::vector<std::thread> threads;
    for (std::size_t index = 0; index < 8; ++index) {
        threads.emplace_back([&tracker, index] {
            for (int i = 0; i < 1000; ++i) {
                tracker.addCompleted(index, 10);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto state = tracker.snapshot();
    EXPECT_EQ(state.transferred_total, 80000);
    for (const auto& range : state.ranges) {
        EXPECT_EQ(range.completed, 10000);
    }
}

} // namespace
} // namespace rangexfer

#include "rangexfer/transfer_worker.hpp"
#include "rangexfer/range_partitioner.hpp"

#include "fake_http_client.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

namespace rangexfer {
namespace {

using namespace std::chrono_literals;
using test::FakeHttpClient;
using test::TempDir;
using test::makeContent;
using test::readFile;
using test::writeFile;

constexpr const char* kUrl = "http://files.test/a.bin";

class TransferWorkerTest : public ::testing::Test {
protected:
    void plan(std::int64_t total, int ranges) {
        TransferState state;
        state.total_size = total;
        state.ranges = partitionRanges(total, ranges);
        state.status = TransferStatus::Running;
        tracker_ = std::make_unique<ProgressTracker>(state, ProgressSink{}, ProgressTracker::CheckpointFn{}, 0ms, 1h);
    }

    WorkerContext context(HttpClient& client) { return WorkerContext{client, config_, *tracker_, signal_, kUrl}; }

    TempDir dir_;
    TransferConfig config_;
    TransferSignal signal_;
    std::unique_ptr<ProgressTracker> tracker_;
};

TEST_F(TransferWorkerTest, DownloadRangeWritesInPlace) {
    const auto content = makeContent(10000);
    FakeHttpClient client(content);
    plan(10000, 4);
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(10000);

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(2));
    output.close();

    EXPECT_EQ(outcome.status, WorkerStatus::Complete);
    EXPECT_EQ(tracker_->range(2).completed, 2500);
    EXPECT_EQ(readFile(dir_ / "out.bin").substr(5000, 2500), content.substr(5000, 2500));
    EXPECT_EQ(client.requestedRanges().back(), "bytes=5000-7499");
}

TEST_F(TransferWorkerTest, DownloadRangeContinuesFromCompletedOffset) {
    FakeHttpClient client(makeContent(10000));
    plan(10000, 2);
    tracker_->addCompleted(1, 1000);
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(10000);

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(1));

    EXPECT_EQ(outcome.status, WorkerStatus::Complete);
    EXPECT_EQ(client.requestedRanges().back(), "bytes=6000-9999");
    EXPECT_EQ(client.bytesServed(), 4000);
}

TEST_F(TransferWorkerTest, FullBodyAnswerIsRangeUnsupported) {
    FakeHttpClient::Options options;
    options.ranges_only_for_probe = true;
    FakeHttpClient client(makeContent(10000), options);
    plan(10000, 2);
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(10000);

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(1));

    EXPECT_EQ(outcome.status, WorkerStatus::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::RangeUnsupportedMidTransfer);
    EXPECT_FALSE(outcome.retryable);
    EXPECT_EQ(client.bytesServed(), 0);
    EXPECT_EQ(tracker_->range(1).completed, 0);
}

TEST_F(TransferWorkerTest, ServiceUnavailableIsRetryable) {
    FakeHttpClient client(makeContent(10000));
    client.failRangeAt(0, 1);
    plan(10000, 2);
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(10000);

    DownloadRangeWorker worker(context(client), output);
    const auto first = worker.run(tracker_->range(0));
    const auto second = worker.run(tracker_->range(0));

    EXPECT_EQ(first.status, WorkerStatus::Failed);
    EXPECT_EQ(first.error, ErrorKind::WorkerIOFailure);
    EXPECT_TRUE(first.retryable);
    EXPECT_EQ(second.status, WorkerStatus::Complete);
}

TEST_F(TransferWorkerTest, StopRequestPausesBeforeAnyRequest) {
    FakeHttpClient client(makeContent(10000));
    plan(10000, 2);
    detail::OutputFile output(dir_ / "out.bin", true);
    signal_.raise(TransferSignal::Kind::Pause);

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(0));

    EXPECT_EQ(outcome.status, WorkerStatus::Paused);
    EXPECT_TRUE(client.requestedRanges().empty());
}

TEST_F(TransferWorkerTest, TransportErrorIsRetryableIOFailure) {
    FakeHttpClient::Options options;
    options.unreachable = true;
    FakeHttpClient client(makeContent(100), options);
    plan(100, 1);
    detail::OutputFile output(dir_ / "out.bin", true);

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(0));

    EXPECT_EQ(outcome.error, ErrorKind::WorkerIOFailure);
    EXPECT_TRUE(outcome.retryable);
}

TEST_F(TransferWorkerTest, StreamDownloadResolvesUnknownSize) {
    const auto content = makeContent(9000);
    FakeHttpClient::Options options;
    options.send_content_length = false;
    FakeHttpClient client(content, options);

    TransferState state;
    state.mode = TransferMode::SingleStream;
    state.ranges.push_back(TransferRange{});
    tracker_ = std::make_unique<ProgressTracker>(state, ProgressSink{}, ProgressTracker::CheckpointFn{}, 0ms, 1h);
    detail::OutputFile output(dir_ / "out.bin", true);

    StreamDownloadWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(0));
    output.close();

    EXPECT_EQ(outcome.status, WorkerStatus::Complete);
    EXPECT_EQ(tracker_->snapshot().total_size, 9000);
    EXPECT_EQ(readFile(dir_ / "out.bin"), content);
}

TEST_F(TransferWorkerTest, UploadRangeSendsContentRangeAndCommits) {
    const auto content = makeContent(10000);
    writeFile(dir_ / "src.bin", content);
    const detail::SourceFile source(dir_ / "src.bin");
    FakeHttpClient client("");
    plan(10000, 2);

    UploadRangeWorker worker(context(client), source, "remote.bin");
    const auto outcome = worker.run(tracker_->range(1));

    ASSERT_EQ(outcome.status, WorkerStatus::Complete);
    EXPECT_EQ(tracker_->range(1).completed, 5000);
    EXPECT_EQ(tracker_->snapshot().transferred_total, 5000);

    const auto uploads = client.uploads();
    ASSERT_EQ(uploads.size(), 1u);
    EXPECT_EQ(uploads[0].headers.at("X-File-Name"), "remote.bin");
    EXPECT_EQ(uploads[0].headers.at("Content-Range"), "bytes 5000-9999/10000");
    EXPECT_EQ(uploads[0].body, content.substr(5000));
}

TEST_F(TransferWorkerTest, RejectedUploadRollsBackInFlightBytes) {
    writeFile(dir_ / "src.bin", makeContent(10000));
    const detail::SourceFile source(dir_ / "src.bin");
    FakeHttpClient client("");
    client.failUploads(1);
    plan(10000, 2);

    UploadRangeWorker worker(context(client), source, "remote.bin");
    const auto outcome = worker.run(tracker_->range(0));

    EXPECT_EQ(outcome.status, WorkerStatus::Failed);
    EXPECT_TRUE(outcome.retryable);
    EXPECT_EQ(tracker_->range(0).completed, 0);
    EXPECT_EQ(tracker_->snapshot().transferred_total, 0);
}

TEST_F(TransferWorkerTest, StreamUploadOmitsContentRange) {
    const auto content = makeContent(3000);
    writeFile(dir_ / "src.bin", content);
    const detail::SourceFile source(dir_ / "src.bin");
    FakeHttpClient client("");
    plan(3000, 1);

    StreamUploadWorker worker(context(client), source, "src.bin");
    const auto outcome = worker.run(tracker_->range(0));

    ASSERT_EQ(outcome.status, WorkerStatus::Complete);
    const auto uploads = client.uploads();
    ASSERT_EQ(uploads.size(), 1u);
    EXPECT_EQ(uploads[0].headers.count("Content-Range"), 0u);
    EXPECT_EQ(uploads[0].body, content);
}

TEST_F(TransferWorkerTest, WriteFailureIsFatal) {
    FakeHttpClient client(makeContent(10000));
    plan(10000, 2);
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(10000);
    output.close();

    DownloadRangeWorker worker(context(client), output);
    const auto outcome = worker.run(tracker_->range(0));

    EXPECT_EQ(outcome.status, WorkerStatus::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::OutputWriteFailure);
    EXPECT_TRUE(outcome.fatal());
    EXPECT_FALSE(outcome.retryable);
    EXPECT_EQ(tracker_->range(0).completed, 0);
}

TEST_F(TransferWorkerTest, SourceShrinkingDuringUploadIsFatal) {
    writeFile(dir_ / "src.bin", makeContent(10000));
    const detail::SourceFile source(dir_ / "src.bin");
    FakeHttpClient::Options options;
    options.block_size = 1000;
    std::atomic<bool> truncated{false};
    options.on_upload_block = [&truncated, path = dir_ / "src.bin"] {
        if (!truncated.exchange(true)) {
            std::filesystem::resize_file(path, 0);
        }
    };
    FakeHttpClient client("", options);
    plan(10000, 2);

    UploadRangeWorker worker(context(client), source, "remote.bin");
    const auto outcome = worker.run(tracker_->range(0));

    EXPECT_EQ(outcome.status, WorkerStatus::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::SourceReadFailure);
    EXPECT_TRUE(outcome.fatal());
    EXPECT_TRUE(client.uploads().empty());
    EXPECT_EQ(tracker_->range(0).completed, 0);
    EXPECT_EQ(tracker_->snapshot().transferred_total, 0);
}

TEST_F(TransferWorkerTest, SyncDataNeedsAnOpenFile) {
    detail::OutputFile output(dir_ / "out.bin", true);
    output.resize(100);
    output.writeAt(0, "abc", 3);
    EXPECT_NO_THROW(output.syncData());

    output.close();
    try {
        output.syncData();
        FAIL() << "syncData should have thrown";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::OutputWriteFailure);
    }
}

TEST(TransientStatusTest, ServerSideAndThrottlingStatuses) {
    EXPECT_TRUE(isTransientStatus(503));
    EXPECT_TRUE(isTransientStatus(500));
    EXPECT_TRUE(isTransientStatus(429));
    EXPECT_TRUE(isTransientStatus(408));
    EXPECT_FALSE(isTransientStatus(404));
    EXPECT_FALSE(isTransientStatus(200));
    EXPECT_FALSE(isTransientStatus(416));
}

} // namespace
} // namespace rangexfer

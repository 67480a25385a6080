#pragma once

#include "detail/file_io.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "progress_tracker.hpp"
#include "transfer_config.hpp"
#include "transfer_signal.hpp"
#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace rangexfer {

enum class WorkerStatus { Complete, Paused, Failed };

struct WorkerOutcome {
    WorkerStatus status{WorkerStatus::Failed};
    ErrorKind error{ErrorKind::None};
    std::string message;
    bool retryable{false};

    [[nodiscard]] static WorkerOutcome complete();
    [[nodiscard]] static WorkerOutcome paused();
    [[nodiscard]] static WorkerOutcome failure(ErrorKind error, std::string message, bool retryable);

    // Failures that leave the whole transfer unusable, not just this range.
    [[nodiscard]] bool fatal() const {
        return error == ErrorKind::OutputWriteFailure || error == ErrorKind::SourceReadFailure;
    }
};

// What every worker of a session shares, handed over at spawn time.
struct WorkerContext {
    HttpClient& client;
    const TransferConfig& config;
    ProgressTracker& tracker;
    const TransferSignal& signal;
    std::string url;
};

class TransferWorker {
public:
    explicit TransferWorker(WorkerContext context) : context_(context) {}
    virtual ~TransferWorker() = default;

    // One attempt over `range` starting from its `completed` count. Never throws.
    [[nodiscard]] WorkerOutcome run(const TransferRange& range);

protected:
    [[nodiscard]] virtual WorkerOutcome attempt(const TransferRange& range) = 0;

    [[nodiscard]] bool stopRequested() const { return context_.signal.stopRequested(); }

    WorkerContext context_;
};

// Fetches one range with a Range request and writes it in place.
class DownloadRangeWorker final : public TransferWorker {
public:
    DownloadRangeWorker(WorkerContext context, detail::OutputFile& output)
        : TransferWorker(context), output_(output) {}

protected:
    [[nodiscard]] WorkerOutcome attempt(const TransferRange& range) override;

private:
    detail::OutputFile& output_;
};

// Pushes one slice of the source with a Content-Range descriptor. All-or-nothing.
class UploadRangeWorker final : public TransferWorker {
public:
    UploadRangeWorker(WorkerContext context, const detail::SourceFile& source, std::string remote_name)
        : TransferWorker(context), source_(source), remote_name_(std::move(remote_name)) {}

protected:
    [[nodiscard]] WorkerOutcome attempt(const TransferRange& range) override;

private:
    const detail::SourceFile& source_;
    std::string remote_name_;
};

// Whole-stream download used when ranges are unavailable. Every attempt starts from zero.
class StreamDownloadWorker final : public TransferWorker {
public:
    StreamDownloadWorker(WorkerContext context, detail::OutputFile& output)
        : TransferWorker(context), output_(output) {}

protected:
    [[nodiscard]] WorkerOutcome attempt(const TransferRange& range) override;

private:
    detail::OutputFile& output_;
};

// Single push of the whole source without a Content-Range header.
class StreamUploadWorker final : public TransferWorker {
public:
    StreamUploadWorker(WorkerContext context, const detail::SourceFile& source, std::string remote_name)
        : TransferWorker(context), source_(source), remote_name_(std::move(remote_name)) {}

protected:
    [[nodiscard]] WorkerOutcome attempt(const TransferRange& range) override;

private:
    const detail::SourceFile& source_;
    std::string remote_name_;
};

// Statuses on which a failed request is worth repeating.
[[nodiscard]] bool isTransientStatus(long status);

} // namespace rangexfer

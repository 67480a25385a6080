#include "rangexfer/transfer_coordinator.hpp"

#include "rangexfer/capability_prober.hpp"
#include "rangexfer/detail/file_io.hpp"
#include "rangexfer/errors.hpp"
#include "rangexfer/progress_store.hpp"
#include "rangexfer/progress_tracker.hpp"
#include "rangexfer/range_partitioner.hpp"
#include "rangexfer/transfer_signal.hpp"
#include "rangexfer/transfer_worker.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define LOG_SC_COORD "[COORD] "

namespace rangexfer {

class TransferSession {
public:
    TransferSession(std::shared_ptr<HttpClient> client, const TransferConfig& config,
                    TransferSpec spec, ProgressSink sink)
        : client_(std::move(client)), config_(config), spec_(std::move(spec)), sink_(std::move(sink)) {}

    // Dropping the last handle cancels a running transfer.
    ~TransferSession() {
        signal_.raise(TransferSignal::Kind::Cancel);
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
    }

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void prepare() {
        url_ = spec_.token.empty() ? spec_.url : appendQueryParameter(spec_.url, "token", spec_.token);

        TransferState initial = spec_.direction == Direction::Download ? planDownload() : planUpload();
        initial.status = TransferStatus::Running;
        for (const auto& range : initial.ranges) {
            initial.transferred_total += range.completed;
        }
        mode_ = initial.mode;

        ProgressTracker::CheckpointFn checkpoint;
        if (store_) {
            // Downloads sync the output first so a record never claims bytes still in the page cache.
            std::function<void()> flush_output;
            if (output_) {
                flush_output = [output = output_.get()] { output->syncData(); };
            }
            checkpoint = [store = store_.get(), flush_output](const std::vector<TransferRange>& ranges) {
                if (!store->save(ranges, flush_output)) {
                    spdlog::debug(LOG_SC_COORD "Checkpoint skipped, previous record kept");
                }
            };
        }

        spdlog::info(LOG_SC_COORD "{} {} <-> {}: {} bytes, {}, {} range(s), {} bytes already done",
                     toString(spec_.direction), spec_.url, spec_.local_path,
                     initial.total_size < 0 ? std::string{"unknown"} : std::to_string(initial.total_size),
                     toString(initial.mode), initial.ranges.size(), initial.transferred_total);

        tracker_ = std::make_unique<ProgressTracker>(std::move(initial), sink_, std::move(checkpoint),
                                                     config_.progress_interval, config_.checkpoint_interval);
    }

    void launch() {
        std::lock_guard<std::mutex> lock(mutex_);
        startSupervisorLocked();
    }

    void pause() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        signal_.raise(TransferSignal::Kind::Pause);
        cv_.wait(lock, [this] { return !running_; });
    }

    void resume() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || status_ != TransferStatus::Paused) {
            spdlog::debug(LOG_SC_COORD "Resume ignored, transfer is {}", toString(status_));
            return;
        }
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
        failures_.clear();
        error_ = ErrorKind::None;
        message_.clear();
        signal_.clear();
        spdlog::info(LOG_SC_COORD "Resuming {}", spec_.local_path);
        startSupervisorLocked();
    }

    void cancel() {
        std::unique_lock<std::mutex> lock(mutex_);
        signal_.raise(TransferSignal::Kind::Cancel);
        if (running_) {
            cv_.wait(lock, [this] { return !running_; });
            return;
        }
        if (status_ == TransferStatus::Paused) {
            status_ = TransferStatus::Cancelled;
            tracker_->setStatus(status_);
            spdlog::info(LOG_SC_COORD "Cancelled {} while paused", spec_.local_path);
        }
        cv_.notify_all();
    }

    TransferResult wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !running_; });
        return resultLocked();
    }

    std::optional<TransferResult> waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !running_; })) {
            return std::nullopt;
        }
        return resultLocked();
    }

    [[nodiscard]] TransferState snapshot() const { return tracker_->snapshot(); }

private:
    TransferState planDownload() {
        const ProbeResult probe = probeWithRetries();
        const std::filesystem::path destination{spec_.local_path};
        const auto record_path = ProgressStore::recordPathFor(destination);

        TransferState state;
        state.total_size = probe.total_size;

        if (probe.capability != Capability::SizeKnownRangeable) {
            spdlog::info(LOG_SC_COORD "{} ({}), using a single stream", spec_.url, toString(probe.capability));
            state.mode = TransferMode::SingleStream;
            TransferRange whole;
            whole.end = probe.total_size > 0 ? probe.total_size - 1 : -1;
            state.ranges.push_back(whole);

            // The output is rewritten from zero, so progress recorded by an earlier ranged run is void.
            std::error_code ec;
            if (std::filesystem::exists(record_path, ec)) {
                ProgressStore(record_path, Direction::Download, probe.total_size, {}).clear();
            }
            output_ = std::make_unique<detail::OutputFile>(destination, true);
            return state;
        }

        state.mode = TransferMode::MultiRange;
        state.ranges = partitionRanges(probe.total_size, config_.workers);
        store_ = std::make_unique<ProgressStore>(record_path, Direction::Download, probe.total_size, state.ranges);

        PersistedProgress prior = store_->load();
        if (!prior.empty()) {
            std::error_code ec;
            const auto existing = std::filesystem::file_size(destination, ec);
            if (ec || static_cast<std::int64_t>(existing) != probe.total_size) {
                spdlog::warn(LOG_SC_COORD "Partial output {} is missing or resized, discarding recorded progress",
                             destination.string());
                prior.clear();
            }
        }
        applyPriorProgress(state.ranges, prior, false);

        output_ = std::make_unique<detail::OutputFile>(destination, prior.empty());
        output_->resize(probe.total_size);
        return state;
    }

    TransferState planUpload() {
        const std::filesystem::path source_path{spec_.local_path};
        source_ = std::make_unique<detail::SourceFile>(source_path);
        if (spec_.remote_name.empty()) {
            spec_.remote_name = source_path.filename().string();
        }

        TransferState state;
        state.total_size = source_->size();

        const int workers = uploadWorkerCount(state.total_size, config_.workers, config_.min_upload_range);
        if (workers <= 1) {
            state.mode = TransferMode::SingleStream;
            TransferRange whole;
            whole.end = state.total_size - 1;
            state.ranges.push_back(whole);
            return state;
        }

        state.mode = TransferMode::MultiRange;
        state.ranges = partitionRanges(state.total_size, workers);
        store_ = std::make_unique<ProgressStore>(ProgressStore::recordPathFor(source_path), Direction::Upload,
                                                 state.total_size, state.ranges);
        applyPriorProgress(state.ranges, store_->load(), true);
        return state;
    }

    ProbeResult probeWithRetries() {
        CapabilityProber prober(*client_);
        std::string last_error;
        for (int attempt = 0; attempt <= config_.probe_retries; ++attempt) {
            if (attempt > 0) {
                spdlog::warn(LOG_SC_COORD "Probe of {} failed ({}), retry {}/{}", spec_.url, last_error, attempt,
                             config_.probe_retries);
                if (signal_.waitFor(config_.retry_delay)) {
                    break;
                }
            }
            try {
                return prober.probe(url_);
            } catch (const TransferError& ex) {
                last_error = ex.what();
            }
        }
        throw TransferError(ErrorKind::EndpointUnreachable,
                            fmt::format("Cannot reach {}: {}", spec_.url, last_error));
    }

    // Seeds `completed` from a loaded record. Entries that cannot belong to their range restart it.
    static void applyPriorProgress(std::vector<TransferRange>& ranges, const PersistedProgress& prior,
                                   bool whole_ranges_only) {
        for (auto& range : ranges) {
            const auto it = prior.find(range.index);
            if (it == prior.end()) {
                continue;
            }
            std::int64_t completed = it->second;
            if (completed > range.length() || (whole_ranges_only && completed != range.length())) {
                if (completed != 0) {
                    spdlog::warn(LOG_SC_COORD "Recorded progress {} for range {} does not fit, restarting it",
                                 completed, range.index);
                }
                completed = 0;
            }
            range.completed = completed;
            if (completed == range.length()) {
                range.status = RangeStatus::Complete;
            }
        }
    }

    void startSupervisorLocked() {
        running_ = true;
        status_ = TransferStatus::Running;
        tracker_->setStatus(status_);
        try {
            supervisor_ = std::thread([this] { supervise(); });
        } catch (const std::system_error&) {
            running_ = false;
            status_ = TransferStatus::Failed;
            tracker_->setStatus(status_);
            throw;
        }
    }

    void supervise() {
        std::vector<std::thread> workers;
        const TransferState state = tracker_->snapshot();
        workers.reserve(state.ranges.size());
        for (const auto& range : state.ranges) {
            if (range.done()) {
                continue;
            }
            try {
                workers.emplace_back([this, index = range.index] { runRange(index); });
            } catch (const std::system_error& ex) {
                recordFatal(ErrorKind::TransferFailed, fmt::format("Cannot start worker: {}", ex.what()));
                signal_.raise(TransferSignal::Kind::Abort);
                break;
            }
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        finish();
    }

    std::unique_ptr<TransferWorker> makeWorker() {
        WorkerContext context{*client_, config_, *tracker_, signal_, url_};
        if (spec_.direction == Direction::Download) {
            if (mode_ == TransferMode::MultiRange) {
                return std::make_unique<DownloadRangeWorker>(context, *output_);
            }
            return std::make_unique<StreamDownloadWorker>(context, *output_);
        }
        if (mode_ == TransferMode::MultiRange) {
            return std::make_unique<UploadRangeWorker>(context, *source_, spec_.remote_name);
        }
        return std::make_unique<StreamUploadWorker>(context, *source_, spec_.remote_name);
    }

    void runRange(std::size_t index) {
        const auto worker = makeWorker();
        int retries = 0;

        while (true) {
            if (signal_.stopRequested()) {
                tracker_->setRangeStatus(index, RangeStatus::Paused);
                return;
            }

            tracker_->setRangeStatus(index, RangeStatus::Running);
            const WorkerOutcome outcome = worker->run(tracker_->range(index));

            if (outcome.status == WorkerStatus::Complete) {
                tracker_->setRangeStatus(index, RangeStatus::Complete);
                spdlog::debug(LOG_SC_COORD "Range {} complete", index);
                return;
            }
            if (outcome.status == WorkerStatus::Paused) {
                tracker_->setRangeStatus(index, RangeStatus::Paused);
                return;
            }

            if (outcome.fatal()) {
                spdlog::error(LOG_SC_COORD "Range {}: {}", index, outcome.message);
                tracker_->setRangeStatus(index, RangeStatus::Failed);
                recordFatal(outcome.error, outcome.message);
                signal_.raise(TransferSignal::Kind::Abort);
                return;
            }

            if (!outcome.retryable || retries >= config_.max_retries) {
                spdlog::error(LOG_SC_COORD "Range {} failed after {} attempt(s): {}", index, retries + 1,
                              outcome.message);
                tracker_->setRangeStatus(index, RangeStatus::Failed);
                recordFailure(index, outcome);
                return;
            }

            ++retries;
            const auto delay = config_.retry_delay * std::min(1 << (retries - 1), 8);
            spdlog::warn(LOG_SC_COORD "Range {}: {}, retry {}/{} in {} ms", index, outcome.message, retries,
                         config_.max_retries, delay.count());
            if (signal_.waitFor(delay)) {
                tracker_->setRangeStatus(index, RangeStatus::Paused);
                return;
            }
        }
    }

    void recordFailure(std::size_t index, const WorkerOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back(RangeFailure{index, outcome.error, outcome.message});
    }

    void recordFatal(ErrorKind kind, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_ == ErrorKind::None) {
            error_ = kind;
            message_ = message;
        }
    }

    TransferStatus finalize() {
        try {
            if (output_) {
                output_->sync();
                output_->close();
            }
        } catch (const TransferError& ex) {
            recordFatal(ex.kind(), ex.what());
            return TransferStatus::Failed;
        }

        const TransferState state = tracker_->snapshot();
        if (state.total_size >= 0 && state.transferred_total != state.total_size) {
            recordFatal(ErrorKind::TransferFailed, fmt::format("Transferred {} of {} bytes",
                                                               state.transferred_total, state.total_size));
            return TransferStatus::Failed;
        }

        if (store_) {
            store_->clear();
        }
        return TransferStatus::Complete;
    }

    void finish() {
        const auto signal = signal_.current();
        const TransferState state = tracker_->snapshot();
        const bool all_done = std::all_of(state.ranges.begin(), state.ranges.end(),
                                          [](const TransferRange& range) { return range.done(); });

        TransferStatus status = TransferStatus::Failed;
        if (signal == TransferSignal::Kind::Abort) {
            status = TransferStatus::Failed;
        } else if (all_done) {
            status = finalize();
        } else if (signal == TransferSignal::Kind::Cancel) {
            status = TransferStatus::Cancelled;
        } else if (signal == TransferSignal::Kind::Pause) {
            status = TransferStatus::Paused;
        }

        tracker_->setStatus(status);
        tracker_->flush(store_ && status != TransferStatus::Complete);

        const TransferState final_state = tracker_->snapshot();
        if (status == TransferStatus::Complete) {
            spdlog::info(LOG_SC_COORD "{} complete, {} bytes", spec_.local_path, final_state.transferred_total);
        } else if (status == TransferStatus::Failed) {
            spdlog::error(LOG_SC_COORD "{} failed at {:.1f}%", spec_.local_path,
                          percentOf(final_state.transferred_total, final_state.total_size, false));
        } else {
            spdlog::info(LOG_SC_COORD "{} {} at {:.1f}%", spec_.local_path, toString(status),
                         percentOf(final_state.transferred_total, final_state.total_size, false));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = status;
            running_ = false;
        }
        cv_.notify_all();
    }

    TransferResult resultLocked() const {
        const TransferState state = tracker_->snapshot();
        TransferResult result;
        result.status = status_;
        result.failures = failures_;
        result.error = error_;
        result.message = message_;
        result.transferred = state.transferred_total;
        result.total = state.total_size;
        result.percent = percentOf(state.transferred_total, state.total_size, status_ == TransferStatus::Complete);

        if (result.status == TransferStatus::Failed) {
            if (result.error == ErrorKind::None) {
                result.error = ErrorKind::TransferFailed;
            }
            if (result.message.empty()) {
                result.message = fmt::format("{} range(s) failed", result.failures.size());
            }
        }
        return result;
    }

    std::shared_ptr<HttpClient> client_;
    TransferConfig config_;
    TransferSpec spec_;
    std::string url_;
    ProgressSink sink_;

    TransferSignal signal_;
    std::unique_ptr<ProgressStore> store_;
    std::unique_ptr<ProgressTracker> tracker_;
    std::unique_ptr<detail::OutputFile> output_;
    std::unique_ptr<detail::SourceFile> source_;
    TransferMode mode_{TransferMode::MultiRange};

    std::thread supervisor_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    TransferStatus status_{TransferStatus::Probing};
    std::vector<RangeFailure> failures_;
    ErrorKind error_{ErrorKind::None};
    std::string message_;
};

namespace {

TransferSession& sessionOf(const TransferHandle& handle) {
    if (!handle) {
        throw std::invalid_argument("Empty transfer handle");
    }
    return *handle;
}

} // namespace

TransferCoordinator::TransferCoordinator(std::shared_ptr<HttpClient> client, TransferConfig config)
    : client_(std::move(client)), config_(std::move(config)) {
    if (!client_) {
        throw std::invalid_argument("TransferCoordinator requires an HttpClient");
    }
    config_.workers = std::max(1, config_.workers);
    config_.max_retries = std::max(0, config_.max_retries);
    config_.probe_retries = std::max(0, config_.probe_retries);
    config_.block_size = std::max<std::size_t>(config_.block_size, 1024);
}

TransferCoordinator::~TransferCoordinator() = default;

TransferHandle TransferCoordinator::start(TransferSpec spec, ProgressSink sink) {
    if (spec.url.empty() || spec.local_path.empty()) {
        throw std::invalid_argument("A transfer needs both a URL and a local path");
    }
    auto session = std::make_shared<TransferSession>(client_, config_, std::move(spec), std::move(sink));
    session->prepare();
    session->launch();
    return session;
}

void TransferCoordinator::pause(const TransferHandle& handle) { sessionOf(handle).pause(); }

void TransferCoordinator::resume(const TransferHandle& handle) { sessionOf(handle).resume(); }

void TransferCoordinator::cancel(const TransferHandle& handle) { sessionOf(handle).cancel(); }

TransferResult TransferCoordinator::wait(const TransferHandle& handle) { return sessionOf(handle).wait(); }

std::optional<TransferResult> TransferCoordinator::waitFor(const TransferHandle& handle,
                                                           std::chrono::milliseconds timeout) {
    return sessionOf(handle).waitFor(timeout);
}

TransferState TransferCoordinator::snapshot(const TransferHandle& handle) const {
    return sessionOf(handle).snapshot();
}

} // namespace rangexfer

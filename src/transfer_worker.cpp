#include "rangexfer/transfer_worker.hpp"

#include <exception>
#include <utility>

namespace rangexfer {

WorkerOutcome WorkerOutcome::complete() {
    WorkerOutcome outcome;
    outcome.status = WorkerStatus::Complete;
    return outcome;
}

WorkerOutcome WorkerOutcome::paused() {
    WorkerOutcome outcome;
    outcome.status = WorkerStatus::Paused;
    return outcome;
}

WorkerOutcome WorkerOutcome::failure(ErrorKind error, std::string message, bool retryable) {
    WorkerOutcome outcome;
    outcome.status = WorkerStatus::Failed;
    outcome.error = error;
    outcome.message = std::move(message);
    outcome.retryable = retryable;
    return outcome;
}

WorkerOutcome TransferWorker::run(const TransferRange& range) {
    if (stopRequested()) {
        return WorkerOutcome::paused();
    }

    try {
        return attempt(range);
    } catch (const TransferError& ex) {
        return WorkerOutcome::failure(ex.kind(), ex.what(), ex.kind() == ErrorKind::WorkerIOFailure);
    } catch (const TransportError& ex) {
        return WorkerOutcome::failure(ErrorKind::WorkerIOFailure, ex.what(), true);
    } catch (const std::exception& ex) {
        return WorkerOutcome::failure(ErrorKind::WorkerIOFailure, ex.what(), false);
    }
}

bool isTransientStatus(long status) {
    return status == 408 || status == 425 || status == 429 || status >= 500;
}

} // namespace rangexfer

#include "rangexfer/transfer_worker.hpp"

#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define LOG_SC_WORKER "[WORKER] "

namespace rangexfer {

WorkerOutcome DownloadRangeWorker::attempt(const TransferRange& range) {
    if (range.remaining() <= 0) {
        return WorkerOutcome::complete();
    }

    const std::int64_t first = range.start + range.completed;
    std::int64_t completed = range.completed;
    long status = 0;
    bool paused = false;
    bool overflow = false;
    std::exception_ptr error;

    spdlog::debug(LOG_SC_WORKER "range {} requesting bytes {}-{}", range.index, first, range.end);

    HttpRequest request{context_.url, {{"Range", rangeHeaderValue(first, range.end)}}};
    const HttpResponse response = context_.client.get(
        request,
        [&status](const HttpResponse& headers) {
            status = headers.status;
            // Anything but partial content would write the wrong bytes at this offset.
            return headers.status == 206;
        },
        [&](const char* data, std::size_t size) {
            try {
                if (static_cast<std::int64_t>(size) > range.length() - completed) {
                    overflow = true;
                    return false;
                }
                output_.writeAt(range.start + completed, data, size);
                completed += static_cast<std::int64_t>(size);
                context_.tracker.addCompleted(range.index, static_cast<std::int64_t>(size));
            } catch (...) {
                error = std::current_exception();
                return false;
            }
            if (stopRequested()) {
                paused = true;
                return false;
            }
            return true;
        });

    if (error) {
        std::rethrow_exception(error);
    }
    if (!response.aborted) {
        status = response.status;
    }

    if (status != 206) {
        if (isTransientStatus(status)) {
            return WorkerOutcome::failure(ErrorKind::WorkerIOFailure,
                                          fmt::format("range {} answered HTTP {}", range.index, status), true);
        }
        return WorkerOutcome::failure(ErrorKind::RangeUnsupportedMidTransfer,
                                      fmt::format("range {} answered HTTP {} instead of 206", range.index, status),
                                      false);
    }
    if (overflow) {
        return WorkerOutcome::failure(ErrorKind::WorkerIOFailure,
                                      fmt::format("range {} received more bytes than requested", range.index), true);
    }
    if (completed >= range.length()) {
        return WorkerOutcome::complete();
    }
    if (paused) {
        spdlog::debug(LOG_SC_WORKER "range {} paused at {}/{}", range.index, completed, range.length());
        return WorkerOutcome::paused();
    }
    return WorkerOutcome::failure(
        ErrorKind::WorkerIOFailure,
        fmt::format("range {} ended after {} of {} bytes", range.index, completed, range.length()), true);
}

WorkerOutcome StreamDownloadWorker::attempt(const TransferRange& range) {
    // No resume without ranges: every attempt starts from an empty file.
    if (range.completed > 0) {
        context_.tracker.resetRange(range.index);
    }
    output_.resize(0);

    const bool size_known = range.end >= range.start;
    std::int64_t received = 0;
    long status = 0;
    bool paused = false;
    std::exception_ptr error;

    const HttpResponse response = context_.client.get(
        HttpRequest{context_.url, {}},
        [&status](const HttpResponse& headers) {
            status = headers.status;
            return headers.successful();
        },
        [&](const char* data, std::size_t size) {
            try {
                output_.writeAt(received, data, size);
                received += static_cast<std::int64_t>(size);
                context_.tracker.addCompleted(range.index, static_cast<std::int64_t>(size));
            } catch (...) {
                error = std::current_exception();
                return false;
            }
            if (stopRequested()) {
                paused = true;
                return false;
            }
            return true;
        });

    if (error) {
        std::rethrow_exception(error);
    }
    if (!response.aborted) {
        status = response.status;
    }

    if (status < 200 || status >= 300) {
        return WorkerOutcome::failure(ErrorKind::WorkerIOFailure, fmt::format("stream answered HTTP {}", status),
                                      isTransientStatus(status));
    }
    if (paused && !(size_known && received == range.length())) {
        return WorkerOutcome::paused();
    }
    if (size_known && received != range.length()) {
        return WorkerOutcome::failure(
            ErrorKind::WorkerIOFailure,
            fmt::format("stream ended after {} of {} bytes", received, range.length()), true);
    }

    if (!size_known) {
        context_.tracker.resolveTotalSize(received);
    }
    spdlog::debug(LOG_SC_WORKER "stream finished with {} bytes", received);
    return WorkerOutcome::complete();
}

} // namespace rangexfer

#include "rangexfer/transfer_worker.hpp"

#include <algorithm>
#include <exception>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define LOG_SC_WORKER "[WORKER] "

namespace rangexfer {

namespace {

// Streams [range.start, range.end] of the source in one POST. Bytes are counted as in flight and
// either committed to the range on a 2xx answer or rolled back.
WorkerOutcome pushSlice(const WorkerContext& context,
                        const detail::SourceFile& source,
                        const TransferRange& range,
                        const std::string& remote_name,
                        bool with_content_range) {
    const std::int64_t length = std::max<std::int64_t>(0, range.length());
    std::int64_t offset = 0;
    bool paused = false;
    std::exception_ptr error;

    HttpRequest request{context.url, {{"X-File-Name", remote_name}}};
    if (with_content_range) {
        request.headers.emplace("Content-Range", contentRangeHeaderValue(range.start, range.end, source.size()));
    }

    const BodySource body = [&](char* buffer, std::size_t capacity) -> std::size_t {
        if (context.signal.stopRequested()) {
            paused = true;
            return kAbortBody;
        }
        try {
            const auto want = std::min<std::int64_t>(static_cast<std::int64_t>(capacity), length - offset);
            if (want <= 0) {
                return 0;
            }
            const std::size_t n = source.readAt(range.start + offset, buffer, static_cast<std::size_t>(want));
            if (n == 0) {
                throw TransferError(ErrorKind::SourceReadFailure,
                                    fmt::format("{} shrank during the upload", source.path().string()));
            }
            offset += static_cast<std::int64_t>(n);
            context.tracker.addInFlight(static_cast<std::int64_t>(n));
            return n;
        } catch (...) {
            error = std::current_exception();
            return kAbortBody;
        }
    };

    spdlog::debug(LOG_SC_WORKER "range {} pushing bytes {}-{}", range.index, range.start, range.end);

    std::optional<HttpResponse> response;
    try {
        response = context.client.post(request, length, body);
    } catch (...) {
        context.tracker.rollbackInFlight(offset);
        throw;
    }

    if (error) {
        context.tracker.rollbackInFlight(offset);
        std::rethrow_exception(error);
    }
    if (paused || response->aborted) {
        context.tracker.rollbackInFlight(offset);
        return WorkerOutcome::paused();
    }
    if (!response->successful()) {
        context.tracker.rollbackInFlight(offset);
        return WorkerOutcome::failure(ErrorKind::WorkerIOFailure,
                                      fmt::format("upload of range {} answered HTTP {}", range.index, response->status),
                                      isTransientStatus(response->status));
    }
    if (offset != length) {
        context.tracker.rollbackInFlight(offset);
        return WorkerOutcome::failure(
            ErrorKind::WorkerIOFailure,
            fmt::format("upload of range {} sent {} of {} bytes", range.index, offset, length), true);
    }

    context.tracker.commitRange(range.index, offset);
    return WorkerOutcome::complete();
}

} // namespace

WorkerOutcome UploadRangeWorker::attempt(const TransferRange& range) {
    if (range.remaining() <= 0) {
        return WorkerOutcome::complete();
    }
    return pushSlice(context_, source_, range, remote_name_, true);
}

WorkerOutcome StreamUploadWorker::attempt(const TransferRange& range) {
    return pushSlice(context_, source_, range, remote_name_, false);
}

} // namespace rangexfer

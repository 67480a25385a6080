#include "rangexfer/capability_prober.hpp"

#include "rangexfer/errors.hpp"

#include <cctype>
#include <cstdint>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define LOG_SC_PROBE "[PROBE] "

namespace rangexfer {

const char* toString(Capability capability) noexcept {
    switch (capability) {
    case Capability::SizeKnownRangeable:
        return "size known, rangeable";
    case Capability::SizeKnownNotRangeable:
        return "size known, not rangeable";
    case Capability::SizeUnknown:
        return "size unknown";
    }
    return "unknown";
}

std::int64_t parseContentLength(const HttpResponse& response) {
    const auto value = response.header("content-length");
    if (!value || value->empty()) {
        return -1;
    }
    std::int64_t length = 0;
    for (const unsigned char c : *value) {
        if (!std::isdigit(c)) {
            return -1;
        }
        if (length > (INT64_MAX - (c - '0')) / 10) {
            return -1;
        }
        length = length * 10 + (c - '0');
    }
    // Zero is what many servers report when they do not know the length.
    return length > 0 ? length : -1;
}

ProbeResult CapabilityProber::probe(const std::string& url) const {
    ProbeResult result;
    try {
        std::int64_t size = sizeFromHead(url);
        if (size < 0) {
            spdlog::debug(LOG_SC_PROBE "HEAD gave no usable size for {}, trying a streaming probe", url);
            size = sizeFromStream(url);
        }
        if (size < 0) {
            spdlog::debug(LOG_SC_PROBE "{}: size unknown", url);
            return result;
        }

        result.total_size = size;
        result.capability = acceptsRanges(url) ? Capability::SizeKnownRangeable
                                               : Capability::SizeKnownNotRangeable;
    } catch (const TransportError& ex) {
        throw TransferError(ErrorKind::ProbeFailed, ex.what());
    }

    spdlog::debug(LOG_SC_PROBE "{}: {} bytes, {}", url, result.total_size, toString(result.capability));
    return result;
}

std::int64_t CapabilityProber::sizeFromHead(const std::string& url) const {
    const HttpResponse response = client_.head(HttpRequest{url, {}});
    if (!response.successful()) {
        spdlog::debug(LOG_SC_PROBE "HEAD {} answered {}", url, response.status);
        return -1;
    }
    return parseContentLength(response);
}

std::int64_t CapabilityProber::sizeFromStream(const std::string& url) const {
    HttpResponse seen;
    const HttpResponse response = client_.get(
        HttpRequest{url, {}},
        [&seen](const HttpResponse& headers) {
            seen = headers;
            return false;
        },
        [](const char*, std::size_t) { return false; });

    const HttpResponse& final_response = response.aborted ? seen : response;
    if (!final_response.successful()) {
        throw TransferError(ErrorKind::ProbeFailed,
                            fmt::format("GET {} answered HTTP {}", url, final_response.status));
    }
    return parseContentLength(final_response);
}

bool CapabilityProber::acceptsRanges(const std::string& url) const {
    long status = 0;
    const HttpResponse response = client_.get(
        HttpRequest{url, {{"Range", rangeHeaderValue(0, 0)}}},
        [&status](const HttpResponse& headers) {
            status = headers.status;
            return false;
        },
        [](const char*, std::size_t) { return false; });
    if (!response.aborted) {
        status = response.status;
    }
    spdlog::debug(LOG_SC_PROBE "range probe {} answered {}", url, status);
    return status == 206;
}

} // namespace rangexfer

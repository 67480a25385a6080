#pragma once

#include "http_client.hpp"

#include <cstdint>
#include <string>

namespace rangexfer {

enum class Capability { SizeKnownRangeable, SizeKnownNotRangeable, SizeUnknown };

[[nodiscard]] const char* toString(Capability capability) noexcept;

struct ProbeResult {
    Capability capability{Capability::SizeUnknown};
    std::int64_t total_size{-1};
};

class CapabilityProber {
public:
    explicit CapabilityProber(HttpClient& client) : client_(client) {}

    // Throws TransferError(ProbeFailed) on transport errors or when the resource is unavailable.
    [[nodiscard]] ProbeResult probe(const std::string& url) const;

private:
    [[nodiscard]] std::int64_t sizeFromHead(const std::string& url) const;
    [[nodiscard]] std::int64_t sizeFromStream(const std::string& url) const;
    [[nodiscard]] bool acceptsRanges(const std::string& url) const;

    HttpClient& client_;
};

// Content-Length as a positive byte count, or -1 when absent or a placeholder value.
[[nodiscard]] std::int64_t parseContentLength(const HttpResponse& response);

} // namespace rangexfer

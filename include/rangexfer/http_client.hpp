#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace rangexfer {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    long status{0};
    std::map<std::string, std::string> headers;     // names lower-cased
    bool aborted{false};                            // a handler stopped the exchange

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    [[nodiscard]] bool successful() const { return status >= 200 && status < 300; }
};

// Called once with the final status and headers before any body data. Return false to abort.
using HeadersHandler = std::function<bool(const HttpResponse&)>;
// Called for every received block. Return false to abort.
using DataHandler = std::function<bool(const char* data, std::size_t size)>;
// Fills at most `capacity` bytes; returns the count, 0 at end of body, or kAbortBody.
using BodySource = std::function<std::size_t(char* buffer, std::size_t capacity)>;

inline constexpr std::size_t kAbortBody = static_cast<std::size_t>(-1);

class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HttpResponse head(const HttpRequest& request) = 0;
    virtual HttpResponse get(const HttpRequest& request,
                             const HeadersHandler& on_headers,
                             const DataHandler& on_data) = 0;
    virtual HttpResponse post(const HttpRequest& request,
                              std::int64_t content_length,
                              const BodySource& body) = 0;
};

[[nodiscard]] std::string appendQueryParameter(const std::string& url,
                                               const std::string& name,
                                               const std::string& value);

[[nodiscard]] std::string rangeHeaderValue(std::int64_t first, std::int64_t last);
[[nodiscard]] std::string contentRangeHeaderValue(std::int64_t first, std::int64_t last, std::int64_t total);

} // namespace rangexfer

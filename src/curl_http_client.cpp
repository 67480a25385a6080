#include "rangexfer/curl_http_client.hpp"

#include "rangexfer/detail/curl_utils.hpp"
#include "rangexfer/errors.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#define LOG_SC_HTTP "[HTTP] "

namespace rangexfer {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

enum class Method { Head, Get, Post };

const char* methodName(Method method) {
    switch (method) {
    case Method::Head:
        return "HEAD";
    case Method::Get:
        return "GET";
    case Method::Post:
        return "POST";
    }
    return "?";
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Per-request state reachable from the curl callbacks.
struct Exchange {
    CURL* curl{nullptr};
    HttpResponse response;
    const HeadersHandler* on_headers{nullptr};
    const DataHandler* on_data{nullptr};
    const BodySource* body{nullptr};
    bool headers_delivered{false};
    bool aborted_by_handler{false};

    bool deliverHeaders() {
        if (headers_delivered) {
            return !aborted_by_handler;
        }
        headers_delivered = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        if (on_headers && *on_headers && !(*on_headers)(response)) {
            aborted_by_handler = true;
            return false;
        }
        return true;
    }
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* exchange = static_cast<Exchange*>(userdata);
    const size_t total = size * nitems;
    if (!exchange) {
        return 0;
    }

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Status line of a redirect hop or interim response: only the final headers are kept.
    if (line.rfind("HTTP/", 0) == 0) {
        exchange->response.headers.clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        exchange->response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* exchange = static_cast<Exchange*>(userdata);
    const size_t total = size * nmemb;
    if (!exchange || !exchange->deliverHeaders()) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }

    if (exchange->on_data && *exchange->on_data && !(*exchange->on_data)(ptr, total)) {
        exchange->aborted_by_handler = true;
        return 0;
    }
    return total;
}

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* exchange = static_cast<Exchange*>(userdata);
    const size_t capacity = size * nitems;
    if (!exchange || !exchange->body || !*exchange->body) {
        return 0;
    }

    const size_t produced = (*exchange->body)(buffer, capacity);
    if (produced == kAbortBody) {
        exchange->aborted_by_handler = true;
        return CURL_READFUNC_ABORT;
    }
    return std::min(produced, capacity);
}

} // namespace

class CurlHttpClient::Impl {
public:
    explicit Impl(const TransferConfig& config)
        : connect_timeout_(static_cast<long>(config.connect_timeout.count())),
          low_speed_time_(static_cast<long>(config.low_speed_time.count())),
          buffer_size_(static_cast<long>(config.block_size)),
          user_agent_(config.user_agent) {
        detail::ensureCurlInitialized();
    }

    HttpResponse perform(Method method, const HttpRequest& request, Exchange& exchange,
                         std::int64_t content_length = 0) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }
        exchange.curl = curl.get();

        HeaderList headers{nullptr, &curl_slist_free_all};
        auto appendHeader = [&headers](const std::string& line) {
            curl_slist* list = curl_slist_append(headers.get(), line.c_str());
            if (!list) {
                throw TransportError("Failed to build request headers");
            }
            headers.release();
            headers.reset(list);
        };
        for (const auto& [name, value] : request.headers) {
            appendHeader(fmt::format("{}: {}", name, value));
        }
        if (method == Method::Post) {
            appendHeader("Expect:");
        }

        CURL* handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, low_speed_time_);
        curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, buffer_size_);
        curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &headerCallback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &exchange);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &writeCallback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &exchange);

        switch (method) {
        case Method::Head:
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            break;
        case Method::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_READFUNCTION, &readCallback);
            curl_easy_setopt(handle, CURLOPT_READDATA, &exchange);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(content_length));
            break;
        }

        const CURLcode res = curl_easy_perform(handle);
        if (exchange.aborted_by_handler) {
            exchange.response.aborted = true;
            spdlog::debug(LOG_SC_HTTP "{} {} -> {} (stopped by caller)",
                          methodName(method), request.url, exchange.response.status);
            return std::move(exchange.response);
        }
        if (res != CURLE_OK) {
            throw TransportError(fmt::format("{} {} failed: {}", methodName(method), request.url,
                                             curl_easy_strerror(res)));
        }

        // Bodiless responses never reach the write callback.
        if (!exchange.deliverHeaders()) {
            exchange.response.aborted = true;
        }
        spdlog::debug(LOG_SC_HTTP "{} {} -> {}", methodName(method), request.url, exchange.response.status);
        return std::move(exchange.response);
    }

private:
    long connect_timeout_;
    long low_speed_time_;
    long buffer_size_;
    std::string user_agent_;
};

CurlHttpClient::CurlHttpClient(const TransferConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::head(const HttpRequest& request) {
    Exchange exchange;
    return impl_->perform(Method::Head, request, exchange);
}

HttpResponse CurlHttpClient::get(const HttpRequest& request,
                                 const HeadersHandler& on_headers,
                                 const DataHandler& on_data) {
    Exchange exchange;
    exchange.on_headers = &on_headers;
    exchange.on_data = &on_data;
    return impl_->perform(Method::Get, request, exchange);
}

HttpResponse CurlHttpClient::post(const HttpRequest& request,
                                  std::int64_t content_length,
                                  const BodySource& body) {
    Exchange exchange;
    exchange.body = &body;
    return impl_->perform(Method::Post, request, exchange, content_length);
}

} // namespace rangexfer

#include "rangexfer/http_client.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace rangexfer {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percentEncode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (const unsigned char c : value) {
        if (isUnreserved(c)) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded += fmt::format("%{:02X}", c);
        }
    }
    return encoded;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string appendQueryParameter(const std::string& url, const std::string& name, const std::string& value) {
    const auto fragment = url.find('#');
    std::string base = url.substr(0, fragment);
    const std::string tail = fragment == std::string::npos ? std::string{} : url.substr(fragment);

    char separator = '?';
    if (base.find('?') != std::string::npos) {
        separator = (base.back() == '?' || base.back() == '&') ? '\0' : '&';
    }
    if (separator != '\0') {
        base.push_back(separator);
    }
    base += percentEncode(name);
    base.push_back('=');
    base += percentEncode(value);
    return base + tail;
}

std::string rangeHeaderValue(std::int64_t first, std::int64_t last) {
    return fmt::format("bytes={}-{}", first, last);
}

std::string contentRangeHeaderValue(std::int64_t first, std::int64_t last, std::int64_t total) {
    return fmt::format("bytes {}-{}/{}", first, last, total);
}

} // namespace rangexfer

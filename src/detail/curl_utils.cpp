#include "rangexfer/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

namespace rangexfer::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(rc));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string curlVersion() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        return "libcurl (unknown)";
    }
    std::string version = std::string{"libcurl/"} + info->version;
    if (info->ssl_version) {
        version += " ";
        version += info->ssl_version;
    }
    return version;
}

} // namespace rangexfer::detail

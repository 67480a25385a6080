#pragma once

#include <string>

namespace rangexfer::detail {

// Runs curl_global_init once per process and registers the matching cleanup.
void ensureCurlInitialized();

// "libcurl/8.x.y" plus the TLS backend, for diagnostics.
[[nodiscard]] std::string curlVersion();

} // namespace rangexfer::detail

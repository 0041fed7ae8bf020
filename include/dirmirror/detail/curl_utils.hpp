#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>
#include <string_view>

namespace dirmirror::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized();

// Throws std::runtime_error when libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// Percent-decodes `encoded`. '+' is left as is, matching path semantics.
[[nodiscard]] std::string unescape(std::string_view encoded);

} // namespace dirmirror::detail

#include "dirmirror/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <climits>
#include <cstdlib>
#include <stdexcept>
#include <mutex>

namespace dirmirror::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }
    return curl;
}

std::string unescape(std::string_view encoded) {
    if (encoded.empty() || encoded.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::string{encoded};
    }

    // The handle argument has been unused since libcurl 7.82.
    int length = 0;
    char* decoded = curl_easy_unescape(nullptr, encoded.data(), static_cast<int>(encoded.size()), &length);
    if (!decoded) {
        return std::string{encoded};
    }
    std::string result(decoded, static_cast<std::size_t>(length));
    curl_free(decoded);
    return result;
}

} // namespace dirmirror::detail

#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/error.hpp"

#include <cstdlib>
#include <mutex>

namespace rangeget::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw Error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }
    return curl;
}

} // namespace rangeget::detail

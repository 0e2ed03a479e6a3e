#pragma once

#include <curl/curl.h>

#include <memory>

namespace rangeget::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// Runs curl_global_init once per process; throws on failure.
void ensureCurlInitialized();

// Throws TransportError when libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

} // namespace rangeget::detail

#include "rangeget/curl_transport.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/detail/http_headers.hpp"
#include "rangeget/error.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

constexpr long kReadBufferSize = 16 * 1024;
constexpr long kMaxRedirects = 10;

struct TransferContext {
    ResponseHead head;
    const HttpTransport::HeadHandler* on_head{nullptr};
    const HttpTransport::BodyHandler* on_body{nullptr};
    bool head_delivered{false};
    bool stopped{false};
    std::exception_ptr error;
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nitems;
    detail::parseHeaderLine(std::string_view(buffer, total), ctx->head);
    return total;
}

bool deliverHead(TransferContext& ctx) {
    if (ctx.head_delivered) {
        return !ctx.stopped;
    }
    ctx.head_delivered = true;
    if (ctx.on_head && *ctx.on_head && !(*ctx.on_head)(ctx.head)) {
        ctx.stopped = true;
    }
    return !ctx.stopped;
}

// Handlers run inside libcurl's C callbacks, so exceptions are parked and
// rethrown after curl_easy_perform returns.
size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    try {
        if (!deliverHead(*ctx)) {
            return 0;
        }
        if (ctx->on_body && *ctx->on_body && !(*ctx->on_body)(ptr, total)) {
            ctx->stopped = true;
            return 0;
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

std::string describeFailure(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return fmt::format("curl error: {} ({})", curl_easy_strerror(code), error_buffer);
    }
    return fmt::format("curl error: {}", curl_easy_strerror(code));
}

std::string rangeSpec(const ByteRange& range) {
    if (range.last) {
        return fmt::format("{}-{}", range.first, *range.last);
    }
    return fmt::format("{}-", range.first);
}

} // namespace

CurlTransport::CurlTransport(TransportOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

void CurlTransport::applyCommonOptions(void* handle, const std::string& url) const {
    auto* curl = static_cast<CURL*>(handle);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.low_speed_time_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
}

ResponseHead CurlTransport::head(const std::string& url) {
    auto curl = detail::makeCurlHandle();

    TransferContext ctx;
    char error_buffer[CURL_ERROR_SIZE] = {};
    applyCommonOptions(curl.get(), url);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(describeFailure(res, error_buffer));
    }

    long code = 0;
    if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code != 0) {
        ctx.head.status = code;
    }
    spdlog::debug("HEAD {} -> {}", url, ctx.head.status);
    return ctx.head;
}

void CurlTransport::get(const std::string& url,
                        const std::optional<ByteRange>& range,
                        const HeadHandler& on_head,
                        const BodyHandler& on_body) {
    auto curl = detail::makeCurlHandle();

    TransferContext ctx;
    ctx.on_head = &on_head;
    ctx.on_body = &on_body;
    char error_buffer[CURL_ERROR_SIZE] = {};

    applyCommonOptions(curl.get(), url);
    std::string range_value;
    if (range) {
        range_value = rangeSpec(*range);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range_value.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, kReadBufferSize);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (ctx.stopped) {
        return;
    }
    if (res != CURLE_OK) {
        throw TransportError(describeFailure(res, error_buffer));
    }

    // Empty bodies never reach the write callback.
    if (!ctx.head_delivered) {
        long code = 0;
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code != 0) {
            ctx.head.status = code;
        }
        deliverHead(ctx);
    }
}

} // namespace rangeget

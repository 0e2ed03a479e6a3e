#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rangeget {

struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last; // inclusive, empty = to the end
};

// "bytes=0-249" or "bytes=250-".
[[nodiscard]] std::string formatRangeHeader(const ByteRange& range);

struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> accept_ranges;

    [[nodiscard]] bool isSuccess() const noexcept { return status >= 200 && status < 300; }
};

struct TransportOptions {
    std::string user_agent{"curl/7.81.0"};
    long connect_timeout_seconds{30};
    // Abort a transfer that stays below 1 byte/s for this long.
    long low_speed_time_seconds{60};
    bool follow_redirects{true};
};

/// Minimal HTTP client interface consumed by the download core.
///
/// Implementations must allow concurrent calls from several worker threads.
class HttpTransport {
public:
    // Returning false from a handler stops the transfer; get() then returns
    // normally and the caller keeps whatever state the handler recorded.
    using HeadHandler = std::function<bool(const ResponseHead&)>;
    using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpTransport() = default;

    // Throws TransportError when no response could be obtained.
    [[nodiscard]] virtual ResponseHead head(const std::string& url) = 0;

    /// Issues a GET, optionally restricted to `range`. `on_head` runs once
    /// before the first body byte (or after the transfer for an empty body),
    /// then `on_body` for every block read from the stream.
    /// Throws TransportError on connection or mid-stream failures.
    virtual void get(const std::string& url,
                     const std::optional<ByteRange>& range,
                     const HeadHandler& on_head,
                     const BodyHandler& on_body) = 0;
};

} // namespace rangeget

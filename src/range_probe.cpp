#include "rangeget/range_probe.hpp"
#include "rangeget/error.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

constexpr long kMethodNotAllowed = 405;
constexpr long kNotImplemented = 501;

bool acceptsByteRanges(const std::optional<std::string>& accept_ranges) {
    if (!accept_ranges || accept_ranges->empty()) {
        return false;
    }
    std::string value = *accept_ranges;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value != "none";
}

} // namespace

ResourceInfo RangeProbe::interpret(const ResponseHead& head) {
    ResourceInfo info;
    info.total_size = head.content_length;
    info.supports_ranges = acceptsByteRanges(head.accept_ranges);
    return info;
}

ResourceInfo RangeProbe::probe(const std::string& url) {
    ResponseHead head;
    try {
        head = transport_.head(url);
        if (head.status == kMethodNotAllowed || head.status == kNotImplemented) {
            spdlog::info("Server rejected HEAD with {}, probing with GET", head.status);
            head = headViaGet(url);
        }
    } catch (const TransportError& ex) {
        throw ProbeError(fmt::format("Cannot reach {}: {}", url, ex.what()));
    }

    if (!head.isSuccess()) {
        throw ProbeError(fmt::format("Server answered {} with HTTP {}", url, head.status));
    }

    const ResourceInfo info = interpret(head);
    if (info.total_size) {
        spdlog::info("Probed {}: content-length {}, ranges {}", url, *info.total_size,
                     info.supports_ranges ? "supported" : "not supported");
    } else {
        spdlog::info("Probed {}: content-length unknown, ranges {}", url,
                     info.supports_ranges ? "supported" : "not supported");
    }
    return info;
}

ResponseHead RangeProbe::headViaGet(const std::string& url) {
    ResponseHead captured;
    transport_.get(
        url, std::nullopt,
        [&captured](const ResponseHead& head) {
            captured = head;
            return false;
        },
        [](const char*, std::size_t) { return false; });
    return captured;
}

} // namespace rangeget

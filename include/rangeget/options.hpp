#pragma once

#include "http_transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangeget {

inline constexpr std::uint32_t kMaxThreads = 64;

struct Options {
    std::string url;
    std::uint32_t threads{2};
    std::optional<std::string> output;
    bool verbose{false};
    bool show_help{false};
    TransportOptions transport;
};

// Throws UsageError on unknown flags, missing values or a missing URL.
[[nodiscard]] Options parseOptions(int argc, const char* const* argv);

[[nodiscard]] std::string usage(std::string_view program);

// Last path segment of the URL, "index.html" when there is none. Throws UsageError for malformed URLs.
[[nodiscard]] std::string outputNameFromUrl(const std::string& url);

// `candidate` if it does not exist yet, otherwise the first free "name.N.ext".
[[nodiscard]] std::string uniqueOutputPath(const std::string& candidate);

// The explicit --output, or a free name derived from the URL.
[[nodiscard]] std::string resolveOutputPath(const Options& options);

} // namespace rangeget

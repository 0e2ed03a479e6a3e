#include "rangeget/detail/http_headers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace rangeget::detail {

namespace {

std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

void parseHeaderLine(std::string_view line, ResponseHead& head) {
    line = trim(line);
    if (line.rfind("HTTP/", 0) == 0) {
        head = ResponseHead{};
        const auto space = line.find(' ');
        if (space != std::string_view::npos) {
            const auto code = trim(line.substr(space + 1)).substr(0, 3);
            head.status = parseNumber<long>(code).value_or(0);
        }
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    const auto name = trim(line.substr(0, colon));
    const auto value = trim(line.substr(colon + 1));
    if (iequals(name, "Content-Length")) {
        head.content_length = parseNumber<std::uint64_t>(value);
    } else if (iequals(name, "Accept-Ranges")) {
        head.accept_ranges = std::string(value);
    }
}

} // namespace rangeget::detail

#include "rangeget/http_transport.hpp"

#include <fmt/format.h>

namespace rangeget {

std::string formatRangeHeader(const ByteRange& range) {
    if (range.last) {
        return fmt::format("bytes={}-{}", range.first, *range.last);
    }
    return fmt::format("bytes={}-", range.first);
}

} // namespace rangeget

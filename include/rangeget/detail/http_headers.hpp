#pragma once

#include "rangeget/http_transport.hpp"

#include <string_view>

namespace rangeget::detail {

/// Folds one raw header line into `head`. A status line starts a new response
/// (redirect chains), so only the final response's fields survive. Field names
/// are matched case-insensitively; unparsable Content-Length values are dropped.
void parseHeaderLine(std::string_view line, ResponseHead& head);

} // namespace rangeget::detail

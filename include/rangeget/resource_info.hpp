#pragma once

#include <cstdint>
#include <optional>

namespace rangeget {

struct ResourceInfo {
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
};

} // namespace rangeget

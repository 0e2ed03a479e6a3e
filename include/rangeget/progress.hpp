#pragma once

#include <cstdint>
#include <string>

namespace rangeget {

struct ChunkProgress {
    std::uint32_t index{0};
    std::string range;
    std::uint64_t total_bytes{0}; // 0 when unknown
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

} // namespace rangeget

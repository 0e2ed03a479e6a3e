#include "rangeget/events.hpp"

#include <utility>

namespace rangeget {

ChunkResult ChunkResult::success(std::uint32_t chunk_index, std::uint64_t bytes_written) {
    return ChunkResult{chunk_index, std::nullopt, {}, bytes_written};
}

ChunkResult ChunkResult::failure(std::uint32_t chunk_index,
                                 ChunkError error,
                                 std::string message,
                                 std::uint64_t bytes_written) {
    return ChunkResult{chunk_index, error, std::move(message), bytes_written};
}

} // namespace rangeget

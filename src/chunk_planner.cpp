#include "rangeget/chunk_planner.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace rangeget {

std::optional<std::uint64_t> ChunkSpec::endOffset() const noexcept {
    if (!length || *length == 0) {
        return std::nullopt;
    }
    return start_offset + *length - 1;
}

bool operator==(const ChunkSpec& lhs, const ChunkSpec& rhs) noexcept {
    return lhs.index == rhs.index && lhs.start_offset == rhs.start_offset &&
           lhs.length == rhs.length && lhs.ranged == rhs.ranged;
}

bool operator!=(const ChunkSpec& lhs, const ChunkSpec& rhs) noexcept {
    return !(lhs == rhs);
}

std::string describeRange(const ChunkSpec& chunk) {
    if (chunk.isEmpty()) {
        return "empty";
    }
    const auto end = chunk.endOffset();
    if (!end) {
        return fmt::format("{}-", chunk.start_offset);
    }
    return fmt::format("{}-{}", chunk.start_offset, *end);
}

std::vector<ChunkSpec> planChunks(std::optional<std::uint64_t> total_size,
                                  std::uint32_t requested_workers,
                                  bool supports_ranges) {
    std::vector<ChunkSpec> chunks;

    if (!total_size || *total_size == 0 || !supports_ranges) {
        chunks.push_back(ChunkSpec{0, 0, total_size, false});
        return chunks;
    }

    const std::uint64_t total = *total_size;
    const std::uint64_t workers = std::clamp<std::uint64_t>(requested_workers, 1, total);
    const std::uint64_t base = total / workers;
    const std::uint64_t remainder = total % workers;

    chunks.reserve(static_cast<std::size_t>(workers));
    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < workers; ++i) {
        const std::uint64_t size = base + (i < remainder ? 1 : 0);
        chunks.push_back(ChunkSpec{static_cast<std::uint32_t>(i), offset, size, true});
        offset += size;
    }
    return chunks;
}

} // namespace rangeget

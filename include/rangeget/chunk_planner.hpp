#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rangeget {

struct ChunkSpec {
    std::uint32_t index{0};
    std::uint64_t start_offset{0};
    // Number of bytes in the chunk, empty when the resource size is unknown.
    std::optional<std::uint64_t> length;
    // Whether the worker sends a Range header for this chunk.
    bool ranged{false};

    // Inclusive end offset, empty for unbounded or empty chunks.
    [[nodiscard]] std::optional<std::uint64_t> endOffset() const noexcept;
    [[nodiscard]] bool isEmpty() const noexcept { return length && *length == 0; }
};

bool operator==(const ChunkSpec& lhs, const ChunkSpec& rhs) noexcept;
bool operator!=(const ChunkSpec& lhs, const ChunkSpec& rhs) noexcept;

// "250-499", "0-" for unbounded chunks, "empty" for zero-length ones.
[[nodiscard]] std::string describeRange(const ChunkSpec& chunk);

/// Splits [0, total_size) into contiguous, non-overlapping chunks in ascending
/// offset order. The worker count is clamped to [1, total_size]; the division
/// remainder goes one byte each to the leading chunks.
///
/// A single unranged chunk is returned when the size is unknown or the server
/// does not accept ranges, and a single empty chunk when total_size is zero.
/// No I/O is performed: identical inputs always give identical plans.
[[nodiscard]] std::vector<ChunkSpec> planChunks(std::optional<std::uint64_t> total_size,
                                                std::uint32_t requested_workers,
                                                bool supports_ranges);

} // namespace rangeget

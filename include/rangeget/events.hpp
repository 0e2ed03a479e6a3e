#pragma once

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace rangeget {

struct ProgressEvent {
    std::uint32_t chunk_index{0};
    std::uint64_t bytes_since_last{0};
};

// Terminal report of one chunk, emitted exactly once.
struct ChunkResult {
    std::uint32_t chunk_index{0};
    std::optional<ChunkError> error;
    std::string message;
    std::uint64_t bytes_written{0};

    [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }

    static ChunkResult success(std::uint32_t chunk_index, std::uint64_t bytes_written);
    static ChunkResult failure(std::uint32_t chunk_index,
                               ChunkError error,
                               std::string message,
                               std::uint64_t bytes_written);
};

using WorkerEvent = std::variant<ProgressEvent, ChunkResult>;

} // namespace rangeget

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace rangeget {

/// Destination file shared by all workers of one download.
///
/// writeAt() may be called from several threads at once as long as their
/// offset ranges never overlap. The sink does not check this; the chunk plan
/// guarantees it.
class OutputSink {
public:
    // Creates or truncates `path`; a known size is allocated up front. Throws IoError.
    OutputSink(std::string path, std::optional<std::uint64_t> total_size);
    ~OutputSink();

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    // Positioned write of the whole buffer. Throws IoError.
    void writeAt(std::uint64_t offset, const char* data, std::size_t size);

    void sync();

    [[nodiscard]] std::uint64_t size() const;
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void preallocate(std::uint64_t total_size);

    std::string path_;
    int fd_{-1};
};

} // namespace rangeget

#pragma once

#include "download_listener.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace rangeget {

/// Console panel with one bar per chunk and an overall line, redrawn in place
/// at most every refresh interval.
class ProgressPanel final : public DownloadListener {
public:
    ProgressPanel(std::ostream& out, std::string title,
                  std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(200));

    void onPlanned(const ResourceInfo& resource, const std::vector<ChunkSpec>& chunks) override;
    void onProgress(const ProgressEvent& event, std::uint64_t downloaded_total) override;
    void onChunkFinished(const ChunkResult& result) override;
    void onStateChanged(DownloadState state) override;

    [[nodiscard]] std::string buildPanel() const;

    static std::string formatChunkLine(const ChunkProgress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void redraw(bool force);

    std::ostream& out_;
    std::string title_;
    std::chrono::milliseconds refresh_interval_;
    std::chrono::steady_clock::time_point last_draw_{};
    std::size_t previous_lines_{0};

    std::vector<ChunkProgress> chunks_;
    std::uint64_t total_bytes_{0};
    std::uint64_t downloaded_bytes_{0};
};

} // namespace rangeget

#include "rangeget/progress_panel.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

ProgressPanel::ProgressPanel(std::ostream& out, std::string title, std::chrono::milliseconds refresh_interval)
    : out_(out), title_(std::move(title)), refresh_interval_(refresh_interval) {}

void ProgressPanel::onPlanned(const ResourceInfo& resource, const std::vector<ChunkSpec>& chunks) {
    total_bytes_ = resource.total_size.value_or(0);
    downloaded_bytes_ = 0;
    chunks_.clear();
    chunks_.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ChunkProgress progress;
        progress.index = chunk.index;
        progress.range = describeRange(chunk);
        progress.total_bytes = chunk.length.value_or(0);
        progress.is_running = true;
        chunks_.push_back(std::move(progress));
    }
    redraw(true);
}

void ProgressPanel::onProgress(const ProgressEvent& event, std::uint64_t downloaded_total) {
    if (event.chunk_index < chunks_.size()) {
        chunks_[event.chunk_index].downloaded_bytes += event.bytes_since_last;
    }
    downloaded_bytes_ = downloaded_total;
    redraw(false);
}

void ProgressPanel::onChunkFinished(const ChunkResult& result) {
    if (result.chunk_index < chunks_.size()) {
        auto& progress = chunks_[result.chunk_index];
        progress.is_running = false;
        progress.downloaded_bytes = result.bytes_written;
        if (!result.succeeded()) {
            progress.has_error = true;
            progress.error_message = result.message;
        }
    }
    redraw(true);
}

void ProgressPanel::onStateChanged(DownloadState state) {
    if (state == DownloadState::Success || state == DownloadState::PartialFailure) {
        if (!chunks_.empty()) {
            redraw(true);
        }
        out_ << std::flush;
    }
}

std::string ProgressPanel::buildPanel() const {
    std::string panel;
    panel.reserve(chunks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("{} ({} chunks)\n", title_, chunks_.size());
    panel.append("--------------------------------------------------\n");

    for (const auto& progress : chunks_) {
        panel += formatChunkLine(progress);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (total_bytes_ > 0) {
        const double ratio = static_cast<double>(downloaded_bytes_) / static_cast<double>(total_bytes_);
        panel += fmt::format("Overall: {:>3}% ({}/{})", static_cast<int>(ratio * 100.0),
                             formatSize(downloaded_bytes_), formatSize(total_bytes_));
    } else {
        panel += fmt::format("Overall: {} (size unknown)", formatSize(downloaded_bytes_));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatChunkLine(const ChunkProgress& progress) {
    std::string line;
    line.reserve(256);

    const std::string label = fmt::format("#{} {}", progress.index, progress.range);

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<28} [{}] {:>3}% ({}/{})", label, bar, percent,
                            formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes));
    } else {
        line += fmt::format("{:<28} {}", label, formatSize(progress.downloaded_bytes));
    }

    if (progress.has_error) {
        line += fmt::format("  ❌ {}", progress.error_message);
    } else if (!progress.is_running) {
        line.append("  ✅ Done");
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    static constexpr const char* units[] = {"KB", "MB", "GB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

void ProgressPanel::redraw(bool force) {
    const auto now = std::chrono::steady_clock::now();
    if (!force && previous_lines_ > 0 && now - last_draw_ < refresh_interval_) {
        return;
    }
    last_draw_ = now;

    const auto panel = buildPanel();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace rangeget

#include "rangeget/report.hpp"

#include <fmt/format.h>

namespace rangeget {

std::string formatSummary(std::uint64_t bytes, std::chrono::duration<double> elapsed) {
    const double seconds = elapsed.count();
    const double speed = seconds > 0.0 ? static_cast<double>(bytes) / 1024.0 / 1024.0 / seconds : 0.0;
    return fmt::format("Downloaded {} bytes in {:.2f} seconds, speed: {:.2f} MB/s", bytes, seconds, speed);
}

std::string formatFailureReport(const DownloadOutcome& outcome, const std::string& destination) {
    std::string report;
    if (outcome.results.empty()) {
        report += fmt::format("Download failed: {}\n", outcome.error_message);
        return report;
    }

    if (!outcome.failed_chunks.empty()) {
        report += fmt::format("{} of {} chunks failed:\n", outcome.failed_chunks.size(), outcome.chunks.size());
        for (const auto index : outcome.failed_chunks) {
            const auto& chunk = outcome.chunks.at(index);
            const auto& result = outcome.results.at(index);
            report += fmt::format("  chunk {} [bytes {}]: {}: {}\n", index, describeRange(chunk),
                                  result.error ? toString(*result.error) : "unknown error", result.message);
        }
    }
    if (!outcome.error_message.empty()) {
        report += fmt::format("Error: {}\n", outcome.error_message);
    }
    report += fmt::format("Partial output left in {}\n", destination);
    return report;
}

} // namespace rangeget

#pragma once

#include "coordinator.hpp"

#include <chrono>
#include <string>

namespace rangeget {

// "Downloaded N bytes in S seconds, speed: X MB/s"
[[nodiscard]] std::string formatSummary(std::uint64_t bytes, std::chrono::duration<double> elapsed);

// One line per failed chunk with its byte range, error kind and message.
[[nodiscard]] std::string formatFailureReport(const DownloadOutcome& outcome, const std::string& destination);

} // namespace rangeget

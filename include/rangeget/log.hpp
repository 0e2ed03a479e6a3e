#pragma once

namespace rangeget::log {

// Makes the "rangeget" stderr logger spdlog's default. Level is warn, debug when verbose;
// SPDLOG_LEVEL in the environment overrides both.
void setup(bool verbose);

} // namespace rangeget::log

#include "rangeget/log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rangeget::log {

void setup(bool verbose) {
    auto logger = spdlog::get("rangeget");
    if (!logger) {
        logger = spdlog::stderr_color_mt("rangeget");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

} // namespace rangeget::log

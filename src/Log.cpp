/**
 * @file Log.cpp
 * @brief spdlog configuration
 */

#include "boardmerge/Log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace boardmerge {

void configure_logging(Verbosity verbosity) {
    auto logger = spdlog::get("boardmerge");
    if (!logger) {
        logger = spdlog::stderr_color_mt("boardmerge");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");

    switch (verbosity) {
        case Verbosity::Quiet:
            spdlog::set_level(spdlog::level::err);
            break;
        case Verbosity::Normal:
            spdlog::set_level(spdlog::level::warn);
            break;
        case Verbosity::Verbose:
            spdlog::set_level(spdlog::level::debug);
            break;
    }
}

} // namespace boardmerge

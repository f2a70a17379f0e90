/**
 * @file Log.hpp
 * @brief Logger setup for the command-line tool
 *
 * The library logs through spdlog's default logger. The tool routes it to
 * stderr and picks the level from the verbosity flags.
 */

#ifndef BOARDMERGE_LOG_HPP
#define BOARDMERGE_LOG_HPP

namespace boardmerge {

enum class Verbosity {
    Quiet,   ///< errors only
    Normal,  ///< warnings and errors
    Verbose  ///< per-input progress and renames
};

/**
 * @brief Install a colored stderr logger as the spdlog default
 *
 * Safe to call more than once; the logger is created on the first call.
 */
void configure_logging(Verbosity verbosity);

} // namespace boardmerge

#endif // BOARDMERGE_LOG_HPP

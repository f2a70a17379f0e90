/**
 * @file CommandLine.hpp
 * @brief Command-line parsing for the boardmerge tool
 *
 * Global options come first and are parsed with cxxopts. Everything from
 * the first non-option token on is the positional merge description
 * (output file followed by input groups), which has per-input options that
 * cxxopts cannot express and is handed to parse_merge_args().
 */

#ifndef BOARDMERGE_COMMANDLINE_HPP
#define BOARDMERGE_COMMANDLINE_HPP

#include "boardmerge/Layout.hpp"
#include "boardmerge/LibraryReconciler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boardmerge {

struct CommandLine {
    bool help = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<std::string> layout_path;
    std::optional<LibraryMode> library_mode;
    /// Output file and input groups, unparsed
    std::vector<std::string> merge_args;
};

/**
 * @brief Parse argv into global options and merge arguments
 *
 * Example:
 *   boardmerge -v --library-mode union out.json a.json b.json --offx 50mm
 *   → verbose, union mode, merge_args {"out.json", "a.json", "b.json",
 *     "--offx", "50mm"}
 *
 * @throws UsageError for unknown or malformed global options
 */
CommandLine parse_command_line(int argc, const char* const* argv);

/**
 * @brief Usage text (global options plus the positional form)
 */
std::string usage();

/**
 * @brief Turn a parsed command line into a layout
 *
 * Either a layout file or positional merge arguments must be given, not
 * both. An explicit --library-mode overrides the layout file.
 *
 * @throws UsageError, plus the loader's errors for a layout file
 */
Layout resolve_layout(const CommandLine& command_line);

} // namespace boardmerge

#endif // BOARDMERGE_COMMANDLINE_HPP

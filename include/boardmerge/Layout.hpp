/**
 * @file Layout.hpp
 * @brief Panel layout: output path, library mode and placed inputs
 *
 * A layout comes either from positional command-line groups
 *
 *     output-file [in-file [--offx X] [--offy Y] [--rotation R]]...
 *
 * or from a layout file (TOML or JSON):
 *
 * ```toml
 * output = "panel.json"
 * library_mode = "strict"
 *
 * [[input]]
 * path = "a.json"
 *
 * [[input]]
 * path = "b.json"
 * offx = "50mm"
 * offy = "0mm"
 * rotation = 90
 * ```
 */

#ifndef BOARDMERGE_LAYOUT_HPP
#define BOARDMERGE_LAYOUT_HPP

#include "boardmerge/Geometry.hpp"
#include "boardmerge/LibraryReconciler.hpp"
#include "boardmerge/Value.hpp"

#include <string>
#include <vector>

namespace boardmerge {

struct InputSpec {
    std::string path;
    Placement placement;
};

struct Layout {
    std::string output;
    LibraryMode library_mode = LibraryMode::Strict;
    std::vector<InputSpec> inputs;
};

/**
 * @brief Parse positional merge arguments
 *
 * Each option applies to the input file preceding it.
 *
 * Example:
 *   {"out.json", "a.json", "b.json", "--offx", "50mm", "--rotation", "90"}
 *   → output "out.json"; a.json at origin; b.json rotated 90° and
 *     shifted by 50mm in x
 *
 * @throws UsageError for missing values, unknown options, options before
 *         the first input, or when no input is given
 */
Layout parse_merge_args(const std::vector<std::string>& args);

/**
 * @brief Build a layout from a decoded layout file
 *
 * @param v Layout object (see file comment for keys)
 * @param source Label for error messages
 * @throws UsageError for unknown keys or malformed values
 */
Layout layout_from_value(const Value& v, const std::string& source);

/**
 * @brief Load a layout file (.toml or .json)
 *
 * Relative input and output paths are resolved against the directory of
 * the layout file.
 *
 * @throws FileNotFoundError, DocumentFormatError, UsageError
 */
Layout load_layout(const std::string& path);

} // namespace boardmerge

#endif // BOARDMERGE_LAYOUT_HPP

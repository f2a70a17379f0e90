/**
 * @file Diff.hpp
 * @brief Structural comparison of value trees with dot-path reporting
 *
 * Used wherever two inputs must agree on a definition: libraries, design
 * rules and the board-global sections. The comparison walks the trees
 * recursively; objects are compared key by key (key order never matters),
 * arrays element by element unless the caller asks for an unordered
 * comparison.
 *
 * Paths use dots for object keys and brackets for array indices:
 * "packages.R0805.primitives[2].dx".
 */

#ifndef BOARDMERGE_DIFF_HPP
#define BOARDMERGE_DIFF_HPP

#include "boardmerge/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace boardmerge {

/**
 * @brief First point where two trees disagree
 */
struct Divergence {
    /// Dot-path of the divergence, empty for the root
    std::string path;
    /// Rendering of the existing side ("<missing>" if absent)
    std::string existing;
    /// Rendering of the incoming side ("<missing>" if absent)
    std::string incoming;

    /**
     * @brief One-line description: "existing X, incoming Y"
     */
    std::string describe() const;
};

/**
 * @brief Append an object key to a path
 *
 * Examples:
 * - ("", "packages") → "packages"
 * - ("packages", "R0805") → "packages.R0805"
 */
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Append an array index to a path
 *
 * Example: ("primitives", 2) → "primitives[2]"
 */
std::string index_path(const std::string& parent, size_t index);

/**
 * @brief Compare two trees, returning the first divergence
 *
 * Numbers compare by value, so 1 and 1.0 are equal.
 *
 * @param existing Tree already committed to the output
 * @param incoming Tree from the input being merged
 * @param path Path prefix used in the report
 * @return nullopt if the trees are equal
 */
std::optional<Divergence> first_divergence(const Value& existing,
                                           const Value& incoming,
                                           const std::string& path = "");

/**
 * @brief Compare two arrays as multisets
 *
 * Both arrays are sorted before the element-wise comparison, so element
 * order does not matter. Reported indices refer to the sorted order.
 */
std::optional<Divergence> first_divergence_unordered(const Value& existing,
                                                     const Value& incoming,
                                                     const std::string& path = "");

/**
 * @brief Compact rendering of a value for diagnostics
 */
std::string render_value(const Value& v);

} // namespace boardmerge

#endif // BOARDMERGE_DIFF_HPP

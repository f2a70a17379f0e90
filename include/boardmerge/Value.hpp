/**
 * @file Value.hpp
 * @brief Value type for board and layout data
 *
 * Uses nlohmann::json as the underlying value model for:
 * - The on-disk board document rendition
 * - Opaque board sections (grid, autorouter, attributes, ...)
 * - Unrecognised keys kept for the feature gate
 * - Layout files after TOML conversion
 */

#ifndef BOARDMERGE_VALUE_HPP
#define BOARDMERGE_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace boardmerge {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. Objects are ordered by key, which makes
 * structural comparison insensitive to key order.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Whether a Value is an integer that converts to int without loss
 *
 * Floats never fit, even when integral (1.0), and neither do integers
 * outside the range of int.
 */
inline bool fits_int(const Value& val) {
    if (val.is_number_unsigned()) {
        return val.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    if (val.is_number_integer()) {
        const std::int64_t n = val.get<std::int64_t>();
        return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
    }
    return false;
}

} // namespace boardmerge

#endif // BOARDMERGE_VALUE_HPP

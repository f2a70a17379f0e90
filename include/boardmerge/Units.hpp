/**
 * @file Units.hpp
 * @brief Internal linear unit and millimetre conversion
 *
 * All coordinates and sizes are held as integer nanometres so that
 * right-angle rotations and repeated transforms are exact.
 */

#ifndef BOARDMERGE_UNITS_HPP
#define BOARDMERGE_UNITS_HPP

#include <cstdint>
#include <string>

namespace boardmerge {

/// Linear coordinate in nanometres
using Coord = std::int64_t;

/// Exact conversion factor: internal units per millimetre
constexpr Coord kUnitsPerMillimeter = 1000000;

/// Largest accepted magnitude in millimetres. Leaves room in Coord for
/// a rotated coordinate plus an offset of the same size.
constexpr double kMaxMillimeters = 1e9;

/**
 * @brief Convert millimetres to internal units (round to nearest)
 *
 * @throws std::out_of_range if the value is not finite or its magnitude
 *         exceeds kMaxMillimeters
 */
Coord mm_to_coord(double mm);

/**
 * @brief Convert internal units to millimetres
 */
double coord_to_mm(Coord c);

/**
 * @brief Parse an offset with a mandatory "mm" suffix
 *
 * Examples:
 * - "50mm" → 50000000
 * - "-12.5mm" → -12500000
 * - "50" → throws UsageError (units forgotten)
 * - "1e20mm" → throws UsageError (out of range)
 *
 * @param text Offset text
 * @return Offset in internal units
 * @throws UsageError if the text is not a number followed by "mm",
 *         or the number is out of range
 */
Coord parse_offset(const std::string& text);

} // namespace boardmerge

#endif // BOARDMERGE_UNITS_HPP

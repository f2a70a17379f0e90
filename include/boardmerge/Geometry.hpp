/**
 * @file Geometry.hpp
 * @brief Right-angle rotations, placements and orientation attributes
 *
 * Rotations are restricted to multiples of 90 degrees and are applied by
 * swapping and negating coordinates, so no trigonometric error accumulates.
 */

#ifndef BOARDMERGE_GEOMETRY_HPP
#define BOARDMERGE_GEOMETRY_HPP

#include "boardmerge/Units.hpp"
#include <optional>
#include <string>

namespace boardmerge {

/**
 * @brief Counter-clockwise rotation by a right angle
 */
enum class Rotation {
    R0,
    R90,
    R180,
    R270
};

/**
 * @brief Rotation angle in degrees (0, 90, 180 or 270)
 */
int to_degrees(Rotation r) noexcept;

/**
 * @brief Map degrees to a Rotation
 * @throws UsageError unless degrees is 0, 90, 180 or 270
 */
Rotation rotation_from_degrees(int degrees);

/**
 * @brief Parse a rotation argument ("0", "90", "180", "270")
 * @throws UsageError for any other text
 */
Rotation parse_rotation(const std::string& text);

/**
 * @brief Rotation equivalent to applying a then b
 */
Rotation compose(Rotation a, Rotation b) noexcept;

struct Point {
    Coord x = 0;
    Coord y = 0;

    bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Rotate a point about the origin
 *
 * - R90:  (x, y) → (-y, x)
 * - R180: (x, y) → (-x, -y)
 * - R270: (x, y) → (y, -x)
 */
Point rotate(Point p, Rotation r) noexcept;

/**
 * @brief Rotation followed by translation, applied to one input board
 */
struct Placement {
    Rotation rotation = Rotation::R0;
    Point offset;

    /**
     * @brief Build a placement from millimetre offsets
     */
    static Placement from_millimeters(double offx, double offy, Rotation rotation = Rotation::R0);

    /**
     * @brief Rotate p about the origin, then translate by offset
     */
    Point apply(Point p) const noexcept;

    bool is_identity() const noexcept {
        return rotation == Rotation::R0 && offset.x == 0 && offset.y == 0;
    }
};

/**
 * @brief Parsed orientation attribute of the board format
 *
 * The textual form is an optional flag prefix followed by an integer angle,
 * e.g. "R90", "MR180", "SR0". "M" mirrors the construct to the other side of
 * the board, "S" marks spin (text never drawn upside down).
 */
struct Orientation {
    std::string prefix = "R";
    int angle = 0;

    /**
     * @brief Parse an orientation attribute
     *
     * An empty string is the default "R0". Prefix letters are limited to
     * M, S and R; the angle must be below 360.
     *
     * @return Parsed orientation, or nullopt if the text is malformed
     */
    static std::optional<Orientation> parse(const std::string& text);

    bool mirrored() const noexcept {
        return prefix.find('M') != std::string::npos;
    }

    /**
     * @brief Orientation after rotating the board by r
     *
     * Mirrored constructs are rotated in the opposite direction.
     */
    Orientation rotated(Rotation r) const;

    std::string str() const;
};

/**
 * @brief Rotate an orientation attribute text by r
 *
 * "R0" is the default and is always returned as the empty (absent) text;
 * the document codec applies the same normalisation on input.
 *
 * @return The new attribute text, or nullopt if the input does not parse
 */
std::optional<std::string> rotate_orientation(const std::string& text, Rotation r);

} // namespace boardmerge

#endif // BOARDMERGE_GEOMETRY_HPP

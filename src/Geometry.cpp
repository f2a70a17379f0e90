/**
 * @file Geometry.cpp
 * @brief Implementation of right-angle geometry helpers
 */

#include "boardmerge/Geometry.hpp"
#include "boardmerge/Errors.hpp"

#include <cctype>
#include <stdexcept>

namespace boardmerge {

int to_degrees(Rotation r) noexcept {
    switch (r) {
        case Rotation::R0: return 0;
        case Rotation::R90: return 90;
        case Rotation::R180: return 180;
        case Rotation::R270: return 270;
    }
    return 0;
}

Rotation rotation_from_degrees(int degrees) {
    switch (degrees) {
        case 0: return Rotation::R0;
        case 90: return Rotation::R90;
        case 180: return Rotation::R180;
        case 270: return Rotation::R270;
        default: break;
    }
    throw UsageError("Can't use " + std::to_string(degrees) +
                     " as a rotation value. Supported rotations are 0, 90, 180, 270.");
}

Rotation parse_rotation(const std::string& text) {
    if (text == "0") return Rotation::R0;
    if (text == "90") return Rotation::R90;
    if (text == "180") return Rotation::R180;
    if (text == "270") return Rotation::R270;
    throw UsageError("Can't parse '" + text +
                     "' as a rotation value. Supported rotations are 0, 90, 180, 270.");
}

Rotation compose(Rotation a, Rotation b) noexcept {
    int deg = (to_degrees(a) + to_degrees(b)) % 360;
    switch (deg) {
        case 90: return Rotation::R90;
        case 180: return Rotation::R180;
        case 270: return Rotation::R270;
        default: return Rotation::R0;
    }
}

Point rotate(Point p, Rotation r) noexcept {
    switch (r) {
        case Rotation::R0:
            return p;
        case Rotation::R90:
            return Point{-p.y, p.x};
        case Rotation::R180:
            return Point{-p.x, -p.y};
        case Rotation::R270:
            return Point{p.y, -p.x};
    }
    return p;
}

Placement Placement::from_millimeters(double offx, double offy, Rotation rotation) {
    Placement placement;
    placement.rotation = rotation;
    placement.offset = Point{mm_to_coord(offx), mm_to_coord(offy)};
    return placement;
}

Point Placement::apply(Point p) const noexcept {
    Point q = rotate(p, rotation);
    q.x += offset.x;
    q.y += offset.y;
    return q;
}

// ============================================================================
// Orientation
// ============================================================================

std::optional<Orientation> Orientation::parse(const std::string& text) {
    Orientation o;
    if (text.empty()) {
        return o;
    }

    size_t i = 0;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
        char c = text[i];
        if (c != 'M' && c != 'S' && c != 'R') {
            return std::nullopt;
        }
        ++i;
    }
    if (i == text.size()) {
        return std::nullopt;
    }
    for (size_t j = i; j < text.size(); ++j) {
        if (!std::isdigit(static_cast<unsigned char>(text[j]))) {
            return std::nullopt;
        }
    }

    o.prefix = text.substr(0, i);
    try {
        o.angle = std::stoi(text.substr(i));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (o.angle >= 360) {
        return std::nullopt;
    }
    return o;
}

Orientation Orientation::rotated(Rotation r) const {
    Orientation o = *this;
    const int delta = to_degrees(r);
    if (mirrored()) {
        o.angle = ((angle - delta) % 360 + 360) % 360;
    } else {
        o.angle = (angle + delta) % 360;
    }
    return o;
}

std::string Orientation::str() const {
    return prefix + std::to_string(angle);
}

std::optional<std::string> rotate_orientation(const std::string& text, Rotation r) {
    auto parsed = Orientation::parse(text);
    if (!parsed) {
        return std::nullopt;
    }
    if (r == Rotation::R0) {
        return text;
    }
    std::string result = parsed->rotated(r).str();
    if (result == "R0") {
        return std::string();
    }
    return result;
}

} // namespace boardmerge

/**
 * @file Units.cpp
 * @brief Implementation of unit conversion
 */

#include "boardmerge/Units.hpp"
#include "boardmerge/Errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace boardmerge {

Coord mm_to_coord(double mm) {
    if (!std::isfinite(mm) || std::fabs(mm) > kMaxMillimeters) {
        throw std::out_of_range("coordinate " + std::to_string(mm) +
                                "mm is outside the supported range");
    }
    return static_cast<Coord>(std::llround(mm * static_cast<double>(kUnitsPerMillimeter)));
}

double coord_to_mm(Coord c) {
    return static_cast<double>(c) / static_cast<double>(kUnitsPerMillimeter);
}

Coord parse_offset(const std::string& text) {
    const std::string suffix = "mm";
    if (text.size() > suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
        const std::string number = text.substr(0, text.size() - suffix.size());
        double mm = 0.0;
        size_t consumed = 0;
        try {
            mm = std::stod(number, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0; // invalid_argument / out_of_range fall through to the usage error
        }
        if (consumed > 0 && consumed == number.size()) {
            try {
                return mm_to_coord(mm);
            } catch (const std::out_of_range& e) {
                throw UsageError("Offset '" + text + "' is too large: " + e.what());
            }
        }
    }
    throw UsageError("Can't parse '" + text + "' as an offset value. Were units forgotten?");
}

} // namespace boardmerge

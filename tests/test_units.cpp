/**
 * @file test_units.cpp
 * @brief Tests for millimetre conversion and offset parsing
 */

#include <gtest/gtest.h>
#include "boardmerge/Errors.hpp"
#include "boardmerge/Units.hpp"

#include <limits>
#include <stdexcept>

using namespace boardmerge;

TEST(Units, MillimetresToInternal) {
    EXPECT_EQ(mm_to_coord(1.0), 1000000);
    EXPECT_EQ(mm_to_coord(-12.5), -12500000);
    EXPECT_EQ(mm_to_coord(0.95), 950000);
    EXPECT_EQ(mm_to_coord(0.0), 0);
}

TEST(Units, MillimetresOutOfRange) {
    EXPECT_EQ(mm_to_coord(kMaxMillimeters), 1000000000LL * kUnitsPerMillimeter);
    EXPECT_THROW(mm_to_coord(1e20), std::out_of_range);
    EXPECT_THROW(mm_to_coord(-1e20), std::out_of_range);
    EXPECT_THROW(mm_to_coord(std::numeric_limits<double>::infinity()), std::out_of_range);
    EXPECT_THROW(mm_to_coord(std::numeric_limits<double>::quiet_NaN()), std::out_of_range);
}

TEST(Units, InternalToMillimetres) {
    EXPECT_DOUBLE_EQ(coord_to_mm(2500000), 2.5);
    EXPECT_DOUBLE_EQ(coord_to_mm(-950000), -0.95);
}

TEST(Units, ParseOffsetWithUnits) {
    EXPECT_EQ(parse_offset("50mm"), 50 * kUnitsPerMillimeter);
    EXPECT_EQ(parse_offset("-12.5mm"), -12500000);
    EXPECT_EQ(parse_offset("0mm"), 0);
}

TEST(Units, ParseOffsetRejectsMissingUnits) {
    EXPECT_THROW(parse_offset("50"), UsageError);
    EXPECT_THROW(parse_offset("50in"), UsageError);
}

TEST(Units, ParseOffsetRejectsGarbage) {
    EXPECT_THROW(parse_offset(""), UsageError);
    EXPECT_THROW(parse_offset("mm"), UsageError);
    EXPECT_THROW(parse_offset("abcmm"), UsageError);
    EXPECT_THROW(parse_offset("50 mm"), UsageError);
    EXPECT_THROW(parse_offset("5x0mm"), UsageError);
}

TEST(Units, ParseOffsetRejectsHugeValues) {
    EXPECT_THROW(parse_offset("1e20mm"), UsageError);
    EXPECT_THROW(parse_offset("-1e20mm"), UsageError);
    EXPECT_THROW(parse_offset("infmm"), UsageError);
    EXPECT_EQ(parse_offset("1e6mm"), 1000000LL * kUnitsPerMillimeter);
}

TEST(Units, ParseOffsetErrorMentionsUnits) {
    try {
        parse_offset("50");
        FAIL() << "Expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_NE(std::string(e.what()).find("Were units forgotten?"), std::string::npos);
    }
}

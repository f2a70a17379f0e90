/**
 * @file test_document.cpp
 * @brief Tests for the board document model and its JSON codec
 */

#include <gtest/gtest.h>
#include "boardmerge/Document.hpp"
#include "boardmerge/Errors.hpp"
#include "boardmerge/Loader.hpp"
#include "test_boards.hpp"

using namespace boardmerge;
using namespace boardmerge::fixtures;

// ============================================================================
// Decoding
// ============================================================================

TEST(DocumentCodec, DecodesSampleBoard) {
    Document doc = sample_board();
    EXPECT_EQ(doc.version, "9.6.2");
    EXPECT_EQ(doc.layers.size(), 5u);
    ASSERT_EQ(doc.libraries.size(), 1u);
    EXPECT_EQ(doc.libraries[0].packages.at(0).primitives.size(), 3u);
    ASSERT_TRUE(doc.designrules.has_value());
    EXPECT_EQ(doc.designrules->params.at("msDrill"), "0.35mm");

    const Element* u1 = doc.find_element("U1");
    ASSERT_NE(u1, nullptr);
    EXPECT_EQ(u1->library, "RES");
    EXPECT_EQ(u1->value, "10k");
    EXPECT_EQ(u1->position, (Point{mm(10.0), mm(5.0)}));
    EXPECT_TRUE(u1->extensions.empty());
}

TEST(DocumentCodec, PrimitiveFieldsAreTyped) {
    Document doc = sample_board();
    const Primitive& smd = doc.libraries[0].packages[0].primitives[0];
    EXPECT_EQ(smd.type, "smd");
    ASSERT_EQ(smd.points.size(), 1u);
    EXPECT_EQ(smd.points[0], (Point{mm(-0.95), 0}));
    EXPECT_EQ(smd.props.at("name"), "1");
    EXPECT_EQ(smd.layer(), std::optional<int>(1));
    EXPECT_TRUE(smd.extensions.empty());
}

TEST(DocumentCodec, ExplicitZeroRotationIsAbsent) {
    Value j = sample_board_json();
    j["elements"][0]["rot"] = "R0";
    Document doc = board_from(j);
    EXPECT_EQ(doc.elements[0].rot, "");
    EXPECT_TRUE(doc == sample_board());
}

TEST(DocumentCodec, UnknownKeysBecomeExtensions) {
    Value j = sample_board_json();
    j["elements"][0]["foo"] = 1;
    j["modules"] = Value::array();
    Document doc = board_from(j);
    EXPECT_EQ(doc.elements[0].extensions.count("foo"), 1u);
    EXPECT_EQ(doc.extensions.count("modules"), 1u);
}

TEST(DocumentCodec, UnknownPrimitiveKeptWhole) {
    Value j = sample_board_json();
    j["plain"].push_back({{"type", "arc"}, {"x", 1.0}, {"radius", 2.0}});
    Document doc = board_from(j);

    const Primitive& arc = doc.plain.at(1);
    EXPECT_EQ(arc.type, "arc");
    EXPECT_TRUE(arc.points.empty());
    EXPECT_EQ(arc.extensions.size(), 2u);
    EXPECT_EQ(arc.extensions.at("radius"), 2.0);
}

TEST(DocumentCodec, EncodeDecodeKeepsDocument) {
    Document doc = sample_board();
    Document again = board_from(Value(doc));
    EXPECT_TRUE(again == doc);
}

TEST(DocumentCodec, EncodesSignalKeys) {
    Value j = Value(sample_board());
    ASSERT_TRUE(j["signals"][0].contains("contactrefs"));
    EXPECT_EQ(j["signals"][0]["contactrefs"][0]["element"], "U1");
    EXPECT_EQ(j["elements"][0]["x"], 10.0);
    EXPECT_FALSE(j["elements"][0].contains("rot"));
}

TEST(DocumentCodec, LabelRoundTrips) {
    Value j = sample_board_json();
    j["elements"][0]["label"] = "R7";
    Document doc = board_from(j);
    ASSERT_TRUE(doc.elements[0].label.has_value());
    EXPECT_EQ(doc.elements[0].display_label(), "R7");
    EXPECT_EQ(Value(doc)["elements"][0]["label"], "R7");
}

// ============================================================================
// Format errors
// ============================================================================

TEST(DocumentCodec, RootMustBeObject) {
    EXPECT_THROW(parse_document(Value::array(), "x"), DocumentFormatError);
}

TEST(DocumentCodec, MissingRequiredKey) {
    Value j = sample_board_json();
    j["elements"][0].erase("library");
    EXPECT_THROW(board_from(j), DocumentFormatError);
}

TEST(DocumentCodec, WrongValueType) {
    Value j = sample_board_json();
    j["elements"][0]["x"] = "ten";
    try {
        board_from(j);
        FAIL() << "Expected DocumentFormatError";
    } catch (const DocumentFormatError& e) {
        EXPECT_EQ(e.file(), "sample");
    }
}

TEST(DocumentCodec, CoordinateOutOfRange) {
    Value j = sample_board_json();
    j["elements"][0]["x"] = 1e20;
    try {
        board_from(j);
        FAIL() << "Expected DocumentFormatError";
    } catch (const DocumentFormatError& e) {
        EXPECT_EQ(e.file(), "sample");
        EXPECT_NE(e.details().find("outside the supported range"), std::string::npos);
    }

    j = sample_board_json();
    j["signals"][0]["routing"][0]["x2"] = -1e20;
    EXPECT_THROW(board_from(j), DocumentFormatError);
}

TEST(DocumentCodec, LayerNumberMustFitInt) {
    Value j = sample_board_json();
    j["layers"][0]["number"] = 4294967297LL;
    EXPECT_THROW(board_from(j), DocumentFormatError);

    j = sample_board_json();
    j["layers"][0]["number"] = 1.5;
    EXPECT_THROW(board_from(j), DocumentFormatError);
}

TEST(DocumentLookup, PrimitiveLayerOutOfIntRange) {
    Value j = sample_board_json();
    j["plain"][0]["layer"] = 4294967297LL;
    Document doc = board_from(j);
    EXPECT_FALSE(doc.plain[0].layer().has_value());
}

// ============================================================================
// Lookups
// ============================================================================

TEST(DocumentLookup, FindByName) {
    Document doc = sample_board();
    EXPECT_NE(doc.find_library("RES"), nullptr);
    EXPECT_EQ(doc.find_library("CAP"), nullptr);
    EXPECT_NE(doc.find_signal("GND"), nullptr);
    EXPECT_NE(doc.find_layer(20), nullptr);
    EXPECT_EQ(doc.find_layer(2), nullptr);
    EXPECT_NE(doc.libraries[0].find_package("R0805"), nullptr);
    EXPECT_EQ(doc.elements[0].display_label(), "U1");
}

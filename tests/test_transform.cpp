/**
 * @file test_transform.cpp
 * @brief Tests for the document geometry transform
 */

#include <gtest/gtest.h>
#include "boardmerge/Errors.hpp"
#include "boardmerge/Transform.hpp"
#include "test_boards.hpp"

using namespace boardmerge;
using namespace boardmerge::fixtures;

TEST(Transform, IdentityLeavesDocumentUnchanged) {
    Document doc = sample_board();
    Document result = transform_document(doc, Placement{});
    EXPECT_TRUE(result == doc);
}

TEST(Transform, FourQuarterTurnsAreIdentity) {
    Document doc = sample_board();
    Placement quarter;
    quarter.rotation = Rotation::R90;

    Document result = doc;
    for (int i = 0; i < 4; ++i) {
        result = transform_document(result, quarter);
    }
    EXPECT_TRUE(result == doc);
}

TEST(Transform, RotatesThenShiftsElements) {
    Document doc = sample_board();
    Document result = transform_document(doc, Placement::from_millimeters(50.0, 0.0, Rotation::R90));

    const Element& u1 = result.elements.at(0);
    EXPECT_EQ(u1.position, (Point{mm(45.0), mm(10.0)}));
    EXPECT_EQ(u1.rot, "R90");

    const ElementAttribute* name = u1.find_attribute("NAME");
    ASSERT_NE(name, nullptr);
    ASSERT_TRUE(name->position.has_value());
    EXPECT_EQ(*name->position, (Point{mm(43.5), mm(10.0)}));
    EXPECT_EQ(name->rot, "R90");
}

TEST(Transform, MovesPlainAndRouting) {
    Document doc = sample_board();
    Document result = transform_document(doc, Placement::from_millimeters(5.0, -5.0));

    const Primitive& outline = result.plain.at(0);
    ASSERT_EQ(outline.points.size(), 2u);
    EXPECT_EQ(outline.points[0], (Point{mm(5.0), mm(-5.0)}));
    EXPECT_EQ(outline.points[1], (Point{mm(45.0), mm(-5.0)}));

    const Primitive& trace = result.signals.at(0).routing.at(0);
    EXPECT_EQ(trace.points[0], (Point{mm(15.0), mm(0.0)}));
    EXPECT_EQ(trace.points[1], (Point{mm(25.0), mm(0.0)}));
}

TEST(Transform, LibraryPackagesStayLocal) {
    Document doc = sample_board();
    Document result = transform_document(doc, Placement::from_millimeters(50.0, 20.0, Rotation::R180));
    EXPECT_TRUE(result.libraries == doc.libraries);
}

TEST(Transform, PolygonVertices) {
    Value j = sample_board_json();
    j["plain"].push_back({
        {"type", "polygon"}, {"width", 0.2}, {"layer", 1},
        {"vertices", Value::array({
            {{"x", 1.0}, {"y", 0.0}},
            {{"x", 2.0}, {"y", 0.0}, {"curve", 90.0}},
            {{"x", 2.0}, {"y", 1.0}},
        })},
    });
    Document result = transform_document(board_from(j), Placement{Rotation::R90, Point{}});

    const Primitive& polygon = result.plain.at(1);
    ASSERT_EQ(polygon.vertices.size(), 3u);
    EXPECT_EQ(polygon.vertices[0].position, (Point{mm(0.0), mm(1.0)}));
    EXPECT_EQ(polygon.vertices[2].position, (Point{mm(-1.0), mm(2.0)}));
    EXPECT_EQ(polygon.vertices[1].props.at("curve"), 90.0);
}

TEST(Transform, PlainTextRotates) {
    Value j = sample_board_json();
    j["plain"].push_back({{"type", "text"}, {"x", 1.0}, {"y", 1.0}, {"text", "A"},
                          {"size", 1.0}, {"layer", 21}, {"rot", "R90"}});
    Document result = transform_document(board_from(j), Placement{Rotation::R180, Point{}});
    EXPECT_EQ(result.plain.at(1).rot, "R270");
    EXPECT_EQ(result.plain.at(1).points.at(0), (Point{mm(-1.0), mm(-1.0)}));
}

TEST(Transform, RectangleKeepsItsOwnRotation) {
    Value j = sample_board_json();
    j["plain"].push_back({{"type", "rectangle"}, {"x1", 0.0}, {"y1", 0.0}, {"x2", 2.0},
                          {"y2", 1.0}, {"layer", 21}, {"rot", "R45"}});
    Document result = transform_document(board_from(j), Placement{Rotation::R90, Point{}});

    const Primitive& rect = result.plain.at(1);
    EXPECT_EQ(rect.rot, "R45");
    EXPECT_EQ(rect.points.at(1), (Point{mm(-1.0), mm(2.0)}));
}

TEST(Transform, MirroredElementTurnsTheOtherWay) {
    Document doc = sample_board();
    doc.elements[0].rot = "MR0";
    Document result = transform_document(doc, Placement{Rotation::R90, Point{}});
    EXPECT_EQ(result.elements[0].rot, "MR270");
}

TEST(Transform, MalformedRotationIsUnsupported) {
    Document doc = sample_board();
    doc.elements[0].rot = "R45x";
    try {
        transform_document(doc, Placement{Rotation::R90, Point{}});
        FAIL() << "Expected UnsupportedFeatureError";
    } catch (const UnsupportedFeatureError& e) {
        EXPECT_EQ(e.construct(), "elements.U1.rot");
    }
}

TEST(Transform, SourceIsNotModified) {
    Document doc = sample_board();
    const Document copy = doc;
    transform_document(doc, Placement::from_millimeters(1.0, 2.0, Rotation::R270));
    EXPECT_TRUE(doc == copy);
}

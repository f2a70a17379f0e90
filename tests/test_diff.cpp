/**
 * @file test_diff.cpp
 * @brief Tests for structural comparison and path reporting
 */

#include <gtest/gtest.h>
#include "boardmerge/Diff.hpp"

using namespace boardmerge;

// ============================================================================
// Paths
// ============================================================================

TEST(DiffPath, ChildAndIndex) {
    EXPECT_EQ(child_path("", "packages"), "packages");
    EXPECT_EQ(child_path("packages", "R0805"), "packages.R0805");
    EXPECT_EQ(index_path("primitives", 2), "primitives[2]");
}

// ============================================================================
// Ordered comparison
// ============================================================================

TEST(FirstDivergence, EqualTrees) {
    Value a = {{"x", 1}, {"y", {1, 2, 3}}};
    EXPECT_FALSE(first_divergence(a, a).has_value());
}

TEST(FirstDivergence, NumbersCompareByValue) {
    EXPECT_FALSE(first_divergence(Value(1), Value(1.0)).has_value());
}

TEST(FirstDivergence, NestedScalar) {
    Value a = {{"a", {{"b", 1}}}};
    Value b = {{"a", {{"b", 2}}}};
    auto d = first_divergence(a, b);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "a.b");
    EXPECT_EQ(d->existing, "1");
    EXPECT_EQ(d->incoming, "2");
    EXPECT_EQ(d->describe(), "existing 1, incoming 2");
}

TEST(FirstDivergence, MissingKey) {
    Value a = {{"a", 1}};
    Value b = {{"a", 1}, {"c", 2}};
    auto d = first_divergence(a, b, "lib");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "lib.c");
    EXPECT_EQ(d->existing, "<missing>");
    EXPECT_EQ(d->incoming, "2");
}

TEST(FirstDivergence, ArrayElement) {
    Value a = {{"a", {1, 2}}};
    Value b = {{"a", {1, 3}}};
    auto d = first_divergence(a, b);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "a[1]");
}

TEST(FirstDivergence, ArrayLength) {
    auto d = first_divergence(Value::array({1}), Value::array({1, 2}));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "[1]");
    EXPECT_EQ(d->existing, "<missing>");
}

TEST(FirstDivergence, KindMismatch) {
    auto d = first_divergence(Value::object(), Value::array(), "grid");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "grid");
    EXPECT_EQ(d->existing, "{}");
    EXPECT_EQ(d->incoming, "[]");
}

// ============================================================================
// Unordered comparison
// ============================================================================

TEST(FirstDivergenceUnordered, OrderDoesNotMatter) {
    Value a = Value::array({{{"type", "smd"}, {"x", 1}}, {{"type", "wire"}}});
    Value b = Value::array({{{"type", "wire"}}, {{"type", "smd"}, {"x", 1}}});
    EXPECT_FALSE(first_divergence_unordered(a, b).has_value());
    EXPECT_TRUE(first_divergence(a, b).has_value());
}

TEST(FirstDivergenceUnordered, ContentStillMatters) {
    Value a = Value::array({1, 2, 2});
    Value b = Value::array({2, 1, 1});
    EXPECT_TRUE(first_divergence_unordered(a, b).has_value());
}

TEST(RenderValue, Truncates) {
    std::string text = render_value(Value(std::string(500, 'x')));
    EXPECT_LT(text.size(), 500u);
    EXPECT_EQ(text.substr(text.size() - 3), "...");
}

/**
 * @file test_library_reconciler.cpp
 * @brief Tests for library deduplication and conflict detection
 */

#include <gtest/gtest.h>
#include "boardmerge/Errors.hpp"
#include "boardmerge/LibraryReconciler.hpp"
#include "test_boards.hpp"

using namespace boardmerge;
using namespace boardmerge::fixtures;

namespace {

Library res_library() {
    return res_library_json().get<Library>();
}

Library cap_library() {
    Value j = {
        {"name", "CAP"},
        {"packages", Value::array({
            {{"name", "C0603"},
             {"primitives", Value::array({
                 {{"type", "smd"}, {"name", "1"}, {"x", -0.75}, {"y", 0.0},
                  {"dx", 0.9}, {"dy", 1.0}, {"layer", 1}},
             })}},
        })},
    };
    return j.get<Library>();
}

Package sot23_package() {
    Value j = {
        {"name", "SOT23"},
        {"primitives", Value::array({
            {{"type", "smd"}, {"name", "1"}, {"x", -0.95}, {"y", -1.0},
             {"dx", 0.6}, {"dy", 0.7}, {"layer", 1}},
        })},
    };
    return j.get<Package>();
}

} // anonymous namespace

// ============================================================================
// Strict mode
// ============================================================================

TEST(LibraryReconciler, IdenticalLibrariesKeepOneCopy) {
    LibraryReconciler reconciler;
    auto merged = reconciler.merge({res_library()}, {res_library()});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_TRUE(merged[0] == res_library());
}

TEST(LibraryReconciler, NewLibrariesAreAppended) {
    LibraryReconciler reconciler;
    auto merged = reconciler.merge({res_library()}, {cap_library(), res_library()});
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].name, "RES");
    EXPECT_EQ(merged[1].name, "CAP");
}

TEST(LibraryReconciler, PrimitiveOrderDoesNotMatter) {
    Library reordered = res_library();
    auto& primitives = reordered.packages[0].primitives;
    std::swap(primitives[0], primitives[2]);

    LibraryReconciler reconciler;
    EXPECT_NO_THROW(reconciler.merge({res_library()}, {reordered}));
}

TEST(LibraryReconciler, DivergentPackageIsConflict) {
    Library changed = res_library();
    changed.packages[0].primitives[1].props["dx"] = 1.4;

    LibraryReconciler reconciler;
    try {
        reconciler.merge({res_library()}, {changed});
        FAIL() << "Expected LibraryConflictError";
    } catch (const LibraryConflictError& e) {
        EXPECT_EQ(e.library(), "RES");
        EXPECT_EQ(e.path().rfind("packages.R0805.primitives[", 0), 0u);
        EXPECT_NE(e.path().find(".dx"), std::string::npos);
    }
}

TEST(LibraryReconciler, ExtraPackageIsConflictInStrictMode) {
    Library extended = res_library();
    extended.packages.push_back(sot23_package());

    LibraryReconciler reconciler(LibraryMode::Strict);
    try {
        reconciler.merge({res_library()}, {extended});
        FAIL() << "Expected LibraryConflictError";
    } catch (const LibraryConflictError& e) {
        EXPECT_EQ(e.path(), "packages.SOT23");
    }
}

TEST(LibraryReconciler, DescriptionMatters) {
    Library renamed = res_library();
    renamed.description = "Resistors (new)";
    auto d = library_divergence(res_library(), renamed);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->path, "description");
}

TEST(LibraryReconciler, ExistingIsNotModified) {
    const std::vector<Library> existing = {res_library()};
    LibraryReconciler reconciler;
    auto merged = reconciler.merge(existing, {cap_library()});
    EXPECT_EQ(existing.size(), 1u);
    EXPECT_EQ(merged.size(), 2u);
}

// ============================================================================
// Union mode
// ============================================================================

TEST(LibraryReconciler, UnionCombinesPackages) {
    Library extended = res_library();
    extended.packages.push_back(sot23_package());

    LibraryReconciler reconciler(LibraryMode::Union);
    auto merged = reconciler.merge({res_library()}, {extended});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].packages.size(), 2u);
    EXPECT_NE(merged[0].find_package("SOT23"), nullptr);
}

TEST(LibraryReconciler, UnionStillRejectsDivergentSharedPackage) {
    Library changed = res_library();
    changed.packages[0].primitives[0].props["dy"] = 2.0;

    LibraryReconciler reconciler(LibraryMode::Union);
    EXPECT_THROW(reconciler.merge({res_library()}, {changed}), LibraryConflictError);
}

TEST(LibraryMode, Parse) {
    EXPECT_EQ(parse_library_mode("strict"), LibraryMode::Strict);
    EXPECT_EQ(parse_library_mode("union"), LibraryMode::Union);
    EXPECT_THROW(parse_library_mode("loose"), UsageError);
    EXPECT_STREQ(to_string(LibraryMode::Union), "union");
}

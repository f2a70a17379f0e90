/**
 * @file test_loader.cpp
 * @brief Tests for reading and writing board and layout files
 */

#include <gtest/gtest.h>
#include "boardmerge/Errors.hpp"
#include "boardmerge/Loader.hpp"
#include "test_boards.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace boardmerge;
using namespace boardmerge::fixtures;

// ============================================================================
// Value files
// ============================================================================

TEST(Loader, FileExtension) {
    EXPECT_EQ(get_file_extension("panel.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("/a/b/board.json"), ".json");
    EXPECT_EQ(get_file_extension("Makefile"), "");
}

TEST(Loader, JsonFile) {
    TempFile file(R"({"a": {"b": [1, 2]}})");
    Value v = load_json_file(file.path());
    EXPECT_EQ(v["a"]["b"][1], 2);
}

TEST(Loader, TomlFile) {
    TempFile file("title = \"panel\"\n[[input]]\npath = \"a.json\"\nrotation = 90\n", ".toml");
    Value v = load_value_file(file.path());
    EXPECT_EQ(v["title"], "panel");
    ASSERT_TRUE(v["input"].is_array());
    EXPECT_EQ(v["input"][0]["rotation"], 90);
}

TEST(Loader, SyntaxErrors) {
    TempFile json("{\"a\": ", ".json");
    EXPECT_THROW(load_json_file(json.path()), DocumentFormatError);

    TempFile toml("a = = 1\n", ".toml");
    EXPECT_THROW(load_toml_file(toml.path()), DocumentFormatError);
}

TEST(Loader, UnsupportedExtension) {
    TempFile file("a: 1\n", ".yaml");
    EXPECT_THROW(load_value_file(file.path()), DocumentFormatError);
}

TEST(Loader, MissingFile) {
    try {
        load_document("/nonexistent/board.json");
        FAIL() << "Expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/board.json");
    }
}

// ============================================================================
// Board documents
// ============================================================================

TEST(Loader, LoadDocument) {
    TempFile file(sample_board_json().dump(2));
    Document doc = load_document(file.path());
    EXPECT_TRUE(doc == sample_board());
}

TEST(Loader, LoadDocumentReportsFile) {
    Value j = sample_board_json();
    j["elements"][0]["x"] = "ten";
    TempFile file(j.dump());
    try {
        load_document(file.path());
        FAIL() << "Expected DocumentFormatError";
    } catch (const DocumentFormatError& e) {
        EXPECT_EQ(e.file(), file.path());
    }
}

TEST(Loader, SaveThenLoad) {
    TempDir dir;
    const std::string path = dir.file("panel.json");
    save_document(path, sample_board());

    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));
    EXPECT_TRUE(load_document(path) == sample_board());
}

TEST(Loader, SaveReplacesExistingFile) {
    TempDir dir;
    const std::string path = dir.create_file("panel.json", "stale");
    save_document(path, sample_board());
    EXPECT_NO_THROW(load_json_file(path));
}

TEST(Loader, SaveIntoMissingDirectory) {
    EXPECT_THROW(save_document("/nonexistent/dir/panel.json", sample_board()), BoardError);
}

/**
 * @file test_document.cpp
 * @brief Tests for JSON/TOML document loading and JSON output (GoogleTest)
 */

#include <gtest/gtest.h>
#include "arbor/Document.hpp"
#include "arbor/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace arbor;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("arbor_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonFile, NestedDocument) {
    TempFile file(R"({
        "database": {
            "host": "localhost",
            "port": 5432
        },
        "items": [1, "two", true],
        "nullable": null
    })");

    Value result = load_json_file(file.path());

    EXPECT_EQ(result.child("database").child("host"), Value("localhost"));
    EXPECT_EQ(result.child("database").child("port"), Value(5432));
    EXPECT_EQ(result.child("items").size(), 3u);
    EXPECT_EQ(result.child("items").child(1), Value("two"));
    EXPECT_TRUE(result.child("nullable").is_null());
}

TEST(LoadJsonFile, MissingFileThrows) {
    EXPECT_THROW(load_json_file("/nonexistent/path.json"), FileNotFoundError);
}

TEST(LoadJsonFile, InvalidJsonThrows) {
    TempFile file("{ invalid json }");
    try {
        load_json_file(file.path());
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_FALSE(e.details().empty());
    }
}

TEST(ParseJsonText, NamesTheSourceInErrors) {
    try {
        parse_json_text(R"({"key": "value)", "inline");
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.file(), "inline");
    }
}

TEST(ParseJsonOrString, FallsBackToString) {
    EXPECT_EQ(parse_json_or_string("42"), Value(42));
    EXPECT_EQ(parse_json_or_string("[1,2]"), Value::sequence({1, 2}));
    EXPECT_EQ(parse_json_or_string("\"quoted\""), Value("quoted"));
    EXPECT_EQ(parse_json_or_string("hello"), Value("hello"));
    EXPECT_EQ(parse_json_or_string(""), Value(""));
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, TablesAndArrays) {
    TempFile file(R"(
title = "demo"
ratio = 0.5

[server]
ports = [80, 443]
enabled = true
)", ".toml");

    Value result = load_toml_file(file.path());

    EXPECT_EQ(result.child("title"), Value("demo"));
    EXPECT_EQ(result.child("ratio"), Value(0.5));
    EXPECT_EQ(result.child("server").child("ports"), Value::sequence({80, 443}));
    EXPECT_EQ(result.child("server").child("enabled"), Value(true));
}

TEST(LoadTomlFile, DatesBecomeDateLeaves) {
    TempFile file(R"(
released = 2024-03-01
stamp = 2024-03-01T12:30:00+01:00
alarm = 07:32:00
)", ".toml");

    Value result = load_toml_file(file.path());

    ASSERT_TRUE(result.child("released").is_date());
    EXPECT_EQ(result.child("released").as_date(), Date::from_civil(2024, 3, 1));

    ASSERT_TRUE(result.child("stamp").is_date());
    EXPECT_EQ(result.child("stamp").as_date(), Date::from_civil(2024, 3, 1, 11, 30));

    EXPECT_TRUE(result.child("alarm").is_string());
}

TEST(LoadTomlFile, SyntaxErrorCarriesPosition) {
    TempFile file("key = = 1\n", ".toml");
    try {
        load_toml_file(file.path());
        FAIL() << "expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_EQ(e.line(), 1);
    }
}

// ============================================================================
// Auto-detect
// ============================================================================

TEST(LoadDocument, ChoosesFormatByExtension) {
    TempFile json_file(R"({"a": 1})", ".JSON");
    TempFile toml_file("a = 1\n", ".toml");

    EXPECT_EQ(load_document(json_file.path()), Value::mapping({{"a", 1}}));
    EXPECT_EQ(load_document(toml_file.path()), Value::mapping({{"a", 1}}));
}

TEST(LoadDocument, UnsupportedExtensionThrows) {
    TempFile file("a: 1\n", ".yaml");
    try {
        load_document(file.path());
        FAIL() << "expected UnsupportedFormatError";
    } catch (const UnsupportedFormatError& e) {
        EXPECT_EQ(e.extension(), ".yaml");
    }
}

TEST(LoadDocument, MissingFileThrows) {
    EXPECT_THROW(load_document("/nonexistent/doc.toml"), FileNotFoundError);
}

TEST(GetFileExtension, LowerCased) {
    EXPECT_EQ(get_file_extension("/etc/app/Config.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// Output
// ============================================================================

TEST(DumpJson, IndentControl) {
    Value v = Value::mapping({{"a", Value::sequence({1, 2})}});
    EXPECT_EQ(dump_json(v, -1), R"({"a":[1,2]})");
    EXPECT_EQ(dump_json(v, 1), "{\n \"a\": [\n  1,\n  2\n ]\n}");
}

TEST(WriteJsonFile, RoundTrip) {
    TempFile file("", ".json");
    Value v = Value::mapping({
        {"name", "arbor"},
        {"nested", Value::mapping({{"list", Value::sequence({1, 2.5, nullptr})}})}
    });

    write_json_file(file.path(), v);

    EXPECT_EQ(load_json_file(file.path()), v);
}

TEST(WriteJsonFile, UnwritablePathThrows) {
    EXPECT_THROW(write_json_file("/nonexistent/dir/out.json", Value::mapping()), ArborError);
}

TEST(WriteJsonFile, FailedWriteThrows) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    EXPECT_THROW(write_json_file("/dev/full", Value::mapping({{"a", 1}})), ArborError);
}

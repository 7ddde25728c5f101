#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "obfuscator/format/loader.hpp"
#include "obfuscator/format/yaml_codec.hpp"

namespace fs = std::filesystem;

using obfuscator::Document;
using obfuscator::ErrorCode;
using obfuscator::Result;
using obfuscator::format::Format;
using obfuscator::format::FormatLoader;
using obfuscator::format::ParseAttempt;

namespace {

auto write_temp_file(const std::string& name, const std::string& content) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    out.close();
    return path;
}

} // anonymous namespace

TEST_CASE("Loader reads YAML documents", "[format][loader]") {
    FormatLoader loader;
    auto loaded = loader.load_text("db:\n  password: hunter2\n  port: 5432\n");

    REQUIRE(loaded.has_value());
    CHECK(loaded->format == Format::Yaml);
    CHECK(loaded->document == Document::parse(R"({"db": {"password": "hunter2", "port": 5432}})"));
}

TEST_CASE("JSON text is accepted by the YAML attempt first", "[format][loader]") {
    FormatLoader loader;
    auto loaded = loader.load_text(R"({"db": {"host": "localhost"}})");

    REQUIRE(loaded.has_value());
    CHECK(loaded->format == Format::Yaml);
    CHECK(loaded->document == Document::parse(R"({"db": {"host": "localhost"}})"));
}

TEST_CASE("Parser chain falls through in order", "[format][loader]") {
    int yaml_calls = 0;
    int json_calls = 0;
    FormatLoader loader({
        ParseAttempt{Format::Yaml, [&](std::string_view) -> Result<Document> {
            ++yaml_calls;
            return std::unexpected(obfuscator::make_error(
                ErrorCode::UnrecognizedFormat, "Invalid YAML", "forced"));
        }},
        ParseAttempt{Format::Json, [&](std::string_view text) -> Result<Document> {
            ++json_calls;
            return obfuscator::format::parse_json(text);
        }},
    });

    SECTION("second parser wins after the first fails") {
        auto loaded = loader.load_text(R"({"a": 1})");
        REQUIRE(loaded.has_value());
        CHECK(loaded->format == Format::Json);
        CHECK(loaded->document["a"] == 1);
        CHECK(yaml_calls == 1);
        CHECK(json_calls == 1);
    }

    SECTION("exhaustion reports every failure") {
        auto loaded = loader.load_text("not json", "input.cfg");
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code() == ErrorCode::UnrecognizedFormat);
        CHECK(loaded.error().message() == "Failed to load input.cfg as any supported format");
        CHECK(loaded.error().detail().starts_with("YAML: forced; JSON: "));
    }
}

TEST_CASE("First successful parser stops the chain", "[format][loader]") {
    int json_calls = 0;
    FormatLoader loader({
        ParseAttempt{Format::Yaml, obfuscator::format::parse_yaml},
        ParseAttempt{Format::Json, [&](std::string_view text) -> Result<Document> {
            ++json_calls;
            return obfuscator::format::parse_json(text);
        }},
    });

    auto loaded = loader.load_text("a: 1\n");
    REQUIRE(loaded.has_value());
    CHECK(json_calls == 0);
}

TEST_CASE("Default chain is YAML then JSON", "[format][loader]") {
    FormatLoader loader;
    REQUIRE(loader.attempts().size() == 2);
    CHECK(loader.attempts()[0].format == Format::Yaml);
    CHECK(loader.attempts()[1].format == Format::Json);
}

TEST_CASE("parse_json is strict", "[format][loader]") {
    CHECK(obfuscator::format::parse_json(R"({"a": [1, 2]})").has_value());

    auto bad = obfuscator::format::parse_json("a: 1");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::UnrecognizedFormat);
    CHECK(bad.error().message() == "Invalid JSON");
}

TEST_CASE("Neither YAML nor JSON is UnrecognizedFormat", "[format][loader]") {
    FormatLoader loader;
    auto loaded = loader.load_text("key: [unclosed\n");

    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code() == ErrorCode::UnrecognizedFormat);
}

TEST_CASE("load_file", "[format][loader]") {
    FormatLoader loader;

    SECTION("reads a JSON file") {
        auto path = write_temp_file("obfuscator_loader_test.json", R"({"token": "abc", "n": 1})");
        auto loaded = loader.load_file(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->document["token"] == "abc");
        CHECK(loaded->document["n"] == 1);
        fs::remove(path);
    }

    SECTION("empty file is a null document") {
        auto path = write_temp_file("obfuscator_loader_empty.yaml", "");
        auto loaded = loader.load_file(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->document.is_null());
        fs::remove(path);
    }

    SECTION("missing file is an IO error") {
        auto loaded = loader.load_file(fs::temp_directory_path() / "obfuscator_does_not_exist.yaml");
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code() == ErrorCode::IoError);
        CHECK(loaded.error().message() == "Input file does not exist");
    }

    SECTION("directory is an IO error") {
        auto loaded = loader.load_file(fs::temp_directory_path());
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code() == ErrorCode::IoError);
    }
}

#include <catch2/catch_test_macros.hpp>

#include "obfuscator/redact/patterns.hpp"

using obfuscator::redact::SensitivityPatterns;

TEST_CASE("Default pattern set", "[redact][patterns]") {
    const auto& patterns = SensitivityPatterns::defaults();

    SECTION("holds the quoted and unquoted forms") {
        CHECK(patterns.size() == 12);
        CHECK(patterns.sources() == obfuscator::redact::default_pattern_sources());
    }

    SECTION("matches key: shaped text anywhere") {
        CHECK(patterns.match("secret: abc").has_value());
        CHECK(patterns.match("my api_key:xyz").has_value());
        CHECK(patterns.match(R"({"token": "abc"})").has_value());
        CHECK(patterns.match("credentials   : here").has_value());
    }

    SECTION("ignores text without the key shape") {
        CHECK_FALSE(patterns.match("normal text").has_value());
        CHECK_FALSE(patterns.match("password").has_value());
        CHECK_FALSE(patterns.match("reset your password today").has_value());
        CHECK_FALSE(patterns.match("<REDACTED>").has_value());
    }

    SECTION("is case-insensitive") {
        CHECK(patterns.match("PASSWORD: x").has_value());
        CHECK(patterns.match("Api_Key: x").has_value());
    }

    SECTION("reports the first matching pattern") {
        auto hit = patterns.match("token: a password: b");
        REQUIRE(hit);
        CHECK(*hit == R"((password\s*:).*)");
    }
}

TEST_CASE("Key matching renders the key shape", "[redact][patterns]") {
    const auto& patterns = SensitivityPatterns::defaults();

    CHECK(patterns.match_key("password").has_value());
    CHECK(patterns.match_key("Password").has_value());
    CHECK(patterns.match_key("PASSWORD").has_value());
    CHECK(patterns.match_key("db_password").has_value());
    CHECK(patterns.match_key("api_key").has_value());
    CHECK(patterns.match_key("access_key").has_value());
    CHECK(patterns.match_key("credentials").has_value());
    CHECK(patterns.match_key("github_token").has_value());

    CHECK_FALSE(patterns.match_key("password_hint").has_value());
    CHECK_FALSE(patterns.match_key("username").has_value());
    CHECK_FALSE(patterns.match_key("host").has_value());
    CHECK_FALSE(patterns.match_key("tokens").has_value());
}

TEST_CASE("Custom pattern sets", "[redact][patterns]") {
    SECTION("compile and match") {
        auto patterns = SensitivityPatterns::from_sources({R"(ssn\s*:)", R"(^pin:)"});
        REQUIRE(patterns.has_value());
        CHECK(patterns->size() == 2);
        CHECK(patterns->match_key("SSN").has_value());
        CHECK(patterns->match_key("pin").has_value());
        CHECK_FALSE(patterns->match_key("password").has_value());
    }

    SECTION("empty set matches nothing") {
        auto patterns = SensitivityPatterns::from_sources({});
        REQUIRE(patterns.has_value());
        CHECK_FALSE(patterns->match("password: x").has_value());
    }

    SECTION("invalid regex is rejected") {
        auto patterns = SensitivityPatterns::from_sources({"ok", "(unclosed"});
        REQUIRE_FALSE(patterns.has_value());
        CHECK(patterns.error().code() == obfuscator::ErrorCode::InvalidArgument);
        CHECK(patterns.error().detail().starts_with("(unclosed"));
    }
}

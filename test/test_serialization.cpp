// test_serialization.cpp - Tests for JSON text parsing and output

#include <catch2/catch_all.hpp>
#include <json_diff/serialization.h>
#include <json_diff/value_equality.h>

#include <string>

using namespace json_diff;

// ============================================================
// Parsing
// ============================================================

TEST_CASE("from_json parses every kind", "[serialization][parse]") {
    std::string error;
    auto doc = from_json(R"({"n": null, "b": true, "i": -12, "f": 1.5e3, "s": "x", "a": [1, [2]], "o": {}})", &error);

    REQUIRE(error.empty());
    REQUIRE(doc.is_object());
    REQUIRE(doc.at("n").is_null());
    REQUIRE(doc.at("b").as_bool());
    REQUIRE(doc.at("i").get_if<Number>()->literal == "-12");
    REQUIRE(doc.at("f").get_if<Number>()->literal == "1.5e3");
    REQUIRE(doc.at("s").as_string() == "x");
    REQUIRE(doc.at("a").at(1).at(0).as_double() == 2.0);
    REQUIRE(doc.at("o").is_object());
    REQUIRE(doc.at("o").size() == 0);
}

TEST_CASE("from_json string escapes", "[serialization][parse][string]") {
    std::string error;

    SECTION("simple escapes") {
        auto v = from_json(R"("a\"b\\c\/d\n\t")", &error);
        REQUIRE(error.empty());
        REQUIRE(v.as_string() == "a\"b\\c/d\n\t");
    }

    SECTION("unicode escapes") {
        REQUIRE(from_json(R"("\u00e9")", &error).as_string() == "\xC3\xA9");
        REQUIRE(from_json(R"("\u20AC")", &error).as_string() == "\xE2\x82\xAC");
        // Surrogate pair for U+1F600
        REQUIRE(from_json(R"("\uD83D\uDE00")", &error).as_string() == "\xF0\x9F\x98\x80");
        REQUIRE(error.empty());
    }
}

TEST_CASE("from_json keeps object key order", "[serialization][parse][object]") {
    auto doc = from_json(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    REQUIRE(to_json(doc, true) == R"({"zeta":1,"alpha":2,"mid":3})");

    SECTION("duplicate key keeps first position and last value") {
        auto dup = from_json(R"({"a": 1, "b": 2, "a": 3})");
        REQUIRE(to_json(dup, true) == R"({"a":3,"b":2})");
    }
}

TEST_CASE("from_json rejects malformed input", "[serialization][parse][error]") {
    auto fails = [](const std::string& text) {
        std::string error;
        auto v = from_json(text, &error);
        return !error.empty() && v.is_null();
    };

    REQUIRE(fails(""));
    REQUIRE(fails("   "));
    REQUIRE(fails("{"));
    REQUIRE(fails("[1, 2"));
    REQUIRE(fails(R"({"a" 1})"));
    REQUIRE(fails(R"({a: 1})"));
    REQUIRE(fails("[1,]"));
    REQUIRE(fails("01"));
    REQUIRE(fails("1."));
    REQUIRE(fails("1e"));
    REQUIRE(fails("-"));
    REQUIRE(fails("tru"));
    REQUIRE(fails("[1] 2"));
    REQUIRE(fails(R"("unterminated)"));
    REQUIRE(fails(R"("bad \x escape")"));
    REQUIRE(fails("\"line\nbreak\""));
}

// ============================================================
// Output
// ============================================================

TEST_CASE("to_json output", "[serialization][output]") {
    auto doc = Value::object({
        {"name", "Al\"ice"},
        {"age", Number{"25.0"}},
        {"tags", Value::array({"x", Value{}})},
        {"empty", Value::array({})}
    });

    SECTION("compact") {
        REQUIRE(to_json(doc, true) == R"({"name":"Al\"ice","age":25.0,"tags":["x",null],"empty":[]})");
    }

    SECTION("pretty uses two-space indentation") {
        const std::string expected =
            "{\n"
            "  \"name\": \"Al\\\"ice\",\n"
            "  \"age\": 25.0,\n"
            "  \"tags\": [\n"
            "    \"x\",\n"
            "    null\n"
            "  ],\n"
            "  \"empty\": []\n"
            "}";
        REQUIRE(to_json(doc, false) == expected);
    }

    SECTION("control characters are escaped") {
        REQUIRE(to_json(Value{std::string("a\x01")}, true) == R"("a\u0001")");
    }
}

TEST_CASE("to_json output parses back to an equal value", "[serialization][roundtrip]") {
    const std::string text = R"({"users":[{"name":"Alice","score":1.25},{"name":"Bob","score":-3}],"ok":false})";
    auto doc = from_json(text);
    REQUIRE(to_json(doc, true) == text);
    REQUIRE(values_equal(from_json(to_json(doc, false)), doc));
}

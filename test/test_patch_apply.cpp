// test_patch_apply.cpp - Tests for patch application and generate/apply round trips

#include <catch2/catch_all.hpp>
#include <json_diff/patch_apply.h>
#include <json_diff/patch_generator.h>
#include <json_diff/serialization.h>
#include <json_diff/value_equality.h>

#include <string>
#include <utility>
#include <vector>

using namespace json_diff;

namespace {

Value doc_of(const std::string& text)
{
    std::string error;
    auto v = from_json(text, &error);
    REQUIRE(error.empty());
    return v;
}

Value apply_ok(const Value& doc, const PatchOperationList& ops)
{
    auto result = apply_patch(doc, ops);
    INFO(result.error_message);
    REQUIRE(result.success);
    return result.value;
}

} // namespace

// ============================================================
// Single operations
// ============================================================

TEST_CASE("apply add", "[apply][add]") {
    auto doc = doc_of(R"({"a":1,"list":[1,2]})");

    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("/b", 2)}), true) == R"({"a":1,"list":[1,2],"b":2})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("/a", "x")}), true) == R"({"a":"x","list":[1,2]})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("/list/0", 0)}), true) == R"({"a":1,"list":[0,1,2]})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("/list/2", 3)}), true) == R"({"a":1,"list":[1,2,3]})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("/list/-", 3)}), true) == R"({"a":1,"list":[1,2,3]})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::add("", true)}), true) == "true");

    SECTION("past the end") {
        auto result = apply_operation(doc, PatchOperation::add("/list/3", 3));
        REQUIRE(result.error_code == DiffErrorCode::IndexOutOfRange);
    }

    SECTION("missing parent") {
        auto result = apply_operation(doc, PatchOperation::add("/missing/x", 3));
        REQUIRE(result.error_code == DiffErrorCode::PathNotFound);
    }

    SECTION("scalar parent") {
        auto result = apply_operation(doc, PatchOperation::add("/a/x", 3));
        REQUIRE(result.error_code == DiffErrorCode::TypeMismatch);
    }
}

TEST_CASE("apply remove and replace", "[apply][remove][replace]") {
    auto doc = doc_of(R"({"a":1,"nested":{"list":[1,2,3]}})");

    REQUIRE(to_json(apply_ok(doc, {PatchOperation::remove("/a")}), true) == R"({"nested":{"list":[1,2,3]}})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::remove("/nested/list/1")}), true)
            == R"({"a":1,"nested":{"list":[1,3]}})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::replace("/nested/list/2", "c")}), true)
            == R"({"a":1,"nested":{"list":[1,2,"c"]}})");
    REQUIRE(to_json(apply_ok(doc, {PatchOperation::replace("", 5)}), true) == "5");

    SECTION("errors") {
        REQUIRE(apply_operation(doc, PatchOperation::remove("")).error_code == DiffErrorCode::InvalidPointer);
        REQUIRE(apply_operation(doc, PatchOperation::remove("/b")).error_code == DiffErrorCode::PathNotFound);
        REQUIRE(apply_operation(doc, PatchOperation::remove("/nested/list/3")).error_code
                == DiffErrorCode::IndexOutOfRange);
        REQUIRE(apply_operation(doc, PatchOperation::replace("/b", 1)).error_code == DiffErrorCode::PathNotFound);
        REQUIRE(apply_operation(doc, PatchOperation::replace("/nested/list/x", 1)).error_code
                == DiffErrorCode::InvalidPointer);
        REQUIRE(apply_operation(doc, PatchOperation::replace("a", 1)).error_code == DiffErrorCode::InvalidPointer);
    }
}

TEST_CASE("apply move, copy and test", "[apply][move][copy][test]") {
    auto doc = doc_of(R"({"a":{"x":1},"list":["p","q","r"]})");

    SECTION("move between members") {
        REQUIRE(to_json(apply_ok(doc, {PatchOperation::move("/a/x", "/y")}), true)
                == R"({"a":{},"list":["p","q","r"],"y":1})");
    }

    SECTION("move inside an array") {
        REQUIRE(to_json(apply_ok(doc, {PatchOperation::move("/list/0", "/list/2")}), true)
                == R"({"a":{"x":1},"list":["q","r","p"]})");
    }

    SECTION("move onto itself") {
        REQUIRE(apply_ok(doc, {PatchOperation::move("/list/1", "/list/1")}) == doc);
        REQUIRE(apply_operation(doc, PatchOperation::move("/nope", "/nope")).error_code
                == DiffErrorCode::PathNotFound);
    }

    SECTION("move into its own child") {
        REQUIRE(apply_operation(doc, PatchOperation::move("/a", "/a/inner")).error_code
                == DiffErrorCode::InvalidArgument);
    }

    SECTION("copy") {
        REQUIRE(to_json(apply_ok(doc, {PatchOperation::copy("/a", "/b")}), true)
                == R"({"a":{"x":1},"list":["p","q","r"],"b":{"x":1}})");
    }

    SECTION("test") {
        REQUIRE(apply_ok(doc, {PatchOperation::test("/a", Value::object({{"x", Number{"1.0"}}}))}) == doc);
        REQUIRE(apply_operation(doc, PatchOperation::test("/list/0", "q")).error_code
                == DiffErrorCode::TestFailed);
    }
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("apply_patch stops at the first failing operation", "[apply][error]") {
    auto doc = doc_of(R"({"a":1})");
    PatchOperationList ops = {
        PatchOperation::add("/b", 2),
        PatchOperation::replace("/c", 3),
        PatchOperation::remove("/a"),
    };

    auto result = apply_patch(doc, ops);
    REQUIRE_FALSE(result);
    REQUIRE(result.failed_at_index == 1);
    REQUIRE(result.error_code == DiffErrorCode::PathNotFound);
    REQUIRE(result.error_message.rfind("operation 1 (replace /c 3)", 0) == 0);
}

TEST_CASE("apply_patch leaves the input untouched", "[apply][immutable]") {
    auto doc = doc_of(R"({"list":[1,2,3],"name":"x"})");
    const auto before = to_json(doc, true);

    auto patched = apply_ok(doc, {
        PatchOperation::remove("/list/0"),
        PatchOperation::replace("/name", "y"),
        PatchOperation::add("/list/-", 4),
    });

    REQUIRE(to_json(doc, true) == before);
    REQUIRE(to_json(patched, true) == R"({"list":[2,3,4],"name":"y"})");
}

TEST_CASE("get_by_pointer", "[apply][pointer]") {
    auto doc = doc_of(R"({"users":[{"name":"Alice"}],"a/b":{"~":true}})");

    REQUIRE(get_by_pointer(doc, "").value == doc);
    REQUIRE(get_by_pointer(doc, "/users/0/name").value.as_string() == "Alice");
    REQUIRE(get_by_pointer(doc, "/a~1b/~0").value.as_bool());
    REQUIRE(get_by_pointer(doc, "/users/1").error_code == DiffErrorCode::IndexOutOfRange);
    REQUIRE(get_by_pointer(doc, "/users/first").error_code == DiffErrorCode::InvalidPointer);
    REQUIRE(get_by_pointer(doc, "/users/0/name/x").error_code == DiffErrorCode::TypeMismatch);
}

// ============================================================
// Patch documents
// ============================================================

TEST_CASE("parse_patch", "[apply][parse]") {
    SECTION("all operation kinds") {
        auto result = parse_patch(R"([
            {"op":"add","path":"/a","value":1},
            {"op":"remove","path":"/b"},
            {"op":"replace","path":"/c","value":[1]},
            {"op":"move","from":"/d","path":"/e"},
            {"op":"copy","from":"/f","path":"/g"},
            {"op":"test","path":"/h","value":null}
        ])");
        REQUIRE(result.success);
        REQUIRE(result.value.size() == 6);
        REQUIRE(result.value[3] == PatchOperation::move("/d", "/e"));
        REQUIRE(result.value[5].value->is_null());
    }

    SECTION("written form reads back") {
        PatchOperationList ops = {PatchOperation::replace("/age", 26), PatchOperation::move("/0", "/2")};
        auto result = parse_patch(to_json(ops));
        REQUIRE(result.success);
        REQUIRE(result.value == ops);
    }

    SECTION("invalid documents") {
        REQUIRE(parse_patch("[").error_code == DiffErrorCode::ParseError);
        REQUIRE(parse_patch(R"({"op":"add"})").error_code == DiffErrorCode::InvalidArgument);

        auto missing = parse_patch(R"([{"op":"remove","path":"/a"},{"op":"add","path":"/b"}])");
        REQUIRE_FALSE(missing);
        REQUIRE(missing.failed_at_index == 1);

        REQUIRE_FALSE(parse_patch(R"([{"op":"rename","path":"/a"}])"));
        REQUIRE_FALSE(parse_patch(R"([{"op":"move","path":"/a"}])"));
    }
}

// ============================================================
// Round trip
// ============================================================

TEST_CASE("generated patches reproduce the updated document", "[apply][roundtrip]") {
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {R"({"name":"Alice","age":25})", R"({"name":"Alice","age":26})"},
        {R"({"tags":["x","y"]})", R"({"tags":["x","y","z"]})"},
        {"[1,2,3]", "[1,4,3,5]"},
        {R"(["a","b","c"])", R"(["b","c","a"])"},
        {R"({"a":{"b":[1,{"c":2}]},"d":null})", R"({"a":{"b":[{"c":3},1]},"e":[]})"},
        {R"({"k/1":1,"k~2":[true]})", R"({"k/1":2,"k~2":[false,true]})"},
        {"[[1,2],[3]]", "[[3],[1,2],[4]]"},
        {"[]", "[1,2,3]"},
        {"[1,2,3]", "[]"},
        {R"({"x":1})", "[1]"},
        {R"({"list":[1,2,3,4,5,6]})", R"({"list":[6,1,2,4,3]})"},
    };

    PatchOptions full;
    PatchOptions fast;
    fast.array_diff_mode = ArrayDiffMode::Fast;
    PatchOptions plain;
    plain.optimize_patch = false;
    PatchOptions bounded;
    bounded.max_array_size_for_lcs = 2;

    for (const auto& options : {full, fast, plain, bounded}) {
        for (const auto& [before, after] : pairs) {
            CAPTURE(before, after);
            auto original = doc_of(before);
            auto updated = doc_of(after);

            auto patch = generate_patch(original, updated, options);
            REQUIRE(patch.success);
            REQUIRE(values_equal(apply_ok(original, patch.value), updated));
        }
    }
}

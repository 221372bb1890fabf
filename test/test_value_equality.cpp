// test_value_equality.cpp - Tests for JSON value equality
// Module 2: numbers, containers, comparison options

#include <catch2/catch_all.hpp>
#include <json_diff/value_equality.h>

#include <string>

using namespace json_diff;

// ============================================================
// Numbers
// ============================================================

TEST_CASE("values_equal compares numbers numerically", "[equality][number]") {
    SECTION("same value, different spelling") {
        REQUIRE(values_equal(Value{Number{"1"}}, Value{Number{"1.0"}}));
        REQUIRE(values_equal(Value{Number{"1"}}, Value{Number{"1e0"}}));
        REQUIRE(values_equal(Value{Number{"10e-1"}}, Value{Number{"1.000"}}));
        REQUIRE(values_equal(Value{Number{"-0"}}, Value{Number{"0"}}));
        REQUIRE(values_equal(Value{1}, Value{1.0}));
    }

    SECTION("different values") {
        REQUIRE_FALSE(values_equal(Value{Number{"1"}}, Value{Number{"1.0000001"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"1e2"}}, Value{Number{"10"}}));
    }

    SECTION("precision beyond double") {
        REQUIRE_FALSE(values_equal(Value{Number{"9007199254740993"}}, Value{Number{"9007199254740992"}}));
    }

    SECTION("long literals compare every digit") {
        const std::string prefix(84, '7');
        REQUIRE_FALSE(values_equal(Value{Number{prefix + "1"}}, Value{Number{prefix + "2"}}));
        REQUIRE(values_equal(Value{Number{prefix + "1"}}, Value{Number{prefix + "1.000e0"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"0." + prefix + "1"}}, Value{Number{"0." + prefix + "2"}}));
    }

    SECTION("huge exponents are neither rounded nor rejected") {
        REQUIRE_FALSE(values_equal(Value{Number{"1e999999999"}}, Value{Number{"2e999999999"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"1e-999999999"}}, Value{Number{"2e-999999999"}}));
        REQUIRE(values_equal(Value{Number{"1e3000000000"}}, Value{Number{"1e3000000000"}}));
        REQUIRE(values_equal(Value{Number{"1e3000000000"}}, Value{Number{"10e2999999999"}}));
        REQUIRE(values_equal(Value{Number{"1e3000000000"}}, Value{Number{"0.1E+3000000001"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"1e3000000000"}}, Value{Number{"1"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"1e99999999999999999999999"}}, Value{Number{"1e99999999999999999999998"}}));
    }

    SECTION("zero ignores sign, digits and exponent") {
        REQUIRE(values_equal(Value{Number{"-0.000"}}, Value{Number{"0e5"}}));
        REQUIRE(values_equal(Value{Number{"0"}}, Value{Number{"-0E-3000000000"}}));
        REQUIRE_FALSE(values_equal(Value{Number{"-1"}}, Value{Number{"1"}}));
    }

    SECTION("leading zeros in the exponent") {
        REQUIRE(values_equal(Value{Number{"1e007"}}, Value{Number{"10000000"}}));
        REQUIRE(values_equal(Value{Number{"1.5e-010"}}, Value{Number{"15e-11"}}));
    }

    SECTION("malformed literal is an error") {
        REQUIRE_THROWS_AS(values_equal(Value{Number{"abc"}}, Value{Number{"1"}}), DiffOperationError);
        REQUIRE_THROWS_AS(values_equal(Value{Number{"01"}}, Value{Number{"1"}}), DiffOperationError);
        REQUIRE_THROWS_AS(values_equal(Value{Number{"1."}}, Value{Number{"1"}}), DiffOperationError);
        REQUIRE_THROWS_AS(values_equal(Value{Number{"1e"}}, Value{Number{"1"}}), DiffOperationError);
    }
}

// ============================================================
// Kinds and scalars
// ============================================================

TEST_CASE("values_equal on kinds and scalars", "[equality][scalar]") {
    REQUIRE(values_equal(Value{}, Value{}));
    REQUIRE(values_equal(Value{true}, Value{true}));
    REQUIRE_FALSE(values_equal(Value{true}, Value{false}));
    REQUIRE(values_equal(Value{"a"}, Value{"a"}));
    REQUIRE_FALSE(values_equal(Value{"a"}, Value{"A"}));

    SECTION("different kinds are never equal") {
        REQUIRE_FALSE(values_equal(Value{1}, Value{"1"}));
        REQUIRE_FALSE(values_equal(Value{}, Value{false}));
        REQUIRE_FALSE(values_equal(Value::array({}), Value::object({})));
    }
}

// ============================================================
// Containers
// ============================================================

TEST_CASE("values_equal on containers", "[equality][container]") {
    SECTION("object member order is irrelevant") {
        auto a = Value::object({{"x", 1}, {"y", Value::array({1, 2})}});
        auto b = Value::object({{"y", Value::array({Number{"1.0"}, 2})}, {"x", 1}});
        REQUIRE(values_equal(a, b));
        REQUIRE(values_equal(b, a));
    }

    SECTION("objects with different members") {
        auto a = Value::object({{"x", 1}});
        REQUIRE_FALSE(values_equal(a, Value::object({{"x", 1}, {"y", 2}})));
        REQUIRE_FALSE(values_equal(a, Value::object({{"z", 1}})));
        REQUIRE_FALSE(values_equal(a, Value::object({{"x", 2}})));
    }

    SECTION("array order matters") {
        REQUIRE(values_equal(Value::array({1, 2, 3}), Value::array({1, 2, 3})));
        REQUIRE_FALSE(values_equal(Value::array({1, 2, 3}), Value::array({3, 2, 1})));
        REQUIRE_FALSE(values_equal(Value::array({1, 2}), Value::array({1, 2, 3})));
    }

    SECTION("shared subtrees") {
        auto shared = Value::array({1, 2, 3});
        auto a = Value::object({{"list", shared}});
        auto b = a.set("other", true);
        REQUIRE(values_equal(a.at("list"), b.at("list")));
    }
}

// ============================================================
// Comparison options
// ============================================================

TEST_CASE("values_equal with serialized comparison", "[equality][options]") {
    auto a = Value::object({{"x", 1}, {"y", 2}});
    auto b = Value::object({{"y", 2}, {"x", 1}});

    CompareOptions textual{true, true};
    REQUIRE(values_equal(a, b));
    REQUIRE_FALSE(values_equal(a, b, textual));
    REQUIRE(values_equal(a, a, textual));

    auto c = Value::array({Number{"1.0"}});
    auto d = Value::array({Number{"1"}});
    REQUIRE(values_equal(c, d));
    REQUIRE_FALSE(values_equal(c, d, textual));
}

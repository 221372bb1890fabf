// test_patch_optimizer.cpp - Tests for move detection and patch simplification

#include <catch2/catch_all.hpp>
#include <json_diff/patch_optimizer.h>

using namespace json_diff;

namespace {

ArrayContext context_of(std::string base, std::initializer_list<Value> original,
                        std::initializer_list<Value> updated)
{
    return ArrayContext{std::move(base),
                        *Value::array(original).get_if<ValueArray>(),
                        *Value::array(updated).get_if<ValueArray>()};
}

} // namespace

// ============================================================
// Duplicate-path collapse
// ============================================================

TEST_CASE("collapse_duplicate_paths", "[optimizer][collapse]") {
    PatchOptimizer optimizer;

    SECTION("later replace wins") {
        PatchOperationList ops = {
            PatchOperation::replace("/x", 1),
            PatchOperation::replace("/y", 2),
            PatchOperation::replace("/x", 3),
        };
        REQUIRE(optimizer.collapse_duplicate_paths(ops) == 1);
        REQUIRE(ops == PatchOperationList{PatchOperation::replace("/y", 2), PatchOperation::replace("/x", 3)});
    }

    SECTION("replace followed by remove keeps the remove") {
        PatchOperationList ops = {PatchOperation::replace("/a", 1), PatchOperation::remove("/a")};
        optimizer.optimize(ops);
        REQUIRE(ops == PatchOperationList{PatchOperation::remove("/a")});
    }

    SECTION("add followed by replace folds into the add") {
        PatchOperationList ops = {PatchOperation::add("/a", 1), PatchOperation::replace("/a", "two")};
        optimizer.optimize(ops);
        REQUIRE(ops == PatchOperationList{PatchOperation::add("/a", "two")});
    }

    SECTION("an operation on a child blocks the collapse") {
        PatchOperationList ops = {
            PatchOperation::replace("/a", 1),
            PatchOperation::replace("/a/b", 2),
            PatchOperation::replace("/a", 3),
        };
        REQUIRE(optimizer.collapse_duplicate_paths(ops) == 0);
        REQUIRE(ops.size() == 3);
    }

    SECTION("an index shift in the same array blocks the collapse") {
        PatchOperationList ops = {
            PatchOperation::replace("/arr/1", "x"),
            PatchOperation::remove("/arr/0"),
            PatchOperation::replace("/arr/1", "y"),
        };
        REQUIRE(optimizer.collapse_duplicate_paths(ops) == 0);
        REQUIRE(ops.size() == 3);
    }

    SECTION("remove then add on the same path is left alone") {
        PatchOperationList ops = {PatchOperation::remove("/a"), PatchOperation::add("/a", 1)};
        REQUIRE(optimizer.collapse_duplicate_paths(ops) == 0);
    }
}

// ============================================================
// No-op removal
// ============================================================

TEST_CASE("remove_noops drops moves onto themselves", "[optimizer][noop]") {
    PatchOptimizer optimizer;
    PatchOperationList ops = {
        PatchOperation::move("/a/0", "/a/0"),
        PatchOperation::replace("/b", true),
        PatchOperation::move("/a/0", "/a/1"),
    };
    REQUIRE(optimizer.remove_noops(ops) == 1);
    REQUIRE(ops == PatchOperationList{PatchOperation::replace("/b", true), PatchOperation::move("/a/0", "/a/1")});
}

TEST_CASE("optimize is idempotent", "[optimizer]") {
    PatchOptimizer optimizer;
    PatchOperationList ops = {
        PatchOperation::add("/n", 0),
        PatchOperation::replace("/n", 1),
        PatchOperation::replace("/n", 2),
        PatchOperation::move("/k", "/k"),
        PatchOperation::replace("/m", 3),
    };

    optimizer.optimize(ops);
    REQUIRE(ops == PatchOperationList{PatchOperation::add("/n", 2), PatchOperation::replace("/m", 3)});

    auto again = ops;
    optimizer.optimize(again);
    REQUIRE(again == ops);
}

// ============================================================
// Move detection
// ============================================================

TEST_CASE("detect_moves folds remove/add pairs", "[optimizer][move]") {
    PatchOptimizer optimizer;

    SECTION("element moved to the end") {
        auto context = context_of("/items", {"a", "b", "c"}, {"b", "c", "a"});
        PatchOperationList ops = {PatchOperation::remove("/items/0"), PatchOperation::add("/items/2", "a")};
        REQUIRE(optimizer.detect_moves(ops, context) == 1);
        REQUIRE(ops == PatchOperationList{PatchOperation::move("/items/0", "/items/2")});
    }

    SECTION("different values are not paired") {
        auto context = context_of("", {"a", "b"}, {"b", "z"});
        PatchOperationList ops = {PatchOperation::remove("/0"), PatchOperation::add("/1", "z")};
        REQUIRE(optimizer.detect_moves(ops, context) == 0);
        REQUIRE(ops.size() == 2);
    }

    SECTION("operations outside the array are ignored") {
        auto context = context_of("/list", {1, 2}, {2, 1});
        PatchOperationList ops = {PatchOperation::remove("/other/0"), PatchOperation::add("/other/1", 1)};
        REQUIRE(optimizer.detect_moves(ops, context) == 0);
    }

    SECTION("numeric equality finds the pair") {
        auto context = context_of("", {Number{"1.0"}, 2}, {2, Number{"1"}});
        PatchOperationList ops = {PatchOperation::remove("/0"), PatchOperation::add("/1", Number{"1"})};
        REQUIRE(optimizer.detect_moves(ops, context) == 1);
        REQUIRE(ops == PatchOperationList{PatchOperation::move("/0", "/1")});
    }
}

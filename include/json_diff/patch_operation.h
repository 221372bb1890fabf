// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_operation.h
/// @brief RFC 6902 patch operations and their JSON form.
///
/// RFC 6902: https://datatracker.ietf.org/doc/html/rfc6902
///
/// The generator emits add / remove / replace / move. copy and test are
/// accepted when reading a patch document and by apply_patch().
///
/// JSON form (member order: op, from, path, value):
/// @code
///   [
///     { "op": "replace", "path": "/age", "value": 26 },
///     { "op": "move", "from": "/items/0", "path": "/items/2" }
///   ]
/// @endcode

#pragma once

#include "value.h"
#include "result.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace json_diff {

enum class OpType {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test,
};

[[nodiscard]] JSON_DIFF_API std::string_view to_string(OpType op) noexcept;
[[nodiscard]] JSON_DIFF_API std::optional<OpType> op_type_from_string(std::string_view name) noexcept;

struct PatchOperation {
    OpType op = OpType::Add;
    std::string path;                  // JSON Pointer of the target
    std::optional<Value> value;        // add / replace / test
    std::optional<std::string> from;   // move / copy

    static PatchOperation add(std::string path, Value value) {
        return PatchOperation{OpType::Add, std::move(path), std::move(value), std::nullopt};
    }

    static PatchOperation remove(std::string path) {
        return PatchOperation{OpType::Remove, std::move(path), std::nullopt, std::nullopt};
    }

    static PatchOperation replace(std::string path, Value value) {
        return PatchOperation{OpType::Replace, std::move(path), std::move(value), std::nullopt};
    }

    static PatchOperation move(std::string from, std::string path) {
        return PatchOperation{OpType::Move, std::move(path), std::nullopt, std::move(from)};
    }

    static PatchOperation copy(std::string from, std::string path) {
        return PatchOperation{OpType::Copy, std::move(path), std::nullopt, std::move(from)};
    }

    static PatchOperation test(std::string path, Value value) {
        return PatchOperation{OpType::Test, std::move(path), std::move(value), std::nullopt};
    }

    /// Structural comparison; values compare by literal text
    bool operator==(const PatchOperation& other) const {
        return op == other.op && path == other.path && value == other.value && from == other.from;
    }
};

using PatchOperationList = std::vector<PatchOperation>;
using PatchResult = Result<PatchOperationList>;

// ============================================================
// Conversion to and from the RFC 6902 document form
// ============================================================

[[nodiscard]] JSON_DIFF_API Value to_value(const PatchOperation& op);
[[nodiscard]] JSON_DIFF_API Value to_value(const PatchOperationList& ops);

/// Serialize a patch as a JSON array
[[nodiscard]] JSON_DIFF_API std::string to_json(const PatchOperationList& ops, bool compact = false);

/// One-line description for logs: "replace /age 26", "move /0 -> /2"
[[nodiscard]] JSON_DIFF_API std::string to_string(const PatchOperation& op);

/// Read a patch from an already parsed JSON array
[[nodiscard]] JSON_DIFF_API PatchResult patch_from_value(const Value& doc);

/// Parse a patch from JSON text
[[nodiscard]] JSON_DIFF_API PatchResult parse_patch(const std::string& json_text);

} // namespace json_diff

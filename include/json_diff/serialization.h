// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// Usage:
/// @code
///   std::string error;
///   Value doc = from_json(R"({"name": "Alice", "age": 25})", &error);
///   std::string text = to_json(doc, true);   // {"name":"Alice","age":25}
/// @endcode

#pragma once

#include "value.h"

#include <string>

namespace json_diff {

/// Convert Value to JSON string
/// @param val The value to serialize
/// @param compact If true, no whitespace; otherwise 2-space indentation
/// @return JSON string
///
/// Object members are written in insertion order. Numbers are written
/// with their original literal text.
[[nodiscard]] JSON_DIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
///
/// A duplicated object key keeps its first position and its last value.
[[nodiscard]] JSON_DIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace json_diff

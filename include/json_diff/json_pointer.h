// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) helpers.
///
///   "/users/0/name"  ->  data["users"][0]["name"]
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// - Pointers start with "/" (the empty pointer "" is the whole document)
/// - Segments separated by "/"
/// - Escape sequences: "~0" -> "~", "~1" -> "/"
/// - Array indices are base-10 without leading zeros; "-" means "past the end"

#pragma once

#include "api.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace json_diff {

// Escape a single reference token: ~ -> ~0, / -> ~1
[[nodiscard]] JSON_DIFF_API std::string escape_pointer_segment(std::string_view segment);

// Inverse of escape_pointer_segment
[[nodiscard]] JSON_DIFF_API std::string unescape_pointer_segment(std::string_view segment);

// Append an object key (escaped) or an array index to a pointer
//   append_pointer("/a", "b/c") -> "/a/b~1c"
//   append_pointer("", 3)       -> "/3"
[[nodiscard]] JSON_DIFF_API std::string append_pointer(std::string_view base, std::string_view key);
[[nodiscard]] JSON_DIFF_API std::string append_pointer(std::string_view base, std::size_t index);

// Split a pointer into unescaped segments
//   "/users/0/name" -> ["users", "0", "name"]
//   ""              -> []
//   "/"             -> [""]
// Returns std::nullopt when a non-empty pointer doesn't start with '/'
[[nodiscard]] JSON_DIFF_API std::optional<std::vector<std::string>> split_json_pointer(std::string_view pointer);

// Parse an array index segment ("0", "17"); rejects "-", signs, leading zeros
[[nodiscard]] JSON_DIFF_API std::optional<std::size_t> parse_array_index(std::string_view segment);

// "/a/b/0" -> "/a/b"; "/a" -> ""; "" -> ""
[[nodiscard]] JSON_DIFF_API std::string_view parent_pointer(std::string_view pointer);

// Last raw (still escaped) segment: "/a/b~1c" -> "b~1c"
[[nodiscard]] JSON_DIFF_API std::string_view last_segment(std::string_view pointer);

// True when @p pointer equals @p prefix or lies below it
[[nodiscard]] JSON_DIFF_API bool pointer_starts_with(std::string_view pointer, std::string_view prefix);

} // namespace json_diff

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_apply.h
/// @brief Apply RFC 6902 patches to immutable Values.
///
/// The input document is never modified; each step returns a new Value
/// sharing structure with the previous one. Application stops at the
/// first failing operation and reports its index:
/// @code
///   auto result = apply_patch(doc, ops);
///   if (!result) {
///       std::cerr << "operation " << result.failed_at_index << ": " << result.error_message;
///   }
/// @endcode

#pragma once

#include "patch_operation.h"

#include <string_view>

namespace json_diff {

using ApplyResult = Result<Value>;

/// Value at @p pointer ("" is the whole document)
[[nodiscard]] JSON_DIFF_API ApplyResult get_by_pointer(const Value& document, std::string_view pointer);

/// Apply a single operation
[[nodiscard]] JSON_DIFF_API ApplyResult apply_operation(const Value& document, const PatchOperation& op);

/// Apply operations in order
[[nodiscard]] JSON_DIFF_API ApplyResult apply_patch(const Value& document, const PatchOperationList& ops);

} // namespace json_diff

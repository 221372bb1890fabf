// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_equality.h
/// @brief JSON value equality used by every diff decision.
///
/// Rules:
/// - Different kinds are never equal
/// - Numbers compare as exact decimals: 1 == 1.0 == 1e0 == 10e-1, with no
///   limit on digit count or exponent size
/// - Objects: same member count and equal members, key order ignored
/// - Arrays: same length and elementwise equal in order
/// - Null, Bool, String: direct equality
///
/// A Number whose literal is not a valid JSON number throws
/// DiffOperationError.

#pragma once

#include "value.h"
#include "result.h"

namespace json_diff {

/// Switches to textual comparison of containers
struct CompareOptions {
    bool serialize_objects = false;  // Compare objects by compact JSON text
    bool serialize_arrays = false;   // Compare arrays by compact JSON text
};

[[nodiscard]] JSON_DIFF_API bool numbers_equal(const Number& a, const Number& b);

[[nodiscard]] JSON_DIFF_API bool values_equal(const Value& a, const Value& b);

[[nodiscard]] JSON_DIFF_API bool values_equal(const Value& a, const Value& b, const CompareOptions& options);

} // namespace json_diff

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_options.h
/// @brief Runtime configuration of patch generation.

#pragma once

#include "value_equality.h"

#include <cstddef>

namespace json_diff {

/// Array diff strategy
enum class ArrayDiffMode {
    Full,   // LCS alignment, O(m*n) time and space; enables move detection
    Fast,   // Positional comparison, O(max(m, n)) time
};

struct PatchOptions {
    ArrayDiffMode array_diff_mode = ArrayDiffMode::Full;

    /// Run the optimizer: move detection on arrays and duplicate-path collapse
    bool optimize_patch = true;

    /// When false, a changed array is replaced as a whole
    bool use_array_diff = true;

    /// When true, members missing from the updated object are not removed
    bool ignore_removals = false;

    /// Pretty-print RFC 6902 text output (2-space indent)
    bool format_output = true;

    /// Full mode falls back to the bounded algorithm above this length
    std::size_t max_array_size_for_lcs = 100;

    /// Bounded algorithm: equal-length arrays get per-index replaces
    /// instead of one whole-array replace
    bool use_positional_array_patching = true;

    /// Compare objects / arrays by their compact JSON text
    bool deep_compare_objects = false;
    bool deep_compare_arrays = false;

    [[nodiscard]] CompareOptions compare_options() const noexcept {
        return CompareOptions{deep_compare_objects, deep_compare_arrays};
    }
};

} // namespace json_diff

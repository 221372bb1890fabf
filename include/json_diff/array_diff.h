// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_diff.h
/// @brief Array element diff: LCS alignment (Full) or positional (Fast).
///
/// Full mode output order:
/// 1. removes, descending original index
/// 2. replaces and adds, ascending updated index
///
/// Within each gap between aligned elements, unmatched originals and
/// unmatched updates are paired front to front and become replaces at the
/// updated index. That makes [1,2,3] -> [1,4,3,5] produce
/// "replace /1 4" and "add /3 5".

#pragma once

#include "patch_operation.h"
#include "patch_options.h"

#include <string_view>
#include <vector>

namespace json_diff {

/// One aligned element of the longest common subsequence
struct IndexPair {
    std::size_t orig_index;
    std::size_t upd_index;

    bool operator==(const IndexPair&) const = default;
};

class JSON_DIFF_API ArrayDiffer {
public:
    ArrayDiffer() = default;
    ArrayDiffer(ArrayDiffMode mode, bool optimize, CompareOptions compare = {})
        : mode_(mode), optimize_(optimize), compare_(compare) {}

    /// Operations turning @p original into @p updated, paths under @p base_path
    [[nodiscard]] PatchOperationList diff(std::string_view base_path,
                                          const ValueArray& original,
                                          const ValueArray& updated) const;

    /// Aligned pairs in ascending order. Ties while backtracking step back
    /// in @p original first.
    /// @throws DiffOperationError if the backtrack disagrees with the table
    [[nodiscard]] std::vector<IndexPair> longest_common_subsequence(const ValueArray& original,
                                                                    const ValueArray& updated) const;

    /// Bounded fallback for arrays too large for the LCS table:
    /// equal lengths with @p positional give per-index replaces,
    /// anything else replaces the whole array.
    [[nodiscard]] static PatchOperationList diff_simple(std::string_view base_path,
                                                        const ValueArray& original,
                                                        const ValueArray& updated,
                                                        bool positional,
                                                        const CompareOptions& compare = {});

    [[nodiscard]] ArrayDiffMode mode() const noexcept { return mode_; }

private:
    PatchOperationList diff_full(std::string_view base_path,
                                 const ValueArray& original,
                                 const ValueArray& updated) const;
    PatchOperationList diff_fast(std::string_view base_path,
                                 const ValueArray& original,
                                 const ValueArray& updated) const;

    ArrayDiffMode mode_ = ArrayDiffMode::Full;
    bool optimize_ = true;
    CompareOptions compare_;
};

/// Diff two arrays with optimization on and default comparison
[[nodiscard]] JSON_DIFF_API PatchOperationList diff_array(std::string_view base_path,
                                                          const ValueArray& original,
                                                          const ValueArray& updated,
                                                          ArrayDiffMode mode = ArrayDiffMode::Full);

} // namespace json_diff

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_optimizer.h
/// @brief Post-processing of generated patches.
///
/// Rules, applied in place (surviving operations keep their order):
/// 1. Move detection (array context only): a remove of an element and a
///    later add of an equal value under the same array become one move.
///    The rewrite is kept only if replaying it on the original array
///    still yields the updated array.
/// 2. Duplicate-path collapse: of two operations on the same path with
///    nothing touching that path in between, the later one wins
///    (replace+replace, replace+remove), and add+replace folds into a
///    single add carrying the later value.
/// 3. No-op removal: moves whose source equals their target.
///
/// Rules 2 and 3 repeat until nothing changes, so optimize() is idempotent.

#pragma once

#include "patch_operation.h"
#include "value_equality.h"

#include <string>

namespace json_diff {

/// The array a list of element operations was generated for
struct ArrayContext {
    std::string base_path;
    ValueArray original;
    ValueArray updated;
};

class JSON_DIFF_API PatchOptimizer {
public:
    PatchOptimizer() = default;
    explicit PatchOptimizer(CompareOptions compare) : compare_(compare) {}

    /// Rules 2 and 3
    void optimize(PatchOperationList& ops) const;

    /// Rule 1, then rules 2 and 3
    void optimize(PatchOperationList& ops, const ArrayContext& context) const;

    /// @return number of remove/add pairs turned into moves
    std::size_t detect_moves(PatchOperationList& ops, const ArrayContext& context) const;

    /// @return number of operations dropped
    std::size_t collapse_duplicate_paths(PatchOperationList& ops) const;

    /// @return number of operations dropped
    std::size_t remove_noops(PatchOperationList& ops) const;

private:
    CompareOptions compare_;
};

} // namespace json_diff

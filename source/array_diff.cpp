// array_diff.cpp - LCS and positional array diff

#include <json_diff/array_diff.h>
#include <json_diff/json_pointer.h>
#include <json_diff/patch_optimizer.h>

#include <algorithm>
#include <cstdint>

namespace json_diff {

PatchOperationList ArrayDiffer::diff(std::string_view base_path,
                                     const ValueArray& original,
                                     const ValueArray& updated) const
{
    // immer container identity check - O(1)
    if (original.impl().root == updated.impl().root &&
        original.impl().tail == updated.impl().tail &&
        original.impl().size == updated.impl().size) {
        return {};
    }
    return mode_ == ArrayDiffMode::Full ? diff_full(base_path, original, updated)
                                        : diff_fast(base_path, original, updated);
}

std::vector<IndexPair> ArrayDiffer::longest_common_subsequence(const ValueArray& original,
                                                               const ValueArray& updated) const
{
    const std::size_t m = original.size();
    const std::size_t n = updated.size();
    const std::size_t width = n + 1;

    // dp[i][j]: LCS length of original[0, i) and updated[0, j)
    std::vector<std::uint32_t> dp((m + 1) * width, 0);
    auto at = [&dp, width](std::size_t i, std::size_t j) -> std::uint32_t& {
        return dp[i * width + j];
    };

    for (std::size_t i = 0; i < m; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            if (values_equal(*original[i], *updated[j], compare_)) {
                at(i + 1, j + 1) = at(i, j) + 1;
            } else {
                at(i + 1, j + 1) = std::max(at(i + 1, j), at(i, j + 1));
            }
        }
    }

    std::vector<IndexPair> pairs;
    pairs.reserve(at(m, n));

    std::size_t x = m;
    std::size_t y = n;
    while (x > 0 && y > 0) {
        if (values_equal(*original[x - 1], *updated[y - 1], compare_)) {
            pairs.push_back(IndexPair{x - 1, y - 1});
            --x;
            --y;
        } else if (at(x - 1, y) >= at(x, y - 1)) {
            --x;
        } else {
            --y;
        }
    }
    std::reverse(pairs.begin(), pairs.end());

    if (pairs.size() != at(m, n)) {
        throw DiffOperationError("LCS backtrack produced " + std::to_string(pairs.size())
                                 + " pairs, table length is " + std::to_string(at(m, n)));
    }
    for (const auto& pair : pairs) {
        if (pair.orig_index >= m || pair.upd_index >= n) {
            throw DiffOperationError("LCS pair (" + std::to_string(pair.orig_index) + ", "
                                     + std::to_string(pair.upd_index) + ") out of range");
        }
    }
    return pairs;
}

PatchOperationList ArrayDiffer::diff_full(std::string_view base_path,
                                          const ValueArray& original,
                                          const ValueArray& updated) const
{
    const auto pairs = longest_common_subsequence(original, updated);

    std::vector<std::size_t> removed;
    PatchOperationList forward;

    std::size_t next_orig = 0;
    std::size_t next_upd = 0;

    // Unaligned elements up to (orig_end, upd_end), exclusive
    auto close_gap = [&](std::size_t orig_end, std::size_t upd_end) {
        const std::size_t r = orig_end - next_orig;
        const std::size_t a = upd_end - next_upd;
        const std::size_t paired = std::min(r, a);

        for (std::size_t k = 0; k < paired; ++k) {
            const std::size_t j = next_upd + k;
            forward.push_back(PatchOperation::replace(append_pointer(base_path, j), updated[j].get()));
        }
        for (std::size_t k = paired; k < r; ++k) {
            removed.push_back(next_orig + k);
        }
        for (std::size_t k = paired; k < a; ++k) {
            const std::size_t j = next_upd + k;
            forward.push_back(PatchOperation::add(append_pointer(base_path, j), updated[j].get()));
        }
    };

    for (const auto& pair : pairs) {
        close_gap(pair.orig_index, pair.upd_index);
        next_orig = pair.orig_index + 1;
        next_upd = pair.upd_index + 1;
    }
    close_gap(original.size(), updated.size());

    PatchOperationList ops;
    ops.reserve(removed.size() + forward.size());
    for (auto it = removed.rbegin(); it != removed.rend(); ++it) {
        ops.push_back(PatchOperation::remove(append_pointer(base_path, *it)));
    }
    for (auto& op : forward) {
        ops.push_back(std::move(op));
    }

    if (optimize_) {
        PatchOptimizer{compare_}.optimize(ops, ArrayContext{std::string(base_path), original, updated});
    }
    return ops;
}

PatchOperationList ArrayDiffer::diff_fast(std::string_view base_path,
                                          const ValueArray& original,
                                          const ValueArray& updated) const
{
    const std::size_t m = original.size();
    const std::size_t n = updated.size();
    const std::size_t common = std::min(m, n);

    PatchOperationList ops;
    for (std::size_t i = 0; i < common; ++i) {
        if (!values_equal(*original[i], *updated[i], compare_)) {
            ops.push_back(PatchOperation::replace(append_pointer(base_path, i), updated[i].get()));
        }
    }
    for (std::size_t i = m; i > common; --i) {
        ops.push_back(PatchOperation::remove(append_pointer(base_path, i - 1)));
    }
    for (std::size_t i = common; i < n; ++i) {
        ops.push_back(PatchOperation::add(append_pointer(base_path, i), updated[i].get()));
    }
    return ops;
}

PatchOperationList ArrayDiffer::diff_simple(std::string_view base_path,
                                            const ValueArray& original,
                                            const ValueArray& updated,
                                            bool positional,
                                            const CompareOptions& compare)
{
    PatchOperationList ops;
    if (positional && original.size() == updated.size()) {
        for (std::size_t i = 0; i < original.size(); ++i) {
            if (!values_equal(*original[i], *updated[i], compare)) {
                ops.push_back(PatchOperation::replace(append_pointer(base_path, i), updated[i].get()));
            }
        }
        return ops;
    }
    if (!values_equal(Value{original}, Value{updated}, compare)) {
        ops.push_back(PatchOperation::replace(std::string(base_path), Value{updated}));
    }
    return ops;
}

PatchOperationList diff_array(std::string_view base_path,
                              const ValueArray& original,
                              const ValueArray& updated,
                              ArrayDiffMode mode)
{
    return ArrayDiffer{mode, true}.diff(base_path, original, updated);
}

} // namespace json_diff

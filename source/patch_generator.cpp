// patch_generator.cpp - Recursive document diff

#include <json_diff/patch_generator.h>
#include <json_diff/array_diff.h>
#include <json_diff/json_pointer.h>
#include <json_diff/patch_optimizer.h>
#include <json_diff/serialization.h>

#include <algorithm>
#include <chrono>
#include <new>

namespace json_diff {

namespace {

bool is_blank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    });
}

} // anonymous namespace

PatchResult PatchGenerator::generate(const Value& original, const Value& updated) const
{
    const auto start = std::chrono::steady_clock::now();

    try {
        PatchOperationList ops;
        std::string path;
        path.reserve(64);
        diff_value(original, updated, path, ops);

        if (options_.optimize_patch) {
            PatchOptimizer{options_.compare_options()}.optimize(ops);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        detail::log_trace("PatchGenerator",
                          "generated " + std::to_string(ops.size()) + " operations in "
                              + std::to_string(elapsed.count()) + "us");
        return PatchResult::ok(std::move(ops));
    } catch (const DiffOperationError& e) {
        detail::log_access_error("PatchGenerator::generate", e.what());
        return PatchResult::fail(e.code(), e.what());
    } catch (const std::bad_alloc&) {
        // Usually the LCS table of arrays admitted by a raised max_array_size_for_lcs
        detail::log_access_error("PatchGenerator::generate", "out of memory");
        return PatchResult::fail(DiffErrorCode::OperationFailed,
                                 "out of memory while diffing; lower max_array_size_for_lcs or use Fast mode");
    }
}

PatchResult PatchGenerator::generate_from_json(std::string_view original_json,
                                               std::string_view updated_json) const
{
    if (is_blank(original_json)) {
        return PatchResult::fail(DiffErrorCode::InvalidArgument, "original JSON is empty");
    }
    if (is_blank(updated_json)) {
        return PatchResult::fail(DiffErrorCode::InvalidArgument, "updated JSON is empty");
    }

    std::string error;
    Value original = from_json(std::string(original_json), &error);
    if (!error.empty()) {
        return PatchResult::fail(DiffErrorCode::ParseError, "original JSON: " + error);
    }
    Value updated = from_json(std::string(updated_json), &error);
    if (!error.empty()) {
        return PatchResult::fail(DiffErrorCode::ParseError, "updated JSON: " + error);
    }
    return generate(original, updated);
}

Result<std::string> PatchGenerator::generate_json(std::string_view original_json,
                                                  std::string_view updated_json) const
{
    auto result = generate_from_json(original_json, updated_json);
    if (!result) {
        return Result<std::string>::fail(result.error_code, std::move(result.error_message));
    }
    return Result<std::string>::ok(to_json(result.value, !options_.format_output));
}

void PatchGenerator::diff_value(const Value& original, const Value& updated,
                                std::string& path, PatchOperationList& ops) const
{
    // Same node (shared subtree), no changes
    if (&original.data == &updated.data) {
        return;
    }

    if (original.data.index() != updated.data.index()) [[unlikely]] {
        ops.push_back(PatchOperation::replace(path, updated));
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueObject>) {
            if (options_.deep_compare_objects && values_equal(original, updated, options_.compare_options())) {
                return;
            }
            diff_object(old_arg, std::get<ValueObject>(updated.data), path, ops);
        }
        else if constexpr (std::is_same_v<T, ValueArray>) {
            diff_array(old_arg, std::get<ValueArray>(updated.data), path, ops);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null, no change
        }
        else {
            if (!values_equal(original, updated, options_.compare_options())) {
                ops.push_back(PatchOperation::replace(path, updated));
            }
        }
    }, original.data);
}

void PatchGenerator::diff_object(const ValueObject& original, const ValueObject& updated,
                                 std::string& path, PatchOperationList& ops) const
{
    // push/pop on the shared path string instead of copying it per member
    original.for_each([&](const std::string& key, const Value& old_val) {
        const auto saved = path.size();
        path += '/';
        path += escape_pointer_segment(key);

        if (const Value* new_val = updated.find(key)) {
            diff_value(old_val, *new_val, path, ops);
        } else if (!options_.ignore_removals) {
            ops.push_back(PatchOperation::remove(path));
        }

        path.resize(saved);
    });

    updated.for_each([&](const std::string& key, const Value& new_val) {
        if (!original.contains(key)) {
            ops.push_back(PatchOperation::add(append_pointer(path, key), new_val));
        }
    });
}

void PatchGenerator::diff_array(const ValueArray& original, const ValueArray& updated,
                                std::string& path, PatchOperationList& ops) const
{
    const auto compare = options_.compare_options();

    if (!options_.use_array_diff) {
        if (!values_equal(Value{original}, Value{updated}, compare)) {
            ops.push_back(PatchOperation::replace(path, Value{updated}));
        }
        return;
    }

    PatchOperationList element_ops;
    const std::size_t limit = options_.max_array_size_for_lcs;
    if (options_.array_diff_mode == ArrayDiffMode::Full
        && (original.size() > limit || updated.size() > limit)) {
        detail::log_trace("PatchGenerator",
                          "array at '" + path + "' exceeds " + std::to_string(limit)
                              + " elements, using bounded diff");
        element_ops = ArrayDiffer::diff_simple(path, original, updated,
                                               options_.use_positional_array_patching, compare);
    } else {
        element_ops = ArrayDiffer{options_.array_diff_mode, options_.optimize_patch, compare}
                          .diff(path, original, updated);
    }

    ops.insert(ops.end(),
               std::make_move_iterator(element_ops.begin()),
               std::make_move_iterator(element_ops.end()));
}

PatchResult generate_patch(const Value& original, const Value& updated, const PatchOptions& options)
{
    return PatchGenerator{options}.generate(original, updated);
}

} // namespace json_diff

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_generator.h
/// @brief Recursive document diff producing an RFC 6902 patch.
///
/// Walk rules at each path:
/// - Different kinds: replace, no recursion
/// - Objects: keys of the original in insertion order (recurse or remove),
///   then keys only in the updated object, in its insertion order (add)
/// - Arrays: ArrayDiffer (or a whole replace when array diff is disabled)
/// - Scalars of the same kind: replace when not equal
///
/// Usage:
/// @code
///   PatchGenerator generator;
///   auto result = generator.generate(original, updated);
///   if (result) {
///       std::cout << to_json(result.value) << "\n";
///   }
///
///   // From JSON text, straight to JSON text
///   auto text = generator.generate_json(R"({"a":1})", R"({"a":2})");
/// @endcode

#pragma once

#include "patch_operation.h"
#include "patch_options.h"

#include <string>
#include <string_view>

namespace json_diff {

class JSON_DIFF_API PatchGenerator {
public:
    PatchGenerator() = default;
    explicit PatchGenerator(PatchOptions options) : options_(std::move(options)) {}

    /// Patch turning @p original into @p updated.
    /// Running out of memory (an oversized LCS table) fails with OperationFailed.
    [[nodiscard]] PatchResult generate(const Value& original, const Value& updated) const;

    /// Same, parsing both documents first.
    /// Blank text fails with InvalidArgument, unparsable text with ParseError.
    [[nodiscard]] PatchResult generate_from_json(std::string_view original_json,
                                                 std::string_view updated_json) const;

    /// Patch rendered as RFC 6902 text, indented when options().format_output
    [[nodiscard]] Result<std::string> generate_json(std::string_view original_json,
                                                    std::string_view updated_json) const;

    [[nodiscard]] const PatchOptions& options() const noexcept { return options_; }

private:
    void diff_value(const Value& original, const Value& updated, std::string& path, PatchOperationList& ops) const;
    void diff_object(const ValueObject& original, const ValueObject& updated, std::string& path, PatchOperationList& ops) const;
    void diff_array(const ValueArray& original, const ValueArray& updated, std::string& path, PatchOperationList& ops) const;

    PatchOptions options_;
};

/// Convenience wrapper: PatchGenerator{options}.generate(original, updated)
[[nodiscard]] JSON_DIFF_API PatchResult generate_patch(const Value& original,
                                                       const Value& updated,
                                                       const PatchOptions& options = {});

} // namespace json_diff

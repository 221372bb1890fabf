// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file result.h
/// @brief Error codes and result types returned by the public entry points.
///
/// Internal failures are raised as DiffOperationError and converted into a
/// failed Result at the API boundary, so callers never see a partially
/// built patch:
/// @code
///   auto result = generate_patch(original, updated);
///   if (!result) {
///       std::cerr << to_string(result.error_code) << ": " << result.error_message;
///   }
///   const PatchOperationList& ops = result.get();  // throws on failure
/// @endcode

#pragma once

#include "api.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace json_diff {

enum class DiffErrorCode {
    Success = 0,
    InvalidArgument,    // Blank JSON input, patch operation missing a member
    ParseError,         // JSON text could not be parsed
    OperationFailed,    // Internal invariant violated while diffing
    InvalidPointer,     // Malformed JSON Pointer
    PathNotFound,       // Object member doesn't exist
    IndexOutOfRange,    // Array index out of bounds
    TypeMismatch,       // Expected container type, got something else
    TestFailed,         // "test" operation compared unequal
};

[[nodiscard]] JSON_DIFF_API std::string_view to_string(DiffErrorCode code) noexcept;

/// Thrown inside the engine; carries the code reported by Result
class JSON_DIFF_API DiffOperationError : public std::runtime_error {
public:
    explicit DiffOperationError(const std::string& message,
                                DiffErrorCode code = DiffErrorCode::OperationFailed)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] DiffErrorCode code() const noexcept { return code_; }

private:
    DiffErrorCode code_;
};

template <typename T>
struct Result {
    T value{};                                 // Valid only when success is true
    bool success = false;
    DiffErrorCode error_code = DiffErrorCode::Success;
    std::string error_message;
    std::size_t failed_at_index = 0;           // Patch operation index, when applicable

    explicit operator bool() const noexcept { return success; }

    const T& get() const {
        if (!success) {
            throw DiffOperationError(std::string(to_string(error_code)) + ": " + error_message, error_code);
        }
        return value;
    }

    T get_or(T default_val) const {
        return success ? value : std::move(default_val);
    }

    static Result ok(T v) {
        Result r;
        r.value = std::move(v);
        r.success = true;
        return r;
    }

    static Result fail(DiffErrorCode code, std::string message, std::size_t index = 0) {
        Result r;
        r.error_code = code;
        r.error_message = std::move(message);
        r.failed_at_index = index;
        return r;
    }
};

} // namespace json_diff

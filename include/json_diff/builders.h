// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Values.
///
/// This file provides transient-based builders:
/// - ObjectBuilder: Build an insertion-ordered object efficiently
/// - ArrayBuilder: Build an array efficiently
///
/// Usage:
/// @code
///   #include <json_diff/builders.h>
///
///   Value user = ObjectBuilder()
///       .set("name", "Alice")
///       .set("age", 25)
///       .finish();
///
///   Value tags = ArrayBuilder()
///       .push_back("x")
///       .push_back("y")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace json_diff {

// ============================================================
// Builder classes for O(n) construction using immer's transient API
// ============================================================

/// Builder for constructing objects - O(n) complexity
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_object = BasicValueObject<MemoryPolicy>;
    using member_map   = typename value_object::member_map;
    using key_list     = typename value_object::key_list;

    BasicObjectBuilder()
        : members_(member_map{}.transient()), keys_(key_list{}.transient()) {}

    // Move operations (allowed)
    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    /// Set a member. A repeated key keeps its first position and takes the last value.
    template <typename T>
    BasicObjectBuilder& set(const std::string& key, T&& val) {
        if (members_.count(key) == 0) {
            keys_.push_back(key);
        }
        members_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return members_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return members_.size();
    }

    /// Finish building and return the immutable Value
    /// @warning Builder should not be used after calling finish()
    [[nodiscard]] value_type finish() {
        return value_type{value_object{members_.persistent(), keys_.persistent()}};
    }

private:
    typename member_map::transient_type members_;
    typename key_list::transient_type keys_;
};

/// Builder for constructing arrays - O(n) complexity
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_array    = BasicValueArray<MemoryPolicy>;
    using transient_type = typename value_array::transient_type;

    BasicArrayBuilder() : transient_(value_array{}.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;

    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    template <typename T>
    BasicArrayBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

using ObjectBuilder = BasicObjectBuilder<memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<memory_policy>;

} // namespace json_diff

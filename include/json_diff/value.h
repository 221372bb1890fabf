// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable JSON document tree used by the diff engine.
///
/// This file defines the Value type that can represent every JSON node:
/// - Null (std::monostate)
/// - Bool
/// - Number (the decimal literal text, compared numerically)
/// - String (UTF-8)
/// - Array: ordered sequence of boxed Values (immer::flex_vector)
/// - Object: insertion-ordered mapping with unique keys
///
/// The Value type is templated on an immer memory policy. Every "mutation"
/// returns a new Value that shares structure with the old one, so copying a
/// Value is a cheap structural deep copy and a tree can never contain itself.

#pragma once

#include "json_diff_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <charconv>        // for std::to_chars
#include <cmath>           // for std::isfinite
#include <concepts>        // for C++20 Concepts
#include <cstdint>
#include <cstdlib>         // for std::strtod
#include <initializer_list>
#include <iostream>
#include <source_location> // for std::source_location (C++20)
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace json_diff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if json_diff_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if json_diff_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if json_diff_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Progress messages from the generator and optimizer (json_diff_TRACE_LOG)
inline void log_trace(std::string_view component, std::string_view message) noexcept
{
#if json_diff_TRACE_LOG
    std::cerr << "[json_diff::" << component << "] " << message << "\n";
#else
    (void)component;
    (void)message;
#endif
}

} // namespace detail

// ============================================================
// Number
//
// Keeps the JSON literal exactly as written ("1.0", "1e2", "-0").
// Equality of two Numbers as JSON values is numeric and lives in
// value_equality.h; operator== here compares the text.
// ============================================================
struct Number {
    std::string literal;

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    static Number from_integer(T v) {
        return Number{std::to_string(v)};
    }

    /// Shortest text that round-trips to the same double
    static Number from_double(double v) {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        (void)ec;
        return Number{std::string(buf, ptr)};
    }

    [[nodiscard]] double to_double() const { return std::strtod(literal.c_str(), nullptr); }

    bool operator==(const Number&) const = default;
};

/// Node kind, in variant index order
enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Number,
    String,
    Array,
    Object,
};

[[nodiscard]] JSON_DIFF_API std::string_view to_string(ValueKind kind) noexcept;

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::flex_vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

// ============================================================
// BasicValueObject - insertion-ordered JSON object
//
// Members live in an immer::map for O(log n) lookup; the key order is
// kept beside it in a flex_vector. Both are persistent, so set/erase
// return a new object.
// ============================================================
template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box  = BasicValueBox<MemoryPolicy>;
    using member_map = immer::map<std::string,
                                  value_box,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;
    using key_list   = immer::flex_vector<std::string, MemoryPolicy>;

    BasicValueObject() = default;
    BasicValueObject(member_map members, key_list keys)
        : members_(std::move(members)), keys_(std::move(keys)) {}

    [[nodiscard]] std::size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] bool empty() const noexcept { return members_.size() == 0; }

    [[nodiscard]] bool contains(const std::string& key) const { return members_.count(key) > 0; }

    [[nodiscard]] const value_type* find(const std::string& key) const {
        if (auto* found = members_.find(key)) return &found->get();
        return nullptr;
    }

    /// Replaces the member in place or appends a new key at the end
    [[nodiscard]] BasicValueObject set(const std::string& key, value_type val) const {
        auto keys = contains(key) ? keys_ : keys_.push_back(key);
        return BasicValueObject{members_.set(key, value_box{std::move(val)}), std::move(keys)};
    }

    [[nodiscard]] BasicValueObject erase(const std::string& key) const {
        if (!contains(key)) return *this;
        for (std::size_t i = 0; i < keys_.size(); ++i) {
            if (keys_[i] == key) {
                return BasicValueObject{members_.erase(key), keys_.erase(i)};
            }
        }
        return BasicValueObject{members_.erase(key), keys_};
    }

    [[nodiscard]] const key_list& keys() const noexcept { return keys_; }
    [[nodiscard]] const member_map& members() const noexcept { return members_; }

    /// Visit members in insertion order: fn(const std::string&, const value_type&)
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& key : keys_) {
            if (auto* found = members_.find(key)) {
                fn(key, found->get());
            }
        }
    }

    // Key order does not take part in equality
    bool operator==(const BasicValueObject& other) const { return members_ == other.members_; }
    bool operator!=(const BasicValueObject& other) const { return !(*this == other); }

private:
    member_map members_;
    key_list keys_;
};

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 Number,
                 std::string,
                 value_array,
                 value_object>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    BasicValue(T v) : data(Number::from_integer(v)) {}

    // NaN and infinities have no JSON spelling and become null
    template <std::floating_point T>
    BasicValue(T v) : data(std::monostate{}) {
        if (std::isfinite(v)) data = Number::from_double(static_cast<double>(v));
    }

    BasicValue(Number v) : data(std::move(v)) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_array v) : data(std::move(v)) {}
    BasicValue(value_object v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        value_object result;
        for (const auto& [key, val] : init) {
            result = result.set(key, val);
        }
        return BasicValue{std::move(result)};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<Number>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return *found;
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    /// Pointer to a member, or nullptr; no logging
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* o = get_if<value_object>()) return o->find(key);
        return nullptr;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<Number>()) return p->to_double();
        return default_val;
    }

    [[nodiscard]] value_array as_array(value_array default_val = {}) const {
        if (auto* p = get_if<value_array>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_object as_object(value_object default_val = {}) const {
        if (auto* p = get_if<value_object>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<value_object>()) return o->contains(key);
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* a = get_if<value_array>()) return index < a->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* o = get_if<value_object>()) return o->set(key, std::move(val));
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return a->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "out of range or non-array type");
        return *this;
    }

    /// Inserts before @p index; index == size() appends
    [[nodiscard]] BasicValue insert(std::size_t index, BasicValue val) const {
        if (auto* a = get_if<value_array>()) {
            if (index <= a->size()) return a->insert(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::insert", index, "out of range or non-array type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* a = get_if<value_array>()) return a->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot append to non-array type");
        return *this;
    }

    [[nodiscard]] BasicValue erase(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (o->contains(key)) return o->erase(key);
        }
        detail::log_key_error("Value::erase", key, "not found or type mismatch");
        return *this;
    }

    [[nodiscard]] BasicValue erase(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return a->erase(index);
        }
        detail::log_index_error("Value::erase", index, "out of range or non-array type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* a = get_if<value_array>()) return a->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

#if JSON_DIFF_SINGLE_THREADED
using memory_policy = unsafe_memory_policy;
#else
using memory_policy = thread_safe_memory_policy;
#endif

// ============================================================
// Default Value Type Aliases
//
// Value follows the policy chosen in json_diff_config.h. The explicit
// aliases stay available for code that needs a specific policy.
// ============================================================
using Value       = BasicValue<memory_policy>;
using ValueBox    = BasicValueBox<memory_policy>;
using ValueArray  = BasicValueArray<memory_policy>;
using ValueObject = BasicValueObject<memory_policy>;

using UnsafeValue     = BasicValue<unsafe_memory_policy>;
using ThreadSafeValue = BasicValue<thread_safe_memory_policy>;

// ============================================================
// Strict structural comparison
//
// Numbers compare by literal text here. Use values_equal() from
// value_equality.h for JSON value semantics (1.0 == 1).
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Extern Template Declarations
//
// The instantiations live in value.cpp.
// ============================================================

JSON_DIFF_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;
JSON_DIFF_EXTERN_TEMPLATE class BasicValueObject<unsafe_memory_policy>;

JSON_DIFF_EXTERN_TEMPLATE struct BasicValue<thread_safe_memory_policy>;
JSON_DIFF_EXTERN_TEMPLATE class BasicValueObject<thread_safe_memory_policy>;

} // namespace json_diff

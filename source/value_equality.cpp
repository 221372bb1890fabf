// value_equality.cpp - Deep JSON value comparison

#include <json_diff/value_equality.h>
#include <json_diff/serialization.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <cctype>
#include <string>
#include <string_view>

namespace json_diff {

namespace {

using big_int = boost::multiprecision::cpp_int;

// ============================================================
// Exact decimal form
//
// value = (negative ? -1 : 1) * 0.d1d2...dn * 10^exponent, digits without
// leading or trailing zeros. Zero has no digits and is never negative, so
// two literals denote the same number exactly when their forms match.
// ============================================================

struct Decimal {
    bool negative = false;
    std::string digits;
    big_int exponent;
};

[[noreturn]] void malformed(const Number& n)
{
    throw DiffOperationError("Malformed number literal '" + n.literal + "'");
}

Decimal to_decimal(const Number& n)
{
    const std::string& s = n.literal;
    std::size_t pos = 0;
    auto digit_run = [&s, &pos]() {
        const std::size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        return std::string_view(s).substr(start, pos - start);
    };

    Decimal d;
    if (pos < s.size() && s[pos] == '-') {
        d.negative = true;
        ++pos;
    }

    const auto int_part = digit_run();
    if (int_part.empty() || (int_part.size() > 1 && int_part[0] == '0')) malformed(n);

    std::string_view frac_part;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        frac_part = digit_run();
        if (frac_part.empty()) malformed(n);
    }

    big_int exponent = 0;
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        bool exp_negative = false;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
            exp_negative = s[pos] == '-';
            ++pos;
        }
        const auto exp_digits = digit_run();
        if (exp_digits.empty()) malformed(n);
        // cpp_int reads a leading 0 as an octal prefix
        const auto significant = exp_digits.find_first_not_of('0');
        if (significant != std::string_view::npos) {
            exponent = big_int{std::string(exp_digits.substr(significant)).c_str()};
        }
        if (exp_negative) exponent = -exponent;
    }
    if (pos != s.size()) malformed(n);

    std::string digits{int_part};
    digits += frac_part;

    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Decimal{};
    }
    const auto last = digits.find_last_not_of('0');

    // int_part.frac_part * 10^e == 0.int_part frac_part * 10^(e + |int_part|)
    d.exponent = exponent + static_cast<long long>(int_part.size()) - static_cast<long long>(first);
    d.digits = digits.substr(first, last - first + 1);
    return d;
}

bool arrays_equal(const ValueArray& a, const ValueArray& b, const CompareOptions& options)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        // Shared nodes are equal without descending
        if (&a[i].get() == &b[i].get()) continue;
        if (!values_equal(*a[i], *b[i], options)) return false;
    }
    return true;
}

bool objects_equal(const ValueObject& a, const ValueObject& b, const CompareOptions& options)
{
    if (a.size() != b.size()) return false;
    for (const auto& key : a.keys()) {
        const Value* lhs = a.find(key);
        const Value* rhs = b.find(key);
        if (!rhs) return false;
        if (lhs == rhs) continue;
        if (!values_equal(*lhs, *rhs, options)) return false;
    }
    return true;
}

} // anonymous namespace

bool numbers_equal(const Number& a, const Number& b)
{
    if (a.literal == b.literal) {
        return true;
    }
    const Decimal lhs = to_decimal(a);
    const Decimal rhs = to_decimal(b);
    return lhs.negative == rhs.negative && lhs.digits == rhs.digits && lhs.exponent == rhs.exponent;
}

bool values_equal(const Value& a, const Value& b)
{
    return values_equal(a, b, CompareOptions{});
}

bool values_equal(const Value& a, const Value& b, const CompareOptions& options)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, Number>) {
            return numbers_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (options.serialize_arrays) return to_json(a, true) == to_json(b, true);
            return arrays_equal(lhs, rhs, options);
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (options.serialize_objects) return to_json(a, true) == to_json(b, true);
            return objects_equal(lhs, rhs, options);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

} // namespace json_diff

// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) helpers

#include <json_diff/json_pointer.h>
#include <json_diff/value.h>

#include <charconv>

namespace json_diff {

std::string escape_pointer_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string unescape_pointer_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

std::string append_pointer(std::string_view base, std::string_view key)
{
    std::string result{base};
    result += '/';
    result += escape_pointer_segment(key);
    return result;
}

std::string append_pointer(std::string_view base, std::size_t index)
{
    std::string result{base};
    result += '/';
    result += std::to_string(index);
    return result;
}

std::optional<std::vector<std::string>> split_json_pointer(std::string_view pointer)
{
    std::vector<std::string> segments;

    // Empty pointer refers to root
    if (pointer.empty()) {
        return segments;
    }

    if (pointer[0] != '/') {
        detail::log_access_error("split_json_pointer",
                                 "invalid pointer, must start with '/': " + std::string(pointer));
        return std::nullopt;
    }

    pointer.remove_prefix(1);
    while (true) {
        auto pos = pointer.find('/');
        segments.push_back(unescape_pointer_segment(pointer.substr(0, pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        pointer.remove_prefix(pos + 1);
    }
    return segments;
}

std::optional<std::size_t> parse_array_index(std::string_view segment)
{
    if (segment.empty() || (segment.size() > 1 && segment[0] == '0')) {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

std::string_view parent_pointer(std::string_view pointer)
{
    auto pos = pointer.rfind('/');
    if (pos == std::string_view::npos) {
        return {};
    }
    return pointer.substr(0, pos);
}

std::string_view last_segment(std::string_view pointer)
{
    auto pos = pointer.rfind('/');
    if (pos == std::string_view::npos) {
        return pointer;
    }
    return pointer.substr(pos + 1);
}

bool pointer_starts_with(std::string_view pointer, std::string_view prefix)
{
    if (pointer.size() < prefix.size() || pointer.substr(0, prefix.size()) != prefix) {
        return false;
    }
    return pointer.size() == prefix.size() || pointer[prefix.size()] == '/';
}

} // namespace json_diff

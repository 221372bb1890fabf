// value.cpp - Value type utilities and explicit instantiations

#include <json_diff/value.h>
#include <json_diff/builders.h>

namespace json_diff {

std::string_view to_string(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the code for the templates declared
// with 'extern template' in value.h, so only this translation unit
// pays for them.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicValueObject<unsafe_memory_policy>;
template class BasicObjectBuilder<unsafe_memory_policy>;
template class BasicArrayBuilder<unsafe_memory_policy>;

template struct BasicValue<thread_safe_memory_policy>;
template class BasicValueObject<thread_safe_memory_policy>;
template class BasicObjectBuilder<thread_safe_memory_policy>;
template class BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace json_diff

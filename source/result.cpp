// result.cpp - Error code names

#include <json_diff/result.h>

namespace json_diff {

std::string_view to_string(DiffErrorCode code) noexcept
{
    switch (code) {
        case DiffErrorCode::Success:         return "Success";
        case DiffErrorCode::InvalidArgument: return "Invalid argument";
        case DiffErrorCode::ParseError:      return "JSON parse error";
        case DiffErrorCode::OperationFailed: return "Diff operation failed";
        case DiffErrorCode::InvalidPointer:  return "Invalid JSON pointer";
        case DiffErrorCode::PathNotFound:    return "Path not found";
        case DiffErrorCode::IndexOutOfRange: return "Index out of range";
        case DiffErrorCode::TypeMismatch:    return "Type mismatch";
        case DiffErrorCode::TestFailed:      return "Test operation failed";
    }
    return "Unknown error";
}

} // namespace json_diff

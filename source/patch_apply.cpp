// patch_apply.cpp - RFC 6902 patch application on immutable Values

#include <json_diff/patch_apply.h>
#include <json_diff/json_pointer.h>
#include <json_diff/value_equality.h>

#include <functional>
#include <vector>

namespace json_diff {

namespace {

using Segments = std::vector<std::string>;
using LeafUpdate = std::function<Value(const Value& parent, const std::string& segment)>;

[[noreturn]] void fail(DiffErrorCode code, std::string message)
{
    throw DiffOperationError(std::move(message), code);
}

Segments split_or_throw(std::string_view pointer)
{
    auto segments = split_json_pointer(pointer);
    if (!segments) {
        fail(DiffErrorCode::InvalidPointer, "invalid JSON pointer '" + std::string(pointer) + "'");
    }
    return std::move(*segments);
}

std::size_t index_or_throw(const std::string& segment, std::size_t size, std::string_view pointer)
{
    auto index = parse_array_index(segment);
    if (!index) {
        fail(DiffErrorCode::InvalidPointer,
             "'" + segment + "' is not an array index in '" + std::string(pointer) + "'");
    }
    if (*index >= size) {
        fail(DiffErrorCode::IndexOutOfRange,
             "index " + segment + " out of range (size " + std::to_string(size) + ") in '"
                 + std::string(pointer) + "'");
    }
    return *index;
}

Value child_of(const Value& node, const std::string& segment, std::string_view pointer)
{
    if (auto* object = node.get_if<ValueObject>()) {
        if (auto* found = object->find(segment)) {
            return *found;
        }
        fail(DiffErrorCode::PathNotFound,
             "member '" + segment + "' not found in '" + std::string(pointer) + "'");
    }
    if (auto* array = node.get_if<ValueArray>()) {
        return (*array)[index_or_throw(segment, array->size(), pointer)].get();
    }
    fail(DiffErrorCode::TypeMismatch,
         "cannot descend into " + std::string(to_string(node.kind())) + " at '" + std::string(pointer) + "'");
}

Value resolve(const Value& root, const Segments& segments, std::string_view pointer)
{
    Value current = root;
    for (const auto& segment : segments) {
        current = child_of(current, segment, pointer);
    }
    return current;
}

/// Rebuilds the spine from the root down to the parent of the last segment
Value update_parent(const Value& node, const Segments& segments, std::size_t depth,
                    std::string_view pointer, const LeafUpdate& leaf)
{
    if (depth + 1 == segments.size()) {
        return leaf(node, segments[depth]);
    }
    const auto& segment = segments[depth];
    Value child = update_parent(child_of(node, segment, pointer), segments, depth + 1, pointer, leaf);
    if (node.is_object()) {
        return node.set(segment, std::move(child));
    }
    return node.set(index_or_throw(segment, node.size(), pointer), std::move(child));
}

Value add_value(const Value& document, std::string_view pointer, const Value& value)
{
    const auto segments = split_or_throw(pointer);
    if (segments.empty()) {
        return value;
    }
    return update_parent(document, segments, 0, pointer, [&](const Value& parent, const std::string& segment) {
        if (parent.is_object()) {
            return parent.set(segment, value);
        }
        if (parent.is_array()) {
            if (segment == "-") {
                return parent.push_back(value);
            }
            // Insertion allows index == size
            auto index = parse_array_index(segment);
            if (!index) {
                fail(DiffErrorCode::InvalidPointer,
                     "'" + segment + "' is not an array index in '" + std::string(pointer) + "'");
            }
            if (*index > parent.size()) {
                fail(DiffErrorCode::IndexOutOfRange,
                     "index " + segment + " past the end (size " + std::to_string(parent.size())
                         + ") in '" + std::string(pointer) + "'");
            }
            return parent.insert(*index, value);
        }
        fail(DiffErrorCode::TypeMismatch,
             "cannot add a member to " + std::string(to_string(parent.kind())) + " at '"
                 + std::string(pointer) + "'");
    });
}

Value remove_value(const Value& document, std::string_view pointer)
{
    const auto segments = split_or_throw(pointer);
    if (segments.empty()) {
        fail(DiffErrorCode::InvalidPointer, "cannot remove the document root");
    }
    return update_parent(document, segments, 0, pointer, [&](const Value& parent, const std::string& segment) {
        if (parent.is_object()) {
            if (!parent.contains(segment)) {
                fail(DiffErrorCode::PathNotFound,
                     "member '" + segment + "' not found in '" + std::string(pointer) + "'");
            }
            return parent.erase(segment);
        }
        if (parent.is_array()) {
            return parent.erase(index_or_throw(segment, parent.size(), pointer));
        }
        fail(DiffErrorCode::TypeMismatch,
             "cannot remove from " + std::string(to_string(parent.kind())) + " at '"
                 + std::string(pointer) + "'");
    });
}

Value replace_value(const Value& document, std::string_view pointer, const Value& value)
{
    const auto segments = split_or_throw(pointer);
    if (segments.empty()) {
        return value;
    }
    return update_parent(document, segments, 0, pointer, [&](const Value& parent, const std::string& segment) {
        if (parent.is_object()) {
            if (!parent.contains(segment)) {
                fail(DiffErrorCode::PathNotFound,
                     "member '" + segment + "' not found in '" + std::string(pointer) + "'");
            }
            return parent.set(segment, value);
        }
        if (parent.is_array()) {
            return parent.set(index_or_throw(segment, parent.size(), pointer), value);
        }
        fail(DiffErrorCode::TypeMismatch,
             "cannot replace inside " + std::string(to_string(parent.kind())) + " at '"
                 + std::string(pointer) + "'");
    });
}

const Value& required_value(const PatchOperation& op)
{
    if (!op.value) {
        fail(DiffErrorCode::InvalidArgument, "'" + std::string(to_string(op.op)) + "' requires a value");
    }
    return *op.value;
}

const std::string& required_from(const PatchOperation& op)
{
    if (!op.from) {
        fail(DiffErrorCode::InvalidArgument, "'" + std::string(to_string(op.op)) + "' requires 'from'");
    }
    return *op.from;
}

Value apply_or_throw(const Value& document, const PatchOperation& op)
{
    switch (op.op) {
        case OpType::Add:
            return add_value(document, op.path, required_value(op));
        case OpType::Remove:
            return remove_value(document, op.path);
        case OpType::Replace:
            return replace_value(document, op.path, required_value(op));
        case OpType::Move: {
            const auto& from = required_from(op);
            if (from == op.path) {
                // Still has to exist
                (void)resolve(document, split_or_throw(from), from);
                return document;
            }
            if (pointer_starts_with(op.path, from)) {
                fail(DiffErrorCode::InvalidArgument,
                     "cannot move '" + from + "' into its own child '" + op.path + "'");
            }
            Value moved = resolve(document, split_or_throw(from), from);
            return add_value(remove_value(document, from), op.path, moved);
        }
        case OpType::Copy: {
            const auto& from = required_from(op);
            return add_value(document, op.path, resolve(document, split_or_throw(from), from));
        }
        case OpType::Test: {
            Value actual = resolve(document, split_or_throw(op.path), op.path);
            if (!values_equal(actual, required_value(op))) {
                fail(DiffErrorCode::TestFailed, "value at '" + op.path + "' differs");
            }
            return document;
        }
    }
    fail(DiffErrorCode::InvalidArgument, "unknown operation");
}

} // anonymous namespace

ApplyResult get_by_pointer(const Value& document, std::string_view pointer)
{
    try {
        return ApplyResult::ok(resolve(document, split_or_throw(pointer), pointer));
    } catch (const DiffOperationError& e) {
        return ApplyResult::fail(e.code(), e.what());
    }
}

ApplyResult apply_operation(const Value& document, const PatchOperation& op)
{
    try {
        return ApplyResult::ok(apply_or_throw(document, op));
    } catch (const DiffOperationError& e) {
        return ApplyResult::fail(e.code(), e.what());
    }
}

ApplyResult apply_patch(const Value& document, const PatchOperationList& ops)
{
    Value current = document;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        auto step = apply_operation(current, ops[i]);
        if (!step) {
            return ApplyResult::fail(step.error_code,
                                     "operation " + std::to_string(i) + " (" + to_string(ops[i]) + "): "
                                         + step.error_message,
                                     i);
        }
        current = std::move(step.value);
    }
    return ApplyResult::ok(std::move(current));
}

} // namespace json_diff

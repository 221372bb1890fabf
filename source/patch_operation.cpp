// patch_operation.cpp - RFC 6902 document form of patch operations

#include <json_diff/patch_operation.h>
#include <json_diff/builders.h>
#include <json_diff/serialization.h>

namespace json_diff {

std::string_view to_string(OpType op) noexcept
{
    switch (op) {
        case OpType::Add:     return "add";
        case OpType::Remove:  return "remove";
        case OpType::Replace: return "replace";
        case OpType::Move:    return "move";
        case OpType::Copy:    return "copy";
        case OpType::Test:    return "test";
    }
    return "unknown";
}

std::optional<OpType> op_type_from_string(std::string_view name) noexcept
{
    if (name == "add")     return OpType::Add;
    if (name == "remove")  return OpType::Remove;
    if (name == "replace") return OpType::Replace;
    if (name == "move")    return OpType::Move;
    if (name == "copy")    return OpType::Copy;
    if (name == "test")    return OpType::Test;
    return std::nullopt;
}

Value to_value(const PatchOperation& op)
{
    ObjectBuilder builder;
    builder.set("op", std::string(to_string(op.op)));
    if (op.from) {
        builder.set("from", *op.from);
    }
    builder.set("path", op.path);
    if (op.value) {
        builder.set("value", *op.value);
    }
    return builder.finish();
}

Value to_value(const PatchOperationList& ops)
{
    ArrayBuilder builder;
    for (const auto& op : ops) {
        builder.push_back(to_value(op));
    }
    return builder.finish();
}

std::string to_json(const PatchOperationList& ops, bool compact)
{
    return to_json(to_value(ops), compact);
}

std::string to_string(const PatchOperation& op)
{
    std::string result{to_string(op.op)};
    result += ' ';
    if (op.from) {
        result += *op.from;
        result += " -> ";
    }
    result += op.path;
    if (op.value) {
        result += ' ';
        result += to_json(*op.value, true);
    }
    return result;
}

namespace {

PatchOperation operation_from_value(const Value& entry, std::size_t index)
{
    auto fail = [index](const std::string& message) {
        return DiffOperationError("operation " + std::to_string(index) + ": " + message,
                                  DiffErrorCode::InvalidArgument);
    };

    if (!entry.is_object()) {
        throw fail("expected an object, got " + std::string(to_string(entry.kind())));
    }

    const Value* op_name = entry.find("op");
    if (!op_name || !op_name->is_string()) {
        throw fail("missing string member 'op'");
    }
    auto type = op_type_from_string(op_name->as_string_view());
    if (!type) {
        throw fail("unknown op '" + op_name->as_string() + "'");
    }

    const Value* path = entry.find("path");
    if (!path || !path->is_string()) {
        throw fail("missing string member 'path'");
    }

    PatchOperation op;
    op.op = *type;
    op.path = path->as_string();

    switch (op.op) {
        case OpType::Add:
        case OpType::Replace:
        case OpType::Test: {
            const Value* value = entry.find("value");
            if (!value) {
                throw fail("'" + op_name->as_string() + "' requires member 'value'");
            }
            op.value = *value;
            break;
        }
        case OpType::Move:
        case OpType::Copy: {
            const Value* from = entry.find("from");
            if (!from || !from->is_string()) {
                throw fail("'" + op_name->as_string() + "' requires string member 'from'");
            }
            op.from = from->as_string();
            break;
        }
        case OpType::Remove:
            break;
    }
    return op;
}

} // anonymous namespace

PatchResult patch_from_value(const Value& doc)
{
    const auto* entries = doc.get_if<ValueArray>();
    if (!entries) {
        return PatchResult::fail(DiffErrorCode::InvalidArgument,
                                 "patch document must be an array, got " + std::string(to_string(doc.kind())));
    }

    PatchOperationList ops;
    ops.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        try {
            ops.push_back(operation_from_value((*entries)[i].get(), i));
        } catch (const DiffOperationError& e) {
            return PatchResult::fail(e.code(), e.what(), i);
        }
    }
    return PatchResult::ok(std::move(ops));
}

PatchResult parse_patch(const std::string& json_text)
{
    std::string error;
    Value doc = from_json(json_text, &error);
    if (!error.empty()) {
        return PatchResult::fail(DiffErrorCode::ParseError, error);
    }
    return patch_from_value(doc);
}

} // namespace json_diff

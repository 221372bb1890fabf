// patch_optimizer.cpp - Move detection and patch simplification

#include <json_diff/patch_optimizer.h>
#include <json_diff/json_pointer.h>

#include <limits>
#include <optional>
#include <vector>

namespace json_diff {

namespace {

// ============================================================
// Array replay
//
// Each slot remembers which original element it came from (its token),
// so an element can be followed through the removes and adds that
// precede a candidate move.
// ============================================================

constexpr std::size_t fresh_token = std::numeric_limits<std::size_t>::max();

struct Slot {
    std::size_t token;
    Value value;
};

using Slots = std::vector<Slot>;

Slots initial_slots(const ValueArray& original)
{
    Slots slots;
    slots.reserve(original.size());
    for (std::size_t i = 0; i < original.size(); ++i) {
        slots.push_back(Slot{i, original[i].get()});
    }
    return slots;
}

/// Index addressed by @p pointer inside the context array; "-" maps to @p size
std::optional<std::size_t> element_index(std::string_view base, std::string_view pointer, std::size_t size)
{
    if (pointer.size() <= base.size() || parent_pointer(pointer) != base) {
        return std::nullopt;
    }
    auto segment = last_segment(pointer);
    if (segment == "-") {
        return size;
    }
    return parse_array_index(segment);
}

/// Applies ops [0, stop) to @p slots; false when one of them doesn't apply
bool replay(const std::string& base, const PatchOperationList& ops, std::size_t stop, Slots& slots)
{
    for (std::size_t i = 0; i < stop; ++i) {
        const auto& op = ops[i];
        auto index = element_index(base, op.path, slots.size());
        if (!index) return false;

        switch (op.op) {
            case OpType::Add:
                if (*index > slots.size() || !op.value) return false;
                slots.insert(slots.begin() + static_cast<std::ptrdiff_t>(*index), Slot{fresh_token, *op.value});
                break;
            case OpType::Remove:
                if (*index >= slots.size()) return false;
                slots.erase(slots.begin() + static_cast<std::ptrdiff_t>(*index));
                break;
            case OpType::Replace:
                if (*index >= slots.size() || !op.value) return false;
                slots[*index] = Slot{fresh_token, *op.value};
                break;
            case OpType::Move: {
                if (!op.from) return false;
                auto from = element_index(base, *op.from, slots.size());
                if (!from || *from >= slots.size()) return false;
                Slot moved = slots[*from];
                slots.erase(slots.begin() + static_cast<std::ptrdiff_t>(*from));
                if (*index > slots.size()) return false;
                slots.insert(slots.begin() + static_cast<std::ptrdiff_t>(*index), std::move(moved));
                break;
            }
            case OpType::Copy:
            case OpType::Test:
                return false;
        }
    }
    return true;
}

bool reproduces(const Slots& slots, const ValueArray& updated, const CompareOptions& compare)
{
    if (slots.size() != updated.size()) return false;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!values_equal(slots[i].value, updated[i].get(), compare)) return false;
    }
    return true;
}

/// Builds the list with remove @p ri folded into add @p ai as a move.
std::optional<PatchOperationList> try_fold_move(const PatchOperationList& ops,
                                                 std::size_t ri,
                                                 std::size_t ai,
                                                 std::size_t original_index,
                                                 const ArrayContext& context,
                                                 const CompareOptions& compare)
{
    PatchOperationList trial = ops;
    trial.erase(trial.begin() + static_cast<std::ptrdiff_t>(ri));
    const std::size_t move_at = ai > ri ? ai - 1 : ai;

    // Where the element sits once everything before the move has run
    Slots slots = initial_slots(context.original);
    if (!replay(context.base_path, trial, move_at, slots)) {
        return std::nullopt;
    }
    std::size_t from = slots.size();
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].token == original_index) {
            from = i;
            break;
        }
    }
    if (from == slots.size()) {
        return std::nullopt;
    }

    trial[move_at] = PatchOperation::move(append_pointer(context.base_path, from), trial[move_at].path);

    Slots check = initial_slots(context.original);
    if (!replay(context.base_path, trial, trial.size(), check) || !reproduces(check, context.updated, compare)) {
        return std::nullopt;
    }
    return trial;
}

bool is_structural(OpType op)
{
    return op == OpType::Add || op == OpType::Remove || op == OpType::Move || op == OpType::Copy;
}

bool may_be_array_element(std::string_view pointer)
{
    auto segment = last_segment(pointer);
    return segment == "-" || parse_array_index(segment).has_value();
}

/// Whether @p k touches @p path or may shift the index it addresses
bool interferes(const PatchOperation& k, std::string_view path)
{
    auto overlaps = [path](std::string_view p) {
        return pointer_starts_with(p, path) || pointer_starts_with(path, p);
    };
    auto shifts = [path](std::string_view p) {
        return may_be_array_element(p) && pointer_starts_with(path, parent_pointer(p));
    };

    if (overlaps(k.path)) return true;
    if (k.from && overlaps(*k.from)) return true;
    if (is_structural(k.op)) {
        if (shifts(k.path)) return true;
        if (k.from && shifts(*k.from)) return true;
    }
    return false;
}

/// Collapses the first collapsible pair; false when there is none
bool collapse_once(PatchOperationList& ops)
{
    for (std::size_t i = 0; i < ops.size(); ++i) {
        for (std::size_t j = i + 1; j < ops.size(); ++j) {
            auto& earlier = ops[i];
            auto& later = ops[j];

            if (later.path == earlier.path) {
                if (earlier.op == OpType::Replace
                    && (later.op == OpType::Replace || later.op == OpType::Remove)) {
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(i));
                    return true;
                }
                if (earlier.op == OpType::Add && later.op == OpType::Replace && later.value) {
                    earlier.value = std::move(later.value);
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(j));
                    return true;
                }
                break;
            }
            if (interferes(later, earlier.path)) {
                break;
            }
        }
    }
    return false;
}

} // anonymous namespace

void PatchOptimizer::optimize(PatchOperationList& ops) const
{
    const std::size_t before = ops.size();
    while (collapse_duplicate_paths(ops) + remove_noops(ops) > 0) {
    }
    if (ops.size() != before) {
        detail::log_trace("PatchOptimizer",
                          "dropped " + std::to_string(before - ops.size()) + " redundant operations");
    }
}

void PatchOptimizer::optimize(PatchOperationList& ops, const ArrayContext& context) const
{
    const std::size_t moves = detect_moves(ops, context);
    if (moves > 0) {
        detail::log_trace("PatchOptimizer",
                          "detected " + std::to_string(moves) + " moves under '" + context.base_path + "'");
    }
    optimize(ops);
}

std::size_t PatchOptimizer::detect_moves(PatchOperationList& ops, const ArrayContext& context) const
{
    std::size_t moves = 0;
    std::size_t i = 0;
    while (i < ops.size()) {
        const auto& remove = ops[i];
        std::optional<std::size_t> original_index;
        if (remove.op == OpType::Remove) {
            original_index = element_index(context.base_path, remove.path, context.original.size());
        }
        if (!original_index || *original_index >= context.original.size()) {
            ++i;
            continue;
        }

        const Value& removed = context.original[*original_index].get();
        bool folded = false;
        for (std::size_t j = 0; j < ops.size() && !folded; ++j) {
            const auto& add = ops[j];
            if (add.op != OpType::Add || !add.value || parent_pointer(add.path) != context.base_path) {
                continue;
            }
            if (!values_equal(*add.value, removed, compare_)) {
                continue;
            }
            if (auto trial = try_fold_move(ops, i, j, *original_index, context, compare_)) {
                ops = std::move(*trial);
                ++moves;
                folded = true;
            }
        }
        // The fold erased ops[i], so the next candidate now sits at i
        if (!folded) {
            ++i;
        }
    }
    return moves;
}

std::size_t PatchOptimizer::collapse_duplicate_paths(PatchOperationList& ops) const
{
    const std::size_t before = ops.size();
    while (collapse_once(ops)) {
    }
    return before - ops.size();
}

std::size_t PatchOptimizer::remove_noops(PatchOperationList& ops) const
{
    return std::erase_if(ops, [](const PatchOperation& op) {
        return op.op == OpType::Move && op.from && *op.from == op.path;
    });
}

} // namespace json_diff

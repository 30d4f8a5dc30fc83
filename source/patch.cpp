// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// patch.cpp - Operation factories and the patch applier

#include <statecast/patch.h>

#include <cmath>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>

namespace statecast {

namespace {

constexpr std::string_view kComponent = "PatchApplier";

std::size_t checked_index(int64_t index, const char* op) {
    if (index < 0) {
        throw std::invalid_argument(std::string(op) + ": index must be non-negative, got "
                                    + std::to_string(index));
    }
    return static_cast<std::size_t>(index);
}

void check_map_key(const std::string& key, const char* op) {
    if (key.empty()) {
        throw std::invalid_argument(std::string(op) + ": map key must be a non-empty string");
    }
}

void warn_skip(const PatchOperation& op, const Path& path, std::string_view reason) {
    detail::log_warning(kComponent, std::string(operation_name(op)) + " at " + path.to_string()
                                        + " skipped: " + std::string(reason));
}

bool fits_int64(double d) {
    return d >= static_cast<double>(std::numeric_limits<int64_t>::min())
        && d < static_cast<double>(std::numeric_limits<int64_t>::max());
}

// Integer + integral delta stays an integer (int32 widens when it would
// overflow); everything else is computed in double.
std::optional<Value> incremented(const Value& current, double delta) {
    const bool integral_delta = std::floor(delta) == delta && fits_int64(delta);
    if (current.is_integer() && integral_delta) {
        const int64_t lhs = current.as_int64();
        const auto rhs = static_cast<int64_t>(delta);
        if ((rhs > 0 && lhs > std::numeric_limits<int64_t>::max() - rhs)
            || (rhs < 0 && lhs < std::numeric_limits<int64_t>::min() - rhs)) {
            return Value{static_cast<double>(lhs) + delta};
        }
        const int64_t sum = lhs + rhs;
        if (current.is<int32_t>() && sum >= std::numeric_limits<int32_t>::min()
            && sum <= std::numeric_limits<int32_t>::max()) {
            return Value{static_cast<int32_t>(sum)};
        }
        return Value{sum};
    }
    if (current.is_number()) {
        return Value{current.as_number() + delta};
    }
    return std::nullopt;
}

ApplyStatus apply_list_op(Value& tree, const PatchOperation& op, const Path& path,
                          const std::function<std::optional<ValueVector>(const ValueVector&)>& fn)
{
    auto target = get_at_path(tree, path);
    auto* vec = target ? target->get_if<ValueVector>() : nullptr;
    if (!vec) {
        warn_skip(op, path, target ? "target is " + std::string(type_name(*target)) + ", not a vector"
                                   : std::string("target does not exist"));
        return ApplyStatus::Skipped;
    }
    auto updated = fn(*vec);
    if (!updated) return ApplyStatus::Skipped;
    return set_at_path(tree, path, Value{std::move(*updated)}) ? ApplyStatus::Applied : ApplyStatus::Skipped;
}

ApplyStatus apply_map_op(Value& tree, const PatchOperation& op, const Path& path_to_map,
                         const std::function<ValueMap(const ValueMap&)>& fn)
{
    auto target = get_at_path(tree, path_to_map);
    auto* map = target ? target->get_if<ValueMap>() : nullptr;
    if (!map) {
        warn_skip(op, path_to_map, target ? "target is " + std::string(type_name(*target)) + ", not a map"
                                          : std::string("target does not exist"));
        return ApplyStatus::Skipped;
    }
    return set_at_path(tree, path_to_map, Value{fn(*map)}) ? ApplyStatus::Applied : ApplyStatus::Skipped;
}

} // anonymous namespace

std::string_view to_string(Reliability reliability) noexcept
{
    return reliability == Reliability::Unreliable ? "unreliable" : "reliable";
}

// ============================================================
// Factories
// ============================================================

PatchOperation op_set(Path path, Value value, Reliability reliability)
{
    return {ops::Set{std::move(path), std::move(value)}, reliability};
}

PatchOperation op_delete(Path path, Reliability reliability)
{
    return {ops::Delete{std::move(path)}, reliability};
}

PatchOperation op_increment(Path path, double delta, Reliability reliability)
{
    if (!std::isfinite(delta)) {
        throw std::invalid_argument("increment: delta must be a finite number");
    }
    return {ops::Increment{std::move(path), delta}, reliability};
}

PatchOperation op_list_push(Path path, Value value, Reliability reliability)
{
    return {ops::ListPush{std::move(path), std::move(value)}, reliability};
}

PatchOperation op_list_insert(Path path, int64_t index, Value value, Reliability reliability)
{
    return {ops::ListInsert{std::move(path), checked_index(index, "listInsert"), std::move(value)}, reliability};
}

PatchOperation op_list_remove_at(Path path, int64_t index, Reliability reliability)
{
    return {ops::ListRemoveAt{std::move(path), checked_index(index, "listRemoveAt")}, reliability};
}

PatchOperation op_map_set(Path path_to_map, std::string key, Value value, Reliability reliability)
{
    check_map_key(key, "mapSet");
    return {ops::MapSet{std::move(path_to_map), std::move(key), std::move(value)}, reliability};
}

PatchOperation op_map_delete(Path path_to_map, std::string key, Reliability reliability)
{
    check_map_key(key, "mapDelete");
    return {ops::MapDelete{std::move(path_to_map), std::move(key)}, reliability};
}

// ============================================================
// Inspection
// ============================================================

std::string_view operation_name(const PatchOperation& op) noexcept
{
    return std::visit([](const auto& body) -> std::string_view {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, ops::Set>) {
            return "set";
        } else if constexpr (std::is_same_v<T, ops::Delete>) {
            return "delete";
        } else if constexpr (std::is_same_v<T, ops::Increment>) {
            return "increment";
        } else if constexpr (std::is_same_v<T, ops::ListPush>) {
            return "listPush";
        } else if constexpr (std::is_same_v<T, ops::ListInsert>) {
            return "listInsert";
        } else if constexpr (std::is_same_v<T, ops::ListRemoveAt>) {
            return "listRemoveAt";
        } else if constexpr (std::is_same_v<T, ops::MapSet>) {
            return "mapSet";
        } else {
            return "mapDelete";
        }
    }, op.body);
}

Path touched_path(const PatchOperation& op)
{
    return std::visit([](const auto& body) -> Path {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, ops::MapSet> || std::is_same_v<T, ops::MapDelete>) {
            return body.path_to_map.child(body.key);
        } else {
            return body.path;
        }
    }, op.body);
}

// ============================================================
// Application
// ============================================================

ApplyStatus apply_operation(Value& tree, const PatchOperation& op)
{
    return std::visit([&](const auto& body) -> ApplyStatus {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, ops::Set>) {
            return set_at_path(tree, body.path, body.value) ? ApplyStatus::Applied : ApplyStatus::Skipped;
        } else if constexpr (std::is_same_v<T, ops::Delete>) {
            // Deleting an absent path is a successful no-op
            erase_at_path(tree, body.path);
            return ApplyStatus::Applied;
        } else if constexpr (std::is_same_v<T, ops::Increment>) {
            auto current = get_at_path(tree, body.path);
            if (!current) {
                warn_skip(op, body.path, "target does not exist");
                return ApplyStatus::Skipped;
            }
            auto next = incremented(*current, body.delta);
            if (!next) {
                warn_skip(op, body.path, "target is " + std::string(type_name(*current)) + ", not a number");
                return ApplyStatus::Skipped;
            }
            return set_at_path(tree, body.path, std::move(*next)) ? ApplyStatus::Applied : ApplyStatus::Skipped;
        } else if constexpr (std::is_same_v<T, ops::ListPush>) {
            return apply_list_op(tree, op, body.path, [&](const ValueVector& vec) -> std::optional<ValueVector> {
                return vec.push_back(ValueBox{body.value});
            });
        } else if constexpr (std::is_same_v<T, ops::ListInsert>) {
            return apply_list_op(tree, op, body.path, [&](const ValueVector& vec) -> std::optional<ValueVector> {
                return vector_insert(vec, body.index, body.value);
            });
        } else if constexpr (std::is_same_v<T, ops::ListRemoveAt>) {
            return apply_list_op(tree, op, body.path, [&](const ValueVector& vec) -> std::optional<ValueVector> {
                if (body.index >= vec.size()) {
                    warn_skip(op, body.path, "index " + std::to_string(body.index) + " out of range (size "
                                                 + std::to_string(vec.size()) + ")");
                    return std::nullopt;
                }
                return vector_erase(vec, body.index);
            });
        } else if constexpr (std::is_same_v<T, ops::MapSet>) {
            return apply_map_op(tree, op, body.path_to_map, [&](const ValueMap& map) {
                return map.set(body.key, ValueBox{body.value});
            });
        } else {
            return apply_map_op(tree, op, body.path_to_map, [&](const ValueMap& map) {
                return map.erase(body.key);
            });
        }
    }, op.body);
}

std::size_t apply_patch(Value& tree, const std::vector<PatchOperation>& operations)
{
    std::size_t applied = 0;
    for (const auto& op : operations) {
        try {
            if (apply_operation(tree, op) == ApplyStatus::Applied) {
                ++applied;
            }
        } catch (const std::exception& e) {
            detail::log_error(kComponent, std::string(operation_name(op)) + " failed: " + e.what());
        }
    }
    return applied;
}

} // namespace statecast

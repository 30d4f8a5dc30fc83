// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief The closed set of tree mutations and their application.
///
/// Operations are built through the validating factories:
/// @code
///   std::vector<PatchOperation> ops{
///       op_increment({"gold"}, 100),
///       op_list_insert({"items"}, 0, "sword"),
///       op_map_set({"flags"}, "tutorial_done", true),
///   };
///   apply_patch(tree, ops);
/// @endcode
///
/// Application is best effort: an operation whose target has the wrong
/// shape is skipped with a warning and the rest of the batch still runs.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "path.h"
#include "value.h"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace statecast {

/// Selects the broadcast channel a patch travels on
enum class Reliability : uint8_t {
    Reliable,
    Unreliable, ///< may be dropped by the transport
};

[[nodiscard]] STATECAST_API std::string_view to_string(Reliability reliability) noexcept;

namespace ops {

struct Set {
    Path path;
    Value value;
    bool operator==(const Set&) const = default;
};

struct Delete {
    Path path;
    bool operator==(const Delete&) const = default;
};

struct Increment {
    Path path;
    double delta;
    bool operator==(const Increment&) const = default;
};

struct ListPush {
    Path path;
    Value value;
    bool operator==(const ListPush&) const = default;
};

struct ListInsert {
    Path path;
    std::size_t index;
    Value value;
    bool operator==(const ListInsert&) const = default;
};

struct ListRemoveAt {
    Path path;
    std::size_t index;
    bool operator==(const ListRemoveAt&) const = default;
};

struct MapSet {
    Path path_to_map;
    std::string key;
    Value value;
    bool operator==(const MapSet&) const = default;
};

struct MapDelete {
    Path path_to_map;
    std::string key;
    bool operator==(const MapDelete&) const = default;
};

} // namespace ops

using OperationBody = std::variant<ops::Set,
                                   ops::Delete,
                                   ops::Increment,
                                   ops::ListPush,
                                   ops::ListInsert,
                                   ops::ListRemoveAt,
                                   ops::MapSet,
                                   ops::MapDelete>;

struct PatchOperation {
    OperationBody body;
    Reliability reliability = Reliability::Reliable;

    bool operator==(const PatchOperation&) const = default;
};

// ============================================================
// Factories
//
// All factories throw std::invalid_argument on arguments that can
// never form a valid operation.
// ============================================================

[[nodiscard]] STATECAST_API PatchOperation op_set(Path path, Value value,
                                                  Reliability reliability = Reliability::Reliable);
[[nodiscard]] STATECAST_API PatchOperation op_delete(Path path,
                                                     Reliability reliability = Reliability::Reliable);
/// @throws std::invalid_argument if @p delta is NaN or infinite
[[nodiscard]] STATECAST_API PatchOperation op_increment(Path path, double delta,
                                                        Reliability reliability = Reliability::Reliable);
[[nodiscard]] STATECAST_API PatchOperation op_list_push(Path path, Value value,
                                                        Reliability reliability = Reliability::Reliable);
[[nodiscard]] STATECAST_API PatchOperation op_list_insert(Path path, int64_t index, Value value,
                                                          Reliability reliability = Reliability::Reliable);
[[nodiscard]] STATECAST_API PatchOperation op_list_remove_at(Path path, int64_t index,
                                                             Reliability reliability = Reliability::Reliable);
/// @throws std::invalid_argument if @p key is empty
[[nodiscard]] STATECAST_API PatchOperation op_map_set(Path path_to_map, std::string key, Value value,
                                                      Reliability reliability = Reliability::Reliable);
[[nodiscard]] STATECAST_API PatchOperation op_map_delete(Path path_to_map, std::string key,
                                                         Reliability reliability = Reliability::Reliable);

// ============================================================
// Inspection
// ============================================================

/// Wire/log name of the operation ("set", "listInsert", ...)
[[nodiscard]] STATECAST_API std::string_view operation_name(const PatchOperation& op) noexcept;

/// The path whose value the operation changes. Map operations resolve
/// to path_to_map + key.
[[nodiscard]] STATECAST_API Path touched_path(const PatchOperation& op);

// ============================================================
// Application
// ============================================================

enum class ApplyStatus : uint8_t {
    Applied,
    Skipped, ///< target had the wrong shape; logged, tree unchanged
};

/// Apply a single operation to @p tree in place.
STATECAST_API ApplyStatus apply_operation(Value& tree, const PatchOperation& op);

/// Apply @p operations in order. Each operation is isolated: a skipped or
/// throwing operation is logged and does not stop the ones after it.
/// @return number of operations applied
STATECAST_API std::size_t apply_patch(Value& tree, const std::vector<PatchOperation>& operations);

} // namespace statecast

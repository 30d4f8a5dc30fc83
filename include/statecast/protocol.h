// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file protocol.h
/// @brief Replication messages and their codec.
///
/// Three messages flow from the authority to observers:
///   - CreateMessage:  full snapshot, also used as an unconditional resync
///   - PatchMessage:   ordered operations plus the resulting version
///   - DestroyMessage: node removal
///
/// Messages are encoded as a Value map with an explicit "kind" field:
/// @code
///   { "kind": 2, "nodeId": "player:alice",
///     "patch": { "nodeId": "player:alice", "version": 7,
///                "operations": [ { "op": "increment", "path": ["gold"],
///                                  "delta": 100, "reliability": "reliable" } ] } }
/// @endcode
/// and carried over the wire with the binary serializer.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "patch.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace statecast {

using NodeId = std::string;

struct Snapshot {
    NodeId node_id;
    uint64_t version = 0;
    Value data;

    bool operator==(const Snapshot&) const = default;
};

struct Patch {
    NodeId node_id;
    uint64_t version = 0;
    std::vector<PatchOperation> operations;

    bool operator==(const Patch&) const = default;
};

struct CreateMessage {
    NodeId node_id;
    Snapshot snapshot;

    bool operator==(const CreateMessage&) const = default;
};

struct PatchMessage {
    NodeId node_id;
    Patch patch;

    bool operator==(const PatchMessage&) const = default;
};

struct DestroyMessage {
    NodeId node_id;

    bool operator==(const DestroyMessage&) const = default;
};

using Message = std::variant<CreateMessage, PatchMessage, DestroyMessage>;

/// Explicit wire discriminant
enum class MessageKind : uint8_t {
    Create  = 1,
    Patch   = 2,
    Destroy = 3,
};

[[nodiscard]] STATECAST_API MessageKind message_kind(const Message& msg) noexcept;
[[nodiscard]] STATECAST_API const NodeId& message_node_id(const Message& msg) noexcept;
[[nodiscard]] STATECAST_API std::string_view to_string(MessageKind kind) noexcept;

// ============================================================
// Codec
//
// Decoders throw std::invalid_argument when a field is missing or
// has the wrong type; the byte-level decoder additionally throws
// std::runtime_error for a corrupt buffer.
// ============================================================

[[nodiscard]] STATECAST_API Value encode_operation(const PatchOperation& op);
[[nodiscard]] STATECAST_API PatchOperation decode_operation(const Value& encoded);

[[nodiscard]] STATECAST_API Value encode_snapshot(const Snapshot& snapshot);
[[nodiscard]] STATECAST_API Snapshot decode_snapshot(const Value& encoded);

[[nodiscard]] STATECAST_API Value encode_message(const Message& msg);
[[nodiscard]] STATECAST_API Message decode_message(const Value& encoded);

[[nodiscard]] STATECAST_API ByteBuffer encode_message_bytes(const Message& msg);
[[nodiscard]] STATECAST_API Message decode_message_bytes(const ByteBuffer& bytes);

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// protocol.cpp - Value encoding of replication messages

#include <statecast/protocol.h>
#include <statecast/builders.h>
#include <statecast/serialization.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace statecast {

namespace {

// Field names
constexpr const char* kKind        = "kind";
constexpr const char* kNodeId      = "nodeId";
constexpr const char* kSnapshot    = "snapshot";
constexpr const char* kPatch       = "patch";
constexpr const char* kVersion     = "version";
constexpr const char* kData        = "data";
constexpr const char* kOperations  = "operations";
constexpr const char* kOp          = "op";
constexpr const char* kPath        = "path";
constexpr const char* kPathToMap   = "pathToMap";
constexpr const char* kValue       = "value";
constexpr const char* kDelta       = "delta";
constexpr const char* kIndex       = "index";
constexpr const char* kKey         = "key";
constexpr const char* kReliability = "reliability";

const ValueMap& require_map(const Value& v, std::string_view what) {
    auto* map = v.get_if<ValueMap>();
    if (!map) {
        throw std::invalid_argument(std::string(what) + " must be a map, got " + std::string(type_name(v)));
    }
    return *map;
}

const Value& require_field(const ValueMap& map, const char* field) {
    auto* found = map.find(field);
    if (!found) {
        throw std::invalid_argument(std::string("missing field '") + field + "'");
    }
    return found->get();
}

std::string require_string(const ValueMap& map, const char* field) {
    const auto& v = require_field(map, field);
    auto* s = v.get_if<std::string>();
    if (!s) {
        throw std::invalid_argument(std::string("field '") + field + "' must be a string");
    }
    return *s;
}

std::string require_node_id(const ValueMap& map) {
    auto id = require_string(map, kNodeId);
    if (id.empty()) {
        throw std::invalid_argument("field 'nodeId' must not be empty");
    }
    return id;
}

// Integral numbers only; JSON peers may send them as doubles.
int64_t require_integer(const ValueMap& map, const char* field) {
    const auto& v = require_field(map, field);
    if (v.is_integer()) return v.as_int64();
    if (auto* d = v.get_if<double>(); d && std::isfinite(*d) && std::floor(*d) == *d
        && std::abs(*d) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(*d);
    }
    throw std::invalid_argument(std::string("field '") + field + "' must be an integer");
}

uint64_t require_version(const ValueMap& map) {
    auto version = require_integer(map, kVersion);
    if (version < 0) {
        throw std::invalid_argument("field 'version' must be non-negative");
    }
    return static_cast<uint64_t>(version);
}

Value encode_version(uint64_t version) {
    return Value{static_cast<int64_t>(version)};
}

Reliability decode_reliability(const ValueMap& map) {
    auto* found = map.find(kReliability);
    if (!found) return Reliability::Reliable;
    auto name = found->get().as_string();
    if (name == "reliable") return Reliability::Reliable;
    if (name == "unreliable") return Reliability::Unreliable;
    throw std::invalid_argument("unknown reliability '" + name + "'");
}

Value encode_patch(const Patch& patch) {
    auto ops = VectorBuilder();
    for (const auto& op : patch.operations) {
        ops.push_back(encode_operation(op));
    }
    return MapBuilder()
        .set(kNodeId, patch.node_id)
        .set(kVersion, encode_version(patch.version))
        .set(kOperations, ops.finish())
        .finish();
}

Patch decode_patch(const Value& encoded) {
    const auto& map = require_map(encoded, "patch");
    Patch patch;
    patch.node_id = require_node_id(map);
    patch.version = require_version(map);
    auto* ops = require_field(map, kOperations).get_if<ValueVector>();
    if (!ops) {
        throw std::invalid_argument("field 'operations' must be a vector");
    }
    patch.operations.reserve(ops->size());
    for (const auto& op : *ops) {
        patch.operations.push_back(decode_operation(op.get()));
    }
    return patch;
}

} // anonymous namespace

MessageKind message_kind(const Message& msg) noexcept
{
    return std::visit([](const auto& m) -> MessageKind {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CreateMessage>) {
            return MessageKind::Create;
        } else if constexpr (std::is_same_v<T, PatchMessage>) {
            return MessageKind::Patch;
        } else {
            return MessageKind::Destroy;
        }
    }, msg);
}

const NodeId& message_node_id(const Message& msg) noexcept
{
    return std::visit([](const auto& m) -> const NodeId& { return m.node_id; }, msg);
}

std::string_view to_string(MessageKind kind) noexcept
{
    switch (kind) {
        case MessageKind::Create:  return "create";
        case MessageKind::Patch:   return "patch";
        case MessageKind::Destroy: return "destroy";
    }
    return "unknown";
}

// ============================================================
// Operations
// ============================================================

Value encode_operation(const PatchOperation& op)
{
    auto builder = MapBuilder();
    builder.set(kOp, std::string(operation_name(op)));
    builder.set(kReliability, std::string(to_string(op.reliability)));

    std::visit([&builder](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, ops::MapSet> || std::is_same_v<T, ops::MapDelete>) {
            builder.set(kPathToMap, body.path_to_map.to_value());
            builder.set(kKey, body.key);
        } else {
            builder.set(kPath, body.path.to_value());
        }
        if constexpr (requires { body.value; }) {
            builder.set(kValue, body.value);
        }
        if constexpr (std::is_same_v<T, ops::Increment>) {
            builder.set(kDelta, body.delta);
        }
        if constexpr (requires { body.index; }) {
            builder.set(kIndex, static_cast<int64_t>(body.index));
        }
    }, op.body);

    return builder.finish();
}

PatchOperation decode_operation(const Value& encoded)
{
    const auto& map = require_map(encoded, "operation");
    const auto name = require_string(map, kOp);
    const auto reliability = decode_reliability(map);

    auto path = [&map](const char* field) { return Path::from_value(require_field(map, field)); };
    auto value = [&map]() {
        auto* found = map.find(kValue);
        return found ? found->get() : Value{};
    };

    if (name == "set") {
        return op_set(path(kPath), value(), reliability);
    }
    if (name == "delete") {
        return op_delete(path(kPath), reliability);
    }
    if (name == "increment") {
        const auto& delta = require_field(map, kDelta);
        if (!delta.is_number()) {
            throw std::invalid_argument("field 'delta' must be a number");
        }
        return op_increment(path(kPath), delta.as_number(), reliability);
    }
    if (name == "listPush") {
        return op_list_push(path(kPath), value(), reliability);
    }
    if (name == "listInsert") {
        return op_list_insert(path(kPath), require_integer(map, kIndex), value(), reliability);
    }
    if (name == "listRemoveAt") {
        return op_list_remove_at(path(kPath), require_integer(map, kIndex), reliability);
    }
    if (name == "mapSet") {
        return op_map_set(path(kPathToMap), require_string(map, kKey), value(), reliability);
    }
    if (name == "mapDelete") {
        return op_map_delete(path(kPathToMap), require_string(map, kKey), reliability);
    }
    throw std::invalid_argument("unknown operation '" + name + "'");
}

// ============================================================
// Snapshots and messages
// ============================================================

Value encode_snapshot(const Snapshot& snapshot)
{
    return MapBuilder()
        .set(kNodeId, snapshot.node_id)
        .set(kVersion, encode_version(snapshot.version))
        .set(kData, snapshot.data)
        .finish();
}

Snapshot decode_snapshot(const Value& encoded)
{
    const auto& map = require_map(encoded, "snapshot");
    Snapshot snapshot;
    snapshot.node_id = require_node_id(map);
    snapshot.version = require_version(map);
    snapshot.data = require_field(map, kData);
    return snapshot;
}

Value encode_message(const Message& msg)
{
    auto builder = MapBuilder();
    builder.set(kKind, static_cast<int32_t>(message_kind(msg)));
    builder.set(kNodeId, message_node_id(msg));

    std::visit([&builder](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CreateMessage>) {
            builder.set(kSnapshot, encode_snapshot(m.snapshot));
        } else if constexpr (std::is_same_v<T, PatchMessage>) {
            builder.set(kPatch, encode_patch(m.patch));
        }
    }, msg);

    return builder.finish();
}

Message decode_message(const Value& encoded)
{
    const auto& map = require_map(encoded, "message");
    const auto kind = require_integer(map, kKind);
    if (kind < static_cast<int64_t>(MessageKind::Create) || kind > static_cast<int64_t>(MessageKind::Destroy)) {
        throw std::invalid_argument("unknown message kind " + std::to_string(kind));
    }
    auto node_id = require_node_id(map);

    switch (static_cast<MessageKind>(kind)) {
        case MessageKind::Create: {
            auto snapshot = decode_snapshot(require_field(map, kSnapshot));
            if (snapshot.node_id != node_id) {
                throw std::invalid_argument("snapshot node id '" + snapshot.node_id
                                            + "' does not match message node id '" + node_id + "'");
            }
            return CreateMessage{std::move(node_id), std::move(snapshot)};
        }
        case MessageKind::Patch: {
            auto patch = decode_patch(require_field(map, kPatch));
            if (patch.node_id != node_id) {
                throw std::invalid_argument("patch node id '" + patch.node_id
                                            + "' does not match message node id '" + node_id + "'");
            }
            return PatchMessage{std::move(node_id), std::move(patch)};
        }
        case MessageKind::Destroy:
            return DestroyMessage{std::move(node_id)};
    }
    throw std::invalid_argument("unknown message kind " + std::to_string(kind));
}

ByteBuffer encode_message_bytes(const Message& msg)
{
    return serialize(encode_message(msg));
}

Message decode_message_bytes(const ByteBuffer& bytes)
{
    return decode_message(deserialize(bytes));
}

} // namespace statecast

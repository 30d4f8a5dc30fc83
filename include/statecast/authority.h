// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file authority.h
/// @brief Authoritative side of replication: owned nodes and their registry.
///
/// Each AuthoritativeNode keeps its state in its own lager store. The
/// reducer applies operation batches through the patch applier and bumps
/// the version exactly once per dispatched action, so a patch always
/// carries the version the node reached after the whole batch.
///
/// AuthorityRegistry is the single writer. It owns the nodes, fans their
/// messages out according to each node's scope and answers bootstrap
/// requests under rate limiting.
///
/// Usage:
/// @code
///   LocalHub hub;
///   AuthorityRegistry authority(hub);
///   authority.init();
///
///   authority.create_node("match", scope::All{}, MapBuilder().set("gold", 0).finish());
///   authority.patch_node("match", op_increment({"gold"}, 100));   // -> version 1
/// @endcode

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "config.h"
#include "patch.h"
#include "protocol.h"
#include "rate_limiter.h"
#include "scope.h"
#include "signal.h"
#include "transport.h"
#include "value.h"

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace statecast {

// ============================================================
// Node State and Actions
// ============================================================

struct NodeState {
    Value data;
    uint64_t version = 0;

    bool operator==(const NodeState&) const = default;
};

namespace node_actions {

/// Apply a batch of operations as one state transition
struct ApplyOperations {
    std::vector<PatchOperation> operations;
};

/// Replace the whole tree (resync)
struct ReplaceState {
    Value data;
};

} // namespace node_actions

using NodeAction = std::variant<node_actions::ApplyOperations, node_actions::ReplaceState>;

/// Reducer for a node store
STATECAST_API NodeState node_update(NodeState state, NodeAction action);

inline auto make_node_store_impl(NodeState initial_state) {
    return lager::make_store<NodeAction>(std::move(initial_state), lager::with_manual_event_loop{},
                                         lager::with_reducer(node_update));
}

using NodeStoreType = decltype(make_node_store_impl(std::declval<NodeState>()));

// ============================================================
// AuthoritativeNode
// ============================================================

/// @brief One replicated node as owned by the authority
///
/// Not thread-safe on its own; AuthorityRegistry serializes access.
class STATECAST_API AuthoritativeNode {
public:
    /// @throws std::invalid_argument for an empty id, an invalid scope or a
    ///         root that is not a map or a vector
    AuthoritativeNode(NodeId id, Scope scope, Value initial_state);

    AuthoritativeNode(const AuthoritativeNode&) = delete;
    AuthoritativeNode& operator=(const AuthoritativeNode&) = delete;

    /// Apply one operation; the version advances by one
    /// @return the new version
    uint64_t apply_operation(const PatchOperation& op);

    /// Apply a batch as a single transition; the version advances by one
    /// @throws std::invalid_argument for an empty batch or a batch mixing
    ///         reliable and unreliable operations (nothing is applied)
    /// @return the new version
    uint64_t apply_operations(const std::vector<PatchOperation>& operations);

    /// Replace the whole tree; the version advances by one
    /// @throws std::invalid_argument if @p data is not a map or a vector
    uint64_t replace_state(Value data);

    [[nodiscard]] Snapshot create_snapshot() const;
    [[nodiscard]] bool should_replicate_to(const Identity& identity) const;

    [[nodiscard]] const NodeId& id() const noexcept { return id_; }
    [[nodiscard]] const Scope& scope() const noexcept { return scope_; }
    [[nodiscard]] const Value& state() const;
    [[nodiscard]] uint64_t version() const;

private:
    NodeId id_;
    Scope scope_;
    std::unique_ptr<NodeStoreType> store_;
};

// ============================================================
// AuthorityRegistry
// ============================================================

/// @brief Owns every authoritative node and replicates it through a transport
///
/// Thread Safety: every public method may be called from any thread. One
/// mutex serializes node-map access and the sends that follow a mutation,
/// so observers receive a node's messages in version order.
///
/// Send failures never reach the caller: the mutation is already committed
/// and the failure is logged.
class STATECAST_API AuthorityRegistry {
public:
    /// @param time_source clock for bootstrap rate limiting (tests inject one)
    /// @throws std::invalid_argument if @p config is invalid
    explicit AuthorityRegistry(AuthorityTransport& transport, ReplicationConfig config = {},
                               RateLimiter::TimeSource time_source = {});
    ~AuthorityRegistry();

    AuthorityRegistry(const AuthorityRegistry&) = delete;
    AuthorityRegistry& operator=(const AuthorityRegistry&) = delete;

    // ---- Lifecycle ----

    /// Start serving bootstrap requests; calling it again does nothing
    void init();

    /// Stop serving bootstrap requests and drop every node without
    /// broadcasting; calling it again does nothing
    void shutdown();

    [[nodiscard]] bool is_running() const;

    // ---- Mutation (require a running registry) ----
    //
    // All of them throw std::logic_error when the registry is not running
    // or the node id is unknown (duplicate, for create_node).

    /// Create a node and send its snapshot to every identity in scope
    Snapshot create_node(const NodeId& id, Scope scope, Value initial_state);

    /// Send a destroy message to the node's scope, then forget the node.
    /// Unknown ids are ignored.
    void destroy_node(const NodeId& id);

    /// @return the node's version after the operation
    uint64_t patch_node(const NodeId& id, const PatchOperation& op);

    /// Apply a batch as one patch; routed on the channel its reliability selects
    /// @throws std::invalid_argument for an empty or mixed-reliability batch
    /// @return the node's version after the batch
    uint64_t patch_node_multiple(const NodeId& id, const std::vector<PatchOperation>& operations);

    /// Replace a node's tree and resend it as a snapshot
    /// @return the node's new version
    uint64_t replace_state(const NodeId& id, Value data);

    // ---- Queries ----

    [[nodiscard]] bool contains(const NodeId& id) const;
    [[nodiscard]] std::optional<Snapshot> snapshot(const NodeId& id) const;
    [[nodiscard]] std::optional<Value> state(const NodeId& id) const;
    [[nodiscard]] std::optional<uint64_t> version(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeId> node_ids() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const ReplicationConfig& config() const noexcept { return config_; }

    // ---- Bootstrap ----

    /// One create message per node visible to @p identity, in id order.
    /// A rate-limited request gets an empty result: retry later.
    [[nodiscard]] std::vector<CreateMessage> handle_initial_data_request(const Identity& identity);

private:
    void require_running(const char* operation) const;
    AuthoritativeNode& require_node(const NodeId& id, const char* operation);
    void broadcast(const AuthoritativeNode& node, Channel channel, const Message& msg);
    void send_safely(const Identity& identity, Channel channel, const Message& msg);

    // Outlives the registry inside the bootstrap handler the transport holds
    struct BootstrapGuard {
        std::shared_mutex mutex;
        AuthorityRegistry* registry = nullptr;
    };

    AuthorityTransport& transport_;
    ReplicationConfig config_;
    RateLimiter limiter_;

    mutable std::mutex mutex_;
    std::map<NodeId, std::unique_ptr<AuthoritativeNode>> nodes_;
    bool running_ = false;
    ScopedConnection initial_data_connection_;
    std::shared_ptr<BootstrapGuard> bootstrap_guard_;
};

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file observer.h
/// @brief Observer side of replication: read-only mirrors and their registry.
///
/// An ObserverNode mirrors one authoritative node. Patches pass a version
/// gate (only a version above the current one is applied); snapshots reset
/// the mirror unconditionally.
///
/// The ObserverRegistry turns incoming messages into nodes, resolves
/// waiters for nodes that do not exist yet and reports nodes whose id
/// starts with a subscribed prefix.
///
/// Usage:
/// @code
///   auto transport = hub.connect("alice");
///   ObserverRegistry observer(*transport);
///   observer.init();
///   observer.request_initial_data();
///
///   ScopedConnectionList connections;
///   connections += observer.on_node_ready("match", [&](const ObserverNodePtr& node) {
///       connections += node->listen_for_change({"gold"}, [](const auto& now, const auto& before) {
///           ...
///       });
///   });
/// @endcode

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "config.h"
#include "path.h"
#include "protocol.h"
#include "signal.h"
#include "transport.h"
#include "value.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statecast {

// ============================================================
// ObserverNode
// ============================================================

class ObserverNode;
using ObserverNodePtr = std::shared_ptr<ObserverNode>;

/// @brief Which patches a path listener hears about
enum class ChangeMatch : uint8_t {
    Exact,   ///< an operation targets exactly the listened path
    Related  ///< an operation targets the path, an ancestor or a descendant
};

/// @brief Read-only mirror of one authoritative node
///
/// Thread Safety: readers and listener registration may run concurrently
/// with apply_patch()/apply_snapshot(). Listeners run on the applying
/// thread, after the new state is visible, outside the node's lock.
class STATECAST_API ObserverNode {
public:
    /// (new value, old value); nullopt for an absent path. Both are nullopt
    /// after a snapshot, meaning "re-read the value".
    using ChangeHandler = std::function<void(const std::optional<Value>&, const std::optional<Value>&)>;
    using AnyChangeHandler = std::function<void()>;
    using RawPatchHandler = std::function<void(const Patch&)>;

    /// @throws std::invalid_argument if the snapshot has an empty node id
    explicit ObserverNode(const Snapshot& initial);
    ~ObserverNode();

    ObserverNode(const ObserverNode&) = delete;
    ObserverNode& operator=(const ObserverNode&) = delete;

    /// Apply @p patch if its version is above the current one.
    /// A path listener fires once per patch when an operation matched its
    /// path (see ChangeMatch) and the value at that path changed.
    /// @return false for a stale patch or a destroyed node
    /// @throws std::invalid_argument if the patch belongs to another node
    bool apply_patch(const Patch& patch);

    /// Replace state and version unconditionally
    /// @throws std::invalid_argument if the snapshot belongs to another node
    void apply_snapshot(const Snapshot& snapshot);

    /// Disconnect every listener; later patches and snapshots are ignored
    void destroy();

    /// Every listener fires after a snapshot, whatever its match mode
    Connection listen_for_change(const Path& path, ChangeHandler handler,
                                 ChangeMatch match = ChangeMatch::Exact);
    Connection listen_for_any_change(AnyChangeHandler handler);

    /// Fires with each patch that passed the version gate, before it is applied
    Connection listen_for_raw_patch(RawPatchHandler handler);

    [[nodiscard]] std::optional<Value> get_value(const Path& path) const;
    [[nodiscard]] Value state() const;
    [[nodiscard]] uint64_t version() const;
    [[nodiscard]] bool is_destroyed() const;
    [[nodiscard]] const NodeId& id() const noexcept { return id_; }

private:
    using ChangeSignal = Signal<std::optional<Value>, std::optional<Value>>;
    using ListenerKey = std::pair<Path, ChangeMatch>;

    // Live signals; drops entries whose listeners are all gone
    std::vector<std::pair<ListenerKey, std::shared_ptr<ChangeSignal>>> path_signals();

    const NodeId id_;

    mutable std::mutex mutex_;
    Value state_;
    uint64_t version_ = 0;
    bool destroyed_ = false;
    std::map<ListenerKey, std::shared_ptr<ChangeSignal>> path_listeners_;

    Signal<> any_change_;
    Signal<Patch> raw_patch_;
};

// ============================================================
// ObserverRegistry
// ============================================================

enum class BootstrapStatus : uint8_t {
    Ready,              ///< Response received and applied
    Empty,              ///< Empty response (rate limited or nothing visible yet); retry later
    Failed,             ///< Transport failure or timeout; retry later
    AlreadyInitialized, ///< A previous request already succeeded
};

[[nodiscard]] STATECAST_API std::string_view to_string(BootstrapStatus status) noexcept;

/// @brief Materializes observer nodes from replication messages
///
/// Thread Safety: message handling is serialized by a recursive dispatch
/// mutex, so callbacks may call back into the registry. The node map has
/// its own lock, which is never held while a callback runs.
class STATECAST_API ObserverRegistry {
public:
    using NodeCallback = std::function<void(const ObserverNodePtr&)>;

    /// @throws std::invalid_argument if @p config is invalid
    explicit ObserverRegistry(ObserverTransport& transport, ReplicationConfig config = {});
    ~ObserverRegistry();

    ObserverRegistry(const ObserverRegistry&) = delete;
    ObserverRegistry& operator=(const ObserverRegistry&) = delete;

    // ---- Lifecycle ----

    /// Start receiving messages; calling it again does nothing
    void init();

    /// Stop receiving, destroy every node and fail pending wait_for_node
    /// futures with std::runtime_error
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool is_initialized() const;

    /// Blocking bootstrap request; the timeout defaults to the configured one
    /// @throws std::logic_error if the registry is not running
    BootstrapStatus request_initial_data(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Route one message. Failures are logged, never thrown.
    void handle_message(const Message& msg);

    // ---- Node access ----

    /// @return nullptr if the node does not exist
    [[nodiscard]] ObserverNodePtr get_node(const NodeId& id) const;

    /// Future resolved with the node once it exists (immediately if it does)
    [[nodiscard]] std::future<ObserverNodePtr> wait_for_node(const NodeId& id);

    /// Call @p callback once with the node, immediately if it exists.
    /// Disconnecting before the node arrives cancels the wait.
    Connection on_node_ready(const NodeId& id, NodeCallback callback);

    /// Call @p callback for every existing node whose id starts with
    /// @p prefix and for each such node created later, until disconnected
    Connection on_node_of_class_created(const std::string& prefix, NodeCallback callback);

    [[nodiscard]] std::vector<NodeId> node_ids() const;
    [[nodiscard]] std::size_t size() const;

private:
    struct Shared;

    void handle_create(const CreateMessage& msg);
    void handle_patch(const PatchMessage& msg);
    void handle_destroy(const DestroyMessage& msg);

    ObserverTransport& transport_;
    ReplicationConfig config_;

    std::recursive_mutex dispatch_mutex_;
    std::shared_ptr<Shared> shared_;
    ScopedConnection message_connection_;
};

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// authority.cpp - Authoritative nodes, their reducer and the registry

#include <statecast/authority.h>
#include <statecast/log.h>

#include <stdexcept>

namespace statecast {

namespace {

constexpr std::string_view kComponent = "AuthorityRegistry";

void check_root(const Value& data, const std::string& id) {
    if (!data.is_container()) {
        throw std::invalid_argument("node '" + id + "': root state must be a map or a vector, got "
                                    + std::string(type_name(data)));
    }
}

void check_batch(const std::vector<PatchOperation>& operations, const std::string& id) {
    if (operations.empty()) {
        throw std::invalid_argument("node '" + id + "': operation batch must not be empty");
    }
    const auto reliability = operations.front().reliability;
    for (const auto& op : operations) {
        if (op.reliability != reliability) {
            throw std::invalid_argument("node '" + id + "': a batch cannot mix reliable and unreliable operations");
        }
    }
}

ReplicationConfig validated(ReplicationConfig config) {
    config.validate();
    return config;
}

} // anonymous namespace

// ============================================================
// Reducer
// ============================================================

NodeState node_update(NodeState state, NodeAction action) {
    return std::visit(
        [&state](auto&& act) -> NodeState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, node_actions::ApplyOperations>) {
                // Skipped operations still count: the batch is one transition
                apply_patch(state.data, act.operations);
                state.version++;
                return state;
            } else if constexpr (std::is_same_v<T, node_actions::ReplaceState>) {
                state.data = std::move(act.data);
                state.version++;
                return state;
            }

            return state;
        },
        std::move(action));
}

// ============================================================
// AuthoritativeNode
// ============================================================

AuthoritativeNode::AuthoritativeNode(NodeId id, Scope scope, Value initial_state)
    : id_(std::move(id))
{
    if (id_.empty()) {
        throw std::invalid_argument("node id must not be empty");
    }
    scope_ = normalize_scope(std::move(scope));
    check_root(initial_state, id_);
    store_ = std::make_unique<NodeStoreType>(make_node_store_impl(NodeState{std::move(initial_state), 0}));
}

uint64_t AuthoritativeNode::apply_operation(const PatchOperation& op)
{
    store_->dispatch(node_actions::ApplyOperations{{op}});
    return version();
}

uint64_t AuthoritativeNode::apply_operations(const std::vector<PatchOperation>& operations)
{
    check_batch(operations, id_);
    store_->dispatch(node_actions::ApplyOperations{operations});
    return version();
}

uint64_t AuthoritativeNode::replace_state(Value data)
{
    check_root(data, id_);
    store_->dispatch(node_actions::ReplaceState{std::move(data)});
    return version();
}

Snapshot AuthoritativeNode::create_snapshot() const
{
    // Values are immutable and structurally shared; copying is the snapshot
    const auto& current = store_->get();
    return Snapshot{id_, current.version, current.data};
}

bool AuthoritativeNode::should_replicate_to(const Identity& identity) const
{
    return scope_includes(scope_, identity);
}

const Value& AuthoritativeNode::state() const
{
    return store_->get().data;
}

uint64_t AuthoritativeNode::version() const
{
    return store_->get().version;
}

// ============================================================
// AuthorityRegistry - lifecycle
// ============================================================

AuthorityRegistry::AuthorityRegistry(AuthorityTransport& transport, ReplicationConfig config,
                                     RateLimiter::TimeSource time_source)
    : transport_(transport)
    , config_(validated(std::move(config)))
    , limiter_(config_.max_initial_requests, config_.request_window, std::move(time_source))
{}

AuthorityRegistry::~AuthorityRegistry() {
    shutdown();
}

void AuthorityRegistry::init()
{
    std::lock_guard lock(mutex_);
    if (running_) return;
    // A fresh guard per run, so a handler copied by the transport during an
    // earlier run stays detached
    bootstrap_guard_ = std::make_shared<BootstrapGuard>();
    bootstrap_guard_->registry = this;
    initial_data_connection_ = transport_.serve_initial_data(
        [guard = bootstrap_guard_](const Identity& identity) -> std::vector<CreateMessage> {
            std::shared_lock lock(guard->mutex);
            if (!guard->registry) return {};
            return guard->registry->handle_initial_data_request(identity);
        });
    running_ = true;
    detail::log_info(kComponent, "started");
}

void AuthorityRegistry::shutdown()
{
    std::map<NodeId, std::unique_ptr<AuthoritativeNode>> dropped;
    std::shared_ptr<BootstrapGuard> guard;
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
        initial_data_connection_.reset();
        dropped.swap(nodes_);
        guard.swap(bootstrap_guard_);
    }
    // Waits for requests already inside the handler; later ones see no registry
    {
        std::unique_lock lock(guard->mutex);
        guard->registry = nullptr;
    }
    limiter_.clear();
    detail::log_info(kComponent, "stopped, dropped " + std::to_string(dropped.size()) + " node(s)");
}

bool AuthorityRegistry::is_running() const
{
    std::lock_guard lock(mutex_);
    return running_;
}

// ============================================================
// AuthorityRegistry - mutation
// ============================================================

Snapshot AuthorityRegistry::create_node(const NodeId& id, Scope scope, Value initial_state)
{
    std::lock_guard lock(mutex_);
    require_running("create_node");
    if (nodes_.count(id) > 0) {
        throw std::logic_error("create_node: node '" + id + "' already exists");
    }

    auto node = std::make_unique<AuthoritativeNode>(id, std::move(scope), std::move(initial_state));
    auto snapshot = node->create_snapshot();
    auto& stored = *nodes_.emplace(id, std::move(node)).first->second;

    broadcast(stored, Channel::Reliable, CreateMessage{id, snapshot});
    return snapshot;
}

void AuthorityRegistry::destroy_node(const NodeId& id)
{
    std::lock_guard lock(mutex_);
    require_running("destroy_node");
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    broadcast(*it->second, Channel::Reliable, DestroyMessage{id});
    nodes_.erase(it);
}

uint64_t AuthorityRegistry::patch_node(const NodeId& id, const PatchOperation& op)
{
    return patch_node_multiple(id, {op});
}

uint64_t AuthorityRegistry::patch_node_multiple(const NodeId& id, const std::vector<PatchOperation>& operations)
{
    std::lock_guard lock(mutex_);
    require_running("patch_node");
    auto& node = require_node(id, "patch_node");

    const auto version = node.apply_operations(operations);
    broadcast(node, channel_for(operations.front().reliability),
              PatchMessage{id, Patch{id, version, operations}});
    return version;
}

uint64_t AuthorityRegistry::replace_state(const NodeId& id, Value data)
{
    std::lock_guard lock(mutex_);
    require_running("replace_state");
    auto& node = require_node(id, "replace_state");

    const auto version = node.replace_state(std::move(data));
    broadcast(node, Channel::Reliable, CreateMessage{id, node.create_snapshot()});
    return version;
}

// ============================================================
// AuthorityRegistry - queries
// ============================================================

bool AuthorityRegistry::contains(const NodeId& id) const
{
    std::lock_guard lock(mutex_);
    return nodes_.count(id) > 0;
}

std::optional<Snapshot> AuthorityRegistry::snapshot(const NodeId& id) const
{
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second->create_snapshot();
}

std::optional<Value> AuthorityRegistry::state(const NodeId& id) const
{
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second->state();
}

std::optional<uint64_t> AuthorityRegistry::version(const NodeId& id) const
{
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second->version();
}

std::vector<NodeId> AuthorityRegistry::node_ids() const
{
    std::lock_guard lock(mutex_);
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t AuthorityRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return nodes_.size();
}

// ============================================================
// AuthorityRegistry - bootstrap
// ============================================================

std::vector<CreateMessage> AuthorityRegistry::handle_initial_data_request(const Identity& identity)
{
    if (!limiter_.can_request(identity)) {
        detail::log_warning(kComponent, "initial data request from '" + identity + "' rate limited");
        return {};
    }

    std::lock_guard lock(mutex_);
    std::vector<CreateMessage> result;
    if (!running_) return result;
    for (const auto& [id, node] : nodes_) {
        if (node->should_replicate_to(identity)) {
            result.push_back(CreateMessage{id, node->create_snapshot()});
        }
    }
    return result;
}

// ============================================================
// AuthorityRegistry - internals (caller holds mutex_)
// ============================================================

void AuthorityRegistry::require_running(const char* operation) const
{
    if (!running_) {
        throw std::logic_error(std::string(operation) + ": registry is not running");
    }
}

AuthoritativeNode& AuthorityRegistry::require_node(const NodeId& id, const char* operation)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::logic_error(std::string(operation) + ": node '" + id + "' does not exist");
    }
    return *it->second;
}

void AuthorityRegistry::broadcast(const AuthoritativeNode& node, Channel channel, const Message& msg)
{
    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, scope::All>) {
            try {
                transport_.send_to_all(channel, msg);
            } catch (const TransportError& e) {
                detail::log_warning(kComponent, std::string(to_string(message_kind(msg))) + " for '"
                                                    + node.id() + "' not sent: " + e.what());
            } catch (const std::exception& e) {
                detail::log_error(kComponent, std::string(to_string(message_kind(msg))) + " for '"
                                                  + node.id() + "' failed: " + e.what());
            }
        } else if constexpr (std::is_same_v<T, scope::Single>) {
            send_safely(s.identity, channel, msg);
        } else {
            for (const auto& identity : s.identities) {
                send_safely(identity, channel, msg);
            }
        }
    }, node.scope());
}

void AuthorityRegistry::send_safely(const Identity& identity, Channel channel, const Message& msg)
{
    try {
        transport_.send_to(identity, channel, msg);
    } catch (const TransportError& e) {
        // Usually the identity is simply not connected yet; it bootstraps later
        detail::log_warning(kComponent, std::string(to_string(message_kind(msg))) + " for '"
                                            + message_node_id(msg) + "' not sent to '" + identity
                                            + "': " + e.what());
    } catch (const std::exception& e) {
        detail::log_error(kComponent, std::string(to_string(message_kind(msg))) + " for '"
                                          + message_node_id(msg) + "' failed for '" + identity
                                          + "': " + e.what());
    }
}

} // namespace statecast

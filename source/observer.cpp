// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// observer.cpp - Observer nodes and the registry that materializes them

#include <statecast/observer.h>
#include <statecast/log.h>
#include <statecast/patch.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace statecast {

namespace {

constexpr std::string_view kRegistryComponent = "ObserverRegistry";
constexpr std::string_view kNodeComponent = "ObserverNode";

void check_node_id(const NodeId& expected, const NodeId& actual, const char* what) {
    if (expected != actual) {
        throw std::invalid_argument(std::string(what) + " for node '" + actual
                                    + "' applied to node '" + expected + "'");
    }
}

template <typename F>
void invoke_callback(std::string_view what, const F& callback, const ObserverNodePtr& node) {
    try {
        callback(node);
    } catch (const std::exception& e) {
        detail::log_error(kRegistryComponent, std::string(what) + " callback for '" + node->id()
                                                  + "' threw: " + e.what());
    }
}

} // anonymous namespace

// ============================================================
// ObserverNode
// ============================================================

ObserverNode::ObserverNode(const Snapshot& initial)
    : id_(initial.node_id)
    , state_(initial.data)
    , version_(initial.version)
{
    if (id_.empty()) {
        throw std::invalid_argument("ObserverNode: node id must not be empty");
    }
}

ObserverNode::~ObserverNode() {
    destroy();
}

bool ObserverNode::apply_patch(const Patch& patch)
{
    check_node_id(id_, patch.node_id, "patch");
    {
        std::lock_guard lock(mutex_);
        if (destroyed_ || patch.version <= version_) return false;
    }

    raw_patch_.fire(patch);

    Value before;
    Value after;
    {
        std::lock_guard lock(mutex_);
        // A raw-patch listener may have destroyed the node
        if (destroyed_ || patch.version <= version_) return false;
        before = state_;
        after = state_;
        statecast::apply_patch(after, patch.operations);
        state_ = after;
        version_ = patch.version;
    }

    std::vector<Path> touched;
    touched.reserve(patch.operations.size());
    for (const auto& op : patch.operations) {
        touched.push_back(touched_path(op));
    }

    for (const auto& [key, signal] : path_signals()) {
        const Path& path = key.first;
        const ChangeMatch match = key.second;
        const bool hit = std::any_of(touched.begin(), touched.end(), [&path, match](const Path& t) {
            if (match == ChangeMatch::Exact) return t == path;
            return path.starts_with(t) || t.starts_with(path);
        });
        if (!hit) continue;

        auto old_value = get_at_path(before, path);
        auto new_value = get_at_path(after, path);
        if (old_value != new_value) {
            signal->fire(new_value, old_value);
        }
    }

    any_change_.fire();
    return true;
}

void ObserverNode::apply_snapshot(const Snapshot& snapshot)
{
    check_node_id(id_, snapshot.node_id, "snapshot");
    {
        std::lock_guard lock(mutex_);
        if (destroyed_) return;
        state_ = snapshot.data;
        version_ = snapshot.version;
    }

    const std::optional<Value> unknown;
    for (const auto& [key, signal] : path_signals()) {
        signal->fire(unknown, unknown);
    }
    any_change_.fire();
}

void ObserverNode::destroy()
{
    std::map<ListenerKey, std::shared_ptr<ChangeSignal>> listeners;
    {
        std::lock_guard lock(mutex_);
        if (destroyed_) return;
        destroyed_ = true;
        listeners.swap(path_listeners_);
    }
    for (auto& [key, signal] : listeners) {
        signal->disconnect_all();
    }
    any_change_.disconnect_all();
    raw_patch_.disconnect_all();
}

Connection ObserverNode::listen_for_change(const Path& path, ChangeHandler handler, ChangeMatch match)
{
    std::shared_ptr<ChangeSignal> signal;
    {
        std::lock_guard lock(mutex_);
        if (destroyed_) {
            detail::log_warning(kNodeComponent, "listen_for_change on destroyed node '" + id_ + "'");
            return Connection{};
        }
        auto& slot = path_listeners_[ListenerKey{path, match}];
        if (!slot) {
            slot = std::make_shared<ChangeSignal>();
        }
        signal = slot;
    }
    return signal->connect(std::move(handler));
}

Connection ObserverNode::listen_for_any_change(AnyChangeHandler handler)
{
    if (is_destroyed()) return Connection{};
    return any_change_.connect(std::move(handler));
}

Connection ObserverNode::listen_for_raw_patch(RawPatchHandler handler)
{
    if (is_destroyed()) return Connection{};
    return raw_patch_.connect(std::move(handler));
}

std::optional<Value> ObserverNode::get_value(const Path& path) const
{
    std::lock_guard lock(mutex_);
    return get_at_path(state_, path);
}

Value ObserverNode::state() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t ObserverNode::version() const
{
    std::lock_guard lock(mutex_);
    return version_;
}

bool ObserverNode::is_destroyed() const
{
    std::lock_guard lock(mutex_);
    return destroyed_;
}

std::vector<std::pair<ObserverNode::ListenerKey, std::shared_ptr<ObserverNode::ChangeSignal>>>
ObserverNode::path_signals()
{
    std::lock_guard lock(mutex_);
    std::vector<std::pair<ListenerKey, std::shared_ptr<ChangeSignal>>> result;
    for (auto it = path_listeners_.begin(); it != path_listeners_.end();) {
        if (it->second->empty()) {
            it = path_listeners_.erase(it);
        } else {
            result.emplace_back(it->first, it->second);
            ++it;
        }
    }
    return result;
}

// ============================================================
// ObserverRegistry::Shared
//
// State reachable from Connection disconnectors, which may outlive
// the registry.
// ============================================================

struct ObserverRegistry::Shared {
    struct Waiter {
        uint64_t token;
        NodeCallback on_ready;
        std::function<void(std::exception_ptr)> on_fail;
    };

    struct ClassSubscription {
        std::string prefix;
        NodeCallback callback;
        std::atomic<bool> active{true};
    };

    mutable std::mutex mutex;
    std::map<NodeId, ObserverNodePtr> nodes;
    std::map<NodeId, std::vector<Waiter>> waiters;
    std::vector<std::shared_ptr<ClassSubscription>> class_subscriptions;
    uint64_t next_token = 1;
    bool running = false;
    bool initialized = false;

    static Connection add_waiter(const std::shared_ptr<Shared>& self, const NodeId& id, NodeCallback on_ready,
                                 std::function<void(std::exception_ptr)> on_fail)
    {
        uint64_t token = 0;
        {
            std::lock_guard lock(self->mutex);
            token = self->next_token++;
            self->waiters[id].push_back(Waiter{token, std::move(on_ready), std::move(on_fail)});
        }
        std::weak_ptr<Shared> weak = self;
        return Connection([weak, id, token]() {
            auto shared = weak.lock();
            if (!shared) return;
            std::lock_guard lock(shared->mutex);
            auto it = shared->waiters.find(id);
            if (it == shared->waiters.end()) return;
            std::erase_if(it->second, [token](const Waiter& w) { return w.token == token; });
            if (it->second.empty()) {
                shared->waiters.erase(it);
            }
        });
    }
};

// ============================================================
// ObserverRegistry - lifecycle
// ============================================================

std::string_view to_string(BootstrapStatus status) noexcept
{
    switch (status) {
        case BootstrapStatus::Ready:              return "ready";
        case BootstrapStatus::Empty:              return "empty";
        case BootstrapStatus::Failed:             return "failed";
        case BootstrapStatus::AlreadyInitialized: return "already initialized";
    }
    return "unknown";
}

ObserverRegistry::ObserverRegistry(ObserverTransport& transport, ReplicationConfig config)
    : transport_(transport)
    , config_(std::move(config))
    , shared_(std::make_shared<Shared>())
{
    config_.validate();
}

ObserverRegistry::~ObserverRegistry() {
    shutdown();
}

void ObserverRegistry::init()
{
    std::lock_guard dispatch(dispatch_mutex_);
    {
        std::lock_guard lock(shared_->mutex);
        if (shared_->running) return;
        shared_->running = true;
    }
    message_connection_ = transport_.on_message([this](const Message& msg) { handle_message(msg); });
    detail::log_info(kRegistryComponent, "started");
}

void ObserverRegistry::shutdown()
{
    std::lock_guard dispatch(dispatch_mutex_);
    message_connection_.reset();

    std::map<NodeId, ObserverNodePtr> nodes;
    std::map<NodeId, std::vector<Shared::Waiter>> waiters;
    std::vector<std::shared_ptr<Shared::ClassSubscription>> subscriptions;
    {
        std::lock_guard lock(shared_->mutex);
        shared_->running = false;
        shared_->initialized = false;
        nodes.swap(shared_->nodes);
        waiters.swap(shared_->waiters);
        subscriptions.swap(shared_->class_subscriptions);
    }

    for (auto& subscription : subscriptions) {
        subscription->active = false;
    }
    const auto error = std::make_exception_ptr(std::runtime_error("observer registry shut down"));
    for (auto& [id, pending] : waiters) {
        for (auto& waiter : pending) {
            if (waiter.on_fail) waiter.on_fail(error);
        }
    }
    for (auto& [id, node] : nodes) {
        node->destroy();
    }
}

bool ObserverRegistry::is_running() const
{
    std::lock_guard lock(shared_->mutex);
    return shared_->running;
}

bool ObserverRegistry::is_initialized() const
{
    std::lock_guard lock(shared_->mutex);
    return shared_->initialized;
}

// Holding the dispatch mutex across the request keeps broadcasts that
// arrive meanwhile behind the snapshots they supersede.
BootstrapStatus ObserverRegistry::request_initial_data(std::optional<std::chrono::milliseconds> timeout)
{
    std::lock_guard dispatch(dispatch_mutex_);
    {
        std::lock_guard lock(shared_->mutex);
        if (!shared_->running) {
            throw std::logic_error("request_initial_data: registry is not running");
        }
        if (shared_->initialized) return BootstrapStatus::AlreadyInitialized;
    }

    std::vector<CreateMessage> response;
    try {
        response = transport_.request_initial_data(timeout.value_or(config_.bootstrap_timeout));
    } catch (const TransportError& e) {
        detail::log_warning(kRegistryComponent, std::string("initial data request failed: ") + e.what());
        return BootstrapStatus::Failed;
    } catch (const std::exception& e) {
        detail::log_warning(kRegistryComponent, std::string("initial data response rejected: ") + e.what());
        return BootstrapStatus::Failed;
    }

    if (response.empty()) {
        detail::log_info(kRegistryComponent, "initial data response empty, retry later");
        return BootstrapStatus::Empty;
    }

    for (const auto& create : response) {
        handle_message(create);
    }
    {
        std::lock_guard lock(shared_->mutex);
        shared_->initialized = true;
    }
    detail::log_info(kRegistryComponent, "bootstrapped " + std::to_string(response.size()) + " node(s)");
    return BootstrapStatus::Ready;
}

// ============================================================
// ObserverRegistry - message routing
// ============================================================

void ObserverRegistry::handle_message(const Message& msg)
{
    std::lock_guard dispatch(dispatch_mutex_);
    if (!is_running()) {
        detail::log_warning(kRegistryComponent, std::string(to_string(message_kind(msg))) + " for '"
                                                    + message_node_id(msg) + "' ignored: registry is not running");
        return;
    }

    try {
        std::visit([this](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, CreateMessage>) {
                handle_create(m);
            } else if constexpr (std::is_same_v<T, PatchMessage>) {
                handle_patch(m);
            } else {
                handle_destroy(m);
            }
        }, msg);
    } catch (const std::exception& e) {
        detail::log_warning(kRegistryComponent, std::string(to_string(message_kind(msg))) + " for '"
                                                    + message_node_id(msg) + "' failed: " + e.what());
    }
}

void ObserverRegistry::handle_create(const CreateMessage& msg)
{
    if (msg.snapshot.node_id != msg.node_id) {
        detail::log_warning(kRegistryComponent, "create for '" + msg.node_id + "' carries a snapshot of '"
                                                    + msg.snapshot.node_id + "', ignored");
        return;
    }

    if (auto existing = get_node(msg.node_id)) {
        // Keep the node object so existing listeners stay attached
        existing->apply_snapshot(msg.snapshot);
        return;
    }

    auto node = std::make_shared<ObserverNode>(msg.snapshot);
    std::vector<Shared::Waiter> ready;
    std::vector<std::shared_ptr<Shared::ClassSubscription>> matching;
    {
        std::lock_guard lock(shared_->mutex);
        shared_->nodes.emplace(msg.node_id, node);
        if (auto it = shared_->waiters.find(msg.node_id); it != shared_->waiters.end()) {
            ready = std::move(it->second);
            shared_->waiters.erase(it);
        }
        for (const auto& subscription : shared_->class_subscriptions) {
            if (msg.node_id.starts_with(subscription->prefix)) {
                matching.push_back(subscription);
            }
        }
    }

    for (const auto& waiter : ready) {
        invoke_callback("node ready", waiter.on_ready, node);
    }
    for (const auto& subscription : matching) {
        if (subscription->active) {
            invoke_callback("class created", subscription->callback, node);
        }
    }
}

void ObserverRegistry::handle_patch(const PatchMessage& msg)
{
    auto node = get_node(msg.node_id);
    if (!node) {
        detail::log_warning(kRegistryComponent, "patch v" + std::to_string(msg.patch.version)
                                                    + " for unknown node '" + msg.node_id + "' ignored");
        return;
    }
    if (!node->apply_patch(msg.patch)) {
        detail::log_info(kRegistryComponent, "stale patch v" + std::to_string(msg.patch.version) + " for '"
                                                 + msg.node_id + "' ignored (at v"
                                                 + std::to_string(node->version()) + ")");
    }
}

void ObserverRegistry::handle_destroy(const DestroyMessage& msg)
{
    ObserverNodePtr node;
    {
        std::lock_guard lock(shared_->mutex);
        auto it = shared_->nodes.find(msg.node_id);
        if (it == shared_->nodes.end()) return;
        node = std::move(it->second);
        shared_->nodes.erase(it);
    }
    node->destroy();
}

// ============================================================
// ObserverRegistry - node access
// ============================================================

ObserverNodePtr ObserverRegistry::get_node(const NodeId& id) const
{
    std::lock_guard lock(shared_->mutex);
    auto it = shared_->nodes.find(id);
    return it == shared_->nodes.end() ? nullptr : it->second;
}

std::future<ObserverNodePtr> ObserverRegistry::wait_for_node(const NodeId& id)
{
    auto promise = std::make_shared<std::promise<ObserverNodePtr>>();
    auto future = promise->get_future();

    // Serialized with message handling so a create cannot slip between the
    // lookup and the registration
    std::lock_guard dispatch(dispatch_mutex_);
    if (auto node = get_node(id)) {
        promise->set_value(std::move(node));
        return future;
    }
    if (!is_running()) {
        // Nothing would ever resolve or fail the waiter
        promise->set_exception(std::make_exception_ptr(std::runtime_error("observer registry is not running")));
        return future;
    }
    // The returned connection is dropped: a future cannot be cancelled
    Shared::add_waiter(
        shared_, id,
        [promise](const ObserverNodePtr& node) { promise->set_value(node); },
        [promise](std::exception_ptr error) { promise->set_exception(std::move(error)); });
    return future;
}

Connection ObserverRegistry::on_node_ready(const NodeId& id, NodeCallback callback)
{
    std::lock_guard dispatch(dispatch_mutex_);
    if (auto node = get_node(id)) {
        invoke_callback("node ready", callback, node);
        return Connection{};
    }
    if (!is_running()) {
        detail::log_warning(kRegistryComponent, "on_node_ready for '" + id + "' ignored: registry is not running");
        return Connection{};
    }
    return Shared::add_waiter(shared_, id, std::move(callback), {});
}

Connection ObserverRegistry::on_node_of_class_created(const std::string& prefix, NodeCallback callback)
{
    auto subscription = std::make_shared<Shared::ClassSubscription>();
    subscription->prefix = prefix;
    subscription->callback = std::move(callback);

    std::lock_guard dispatch(dispatch_mutex_);
    std::vector<ObserverNodePtr> existing;
    {
        std::lock_guard lock(shared_->mutex);
        shared_->class_subscriptions.push_back(subscription);
        for (const auto& [id, node] : shared_->nodes) {
            if (id.starts_with(prefix)) {
                existing.push_back(node);
            }
        }
    }

    for (const auto& node : existing) {
        if (!subscription->active) break;
        invoke_callback("class created", subscription->callback, node);
    }

    std::weak_ptr<Shared> weak_shared = shared_;
    std::weak_ptr<Shared::ClassSubscription> weak_subscription = subscription;
    return Connection([weak_shared, weak_subscription]() {
        auto target = weak_subscription.lock();
        if (!target) return;
        target->active = false;
        if (auto shared = weak_shared.lock()) {
            std::lock_guard lock(shared->mutex);
            std::erase(shared->class_subscriptions, target);
        }
    });
}

std::vector<NodeId> ObserverRegistry::node_ids() const
{
    std::lock_guard lock(shared_->mutex);
    std::vector<NodeId> ids;
    ids.reserve(shared_->nodes.size());
    for (const auto& [id, node] : shared_->nodes) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ObserverRegistry::size() const
{
    std::lock_guard lock(shared_->mutex);
    return shared_->nodes.size();
}

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// local_transport.cpp - In-process hub with byte-encoded queues

#include <statecast/local_transport.h>
#include <statecast/log.h>

#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>

namespace statecast {

namespace {

struct QueuedMessage {
    Channel channel;
    ByteBuffer bytes;
};

struct EndpointState {
    explicit EndpointState(Identity id) : identity(std::move(id)) {}

    Identity identity;
    std::deque<QueuedMessage> queue;
    Signal<Message> messages;
};

} // anonymous namespace

// ============================================================
// LocalHub::Impl
// ============================================================

struct LocalHub::Impl {
    class Endpoint;

    mutable std::mutex mutex;
    // std::map keeps connected_identities() and pump() order deterministic
    std::map<Identity, std::shared_ptr<EndpointState>> endpoints;
    std::shared_ptr<InitialDataHandler> initial_data_handler;
    DropFilter drop_filter;
    bool requests_enabled = true;
    Stats stats;

    // Caller holds the mutex
    void enqueue(EndpointState& endpoint, Channel channel, const Message& msg, const ByteBuffer& bytes) {
        if (channel == Channel::Unreliable && drop_filter && drop_filter(endpoint.identity, msg)) {
            ++stats.dropped;
            return;
        }
        endpoint.queue.push_back(QueuedMessage{channel, bytes});
        ++stats.sent;
    }

    std::size_t deliver(const std::shared_ptr<EndpointState>& endpoint) {
        std::deque<QueuedMessage> batch;
        {
            std::lock_guard lock(mutex);
            batch.swap(endpoint->queue);
        }
        std::size_t delivered = 0;
        std::size_t undecodable = 0;
        for (const auto& queued : batch) {
            Message msg;
            try {
                msg = decode_message_bytes(queued.bytes);
            } catch (const std::exception& e) {
                // One bad frame must not strand the rest of the batch
                detail::log_error("LocalHub", "undecodable message for '" + endpoint->identity
                                                  + "' discarded: " + e.what());
                ++undecodable;
                continue;
            }
            endpoint->messages.fire(msg);
            ++delivered;
        }
        std::lock_guard lock(mutex);
        stats.delivered += delivered;
        stats.undecodable += undecodable;
        return delivered;
    }
};

// ============================================================
// Observer endpoint
// ============================================================

class LocalHub::Impl::Endpoint : public ObserverTransport {
public:
    Endpoint(std::weak_ptr<Impl> hub, std::shared_ptr<EndpointState> state)
        : hub_(std::move(hub)), state_(std::move(state)) {}

    std::vector<CreateMessage> request_initial_data(std::chrono::milliseconds timeout) override {
        auto hub = hub_.lock();
        if (!hub) {
            throw TransportError("hub is gone");
        }

        std::shared_ptr<InitialDataHandler> handler;
        {
            std::lock_guard lock(hub->mutex);
            auto it = hub->endpoints.find(state_->identity);
            if (it == hub->endpoints.end() || it->second != state_) {
                throw TransportError("'" + state_->identity + "' is not connected");
            }
            if (!hub->requests_enabled) {
                throw TransportError("authority unreachable");
            }
            handler = hub->initial_data_handler;
        }
        if (!handler) {
            throw TransportError("no initial data handler installed");
        }

        // The handler runs on the requesting thread; a response slower than
        // the timeout is discarded as the remote peer would.
        const auto started = std::chrono::steady_clock::now();
        auto response = (*handler)(state_->identity);
        if (std::chrono::steady_clock::now() - started > timeout) {
            throw TransportError("initial data request timed out");
        }

        // Round-trip through the codec like any other message
        std::vector<CreateMessage> decoded;
        decoded.reserve(response.size());
        for (const auto& create : response) {
            auto msg = decode_message_bytes(encode_message_bytes(create));
            decoded.push_back(std::get<CreateMessage>(std::move(msg)));
        }

        std::lock_guard lock(hub->mutex);
        ++hub->stats.requests;
        return decoded;
    }

    Connection on_message(MessageHandler handler) override {
        return state_->messages.connect(std::move(handler));
    }

private:
    std::weak_ptr<Impl> hub_;
    std::shared_ptr<EndpointState> state_;
};

// ============================================================
// LocalHub
// ============================================================

LocalHub::LocalHub() : impl_(std::make_shared<Impl>()) {}

LocalHub::~LocalHub() = default;

void LocalHub::send_to(const Identity& identity, Channel channel, const Message& msg)
{
    auto bytes = encode_message_bytes(msg);
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->endpoints.find(identity);
    if (it == impl_->endpoints.end()) {
        throw TransportError("'" + identity + "' is not connected");
    }
    impl_->enqueue(*it->second, channel, msg, bytes);
}

void LocalHub::send_to_all(Channel channel, const Message& msg)
{
    auto bytes = encode_message_bytes(msg);
    std::lock_guard lock(impl_->mutex);
    for (auto& [identity, endpoint] : impl_->endpoints) {
        impl_->enqueue(*endpoint, channel, msg, bytes);
    }
}

std::vector<Identity> LocalHub::connected_identities() const
{
    std::lock_guard lock(impl_->mutex);
    std::vector<Identity> result;
    result.reserve(impl_->endpoints.size());
    for (const auto& [identity, endpoint] : impl_->endpoints) {
        result.push_back(identity);
    }
    return result;
}

Connection LocalHub::serve_initial_data(InitialDataHandler handler)
{
    auto shared = std::make_shared<InitialDataHandler>(std::move(handler));
    {
        std::lock_guard lock(impl_->mutex);
        impl_->initial_data_handler = shared;
    }
    std::weak_ptr<Impl> weak_impl = impl_;
    std::weak_ptr<InitialDataHandler> weak_handler = shared;
    return Connection([weak_impl, weak_handler]() {
        auto impl = weak_impl.lock();
        if (!impl) return;
        std::lock_guard lock(impl->mutex);
        // Only uninstall if no newer handler replaced this one
        if (impl->initial_data_handler == weak_handler.lock()) {
            impl->initial_data_handler.reset();
        }
    });
}

std::shared_ptr<ObserverTransport> LocalHub::connect(const Identity& identity)
{
    if (identity.empty()) {
        throw std::invalid_argument("LocalHub::connect: identity must not be empty");
    }
    auto state = std::make_shared<EndpointState>(identity);
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->endpoints.emplace(identity, state).second) {
            throw TransportError("'" + identity + "' is already connected");
        }
    }
    return std::make_shared<Impl::Endpoint>(impl_, std::move(state));
}

void LocalHub::disconnect(const Identity& identity)
{
    std::lock_guard lock(impl_->mutex);
    impl_->endpoints.erase(identity);
}

bool LocalHub::is_connected(const Identity& identity) const
{
    std::lock_guard lock(impl_->mutex);
    return impl_->endpoints.count(identity) > 0;
}

std::size_t LocalHub::pump()
{
    std::vector<std::shared_ptr<EndpointState>> endpoints;
    {
        std::lock_guard lock(impl_->mutex);
        for (const auto& [identity, endpoint] : impl_->endpoints) {
            endpoints.push_back(endpoint);
        }
    }
    std::size_t delivered = 0;
    for (const auto& endpoint : endpoints) {
        delivered += impl_->deliver(endpoint);
    }
    return delivered;
}

std::size_t LocalHub::pump(const Identity& identity)
{
    std::shared_ptr<EndpointState> endpoint;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->endpoints.find(identity);
        if (it == impl_->endpoints.end()) return 0;
        endpoint = it->second;
    }
    return impl_->deliver(endpoint);
}

std::size_t LocalHub::pending() const
{
    std::lock_guard lock(impl_->mutex);
    std::size_t total = 0;
    for (const auto& [identity, endpoint] : impl_->endpoints) {
        total += endpoint->queue.size();
    }
    return total;
}

std::size_t LocalHub::pending(const Identity& identity) const
{
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->endpoints.find(identity);
    return it == impl_->endpoints.end() ? 0 : it->second->queue.size();
}

void LocalHub::set_unreliable_drop_filter(DropFilter filter)
{
    std::lock_guard lock(impl_->mutex);
    impl_->drop_filter = std::move(filter);
}

void LocalHub::set_requests_enabled(bool enabled)
{
    std::lock_guard lock(impl_->mutex);
    impl_->requests_enabled = enabled;
}

LocalHub::Stats LocalHub::stats() const
{
    std::lock_guard lock(impl_->mutex);
    return impl_->stats;
}

} // namespace statecast

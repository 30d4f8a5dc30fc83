// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file signal.h
/// @brief Signal - thread-safe local publish/subscribe with connection handles
///
/// This header provides:
/// - Signal<Args...>: a typed multicast callback list
/// - Connection: handle to one subscription (or any deferred teardown action)
/// - ScopedConnection: RAII wrapper, disconnects on destruction
/// - ScopedConnectionList: batches teardown of many connections
///
/// Handlers may connect or disconnect (including themselves) while the
/// signal is firing. A handler disconnected during a fire is not invoked
/// afterwards. A handler that throws a std::exception is logged and the
/// remaining handlers still run.
///
/// Usage:
/// @code
///   Signal<int, std::string> changed;
///   ScopedConnectionList connections;
///   connections += changed.connect([](int n, const std::string& s) { ... });
///   changed.fire(1, "one");
/// @endcode

#pragma once

#include <statecast/statecast_config.h>

#include "log.h"

#include <atomic>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace statecast {

// ============================================================================
// Connection Management
// ============================================================================

/// @brief Handle to a subscription
///
/// Lightweight, move-only. Does NOT auto-disconnect on destruction.
/// Use ScopedConnection for RAII semantics.
class Connection {
public:
    /// @brief Action run (once) by disconnect()
    using Disconnector = std::function<void()>;

    Connection() noexcept = default;

    /// @brief Construct with a disconnector; any teardown action can be wrapped this way
    explicit Connection(Disconnector disconnector) noexcept;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection() = default;

    /// @brief Run the disconnector; later calls do nothing
    void disconnect();

    [[nodiscard]] bool connected() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept { return connected(); }

private:
    Disconnector disconnector_;
};

/// @brief RAII wrapper for Connection - auto-disconnects on destruction
class ScopedConnection {
public:
    ScopedConnection() noexcept = default;
    ScopedConnection(Connection conn) noexcept;
    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(Connection conn) noexcept;
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void reset();
    [[nodiscard]] Connection release() noexcept;
    [[nodiscard]] bool connected() const noexcept { return conn_.connected(); }
    [[nodiscard]] explicit operator bool() const noexcept { return connected(); }

private:
    Connection conn_;
};

/// @brief Container for multiple scoped connections
///
/// Everything added is disconnected by clear() or on destruction.
class ScopedConnectionList {
public:
    ScopedConnectionList() = default;
    ~ScopedConnectionList() = default;
    ScopedConnectionList(ScopedConnectionList&&) = default;
    ScopedConnectionList& operator=(ScopedConnectionList&&) = default;
    ScopedConnectionList(const ScopedConnectionList&) = delete;
    ScopedConnectionList& operator=(const ScopedConnectionList&) = delete;

    void add(Connection conn);
    ScopedConnectionList& operator+=(Connection conn);
    void clear();
    [[nodiscard]] std::size_t size() const noexcept { return connections_.size(); }
    [[nodiscard]] bool empty() const noexcept { return connections_.empty(); }

private:
    std::vector<ScopedConnection> connections_;
};

// ============================================================================
// Signal
// ============================================================================

namespace detail {

template <typename... Args>
struct SignalSlot {
    std::function<void(const Args&...)> handler;
    std::atomic<bool> active{true};
};

template <typename... Args>
struct SignalState {
    std::mutex mutex;
    std::vector<std::shared_ptr<SignalSlot<Args...>>> slots;
};

} // namespace detail

/// @brief Typed multicast callback list
///
/// Thread Safety: connect(), disconnect and fire() may be called from any
/// thread. Handlers run on the firing thread, outside the internal lock.
template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(const Args&...)>;

    Signal() : state_(std::make_shared<State>()) {}
    ~Signal() { disconnect_all(); }

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// @brief Subscribe a handler
    /// @return Connection whose disconnect() removes exactly this handler.
    ///         It stays safe to call after the Signal is destroyed.
    template <std::invocable<const Args&...> F>
    Connection connect(F&& handler) {
        auto slot = std::make_shared<Slot>();
        slot->handler = Handler(std::forward<F>(handler));
        {
            std::lock_guard lock(state_->mutex);
            state_->slots.push_back(slot);
        }
        std::weak_ptr<State> weak_state = state_;
        std::weak_ptr<Slot> weak_slot = slot;
        return Connection([weak_state, weak_slot]() {
            auto target = weak_slot.lock();
            if (!target) return;
            target->active = false;
            if (auto state = weak_state.lock()) {
                std::lock_guard lock(state->mutex);
                std::erase(state->slots, target);
            }
        });
    }

    /// @brief Invoke every currently connected handler in connection order
    void fire(const Args&... args) const {
        std::vector<std::shared_ptr<Slot>> snapshot;
        {
            std::lock_guard lock(state_->mutex);
            snapshot = state_->slots;
        }
        for (const auto& slot : snapshot) {
            if (!slot->active) continue;
            try {
                slot->handler(args...);
            } catch (const std::exception& e) {
                detail::log_error("Signal", std::string("handler threw: ") + e.what());
            }
        }
    }

    void disconnect_all() {
        std::vector<std::shared_ptr<Slot>> removed;
        {
            std::lock_guard lock(state_->mutex);
            removed.swap(state_->slots);
        }
        for (const auto& slot : removed) {
            slot->active = false;
        }
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(state_->mutex);
        return state_->slots.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    using Slot = detail::SignalSlot<Args...>;
    using State = detail::SignalState<Args...>;

    std::shared_ptr<State> state_;
};

// ============================================================================
// Inline Implementations
// ============================================================================

inline Connection::Connection(Disconnector disconnector) noexcept
    : disconnector_(std::move(disconnector)) {}

inline Connection::Connection(Connection&& other) noexcept
    : disconnector_(std::move(other.disconnector_)) {
    other.disconnector_ = nullptr;
}

inline Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        disconnector_ = std::move(other.disconnector_);
        other.disconnector_ = nullptr;
    }
    return *this;
}

inline void Connection::disconnect() {
    if (disconnector_) {
        auto d = std::move(disconnector_);
        disconnector_ = nullptr;
        d();
    }
}

inline bool Connection::connected() const noexcept {
    return disconnector_ != nullptr;
}

inline ScopedConnection::ScopedConnection(Connection conn) noexcept : conn_(std::move(conn)) {}

inline ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        conn_.disconnect();
        conn_ = std::move(other.conn_);
    }
    return *this;
}

inline ScopedConnection& ScopedConnection::operator=(Connection conn) noexcept {
    conn_.disconnect();
    conn_ = std::move(conn);
    return *this;
}

inline ScopedConnection::~ScopedConnection() {
    conn_.disconnect();
}

inline void ScopedConnection::reset() {
    conn_.disconnect();
}

inline Connection ScopedConnection::release() noexcept {
    return std::move(conn_);
}

inline void ScopedConnectionList::add(Connection conn) {
    connections_.emplace_back(std::move(conn));
}

inline ScopedConnectionList& ScopedConnectionList::operator+=(Connection conn) {
    add(std::move(conn));
    return *this;
}

inline void ScopedConnectionList::clear() {
    connections_.clear();
}

} // namespace statecast

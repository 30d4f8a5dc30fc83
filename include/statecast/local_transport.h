// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file local_transport.h
/// @brief In-process transport connecting one authority to many observers.
///
/// Every message is encoded to bytes on send and decoded on delivery, so the
/// full wire codec is exercised. Delivery is explicit: messages queue per
/// observer until pump() is called, which makes reordering and loss
/// scenarios reproducible.
///
/// @code
///   LocalHub hub;
///   AuthorityRegistry authority(hub);
///   auto alice = hub.connect("alice");
///   ObserverRegistry observer(*alice);
///   ...
///   hub.pump();   // deliver everything queued so far
/// @endcode

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "transport.h"

#include <cstddef>
#include <functional>
#include <memory>

namespace statecast {

class STATECAST_API LocalHub : public AuthorityTransport {
public:
    /// Return true to drop an unreliable message addressed to the identity
    using DropFilter = std::function<bool(const Identity&, const Message&)>;

    struct Stats {
        std::size_t sent = 0;       ///< messages accepted for delivery
        std::size_t dropped = 0;    ///< unreliable messages discarded by the drop filter
        std::size_t delivered = 0;  ///< messages handed to observer handlers
        std::size_t undecodable = 0; ///< queued messages that failed to decode
        std::size_t requests = 0;   ///< bootstrap requests answered
    };

    LocalHub();
    ~LocalHub() override;

    LocalHub(const LocalHub&) = delete;
    LocalHub& operator=(const LocalHub&) = delete;

    // ========================================================================
    // AuthorityTransport
    // ========================================================================

    /// @throws TransportError if @p identity is not connected
    void send_to(const Identity& identity, Channel channel, const Message& msg) override;
    void send_to_all(Channel channel, const Message& msg) override;
    [[nodiscard]] std::vector<Identity> connected_identities() const override;
    Connection serve_initial_data(InitialDataHandler handler) override;

    // ========================================================================
    // Observer endpoints
    // ========================================================================

    /// Connect an observer. The endpoint stays usable as an ObserverTransport
    /// after disconnect() or hub destruction, but its requests then fail.
    /// @throws std::invalid_argument for an empty identity
    /// @throws TransportError if @p identity is already connected
    [[nodiscard]] std::shared_ptr<ObserverTransport> connect(const Identity& identity);

    /// Drop the identity and its undelivered messages
    void disconnect(const Identity& identity);

    [[nodiscard]] bool is_connected(const Identity& identity) const;

    // ========================================================================
    // Delivery control
    // ========================================================================

    /// Deliver every queued message, FIFO per identity
    /// @return number of messages delivered
    std::size_t pump();

    /// Deliver queued messages of one identity only
    std::size_t pump(const Identity& identity);

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t pending(const Identity& identity) const;

    void set_unreliable_drop_filter(DropFilter filter);

    /// Simulate an unreachable authority: requests throw TransportError
    void set_requests_enabled(bool enabled);

    [[nodiscard]] Stats stats() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace statecast

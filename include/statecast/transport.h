// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file transport.h
/// @brief The boundary between the replication core and the message transport.
///
/// A transport provides:
///   - a request/response primitive: identity -> initial create messages
///   - a reliable and a best-effort (may silently drop) channel
///   - addressing of "one identity" and "all connected identities"
///
/// Transports report failures by throwing TransportError.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "protocol.h"
#include "scope.h"
#include "signal.h"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <vector>

namespace statecast {

enum class Channel : uint8_t {
    Reliable,
    Unreliable,
};

[[nodiscard]] inline Channel channel_for(Reliability reliability) noexcept {
    return reliability == Reliability::Unreliable ? Channel::Unreliable : Channel::Reliable;
}

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Answers a bootstrap request from the given identity
using InitialDataHandler = std::function<std::vector<CreateMessage>(const Identity&)>;

/// Receives every message delivered to an observer
using MessageHandler = std::function<void(const Message&)>;

/// @brief Authority-side view of the transport
class STATECAST_API AuthorityTransport {
public:
    virtual ~AuthorityTransport() = default;

    virtual void send_to(const Identity& identity, Channel channel, const Message& msg) = 0;
    virtual void send_to_all(Channel channel, const Message& msg) = 0;
    [[nodiscard]] virtual std::vector<Identity> connected_identities() const = 0;

    /// Install the bootstrap request handler; disconnecting uninstalls it
    virtual Connection serve_initial_data(InitialDataHandler handler) = 0;
};

/// @brief Observer-side view of the transport
class STATECAST_API ObserverTransport {
public:
    virtual ~ObserverTransport() = default;

    /// Blocking bootstrap request
    /// @throws TransportError when the authority is unreachable or the
    ///         response does not arrive within @p timeout
    virtual std::vector<CreateMessage> request_initial_data(std::chrono::milliseconds timeout) = 0;

    virtual Connection on_message(MessageHandler handler) = 0;
};

} // namespace statecast

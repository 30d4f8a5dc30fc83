// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file token.h
/// @brief Names for replicated node classes.
///
/// A NodeToken labels one class of node. Singleton nodes use the token id
/// directly; dynamically created nodes of the same class use instance ids
/// sharing the token as a prefix, which observers match with
/// ObserverRegistry::on_node_of_class_created().
///
/// @code
///   const auto kPlayerData = NodeToken::create("player_data");
///   authority.create_node(kPlayerData.instance("alice"), ...);  // "player_data:alice"
///   observer.on_node_of_class_created(kPlayerData.class_prefix(), ...);
/// @endcode
///
/// Ids are opaque to the replication core; uniqueness across the process is
/// the application's responsibility.

#pragma once

#include <statecast/statecast_config.h>

#include <stdexcept>
#include <string>

namespace statecast {

class NodeToken {
public:
    /// @throws std::invalid_argument for an empty id or one containing ':'
    [[nodiscard]] static NodeToken create(std::string id) {
        if (id.empty()) {
            throw std::invalid_argument("NodeToken: id must not be empty");
        }
        if (id.find(kSeparator) != std::string::npos) {
            throw std::invalid_argument("NodeToken: id '" + id + "' must not contain ':'");
        }
        return NodeToken{std::move(id)};
    }

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// Id of one dynamically created node of this class, "<id>:<suffix>"
    /// @throws std::invalid_argument for an empty suffix
    [[nodiscard]] std::string instance(const std::string& suffix) const {
        if (suffix.empty()) {
            throw std::invalid_argument("NodeToken: instance suffix must not be empty");
        }
        return class_prefix() + suffix;
    }

    /// Prefix shared by every instance id, "<id>:"
    [[nodiscard]] std::string class_prefix() const { return id_ + kSeparator; }

    bool operator==(const NodeToken&) const = default;

private:
    static constexpr char kSeparator = ':';

    explicit NodeToken(std::string id) : id_(std::move(id)) {}

    std::string id_;
};

} // namespace statecast

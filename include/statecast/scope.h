// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file scope.h
/// @brief Which observer identities may receive a node's messages.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"

#include <string>
#include <variant>
#include <vector>

namespace statecast {

/// Opaque observer identity supplied by the transport
using Identity = std::string;

namespace scope {

/// Every connected identity
struct All {
    bool operator==(const All&) const = default;
};

/// Exactly one identity
struct Single {
    Identity identity;
    bool operator==(const Single&) const = default;
};

/// An explicit list of identities, each addressed individually
struct Set {
    std::vector<Identity> identities;
    bool operator==(const Set&) const = default;
};

} // namespace scope

using Scope = std::variant<scope::All, scope::Single, scope::Set>;

/// @throws std::invalid_argument for an empty identity or an empty set
STATECAST_API void validate_scope(const Scope& s);

/// Validate and drop duplicate identities from a Set, keeping first occurrence order
[[nodiscard]] STATECAST_API Scope normalize_scope(Scope s);

/// Pure membership test
[[nodiscard]] STATECAST_API bool scope_includes(const Scope& s, const Identity& identity);

/// "all", "single(alice)", "set(alice,bob)"
[[nodiscard]] STATECAST_API std::string scope_to_string(const Scope& s);

} // namespace statecast

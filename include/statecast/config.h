// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Runtime tunables shared by the authority and observer registries.
///
/// Loadable from a Value or a JSON document:
/// @code
///   { "maxInitialRequests": 5, "requestWindowMs": 10000, "bootstrapTimeoutMs": 5000 }
/// @endcode
/// Missing keys keep their defaults; unknown keys are ignored.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "value.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace statecast {

struct ReplicationConfig {
    /// Bootstrap requests admitted per identity within request_window
    std::size_t max_initial_requests = 5;
    std::chrono::milliseconds request_window{10000};
    /// Upper bound an observer waits for the bootstrap response
    std::chrono::milliseconds bootstrap_timeout{5000};

    /// @throws std::invalid_argument if any limit is zero or negative
    STATECAST_API void validate() const;

    /// @throws std::invalid_argument on a non-map or a wrongly typed field
    [[nodiscard]] STATECAST_API static ReplicationConfig from_value(const Value& v);

    /// @throws std::invalid_argument on malformed JSON or invalid fields
    [[nodiscard]] STATECAST_API static ReplicationConfig from_json(const std::string& json);

    [[nodiscard]] STATECAST_API Value to_value() const;

    bool operator==(const ReplicationConfig&) const = default;
};

} // namespace statecast

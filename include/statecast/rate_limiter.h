// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file rate_limiter.h
/// @brief Sliding-window request admission per identity.
///
/// Each identity may make at most max_requests calls within any trailing
/// window. Timestamps older than the window are pruned on the next
/// can_request() for that identity. Identities whose requests have all
/// expired are evicted by a sweep that runs at most once per window, so
/// history stays bounded by the identities active in the last two windows.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace statecast {

class STATECAST_API RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /// @param time_source Injectable clock for tests; defaults to steady_clock::now
    /// @throws std::invalid_argument if @p max_requests is 0 or @p window is not positive
    RateLimiter(std::size_t max_requests, Clock::duration window, TimeSource time_source = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Record and admit a request from @p identity, or deny it when the
    /// identity already made max_requests within the window.
    [[nodiscard]] bool can_request(const std::string& identity);

    /// Forget one identity's history
    void reset(const std::string& identity);

    /// Forget all history
    void clear();

    /// Identities with recorded history. An identity idle for a full window
    /// is dropped by the next sweep.
    [[nodiscard]] std::vector<std::string> tracked_identities() const;

    [[nodiscard]] std::size_t max_requests() const noexcept { return max_requests_; }
    [[nodiscard]] Clock::duration window() const noexcept { return window_; }

private:
    void evict_expired(Clock::time_point cutoff);

    std::size_t max_requests_;
    Clock::duration window_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> history_;
    std::optional<Clock::time_point> last_sweep_;
};

} // namespace statecast

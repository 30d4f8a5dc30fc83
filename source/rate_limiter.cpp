// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <statecast/rate_limiter.h>

#include <stdexcept>

namespace statecast {

RateLimiter::RateLimiter(std::size_t max_requests, Clock::duration window, TimeSource time_source)
    : max_requests_(max_requests)
    , window_(window)
    , now_(time_source ? std::move(time_source) : TimeSource{[] { return Clock::now(); }})
{
    if (max_requests_ == 0) {
        throw std::invalid_argument("RateLimiter: max_requests must be at least 1");
    }
    if (window_ <= Clock::duration::zero()) {
        throw std::invalid_argument("RateLimiter: window must be positive");
    }
}

bool RateLimiter::can_request(const std::string& identity)
{
    const auto now = now_();
    const auto cutoff = now - window_;

    std::lock_guard lock(mutex_);
    if (!last_sweep_ || now - *last_sweep_ >= window_) {
        evict_expired(cutoff);
        last_sweep_ = now;
    }

    auto& stamps = history_[identity];
    while (!stamps.empty() && stamps.front() <= cutoff) {
        stamps.pop_front();
    }
    if (stamps.size() >= max_requests_) {
        return false;
    }
    stamps.push_back(now);
    return true;
}

// Caller holds the mutex
void RateLimiter::evict_expired(Clock::time_point cutoff)
{
    std::erase_if(history_, [cutoff](const auto& entry) {
        return entry.second.empty() || entry.second.back() <= cutoff;
    });
}

void RateLimiter::reset(const std::string& identity)
{
    std::lock_guard lock(mutex_);
    history_.erase(identity);
}

void RateLimiter::clear()
{
    std::lock_guard lock(mutex_);
    history_.clear();
}

std::vector<std::string> RateLimiter::tracked_identities() const
{
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(history_.size());
    for (const auto& [identity, stamps] : history_) {
        result.push_back(identity);
    }
    return result;
}

} // namespace statecast

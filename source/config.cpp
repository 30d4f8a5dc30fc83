// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <statecast/config.h>
#include <statecast/builders.h>
#include <statecast/serialization.h>

#include <optional>
#include <stdexcept>

namespace statecast {

namespace {

constexpr const char* kMaxInitialRequests = "maxInitialRequests";
constexpr const char* kRequestWindowMs = "requestWindowMs";
constexpr const char* kBootstrapTimeoutMs = "bootstrapTimeoutMs";

std::optional<int64_t> read_integer(const ValueMap& map, const char* key) {
    auto* found = map.find(key);
    if (!found) return std::nullopt;
    const auto& v = found->get();
    if (!v.is_integer()) {
        throw std::invalid_argument(std::string("config field '") + key + "' must be an integer, got "
                                    + std::string(type_name(v)));
    }
    return v.as_int64();
}

} // anonymous namespace

void ReplicationConfig::validate() const
{
    if (max_initial_requests == 0) {
        throw std::invalid_argument("config: maxInitialRequests must be at least 1");
    }
    if (request_window.count() <= 0) {
        throw std::invalid_argument("config: requestWindowMs must be positive");
    }
    if (bootstrap_timeout.count() <= 0) {
        throw std::invalid_argument("config: bootstrapTimeoutMs must be positive");
    }
}

ReplicationConfig ReplicationConfig::from_value(const Value& v)
{
    auto* map = v.get_if<ValueMap>();
    if (!map) {
        throw std::invalid_argument("config must be a map, got " + std::string(type_name(v)));
    }

    ReplicationConfig config;
    if (auto n = read_integer(*map, kMaxInitialRequests)) {
        if (*n <= 0) {
            throw std::invalid_argument("config: maxInitialRequests must be at least 1");
        }
        config.max_initial_requests = static_cast<std::size_t>(*n);
    }
    if (auto ms = read_integer(*map, kRequestWindowMs)) {
        config.request_window = std::chrono::milliseconds{*ms};
    }
    if (auto ms = read_integer(*map, kBootstrapTimeoutMs)) {
        config.bootstrap_timeout = std::chrono::milliseconds{*ms};
    }
    config.validate();
    return config;
}

ReplicationConfig ReplicationConfig::from_json(const std::string& json)
{
    std::string error;
    Value parsed = statecast::from_json(json, &error);
    if (!error.empty()) {
        throw std::invalid_argument("config: " + error);
    }
    return from_value(parsed);
}

Value ReplicationConfig::to_value() const
{
    return MapBuilder()
        .set(kMaxInitialRequests, static_cast<int64_t>(max_initial_requests))
        .set(kRequestWindowMs, static_cast<int64_t>(request_window.count()))
        .set(kBootstrapTimeoutMs, static_cast<int64_t>(bootstrap_timeout.count()))
        .finish();
}

} // namespace statecast

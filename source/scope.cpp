// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <statecast/scope.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace statecast {

void validate_scope(const Scope& s)
{
    std::visit([](const auto& sc) {
        using T = std::decay_t<decltype(sc)>;
        if constexpr (std::is_same_v<T, scope::Single>) {
            if (sc.identity.empty()) {
                throw std::invalid_argument("single scope requires a non-empty identity");
            }
        } else if constexpr (std::is_same_v<T, scope::Set>) {
            if (sc.identities.empty()) {
                throw std::invalid_argument("set scope requires at least one identity");
            }
            for (const auto& id : sc.identities) {
                if (id.empty()) {
                    throw std::invalid_argument("set scope contains an empty identity");
                }
            }
        }
    }, s);
}

Scope normalize_scope(Scope s)
{
    validate_scope(s);
    if (auto* set = std::get_if<scope::Set>(&s)) {
        std::unordered_set<Identity> seen;
        std::vector<Identity> unique;
        unique.reserve(set->identities.size());
        for (auto& id : set->identities) {
            if (seen.insert(id).second) {
                unique.push_back(std::move(id));
            }
        }
        set->identities = std::move(unique);
    }
    return s;
}

bool scope_includes(const Scope& s, const Identity& identity)
{
    return std::visit([&identity](const auto& sc) -> bool {
        using T = std::decay_t<decltype(sc)>;
        if constexpr (std::is_same_v<T, scope::All>) {
            return true;
        } else if constexpr (std::is_same_v<T, scope::Single>) {
            return sc.identity == identity;
        } else {
            return std::find(sc.identities.begin(), sc.identities.end(), identity) != sc.identities.end();
        }
    }, s);
}

std::string scope_to_string(const Scope& s)
{
    return std::visit([](const auto& sc) -> std::string {
        using T = std::decay_t<decltype(sc)>;
        if constexpr (std::is_same_v<T, scope::All>) {
            return "all";
        } else if constexpr (std::is_same_v<T, scope::Single>) {
            return "single(" + sc.identity + ")";
        } else {
            std::string result = "set(";
            for (std::size_t i = 0; i < sc.identities.size(); ++i) {
                if (i > 0) result += ",";
                result += sc.identities[i];
            }
            return result + ")";
        }
    }, s);
}

} // namespace statecast

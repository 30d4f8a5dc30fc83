// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value diagnostics and the library's template instantiations

#include <statecast/value.h>
#include <statecast/builders.h>

#include <iomanip>
#include <sstream>

namespace statecast {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::string_view type_name(const Value& val) noexcept
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return "int";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "int64";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "map";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "vector";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

template struct BasicValue<thread_safe_memory_policy>;
template class BasicMapBuilder<thread_safe_memory_policy>;
template class BasicVectorBuilder<thread_safe_memory_policy>;

} // namespace statecast

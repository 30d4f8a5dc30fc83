// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief The replicated state tree: a JSON-like dynamic Value.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Primitive types: bool, int32, int64, double, string
/// - Container types: map (string keys) and vector, using immer's
///   persistent containers
///
/// Containers are structurally shared, so copying a whole tree is O(1) and a
/// copy never observes later mutation of the original. Authoritative nodes
/// hand out snapshots and observers keep pre-patch states this way instead of
/// deep-copying.
///
/// BasicValue is templated on an immer memory policy; the library
/// instantiates it once, for the thread-safe policy behind Value.

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "log.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace statecast {

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

/// @brief Byte buffer type for binary serialization
using ByteBuffer = std::vector<uint8_t>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<int32_t,
                 int64_t,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(int32_t v) noexcept : data(v) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_map() || is_vector(); }
    [[nodiscard]] bool is_integer() const noexcept { return is<int32_t>() || is<int64_t>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_integer() || is<double>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    /// Widens int32 values; doubles are not truncated.
    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-vector type");
        return *this;
    }

    /// Set on a map, or on null which becomes a new map.
    [[nodiscard]] BasicValue set_vivify(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        if (is_null()) return value_map{}.set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set_vivify", key, "cannot set on non-map/non-null type");
        return *this;
    }

    /// Set on a vector (padding with nulls up to @p index), or on null which
    /// becomes a new vector.
    [[nodiscard]] BasicValue set_vivify(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
            auto trans = v->transient();
            while (trans.size() < index) trans.push_back(value_box{});
            trans.push_back(value_box{std::move(val)});
            return trans.persistent();
        }
        if (is_null()) {
            auto trans = value_vector{}.transient();
            for (std::size_t i = 0; i < index; ++i) trans.push_back(value_box{});
            trans.push_back(value_box{std::move(val)});
            return trans.persistent();
        }
        detail::log_index_error("Value::set_vivify", index, "cannot set on non-vector/non-null type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }
};

/// Atomic refcount with a spinlock: trees cross threads freely
using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// Value - the replicated tree type
//
// Snapshots and pre-patch states are handed between the transport
// thread, the registries and user callbacks, so the default Value
// uses atomic reference counting.
// ============================================================
using Value       = BasicValue<thread_safe_memory_policy>;
using ValueBox    = BasicValueBox<thread_safe_memory_policy>;
using ValueMap    = BasicValueMap<thread_safe_memory_policy>;
using ValueVector = BasicValueVector<thread_safe_memory_policy>;

// ============================================================
// BasicValue comparison
//
// Structural equality. immer containers compare equal in O(1) when
// they share the same root, which makes "did this subtree change"
// checks after a patch cheap for untouched branches.
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Convert Value to a short human-readable string (containers show their size)
[[nodiscard]] STATECAST_API std::string value_to_string(const Value& val);

/// Name of the stored alternative ("null", "int", "map", ...), for diagnostics
[[nodiscard]] STATECAST_API std::string_view type_name(const Value& val) noexcept;

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

extern template struct BasicValue<thread_safe_memory_policy>;

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// path.cpp - Path validation and tree access

#include <statecast/path.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace statecast {

namespace {

void validate_elements(const std::vector<PathElement>& elements) {
    if (elements.empty()) {
        throw std::invalid_argument("path must not be empty");
    }
    for (const auto& elem : elements) {
        if (auto* key = std::get_if<std::string>(&elem); key && key->empty()) {
            throw std::invalid_argument("path key must be a non-empty string");
        }
    }
}

std::string element_to_string(const PathElement& elem) {
    if (auto* key = std::get_if<std::string>(&elem)) return *key;
    return std::to_string(std::get<std::size_t>(elem));
}

PathElement decode_element(const Value& encoded) {
    if (auto* s = encoded.get_if<std::string>()) {
        if (s->empty()) {
            throw std::invalid_argument("path key must be a non-empty string");
        }
        return *s;
    }
    if (encoded.is_integer()) {
        int64_t index = encoded.as_int64();
        if (index < 0) {
            throw std::invalid_argument("path index must be non-negative, got " + std::to_string(index));
        }
        return static_cast<std::size_t>(index);
    }
    if (auto* d = encoded.get_if<double>()) {
        if (!std::isfinite(*d) || *d < 0.0 || std::floor(*d) != *d
            || *d > static_cast<double>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("path index must be a non-negative integer, got " + value_to_string(encoded));
        }
        return static_cast<std::size_t>(*d);
    }
    throw std::invalid_argument("path key must be a string or integer, got " + std::string{type_name(encoded)});
}

// Returns the rewritten node, or nullopt when the write is impossible.
// Only nodes below the root may be replaced by a fresh container.
std::optional<Value> set_impl(const Value& node, const Path& path, std::size_t idx,
                              Value value, bool may_replace)
{
    const auto& elem = path[idx];
    const bool last = idx + 1 == path.size();

    Value current = node;
    if (!current.is_container()) {
        if (!may_replace) {
            detail::log_warning("set_at_path", "root of " + path.to_string() + " is not a container");
            return std::nullopt;
        }
        current = std::holds_alternative<std::size_t>(elem) ? Value{ValueVector{}} : Value{ValueMap{}};
    }

    if (auto* key = std::get_if<std::string>(&elem)) {
        auto* map = current.get_if<ValueMap>();
        if (!map) {
            detail::log_key_error("set_at_path", *key, "addresses a vector in " + path.to_string());
            return std::nullopt;
        }
        if (last) {
            return Value{map->set(*key, ValueBox{std::move(value)})};
        }
        Value child;
        if (auto* found = map->find(*key)) child = found->get();
        auto new_child = set_impl(child, path, idx + 1, std::move(value), true);
        if (!new_child) return std::nullopt;
        return Value{map->set(*key, ValueBox{std::move(*new_child)})};
    }

    const auto index = std::get<std::size_t>(elem);
    auto* vec = current.get_if<ValueVector>();
    if (!vec) {
        detail::log_index_error("set_at_path", index, "addresses a map in " + path.to_string());
        return std::nullopt;
    }
    if (last) {
        return current.set_vivify(index, std::move(value));
    }
    Value child = index < vec->size() ? (*vec)[index].get() : Value{};
    auto new_child = set_impl(child, path, idx + 1, std::move(value), true);
    if (!new_child) return std::nullopt;
    return current.set_vivify(index, std::move(*new_child));
}

// Returns the rewritten node, or nullopt when nothing was removed.
std::optional<Value> erase_impl(const Value& node, const Path& path, std::size_t idx)
{
    const auto& elem = path[idx];
    const bool last = idx + 1 == path.size();

    if (auto* key = std::get_if<std::string>(&elem)) {
        auto* map = node.get_if<ValueMap>();
        if (!map) {
            if (node.is_vector()) {
                detail::log_key_error("erase_at_path", *key, "addresses a vector in " + path.to_string());
            }
            return std::nullopt;
        }
        auto* found = map->find(*key);
        if (!found) return std::nullopt;
        if (last) {
            return Value{map->erase(*key)};
        }
        auto new_child = erase_impl(found->get(), path, idx + 1);
        if (!new_child) return std::nullopt;
        return Value{map->set(*key, ValueBox{std::move(*new_child)})};
    }

    const auto index = std::get<std::size_t>(elem);
    auto* vec = node.get_if<ValueVector>();
    if (!vec) {
        if (node.is_map()) {
            detail::log_index_error("erase_at_path", index, "addresses a map in " + path.to_string());
        }
        return std::nullopt;
    }
    if (index >= vec->size()) return std::nullopt;
    if (last) {
        return Value{vector_erase(*vec, index)};
    }
    auto new_child = erase_impl((*vec)[index].get(), path, idx + 1);
    if (!new_child) return std::nullopt;
    return Value{vec->set(index, ValueBox{std::move(*new_child)})};
}

} // anonymous namespace

// ============================================================
// Path
// ============================================================

Path::Path(std::initializer_list<PathKey> keys)
{
    elements_.reserve(keys.size());
    for (const auto& key : keys) {
        elements_.push_back(key.element());
    }
    validate_elements(elements_);
}

Path::Path(std::vector<PathElement> elements)
    : elements_(std::move(elements))
{
    validate_elements(elements_);
}

Path Path::from_value(const Value& encoded)
{
    auto* vec = encoded.get_if<ValueVector>();
    if (!vec) {
        throw std::invalid_argument("encoded path must be a vector, got " + std::string{type_name(encoded)});
    }
    std::vector<PathElement> elements;
    elements.reserve(vec->size());
    for (const auto& box : *vec) {
        elements.push_back(decode_element(box.get()));
    }
    return Path(std::move(elements));
}

Value Path::to_value() const
{
    auto t = ValueVector{}.transient();
    for (const auto& elem : elements_) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            t.push_back(ValueBox{Value{*key}});
        } else {
            const auto index = std::get<std::size_t>(elem);
            if (index <= static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
                t.push_back(ValueBox{Value{static_cast<int32_t>(index)}});
            } else {
                t.push_back(ValueBox{Value{static_cast<int64_t>(index)}});
            }
        }
    }
    return Value{t.persistent()};
}

std::string Path::to_string() const
{
    std::string result;
    for (const auto& elem : elements_) {
        if (std::holds_alternative<std::string>(elem)) {
            result += "." + element_to_string(elem);
        } else {
            result += "[" + element_to_string(elem) + "]";
        }
    }
    return result;
}

Path Path::child(PathKey key) const
{
    auto elements = elements_;
    elements.push_back(key.element());
    return Path(std::move(elements));
}

bool Path::starts_with(const Path& other) const
{
    if (other.size() > size()) return false;
    for (std::size_t i = 0; i < other.size(); ++i) {
        if (elements_[i] != other.elements_[i]) return false;
    }
    return true;
}

// ============================================================
// Tree access
// ============================================================

std::optional<Value> get_at_path(const Value& root, const Path& path)
{
    Value current = root;
    for (const auto& elem : path) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            auto* map = current.get_if<ValueMap>();
            if (!map) return std::nullopt;
            auto* found = map->find(*key);
            if (!found) return std::nullopt;
            current = found->get();
        } else {
            const auto index = std::get<std::size_t>(elem);
            auto* vec = current.get_if<ValueVector>();
            if (!vec || index >= vec->size()) return std::nullopt;
            current = (*vec)[index].get();
        }
    }
    return current;
}

bool set_at_path(Value& root, const Path& path, Value value)
{
    auto updated = set_impl(root, path, 0, std::move(value), false);
    if (!updated) return false;
    root = std::move(*updated);
    return true;
}

bool erase_at_path(Value& root, const Path& path)
{
    auto updated = erase_impl(root, path, 0);
    if (!updated) return false;
    root = std::move(*updated);
    return true;
}

// ============================================================
// Vector helpers
// ============================================================

ValueVector vector_insert(const ValueVector& vec, std::size_t index, Value value)
{
    if (index >= vec.size()) {
        return vec.push_back(ValueBox{std::move(value)});
    }
    auto t = vec.take(index).transient();
    t.push_back(ValueBox{std::move(value)});
    for (std::size_t i = index; i < vec.size(); ++i) {
        t.push_back(vec[i]);
    }
    return t.persistent();
}

ValueVector vector_erase(const ValueVector& vec, std::size_t index)
{
    auto t = vec.take(index).transient();
    for (std::size_t i = index + 1; i < vec.size(); ++i) {
        t.push_back(vec[i]);
    }
    return t.persistent();
}

} // namespace statecast

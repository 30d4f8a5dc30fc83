// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Addressing values inside a state tree.
///
/// A Path is an immutable, non-empty sequence of keys. Each key is either a
/// non-empty string (map field) or a non-negative index (vector element).
///
/// @code
///   Path p{"inventory", "items", 0};
///   set_at_path(tree, p, Value{"sword"});
///   auto v = get_at_path(tree, p);        // optional<Value>
///   p.to_string();                         // ".inventory.items[0]"
/// @endcode

#pragma once

#include <statecast/statecast_config.h>

#include "api.h"
#include "value.h"

#include <compare>
#include <concepts>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace statecast {

using PathElement = std::variant<std::string, std::size_t>;

// ============================================================
// PathKey - implicit conversion helper for path literals
//
// Lets Path{"items", 0} be written without casts while rejecting
// negative indices and empty field names at the call site.
// ============================================================
class PathKey {
public:
    PathKey(std::string key) : element_(std::move(key)) {
        if (std::get<std::string>(element_).empty()) {
            throw std::invalid_argument("path key must be a non-empty string");
        }
    }

    PathKey(const char* key) : PathKey(std::string{key ? key : ""}) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    PathKey(T index) : element_(std::size_t{0}) {
        if constexpr (std::is_signed_v<T>) {
            if (index < 0) {
                throw std::invalid_argument("path index must be non-negative");
            }
        }
        element_ = static_cast<std::size_t>(index);
    }

    [[nodiscard]] const PathElement& element() const noexcept { return element_; }

private:
    PathElement element_;
};

// ============================================================
// Path
// ============================================================
class STATECAST_API Path {
public:
    using const_iterator = std::vector<PathElement>::const_iterator;

    /// @throws std::invalid_argument if @p keys is empty
    Path(std::initializer_list<PathKey> keys);

    /// @throws std::invalid_argument if empty or any string key is empty
    explicit Path(std::vector<PathElement> elements);

    /// Decode a path carried inside a protocol message.
    /// Accepts a vector of non-empty strings and non-negative integral numbers
    /// (an integral-valued double is accepted, as emitted by JSON peers).
    /// @throws std::invalid_argument on any other shape
    [[nodiscard]] static Path from_value(const Value& encoded);

    /// Encode as a vector of strings and integers
    [[nodiscard]] Value to_value() const;

    /// Dot/bracket notation, e.g. ".users[0].name"
    [[nodiscard]] std::string to_string() const;

    /// New path with @p key appended
    [[nodiscard]] Path child(PathKey key) const;

    /// True when this path equals @p other or lies below it
    [[nodiscard]] bool starts_with(const Path& other) const;

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] const PathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const PathElement& back() const { return elements_.back(); }
    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }
    [[nodiscard]] const std::vector<PathElement>& elements() const noexcept { return elements_; }

    bool operator==(const Path&) const = default;
    auto operator<=>(const Path&) const = default;

private:
    std::vector<PathElement> elements_;
};

// ============================================================
// Tree access
//
// Mutating functions return false (after logging) when the tree
// cannot be changed as requested; they never throw for shape
// problems in the tree itself.
// ============================================================

/// Read the value at @p path.
/// @return nullopt when a key is missing, an index is out of range, or the
///         traversal reaches a non-container or a container of the wrong kind
[[nodiscard]] STATECAST_API std::optional<Value> get_at_path(const Value& root, const Path& path);

/// Write @p value at @p path.
///
/// Missing or non-container intermediates are replaced by a new container
/// chosen by the next key: a vector for an index, otherwise a map. A vector
/// addressed past its end is padded with nulls. Addressing an existing map
/// with an index (or a vector with a string key) is a no-op, and so is a
/// non-container root.
STATECAST_API bool set_at_path(Value& root, const Path& path, Value value);

/// Remove the value at @p path from its parent container.
/// Vector elements after the removed index shift down by one.
/// @return false if nothing was removed (absent key, out-of-range index or
///         shape mismatch)
STATECAST_API bool erase_at_path(Value& root, const Path& path);

// ============================================================
// Vector helpers (immer::vector has no positional insert/erase)
// ============================================================

/// Insert @p value before @p index; an index past the end appends
[[nodiscard]] STATECAST_API ValueVector vector_insert(const ValueVector& vec, std::size_t index, Value value);

/// Remove the element at @p index (which must be < vec.size())
[[nodiscard]] STATECAST_API ValueVector vector_erase(const ValueVector& vec, std::size_t index);

} // namespace statecast

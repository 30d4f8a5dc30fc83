// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Serialization utilities for Value (Binary and JSON formats).
///
/// - Binary format: compact, used by transports to carry protocol messages
/// - JSON format: human-readable, for configuration files and debugging
///
/// Usage:
/// @code
///   Value data = Value::map({{"gold", 100}});
///   ByteBuffer buffer = serialize(data);
///   Value restored = deserialize(buffer);
///
///   std::string json = to_json(data);
///   Value parsed = from_json(json);
/// @endcode
///
/// Binary Format Type Tags (1 byte):
///   0x00 = null (monostate)
///   0x01 = int32 (4 bytes, little-endian)
///   0x03 = double (8 bytes, IEEE 754 bits, little-endian)
///   0x04 = bool (1 byte: 0x00=false, 0x01=true)
///   0x05 = string (4-byte length + UTF-8 data)
///   0x06 = map (4-byte count + entries)
///   0x07 = vector (4-byte count + elements)
///   0x0A = int64 (8 bytes, little-endian)

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <string>

namespace statecast {

// ============================================================
// Binary Serialization
// ============================================================

/// Serialize Value to binary buffer
STATECAST_API ByteBuffer serialize(const Value& val);

/// Deserialize Value from binary buffer
/// @return Reconstructed Value (an empty buffer yields null)
/// @throws std::runtime_error on invalid data format or trailing bytes
STATECAST_API Value deserialize(const ByteBuffer& buffer);

/// Deserialize from raw pointer and size
STATECAST_API Value deserialize(const uint8_t* data, std::size_t size);

// ============================================================
// JSON Serialization
// ============================================================

/// Convert Value to a single-line JSON string
///
/// Map keys are emitted in immer's hash order, not insertion order.
/// NaN and infinities become null; integral doubles keep a ".0".
STATECAST_API std::string to_json(const Value& val);

/// Parse JSON string to Value
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
///
/// Integers that fit int32 become int32, larger ones int64; numbers with a
/// fraction or exponent become double.
STATECAST_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics shared by every statecast component.
///
/// Output format:
///   [component] message (called from file.cpp:42)

#pragma once

#include <statecast/statecast_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace statecast {
namespace detail {

inline void log_warning(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATECAST_VERBOSE_LOG
    std::cerr << "[" << component << "] warning: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

inline void log_info(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATECAST_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

/// Errors bypass STATECAST_VERBOSE_LOG: they report lost messages or
/// failed callbacks that a release build must still surface.
inline void log_error(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
    std::cerr << "[" << component << "] error: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATECAST_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATECAST_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail
} // namespace statecast

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file statecast_config.h
/// @brief Centralized compile-time configuration for statecast and its dependencies
///
/// This file defines the settings for the third-party libraries used by statecast:
///   - immer: persistent containers backing the replicated state tree
///   - lager: per-node stores on the authoritative side
///   - zug:   transducers used internally by lager
///
/// It MUST be included before any library headers. All statecast public
/// headers include it first.
///
/// Unlike a purely single-threaded build, replicated trees are handed from
/// transport threads to observer threads, so immer keeps its atomic
/// reference counting enabled here.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(STATECAST_CONFIGURED)
#error "immer headers were included before statecast/statecast_config.h. " \
       "Please include statecast headers before any direct immer includes."
#endif

#define STATECAST_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager Settings
// ============================================================

/// @brief Node stores are never watched through lager cursors, so the
/// dependency bookkeeping between derived nodes is not needed.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging Configuration
//
// When STATECAST_VERBOSE_LOG is 1, warnings and informational
// messages (skipped operations, stale patches, rate limiting) are
// written to stderr. Errors are always written.
//
// Disabled by default in release builds, enabled in debug builds.
// ============================================================

#ifndef STATECAST_VERBOSE_LOG
#  if defined(NDEBUG)
#    define STATECAST_VERBOSE_LOG 0
#  else
#    define STATECAST_VERBOSE_LOG 1
#  endif
#endif

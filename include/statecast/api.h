// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the statecast library.
///
/// Usage:
/// - When building statecast as a SHARED library:
///   - CMake defines STATECAST_EXPORTS (private) and STATECAST_SHARED (public)
///   - Functions/classes marked with STATECAST_API will be exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, STATECAST_API expands to nothing

#pragma once

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef STATECAST_SHARED
        #ifdef STATECAST_EXPORTS
            #define STATECAST_API __declspec(dllexport)
        #else
            #define STATECAST_API __declspec(dllimport)
        #endif
    #else
        #define STATECAST_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STATECAST_SHARED) && defined(STATECAST_EXPORTS)
        #define STATECAST_API __attribute__((visibility("default")))
    #else
        #define STATECAST_API
    #endif
#else
    #define STATECAST_API
#endif

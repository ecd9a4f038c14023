// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform DLL export/import macros for structdiff.
///
/// Usage:
/// - When building structdiff as a SHARED library:
///   - CMake defines STRUCTDIFF_EXPORTS (private) and STRUCTDIFF_SHARED (public)
///   - Functions/classes marked with STRUCTDIFF_API will be exported
///
/// - When using structdiff as a SHARED library:
///   - Link against the structdiff target (CMake propagates STRUCTDIFF_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, STRUCTDIFF_API expands to nothing
///
/// Example:
/// @code
/// class STRUCTDIFF_API Difference { ... };
/// STRUCTDIFF_API Difference diff(const Value& a, const Value& b);
/// @endcode

#pragma once

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef STRUCTDIFF_SHARED
        #ifdef STRUCTDIFF_EXPORTS
            #define STRUCTDIFF_API __declspec(dllexport)
        #else
            #define STRUCTDIFF_API __declspec(dllimport)
        #endif
    #else
        #define STRUCTDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STRUCTDIFF_SHARED) && defined(STRUCTDIFF_EXPORTS)
        #define STRUCTDIFF_API __attribute__((visibility("default")))
    #else
        #define STRUCTDIFF_API
    #endif
#else
    #define STRUCTDIFF_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define STRUCTDIFF_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define STRUCTDIFF_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define STRUCTDIFF_DEPRECATED(msg)
#endif

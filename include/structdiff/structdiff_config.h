// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file structdiff_config.h
/// @brief Centralized configuration for structdiff and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by structdiff:
///   - immer: Persistent containers backing every value and difference
///   - lager: Store middleware and watchers (lager_adapters.h)
///   - boost: container_hash for the hash_value protocol
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All structdiff public headers include this file first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(STRUCTDIFF_CONFIGURED)
#error "immer headers were included before structdiff/structdiff_config.h. " \
       "Please include structdiff headers before any direct immer includes."
#endif

#define STRUCTDIFF_CONFIGURED 1

// ============================================================
// Thread Safety
// ============================================================

/// @brief Select the immer memory policy used by every structdiff container
///
/// 1 (default): atomic reference counting. Values and differences may be
///              shared between threads and diffed concurrently.
/// 0:           non-atomic reference counting, no free-list locks.
///              ~15-30% faster, but a Value must never cross threads.
#ifndef STRUCTDIFF_ENABLE_THREAD_SAFE
#define STRUCTDIFF_ENABLE_THREAD_SAFE 1
#endif

// ============================================================
// Verbose Logging
//
// When enabled, failed lookups and every thrown DiffError write a
// diagnostic line to stderr:
//   [function] message (called from file:line)
//
// Enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef STRUCTDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define STRUCTDIFF_VERBOSE_LOG 0
#  else
#    define STRUCTDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Immer Performance Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
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
// Lager / Zug Configuration
// ============================================================

#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Configuration
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); container_hash is header-only
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef STRUCTDIFF_CONFIG_VERBOSE
#if STRUCTDIFF_ENABLE_THREAD_SAFE
#pragma message("structdiff: Thread safety ENABLED")
#else
#pragma message("structdiff: Thread safety DISABLED (single-thread policy)")
#endif
#if STRUCTDIFF_VERBOSE_LOG
#pragma message("structdiff: Verbose logging ENABLED")
#endif
#endif // STRUCTDIFF_CONFIG_VERBOSE

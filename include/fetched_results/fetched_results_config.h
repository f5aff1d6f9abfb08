// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file fetched_results_config.h
/// @brief Compile-time configuration for fetched_results and its dependencies
///
/// Settings for the third-party libraries used by fetched_results:
///   - immer: persistent containers backing layouts and the object store
///   - lager: store holding the cached layout
///   - zug: transducers used when snapshotting fetched objects
///   - boost: Interprocess file mapping for cache records
///
/// It MUST be included before any immer/lager header. All fetched_results
/// public headers include it first.
///
/// A controller and its layouts are affine to one thread, so immer runs
/// without atomic reference counting. RowIdentity values hold no immer
/// containers and may cross threads freely; Layout values may not.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(FETCHED_RESULTS_CONFIGURED)
#error "immer headers were included before fetched_results/fetched_results_config.h. " \
       "Please include fetched_results headers before any direct immer includes."
#endif

#define FETCHED_RESULTS_CONFIGURED 1

// ============================================================
// Immer
// ============================================================

/// Atomic reference counting. Controllers on different threads still share
/// immer's empty-container nodes; define as 1 only for single-threaded use.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

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
// Lager
// ============================================================

/// Skip the SFINAE dependency validation in lager::deps; the cache store
/// is created without dependencies.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug
// ============================================================

#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost
// ============================================================

/// Interprocess is used header-only; no auto-linking on MSVC.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Logging
//
// FETCHED_RESULTS_VERBOSE_LOG enables informational diagnostics
// (cache hits, ignored batches). Warnings are always printed.
// Defaults to on in debug builds and off with NDEBUG.
// ============================================================

#ifndef FETCHED_RESULTS_VERBOSE_LOG
#  if defined(NDEBUG)
#    define FETCHED_RESULTS_VERBOSE_LOG 0
#  else
#    define FETCHED_RESULTS_VERBOSE_LOG 1
#  endif
#endif

#ifdef FETCHED_RESULTS_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("fetched_results: immer thread safety DISABLED (single-threaded use only)")
#else
#pragma message("fetched_results: immer thread safety ENABLED")
#endif
#endif // FETCHED_RESULTS_CONFIG_VERBOSE

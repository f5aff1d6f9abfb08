// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Export/import macros for the fetched_results library.
///
/// - Building fetched_results as a SHARED library: CMake defines
///   FETCHED_RESULTS_EXPORTS (private) and FETCHED_RESULTS_SHARED (public).
/// - Using it as a SHARED library: FETCHED_RESULTS_SHARED is propagated and
///   symbols are imported.
/// - STATIC builds: FETCHED_RESULTS_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef FETCHED_RESULTS_SHARED
        #ifdef FETCHED_RESULTS_EXPORTS
            #define FETCHED_RESULTS_API __declspec(dllexport)
        #else
            #define FETCHED_RESULTS_API __declspec(dllimport)
        #endif
    #else
        #define FETCHED_RESULTS_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(FETCHED_RESULTS_SHARED) && defined(FETCHED_RESULTS_EXPORTS)
        #define FETCHED_RESULTS_API __attribute__((visibility("default")))
    #else
        #define FETCHED_RESULTS_API
    #endif
#else
    #define FETCHED_RESULTS_API
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define FETCHED_RESULTS_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define FETCHED_RESULTS_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define FETCHED_RESULTS_DEPRECATED(msg)
#endif

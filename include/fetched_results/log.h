// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics tagged with the reporting component.

#pragma once

#include <fetched_results/fetched_results_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace fetched_results {
namespace detail {

/// Always printed: "[component] message"
inline void log_warning(std::string_view component, std::string_view message) noexcept
{
    std::cerr << "[" << component << "] " << message << "\n";
}

/// Printed only when FETCHED_RESULTS_VERBOSE_LOG is on.
inline void log_info(std::string_view component, std::string_view message) noexcept
{
#if FETCHED_RESULTS_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message << "\n";
#else
    (void)component;
    (void)message;
#endif
}

/// Misuse of a read accessor (e.g. called before the first fetch).
/// Always printed; verbose builds add the call site.
inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
    std::cerr << "[" << func << "] " << message;
#if FETCHED_RESULTS_VERBOSE_LOG
    std::cerr << " (called from " << loc.file_name() << ":" << loc.line() << ")";
#else
    (void)loc;
#endif
    std::cerr << "\n";
}

} // namespace detail
} // namespace fetched_results

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Exception types thrown by fetched_results.

#pragma once

#include <fetched_results/api.h>

#include <stdexcept>
#include <string>

namespace fetched_results {

/// Base class of every exception thrown by this library
class FETCHED_RESULTS_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid or missing sort descriptors, or a section key path that does not
/// match the leading sort descriptor. Thrown at controller construction.
class FETCHED_RESULTS_API ConfigurationError : public Error {
public:
    using Error::Error;
};

/// The query engine failed to execute a request.
class FETCHED_RESULTS_API QueryExecutionError : public Error {
public:
    using Error::Error;
};

/// A cache record could not be read, decoded or written.
class FETCHED_RESULTS_API CacheIOError : public Error {
public:
    using Error::Error;
};

/// Programmer error, e.g. deleting a cache that a live controller still uses.
class FETCHED_RESULTS_API PreconditionViolation : public Error {
public:
    using Error::Error;
};

/// Internal consistency failure during a diff cycle (duplicate ids,
/// index path out of range). The cycle is aborted and the cache untouched.
class FETCHED_RESULTS_API InvariantViolation : public Error {
public:
    using Error::Error;
};

} // namespace fetched_results

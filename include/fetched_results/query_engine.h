// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file query_engine.h
/// @brief The object store interface a controller fetches from.
///
/// A QueryEngine executes fetch requests and publishes change batches. One
/// batch corresponds to one committed write; a controller runs exactly one
/// diff cycle per batch that touches its entity.

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/connection.h>
#include <fetched_results/row_identity.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetched_results {

/// Objects touched by one committed write
struct FETCHED_RESULTS_API ChangeBatch {
    std::vector<RawObject> added;
    std::vector<RawObject> removed;
    std::vector<RawObject> modified;

    [[nodiscard]] bool empty() const noexcept {
        return added.empty() && removed.empty() && modified.empty();
    }

    /// True if any object of the batch belongs to entity
    [[nodiscard]] bool touches(const std::string& entity) const;
};

using ChangeHandler = std::function<void(const ChangeBatch&)>;

class FETCHED_RESULTS_API QueryEngine {
public:
    virtual ~QueryEngine() = default;

    /// Objects matching the request, in sort order.
    /// @throws QueryExecutionError
    [[nodiscard]] virtual std::vector<RawObject> execute(const FetchRequest& request) = 0;

    /// Call handler after every committed write to the request's entity.
    /// The subscription ends when the returned connection is disconnected.
    [[nodiscard]] virtual Connection subscribe(const FetchRequest& request, ChangeHandler handler) = 0;

    /// Live object of the request's entity with the given primary key
    [[nodiscard]] virtual std::optional<RawObject> find(const FetchRequest& request, const std::string& id) const = 0;

    /// Row snapshot of an object
    [[nodiscard]] virtual RowIdentity snapshot(const RawObject& object,
                                               const FetchRequest& request,
                                               const std::optional<std::string>& section_key_path) const {
        return make_row_identity(object, request, section_key_path);
    }
};

} // namespace fetched_results

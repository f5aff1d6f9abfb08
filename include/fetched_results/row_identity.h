// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file row_identity.h
/// @brief Fetch configuration, raw objects and their row snapshots.
///
/// A RawObject is what the query engine hands out: a primary key plus a map
/// of attributes. A RowIdentity is the immutable, copyable snapshot of one
/// fetched object that the layout and the diff engine work with:
///
///   RowIdentity {
///     id             - primary key, unique within a result set
///     section_key    - value at the section key path (nullopt if ungrouped)
///     sort_values    - one value per sort descriptor, in descriptor order
///     tracked_values - one value per tracked key path
///   }
///
/// Two rows denote the same object when their ids match (same_row). A row
/// needs an update when its sort or tracked values differ (needs_update).
/// RowIdentity holds no immer containers and is safe to pass across threads.

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/field_value.h>

#include <immer/map.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetched_results {

// ============================================================
// Query configuration
// ============================================================

struct SortDescriptor {
    std::string key_path;
    bool ascending = true;

    bool operator==(const SortDescriptor&) const = default;
};

class RawObject;

/// Describes the query a controller is bound to.
struct FetchRequest {
    /// Only objects of this entity are fetched
    std::string entity_name;

    /// Optional filter; an empty function accepts every object
    std::function<bool(const RawObject&)> predicate;

    /// Stable textual form of the predicate. Part of the cache signature,
    /// so two requests with different filters never share a cached layout.
    std::string predicate_format;

    /// At least one descriptor is required
    std::vector<SortDescriptor> sort_descriptors;

    /// Non-sort attributes whose change produces a RowUpdate
    std::vector<std::string> tracked_key_paths;
};

// ============================================================
// RawObject
// ============================================================

/// An object of the live store as returned by QueryEngine::execute.
class FETCHED_RESULTS_API RawObject {
public:
    using FieldMap = immer::map<std::string, FieldValue>;

    RawObject() = default;
    RawObject(std::string entity, std::string primary_key, FieldMap fields = {})
        : entity_(std::move(entity)), primary_key_(std::move(primary_key)), fields_(std::move(fields)) {}

    [[nodiscard]] const std::string& entity() const noexcept { return entity_; }
    [[nodiscard]] const std::string& primary_key() const noexcept { return primary_key_; }
    [[nodiscard]] const FieldMap& fields() const noexcept { return fields_; }

    /// Value at key_path, or a null FieldValue when absent
    [[nodiscard]] const FieldValue& field(const std::string& key_path) const;

    /// Copy of this object with one attribute replaced
    [[nodiscard]] RawObject set(const std::string& key_path, FieldValue value) const;

    bool operator==(const RawObject& other) const {
        return entity_ == other.entity_ && primary_key_ == other.primary_key_ && fields_ == other.fields_;
    }

private:
    std::string entity_;
    std::string primary_key_;
    FieldMap fields_;
};

// ============================================================
// RowIdentity
// ============================================================

struct FETCHED_RESULTS_API RowIdentity {
    std::string id;
    std::optional<std::string> section_key;
    std::vector<FieldValue> sort_values;
    std::vector<FieldValue> tracked_values;

    /// Full value equality (used for layout comparison)
    bool operator==(const RowIdentity&) const = default;
};

/// Identity equality: same underlying object
[[nodiscard]] inline bool same_row(const RowIdentity& a, const RowIdentity& b) noexcept {
    return a.id == b.id;
}

/// True when a sort-descriptor attribute differs
[[nodiscard]] inline bool sort_values_changed(const RowIdentity& old_row, const RowIdentity& new_row) {
    return old_row.sort_values != new_row.sort_values;
}

/// True when any sort or tracked attribute differs
[[nodiscard]] inline bool needs_update(const RowIdentity& old_row, const RowIdentity& new_row) {
    return sort_values_changed(old_row, new_row) || old_row.tracked_values != new_row.tracked_values;
}

/// Snapshot a raw object. Pure; reads the object only during the call.
[[nodiscard]] FETCHED_RESULTS_API RowIdentity make_row_identity(
    const RawObject& object,
    const FetchRequest& request,
    const std::optional<std::string>& section_key_path);

/// Three-way comparison of two objects under the request's sort descriptors
[[nodiscard]] FETCHED_RESULTS_API std::weak_ordering compare_objects(
    const RawObject& a, const RawObject& b, const std::vector<SortDescriptor>& descriptors);

/// Throws ConfigurationError if the request cannot back a sectioned controller:
/// no entity, no sort descriptors, an empty key path, or a section key path
/// that is not the leading sort descriptor's key path.
FETCHED_RESULTS_API void validate_configuration(
    const FetchRequest& request, const std::optional<std::string>& section_key_path);

/// Stable text identifying the request and grouping. Stored with each cache
/// record; a record with a different signature is ignored on load.
[[nodiscard]] FETCHED_RESULTS_API std::string configuration_signature(
    const FetchRequest& request, const std::optional<std::string>& section_key_path);

} // namespace fetched_results

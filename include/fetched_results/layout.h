// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file layout.h
/// @brief Sectioned layout of a fetch result and the change events on it.
///
/// A Layout is an immutable value: ordered sections, each an ordered
/// immer::flex_vector of rows. Mutations produce a new Layout that shares
/// structure with the old one, so keeping the last committed layout around
/// while a diff cycle runs costs almost nothing.
///
/// Change events are applied sequentially. The index paths of an event refer
/// to the layout as left by every previous event of the same cycle:
///
///   SectionInsert  insert an empty section at index
///   SectionDelete  drop the section at index together with its rows
///   RowInsert      insert row at `at`
///   RowDelete      remove the row at `at`
///   RowMove        remove the row at `from`, then insert the new payload at
///                  `to` (interpreted after the removal)
///   RowUpdate      replace the row at `at` with the new payload

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/row_identity.h>

#include <immer/flex_vector.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace fetched_results {

// ============================================================
// Layout
// ============================================================

struct IndexPath {
    std::size_t section = 0;
    std::size_t row = 0;

    bool operator==(const IndexPath&) const = default;
};

FETCHED_RESULTS_API std::ostream& operator<<(std::ostream& os, const IndexPath& path);

struct Section {
    /// nullopt for the implicit section of an ungrouped result
    std::optional<std::string> name;
    immer::flex_vector<RowIdentity> rows;

    bool operator==(const Section&) const = default;
};

/// Name and size of a section, as reported to listeners
struct SectionInfo {
    std::optional<std::string> name;
    std::size_t number_of_objects = 0;

    bool operator==(const SectionInfo&) const = default;
};

struct FETCHED_RESULTS_API Layout {
    immer::flex_vector<Section> sections;

    [[nodiscard]] bool empty() const noexcept { return sections.empty(); }
    [[nodiscard]] std::size_t section_count() const noexcept { return sections.size(); }
    [[nodiscard]] std::size_t row_count() const;

    [[nodiscard]] SectionInfo section_info(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> find_section(const std::optional<std::string>& name) const;

    /// Linear search by row id
    [[nodiscard]] std::optional<IndexPath> find_row(const std::string& id) const;

    /// nullptr when the path is out of range
    [[nodiscard]] const RowIdentity* row_at(const IndexPath& path) const;

    bool operator==(const Layout&) const = default;
};

/// Group a sorted snapshot into sections. Rows keep their order; sections
/// appear in the order of their first row. Rows without a section key form
/// the single implicit section. Throws InvariantViolation on duplicate ids.
[[nodiscard]] FETCHED_RESULTS_API Layout build_layout(const std::vector<RowIdentity>& rows);

// ============================================================
// Change events
// ============================================================

enum class ChangeType { Insert, Delete, Move, Update };

FETCHED_RESULTS_API const char* to_string(ChangeType type) noexcept;

namespace changes {

struct SectionInsert {
    SectionInfo section;
    std::size_t index = 0;
    bool operator==(const SectionInsert&) const = default;
};

struct SectionDelete {
    SectionInfo section;
    std::size_t index = 0;
    bool operator==(const SectionDelete&) const = default;
};

struct RowInsert {
    RowIdentity row;
    IndexPath at;
    bool operator==(const RowInsert&) const = default;
};

struct RowDelete {
    RowIdentity row;
    IndexPath at;
    bool operator==(const RowDelete&) const = default;
};

struct RowMove {
    RowIdentity row;
    IndexPath from;
    IndexPath to;
    bool operator==(const RowMove&) const = default;
};

struct RowUpdate {
    RowIdentity row;
    IndexPath at;
    bool operator==(const RowUpdate&) const = default;
};

} // namespace changes

using ChangeEvent = std::variant<changes::SectionInsert, changes::SectionDelete,
                                 changes::RowInsert, changes::RowDelete,
                                 changes::RowMove, changes::RowUpdate>;

[[nodiscard]] FETCHED_RESULTS_API ChangeType change_type(const ChangeEvent& event) noexcept;
[[nodiscard]] FETCHED_RESULTS_API bool is_section_change(const ChangeEvent& event) noexcept;

FETCHED_RESULTS_API std::ostream& operator<<(std::ostream& os, const ChangeEvent& event);

/// Throws InvariantViolation if the event cannot be applied to layout
/// (index out of range, id or section name mismatch, duplicate section).
FETCHED_RESULTS_API void validate_change(const Layout& layout, const ChangeEvent& event);

/// Apply one event. Validates first; throws InvariantViolation.
[[nodiscard]] FETCHED_RESULTS_API Layout apply_change(Layout layout, const ChangeEvent& event);

} // namespace fetched_results

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_engine.h
/// @brief Computes the change events that turn one layout into another.
///
/// compute_changes() runs two passes:
///
/// 1. Sections. Sections present only in the old layout are deleted in
///    descending index order, sections present only in the new layout are
///    inserted (empty) in ascending index order. Sections present in both are
///    kept. If kept sections changed their relative order, the largest
///    ordered subset stays and the others are deleted and re-inserted.
///
/// 2. Rows, joined by id:
///    - gone from the result          -> RowDelete
///    - new in the result             -> RowInsert
///    - changed relative position     -> RowMove (no separate RowUpdate)
///    - same relative position, but
///      sort or tracked values differ -> RowUpdate
///    - otherwise                     -> nothing
///    Rows whose section is deleted produce no row events.
///
/// Among the rows that stay in their section, the ones whose sort values are
/// unchanged are preferred as anchors (weighted longest increasing
/// subsequence); rows with changed sort values that must be repositioned are
/// reported as moves. A row that changes section is always a move.
///
/// Index paths are computed against the layout as mutated by all previously
/// emitted events, so applying the events in order with apply_change()
/// reproduces the new layout exactly.
///
/// The function is pure: it reads two layout values and returns a value.

#pragma once

#include <fetched_results/api.h>
#include <fetched_results/layout.h>

#include <cstddef>
#include <vector>

namespace fetched_results {

struct ChangeSet {
    /// Section events first, then row events, in emission order
    std::vector<ChangeEvent> events;

    /// Number of leading entries in events that are section events
    std::size_t section_event_count = 0;

    /// The layout after all events are applied
    Layout layout;

    [[nodiscard]] bool empty() const noexcept { return events.empty(); }
};

/// Throws InvariantViolation if either layout repeats a row id or section name.
[[nodiscard]] FETCHED_RESULTS_API ChangeSet compute_changes(const Layout& old_layout, const Layout& new_layout);

} // namespace fetched_results

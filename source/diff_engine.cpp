// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/diff_engine.h>
#include <fetched_results/error.h>

#include <immer/flex_vector_transient.hpp>

#include <cstdint>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace fetched_results {

namespace {

using SectionKey = std::optional<std::string>;

// ============================================================
// Heaviest increasing subsequence
//
// keys are distinct values in [0, key_range); weights are positive.
// Returns, per element, whether it belongs to the subsequence of strictly
// increasing keys with the largest total weight. O(n log n) using a
// Fenwick tree of prefix maxima.
// ============================================================

std::vector<bool> heaviest_increasing_subsequence(const std::vector<std::size_t>& keys,
                                                  const std::vector<std::uint64_t>& weights,
                                                  std::size_t key_range)
{
    struct Best {
        std::uint64_t weight = 0;
        std::ptrdiff_t element = -1;
    };

    std::vector<Best> tree(key_range + 1);
    std::vector<std::ptrdiff_t> parent(keys.size(), -1);

    auto lowbit = [](std::size_t i) { return i & (~i + 1); };

    // Best chain ending at a key < limit (tree positions 1..limit)
    auto query = [&](std::size_t limit) {
        Best best;
        for (std::size_t i = limit; i > 0; i -= lowbit(i)) {
            if (tree[i].weight > best.weight) {
                best = tree[i];
            }
        }
        return best;
    };

    auto update = [&](std::size_t key, Best value) {
        for (std::size_t i = key + 1; i <= key_range; i += lowbit(i)) {
            if (value.weight > tree[i].weight) {
                tree[i] = value;
            }
        }
    };

    Best overall;
    for (std::size_t e = 0; e < keys.size(); ++e) {
        const Best prev = query(keys[e]);
        const Best here{prev.weight + weights[e], static_cast<std::ptrdiff_t>(e)};
        parent[e] = prev.element;
        update(keys[e], here);
        if (here.weight > overall.weight) {
            overall = here;
        }
    }

    std::vector<bool> keep(keys.size(), false);
    for (auto e = overall.element; e >= 0; e = parent[static_cast<std::size_t>(e)]) {
        keep[static_cast<std::size_t>(e)] = true;
    }
    return keep;
}

void check_unique(const Layout& layout, const char* which)
{
    std::unordered_set<std::string> ids;
    std::map<SectionKey, bool> names;
    for (const auto& section : layout.sections) {
        if (!names.emplace(section.name, true).second) {
            throw InvariantViolation(std::string{which} + " layout repeats section '" +
                                     section.name.value_or("<none>") + "'");
        }
        for (const auto& row : section.rows) {
            if (!ids.insert(row.id).second) {
                throw InvariantViolation(std::string{which} + " layout repeats row id '" + row.id + "'");
            }
        }
    }
}

// ============================================================
// LayoutCursor
//
// Mutable mirror of the layout during one cycle. Every emitted event is
// applied immediately, so the index paths of the next event are computed
// against the state a consumer replaying the events will see.
// ============================================================

class LayoutCursor {
public:
    struct CursorSection {
        SectionKey name;
        std::vector<RowIdentity> rows;
    };

    explicit LayoutCursor(const Layout& layout)
    {
        sections_.reserve(layout.sections.size());
        for (const auto& section : layout.sections) {
            sections_.push_back(CursorSection{section.name, {section.rows.begin(), section.rows.end()}});
        }
    }

    [[nodiscard]] const std::vector<CursorSection>& sections() const noexcept { return sections_; }
    [[nodiscard]] std::vector<ChangeEvent>& events() noexcept { return events_; }

    /// Build the id -> section lookup. Called once section events are done.
    void index_rows()
    {
        row_section_.clear();
        for (std::size_t s = 0; s < sections_.size(); ++s) {
            for (const auto& row : sections_[s].rows) {
                row_section_[row.id] = s;
            }
        }
    }

    [[nodiscard]] std::optional<IndexPath> locate(const std::string& id) const
    {
        auto it = row_section_.find(id);
        if (it == row_section_.end()) {
            return std::nullopt;
        }
        const auto& rows = sections_[it->second].rows;
        for (std::size_t r = 0; r < rows.size(); ++r) {
            if (rows[r].id == id) {
                return IndexPath{it->second, r};
            }
        }
        return std::nullopt;
    }

    /// Position of id in section, searching forward from start first
    [[nodiscard]] std::optional<std::size_t> position_in(std::size_t section, const std::string& id,
                                                         std::size_t start) const
    {
        const auto& rows = sections_[section].rows;
        for (std::size_t r = start; r < rows.size(); ++r) {
            if (rows[r].id == id) {
                return r;
            }
        }
        for (std::size_t r = 0; r < start && r < rows.size(); ++r) {
            if (rows[r].id == id) {
                return r;
            }
        }
        return std::nullopt;
    }

    void emit(ChangeEvent event)
    {
        std::visit([this](const auto& change) {
            using T = std::decay_t<decltype(change)>;

            if constexpr (std::is_same_v<T, changes::SectionInsert>) {
                sections_.insert(sections_.begin() + static_cast<std::ptrdiff_t>(change.index),
                                 CursorSection{change.section.name, {}});
            } else if constexpr (std::is_same_v<T, changes::SectionDelete>) {
                sections_.erase(sections_.begin() + static_cast<std::ptrdiff_t>(change.index));
            } else if constexpr (std::is_same_v<T, changes::RowInsert>) {
                insert_row(change.at, change.row);
            } else if constexpr (std::is_same_v<T, changes::RowDelete>) {
                auto& rows = sections_[change.at.section].rows;
                rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(change.at.row));
                row_section_.erase(change.row.id);
            } else if constexpr (std::is_same_v<T, changes::RowMove>) {
                auto& rows = sections_[change.from.section].rows;
                rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(change.from.row));
                insert_row(change.to, change.row);
            } else {
                sections_[change.at.section].rows[change.at.row] = change.row;
            }
        }, event);

        events_.push_back(std::move(event));
    }

    [[nodiscard]] Layout to_layout() const
    {
        auto sections = immer::flex_vector_transient<Section>{};
        for (const auto& section : sections_) {
            sections.push_back(Section{section.name,
                                       immer::flex_vector<RowIdentity>(section.rows.begin(), section.rows.end())});
        }
        return Layout{sections.persistent()};
    }

private:
    void insert_row(const IndexPath& at, const RowIdentity& row)
    {
        auto& rows = sections_[at.section].rows;
        rows.insert(rows.begin() + static_cast<std::ptrdiff_t>(at.row), row);
        row_section_[row.id] = at.section;
    }

    std::vector<CursorSection> sections_;
    std::unordered_map<std::string, std::size_t> row_section_;
    std::vector<ChangeEvent> events_;
};

// ============================================================
// Pass 1: sections
// ============================================================

void diff_sections(const Layout& old_layout, const Layout& new_layout, LayoutCursor& cursor)
{
    std::map<SectionKey, std::size_t> new_index;
    for (std::size_t j = 0; j < new_layout.sections.size(); ++j) {
        new_index.emplace(new_layout.sections[j].name, j);
    }

    // Sections present in both, in old order, keyed by their new index
    std::vector<std::size_t> common_old;
    std::vector<std::size_t> keys;
    std::vector<std::uint64_t> weights;
    for (std::size_t i = 0; i < old_layout.sections.size(); ++i) {
        auto it = new_index.find(old_layout.sections[i].name);
        if (it != new_index.end()) {
            common_old.push_back(i);
            keys.push_back(it->second);
            weights.push_back(old_layout.sections[i].rows.size() + 1);
        }
    }

    const auto keep = heaviest_increasing_subsequence(keys, weights, new_layout.sections.size());

    std::vector<bool> old_kept(old_layout.sections.size(), false);
    std::vector<bool> new_kept(new_layout.sections.size(), false);
    for (std::size_t e = 0; e < keep.size(); ++e) {
        if (keep[e]) {
            old_kept[common_old[e]] = true;
            new_kept[keys[e]] = true;
        }
    }

    for (std::size_t i = old_layout.sections.size(); i-- > 0;) {
        if (!old_kept[i]) {
            cursor.emit(changes::SectionDelete{old_layout.section_info(i), i});
        }
    }

    // Everything before index j is already in place when j is inserted
    for (std::size_t j = 0; j < new_layout.sections.size(); ++j) {
        if (!new_kept[j]) {
            cursor.emit(changes::SectionInsert{new_layout.section_info(j), j});
        }
    }
}

// ============================================================
// Pass 2: rows
// ============================================================

void diff_rows(const Layout& new_layout, LayoutCursor& cursor)
{
    struct Target {
        std::size_t section;
        std::size_t row;
    };

    std::unordered_map<std::string, Target> targets;
    targets.reserve(new_layout.row_count());
    for (std::size_t s = 0; s < new_layout.sections.size(); ++s) {
        const auto& rows = new_layout.sections[s].rows;
        for (std::size_t r = 0; r < rows.size(); ++r) {
            targets.emplace(rows[r].id, Target{s, r});
        }
    }

    cursor.index_rows();

    // Rows gone from the result, bottom-up so each path is also the old row index
    for (std::size_t s = 0; s < cursor.sections().size(); ++s) {
        for (std::size_t r = cursor.sections()[s].rows.size(); r-- > 0;) {
            const auto& row = cursor.sections()[s].rows[r];
            if (!targets.contains(row.id)) {
                cursor.emit(changes::RowDelete{row, IndexPath{s, r}});
            }
        }
    }

    // Anchors: rows staying in their section in unchanged relative order
    std::unordered_set<std::string> anchors;
    for (std::size_t s = 0; s < cursor.sections().size(); ++s) {
        const auto& rows = cursor.sections()[s].rows;
        const auto& new_rows = new_layout.sections[s].rows;

        std::vector<const RowIdentity*> candidates;
        std::vector<std::size_t> keys;
        for (const auto& row : rows) {
            const auto& target = targets.at(row.id);
            if (target.section == s) {
                candidates.push_back(&row);
                keys.push_back(target.row);
            }
        }

        // Any row with unchanged sort values outweighs all changed rows together
        const std::uint64_t heavy = candidates.size() + 1;
        std::vector<std::uint64_t> weights;
        weights.reserve(candidates.size());
        for (std::size_t e = 0; e < candidates.size(); ++e) {
            const auto& fresh = new_rows[keys[e]];
            weights.push_back(sort_values_changed(*candidates[e], fresh) ? 1 : heavy);
        }

        const auto keep = heaviest_increasing_subsequence(keys, weights, new_rows.size());
        for (std::size_t e = 0; e < keep.size(); ++e) {
            if (keep[e]) {
                anchors.insert(candidates[e]->id);
            }
        }
    }

    // Sweep the new layout in order; every row is placed right after its
    // predecessor, anchors are left where they are.
    for (std::size_t s = 0; s < new_layout.sections.size(); ++s) {
        const auto& new_rows = new_layout.sections[s].rows;
        std::optional<std::size_t> last;

        for (std::size_t i = 0; i < new_rows.size(); ++i) {
            const RowIdentity& row = new_rows[i];

            if (anchors.contains(row.id)) {
                auto position = cursor.position_in(s, row.id, last ? *last + 1 : 0);
                if (!position) {
                    throw InvariantViolation("anchor row '" + row.id + "' lost during diff");
                }
                const auto& current = cursor.sections()[s].rows[*position];
                if (needs_update(current, row)) {
                    cursor.emit(changes::RowUpdate{row, IndexPath{s, *position}});
                }
                last = *position;
                continue;
            }

            auto from = cursor.locate(row.id);
            std::size_t to = 0;
            if (last) {
                to = *last + 1;
                // Removing the row first shifts the predecessor up by one
                if (from && from->section == s && from->row < *last) {
                    --to;
                }
            }

            if (from) {
                cursor.emit(changes::RowMove{row, *from, IndexPath{s, to}});
            } else {
                cursor.emit(changes::RowInsert{row, IndexPath{s, to}});
            }
            last = to;
        }
    }
}

} // anonymous namespace

ChangeSet compute_changes(const Layout& old_layout, const Layout& new_layout)
{
    check_unique(old_layout, "previous");
    check_unique(new_layout, "new");

    ChangeSet result;

    // Fast path: structurally shared or equal layouts
    if (old_layout == new_layout) {
        result.layout = new_layout;
        return result;
    }

    LayoutCursor cursor{old_layout};

    diff_sections(old_layout, new_layout, cursor);
    result.section_event_count = cursor.events().size();

    diff_rows(new_layout, cursor);

    if (cursor.to_layout() != new_layout) {
        throw InvariantViolation("change events do not reproduce the new layout");
    }

    result.events = std::move(cursor.events());
    result.layout = new_layout;
    return result;
}

} // namespace fetched_results

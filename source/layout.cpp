// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/layout.h>
#include <fetched_results/error.h>

#include <immer/flex_vector_transient.hpp>

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fetched_results {

// ============================================================
// Layout
// ============================================================

std::ostream& operator<<(std::ostream& os, const IndexPath& path)
{
    return os << "(" << path.section << "," << path.row << ")";
}

std::size_t Layout::row_count() const
{
    std::size_t count = 0;
    for (const auto& section : sections) {
        count += section.rows.size();
    }
    return count;
}

SectionInfo Layout::section_info(std::size_t index) const
{
    if (index >= sections.size()) {
        return {};
    }
    const auto& section = sections[index];
    return SectionInfo{section.name, section.rows.size()};
}

std::optional<std::size_t> Layout::find_section(const std::optional<std::string>& name) const
{
    for (std::size_t i = 0; i < sections.size(); ++i) {
        if (sections[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<IndexPath> Layout::find_row(const std::string& id) const
{
    for (std::size_t s = 0; s < sections.size(); ++s) {
        const auto& rows = sections[s].rows;
        for (std::size_t r = 0; r < rows.size(); ++r) {
            if (rows[r].id == id) {
                return IndexPath{s, r};
            }
        }
    }
    return std::nullopt;
}

const RowIdentity* Layout::row_at(const IndexPath& path) const
{
    if (path.section >= sections.size()) {
        return nullptr;
    }
    const auto& rows = sections[path.section].rows;
    if (path.row >= rows.size()) {
        return nullptr;
    }
    return &rows[path.row];
}

Layout build_layout(const std::vector<RowIdentity>& rows)
{
    struct PendingSection {
        std::optional<std::string> name;
        std::vector<RowIdentity> rows;
    };

    std::vector<PendingSection> pending;
    std::unordered_map<std::string, std::size_t> keyed;
    std::optional<std::size_t> implicit;
    std::unordered_set<std::string> seen_ids;
    seen_ids.reserve(rows.size());

    for (const auto& row : rows) {
        if (!seen_ids.insert(row.id).second) {
            throw InvariantViolation("duplicate row id '" + row.id + "' in fetch result");
        }

        std::size_t index;
        if (row.section_key) {
            auto [it, inserted] = keyed.try_emplace(*row.section_key, pending.size());
            if (inserted) {
                pending.push_back(PendingSection{row.section_key, {}});
            }
            index = it->second;
        } else {
            if (!implicit) {
                implicit = pending.size();
                pending.push_back(PendingSection{std::nullopt, {}});
            }
            index = *implicit;
        }
        pending[index].rows.push_back(row);
    }

    auto sections = immer::flex_vector_transient<Section>{};
    for (auto& section : pending) {
        sections.push_back(Section{std::move(section.name),
                                   immer::flex_vector<RowIdentity>(section.rows.begin(), section.rows.end())});
    }
    return Layout{sections.persistent()};
}

// ============================================================
// Change events
// ============================================================

const char* to_string(ChangeType type) noexcept
{
    switch (type) {
        case ChangeType::Insert: return "insert";
        case ChangeType::Delete: return "delete";
        case ChangeType::Move:   return "move";
        case ChangeType::Update: return "update";
    }
    return "unknown";
}

ChangeType change_type(const ChangeEvent& event) noexcept
{
    return std::visit([](const auto& change) -> ChangeType {
        using T = std::decay_t<decltype(change)>;
        if constexpr (std::is_same_v<T, changes::SectionInsert> || std::is_same_v<T, changes::RowInsert>) {
            return ChangeType::Insert;
        } else if constexpr (std::is_same_v<T, changes::SectionDelete> || std::is_same_v<T, changes::RowDelete>) {
            return ChangeType::Delete;
        } else if constexpr (std::is_same_v<T, changes::RowMove>) {
            return ChangeType::Move;
        } else {
            return ChangeType::Update;
        }
    }, event);
}

bool is_section_change(const ChangeEvent& event) noexcept
{
    return std::holds_alternative<changes::SectionInsert>(event) ||
           std::holds_alternative<changes::SectionDelete>(event);
}

std::ostream& operator<<(std::ostream& os, const ChangeEvent& event)
{
    std::visit([&os](const auto& change) {
        using T = std::decay_t<decltype(change)>;
        if constexpr (std::is_same_v<T, changes::SectionInsert> || std::is_same_v<T, changes::SectionDelete>) {
            os << (std::is_same_v<T, changes::SectionInsert> ? "SectionInsert(" : "SectionDelete(")
               << change.section.name.value_or("<none>") << ", " << change.index << ")";
        } else if constexpr (std::is_same_v<T, changes::RowMove>) {
            os << "RowMove(" << change.row.id << ", " << change.from << "->" << change.to << ")";
        } else if constexpr (std::is_same_v<T, changes::RowInsert>) {
            os << "RowInsert(" << change.row.id << ", " << change.at << ")";
        } else if constexpr (std::is_same_v<T, changes::RowDelete>) {
            os << "RowDelete(" << change.row.id << ", " << change.at << ")";
        } else {
            os << "RowUpdate(" << change.row.id << ", " << change.at << ")";
        }
    }, event);
    return os;
}

namespace {

[[noreturn]] void fail(const ChangeEvent& event, const std::string& reason)
{
    std::ostringstream oss;
    oss << "cannot apply " << event << ": " << reason;
    throw InvariantViolation(oss.str());
}

void check_existing_row(const Layout& layout, const IndexPath& at, const std::string& id, const ChangeEvent& event)
{
    const RowIdentity* row = layout.row_at(at);
    if (!row) {
        fail(event, "index path out of range");
    }
    if (row->id != id) {
        fail(event, "row at index path is '" + row->id + "'");
    }
}

void check_insert_position(const Layout& layout, const IndexPath& at, const ChangeEvent& event)
{
    if (at.section >= layout.sections.size()) {
        fail(event, "section out of range");
    }
    if (at.row > layout.sections[at.section].rows.size()) {
        fail(event, "row out of range");
    }
}

} // anonymous namespace

void validate_change(const Layout& layout, const ChangeEvent& event)
{
    std::visit([&](const auto& change) {
        using T = std::decay_t<decltype(change)>;

        if constexpr (std::is_same_v<T, changes::SectionInsert>) {
            if (change.index > layout.sections.size()) {
                fail(event, "section index out of range");
            }
            if (layout.find_section(change.section.name)) {
                fail(event, "section already exists");
            }
        } else if constexpr (std::is_same_v<T, changes::SectionDelete>) {
            if (change.index >= layout.sections.size()) {
                fail(event, "section index out of range");
            }
            if (layout.sections[change.index].name != change.section.name) {
                fail(event, "section name mismatch");
            }
        } else if constexpr (std::is_same_v<T, changes::RowInsert>) {
            check_insert_position(layout, change.at, event);
        } else if constexpr (std::is_same_v<T, changes::RowDelete> || std::is_same_v<T, changes::RowUpdate>) {
            check_existing_row(layout, change.at, change.row.id, event);
        } else if constexpr (std::is_same_v<T, changes::RowMove>) {
            check_existing_row(layout, change.from, change.row.id, event);
            if (change.to.section >= layout.sections.size()) {
                fail(event, "target section out of range");
            }
            // The target row index is taken after the removal
            std::size_t target_size = layout.sections[change.to.section].rows.size();
            if (change.from.section == change.to.section) {
                --target_size;
            }
            if (change.to.row > target_size) {
                fail(event, "target row out of range");
            }
        }
    }, event);
}

Layout apply_change(Layout layout, const ChangeEvent& event)
{
    validate_change(layout, event);

    std::visit([&layout](const auto& change) {
        using T = std::decay_t<decltype(change)>;
        auto& sections = layout.sections;

        if constexpr (std::is_same_v<T, changes::SectionInsert>) {
            sections = sections.insert(change.index, Section{change.section.name, {}});
        } else if constexpr (std::is_same_v<T, changes::SectionDelete>) {
            sections = sections.erase(change.index);
        } else if constexpr (std::is_same_v<T, changes::RowInsert>) {
            sections = sections.update(change.at.section, [&](Section section) {
                section.rows = section.rows.insert(change.at.row, change.row);
                return section;
            });
        } else if constexpr (std::is_same_v<T, changes::RowDelete>) {
            sections = sections.update(change.at.section, [&](Section section) {
                section.rows = section.rows.erase(change.at.row);
                return section;
            });
        } else if constexpr (std::is_same_v<T, changes::RowMove>) {
            sections = sections.update(change.from.section, [&](Section section) {
                section.rows = section.rows.erase(change.from.row);
                return section;
            });
            sections = sections.update(change.to.section, [&](Section section) {
                section.rows = section.rows.insert(change.to.row, change.row);
                return section;
            });
        } else {
            sections = sections.update(change.at.section, [&](Section section) {
                section.rows = section.rows.set(change.at.row, change.row);
                return section;
            });
        }
    }, event);

    return layout;
}

} // namespace fetched_results

// test_diff_engine.cpp - Tests for compute_changes
// Section pass, row pass, event ordering and replay completeness

#include <catch2/catch_all.hpp>
#include <fetched_results/diff_engine.h>
#include <fetched_results/error.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace fetched_results;

// ============================================================
// Helpers
// ============================================================

namespace {

RowIdentity make_row(std::string id, std::optional<std::string> section, std::int64_t sort,
                     std::int64_t tracked = 0)
{
    RowIdentity row;
    row.id = std::move(id);
    row.section_key = section;
    if (section) {
        row.sort_values.push_back(FieldValue{*section});
    }
    row.sort_values.push_back(FieldValue{sort});
    row.tracked_values.push_back(FieldValue{tracked});
    return row;
}

Layout replay(Layout layout, const ChangeSet& change_set)
{
    for (const auto& event : change_set.events) {
        layout = apply_change(std::move(layout), event);
    }
    return layout;
}

template <typename T>
std::size_t count_of(const ChangeSet& change_set)
{
    return static_cast<std::size_t>(std::count_if(change_set.events.begin(), change_set.events.end(),
                                                  [](const ChangeEvent& e) { return std::holds_alternative<T>(e); }));
}

} // anonymous namespace

// ============================================================
// Basic properties
// ============================================================

TEST_CASE("diff of identical layouts is empty", "[diff][idempotence]") {
    auto layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "B", 1)});

    SECTION("same value") {
        auto changes = compute_changes(layout, layout);
        REQUIRE(changes.empty());
        REQUIRE(changes.section_event_count == 0);
        REQUIRE(changes.layout == layout);
    }

    SECTION("equal but separately built") {
        auto copy = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "B", 1)});
        REQUIRE(compute_changes(layout, copy).empty());
    }

    SECTION("both empty") {
        REQUIRE(compute_changes(Layout{}, Layout{}).empty());
    }
}

TEST_CASE("first fetch produces only inserts", "[diff][insert]") {
    auto fresh = build_layout({make_row("1", "A", 1), make_row("2", "A", 2),
                               make_row("3", "B", 1), make_row("4", "C", 1), make_row("5", "C", 2)});

    auto changes = compute_changes(Layout{}, fresh);

    REQUIRE(changes.events.size() == 8);
    REQUIRE(changes.section_event_count == 3);
    REQUIRE(count_of<changes::SectionInsert>(changes) == 3);
    REQUIRE(count_of<changes::RowInsert>(changes) == 5);

    for (std::size_t i = 0; i < 3; ++i) {
        const auto* insert = std::get_if<changes::SectionInsert>(&changes.events[i]);
        REQUIRE(insert != nullptr);
        REQUIRE(insert->index == i);
    }

    const auto* first_row = std::get_if<changes::RowInsert>(&changes.events[3]);
    REQUIRE(first_row != nullptr);
    REQUIRE(first_row->row.id == "1");
    REQUIRE(first_row->at == IndexPath{0, 0});

    REQUIRE(replay(Layout{}, changes) == fresh);
}

// Rows of a deleted section get no RowDelete of their own: the SectionDelete
// already removes them, and a RowDelete emitted after it would address a
// section that no longer exists.
TEST_CASE("teardown produces only section deletes", "[diff][delete]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "B", 1),
                                    make_row("3", "B", 2), make_row("4", "C", 1)});

    auto changes = compute_changes(old_layout, Layout{});

    REQUIRE(changes.events.size() == 3);
    REQUIRE(changes.section_event_count == 3);

    std::vector<std::size_t> indices;
    for (const auto& event : changes.events) {
        const auto* del = std::get_if<changes::SectionDelete>(&event);
        REQUIRE(del != nullptr);
        indices.push_back(del->index);
    }
    REQUIRE(indices == std::vector<std::size_t>{2, 1, 0});

    const auto& middle = std::get<changes::SectionDelete>(changes.events[1]);
    REQUIRE(middle.section.name == "B");
    REQUIRE(middle.section.number_of_objects == 2);

    REQUIRE(replay(old_layout, changes).empty());
}

// ============================================================
// Worked examples
// ============================================================

TEST_CASE("sort key change reorders rows with a single move", "[diff][move]") {
    auto old_layout = build_layout({make_row("row1", "A", 1), make_row("row2", "A", 2)});
    auto new_layout = build_layout({make_row("row2", "A", 0), make_row("row1", "A", 1)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE(changes.events.size() == 1);
    REQUIRE(changes.section_event_count == 0);

    const auto* move = std::get_if<changes::RowMove>(&changes.events[0]);
    REQUIRE(move != nullptr);
    REQUIRE(move->row.id == "row2");
    REQUIRE(move->from == IndexPath{0, 1});
    REQUIRE(move->to == IndexPath{0, 0});
    REQUIRE(move->row.sort_values[1] == FieldValue{0});

    REQUIRE(replay(old_layout, changes) == new_layout);
}

TEST_CASE("deleted section reports no row events", "[diff][section]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2),
                                    make_row("3", "B", 1), make_row("4", "B", 2)});
    auto new_layout = build_layout({make_row("3", "B", 1), make_row("4", "B", 2)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE(changes.events.size() == 1);
    const auto* del = std::get_if<changes::SectionDelete>(&changes.events[0]);
    REQUIRE(del != nullptr);
    REQUIRE(del->section.name == "A");
    REQUIRE(del->index == 0);

    REQUIRE(replay(old_layout, changes) == new_layout);
}

// ============================================================
// Move vs update
// ============================================================

TEST_CASE("move and update disambiguation", "[diff][move][update]") {
    SECTION("sort and tracked change together give exactly one move") {
        auto old_layout = build_layout({make_row("1", "A", 1, 0), make_row("2", "A", 2, 0), make_row("3", "A", 3, 0)});
        auto new_layout = build_layout({make_row("3", "A", 0, 7), make_row("1", "A", 1, 0), make_row("2", "A", 2, 0)});

        auto changes = compute_changes(old_layout, new_layout);

        REQUIRE(changes.events.size() == 1);
        const auto* move = std::get_if<changes::RowMove>(&changes.events[0]);
        REQUIRE(move != nullptr);
        REQUIRE(move->row.id == "3");
        REQUIRE(move->from == IndexPath{0, 2});
        REQUIRE(move->to == IndexPath{0, 0});
        REQUIRE(move->row.tracked_values[0] == FieldValue{7});
        REQUIRE(count_of<changes::RowUpdate>(changes) == 0);
    }

    SECTION("tracked change in place gives an update") {
        auto old_layout = build_layout({make_row("1", "A", 1, 0), make_row("2", "A", 2, 0)});
        auto new_layout = build_layout({make_row("1", "A", 1, 0), make_row("2", "A", 2, 5)});

        auto changes = compute_changes(old_layout, new_layout);

        REQUIRE(changes.events.size() == 1);
        const auto* update = std::get_if<changes::RowUpdate>(&changes.events[0]);
        REQUIRE(update != nullptr);
        REQUIRE(update->row.id == "2");
        REQUIRE(update->at == IndexPath{0, 1});
    }

    SECTION("sort change without reordering gives an update") {
        auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 5), make_row("3", "A", 9)});
        auto new_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 6), make_row("3", "A", 9)});

        auto changes = compute_changes(old_layout, new_layout);

        REQUIRE(changes.events.size() == 1);
        REQUIRE(std::holds_alternative<changes::RowUpdate>(changes.events[0]));
    }

    SECTION("rows with unchanged sort values stay anchored") {
        // Row 1 moved to the end by its own sort change; 2 and 3 must not move
        auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "A", 3)});
        auto new_layout = build_layout({make_row("2", "A", 2), make_row("3", "A", 3), make_row("1", "A", 4)});

        auto changes = compute_changes(old_layout, new_layout);

        REQUIRE(changes.events.size() == 1);
        const auto* move = std::get_if<changes::RowMove>(&changes.events[0]);
        REQUIRE(move != nullptr);
        REQUIRE(move->row.id == "1");
        REQUIRE(move->from == IndexPath{0, 0});
        REQUIRE(move->to == IndexPath{0, 2});
    }
}

// ============================================================
// Sections and rows together
// ============================================================

TEST_CASE("new section is inserted before its rows", "[diff][section]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "C", 1)});
    auto new_layout = build_layout({make_row("1", "A", 1), make_row("3", "B", 1), make_row("2", "C", 1)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE(changes.events.size() == 2);
    REQUIRE(changes.section_event_count == 1);

    const auto& section = std::get<changes::SectionInsert>(changes.events[0]);
    REQUIRE(section.section.name == "B");
    REQUIRE(section.index == 1);

    const auto& row = std::get<changes::RowInsert>(changes.events[1]);
    REQUIRE(row.row.id == "3");
    REQUIRE(row.at == IndexPath{1, 0});
}

TEST_CASE("section emptied by deletions is deleted", "[diff][section]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "B", 1), make_row("3", "B", 2)});
    auto new_layout = build_layout({make_row("1", "A", 1), make_row("2", "B", 1)});

    SECTION("partial delete keeps the section") {
        auto changes = compute_changes(old_layout, new_layout);
        REQUIRE(changes.events.size() == 1);
        const auto& del = std::get<changes::RowDelete>(changes.events[0]);
        REQUIRE(del.row.id == "3");
        REQUIRE(del.at == IndexPath{1, 1});
    }

    SECTION("deleting every row deletes the section") {
        auto only_a = build_layout({make_row("1", "A", 1)});
        auto changes = compute_changes(old_layout, only_a);
        REQUIRE(changes.events.size() == 1);
        const auto& del = std::get<changes::SectionDelete>(changes.events[0]);
        REQUIRE(del.index == 1);
        REQUIRE(replay(old_layout, changes) == only_a);
    }
}

TEST_CASE("row changing section is a move", "[diff][move][section]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "B", 1)});
    auto new_layout = build_layout({make_row("1", "A", 1), make_row("2", "B", 0), make_row("3", "B", 1)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE(changes.events.size() == 1);
    const auto& move = std::get<changes::RowMove>(changes.events[0]);
    REQUIRE(move.row.id == "2");
    REQUIRE(move.from == IndexPath{0, 1});
    REQUIRE(move.to == IndexPath{1, 0});
    REQUIRE(replay(old_layout, changes) == new_layout);
}

TEST_CASE("row deletes come before moves and inserts", "[diff][order]") {
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "A", 3)});
    auto new_layout = build_layout({make_row("4", "A", 0), make_row("3", "A", 1), make_row("1", "A", 2)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE_FALSE(changes.empty());
    REQUIRE(std::holds_alternative<changes::RowDelete>(changes.events[0]));
    for (std::size_t i = 1; i < changes.events.size(); ++i) {
        REQUIRE_FALSE(std::holds_alternative<changes::RowDelete>(changes.events[i]));
    }
    REQUIRE(replay(old_layout, changes) == new_layout);
}

TEST_CASE("ungrouped layouts use the implicit section", "[diff][ungrouped]") {
    auto old_layout = build_layout({make_row("1", std::nullopt, 1), make_row("2", std::nullopt, 2)});
    auto new_layout = build_layout({make_row("2", std::nullopt, 2), make_row("3", std::nullopt, 3)});

    auto changes = compute_changes(old_layout, new_layout);

    REQUIRE(changes.section_event_count == 0);
    REQUIRE(count_of<changes::RowDelete>(changes) == 1);
    REQUIRE(count_of<changes::RowInsert>(changes) == 1);
    REQUIRE(replay(old_layout, changes) == new_layout);
}

TEST_CASE("reordered sections are deleted and re-inserted", "[diff][section]") {
    // Section order is forced by fetch order; B now precedes A
    auto old_layout = build_layout({make_row("1", "A", 1), make_row("2", "A", 2), make_row("3", "B", 1)});
    auto new_layout = build_layout({make_row("3", "B", 1), make_row("1", "A", 1), make_row("2", "A", 2)});

    auto changes = compute_changes(old_layout, new_layout);

    // A holds more rows, so B is the section that gets rebuilt
    REQUIRE(changes.section_event_count == 2);
    const auto& del = std::get<changes::SectionDelete>(changes.events[0]);
    REQUIRE(del.section.name == "B");
    const auto& ins = std::get<changes::SectionInsert>(changes.events[1]);
    REQUIRE(ins.section.name == "B");
    REQUIRE(ins.index == 0);
    REQUIRE(replay(old_layout, changes) == new_layout);
}

// ============================================================
// Errors
// ============================================================

TEST_CASE("duplicate ids abort the diff", "[diff][error]") {
    Layout broken;
    broken.sections = broken.sections.push_back(
        Section{std::string{"A"}, immer::flex_vector<RowIdentity>{make_row("1", "A", 1), make_row("1", "A", 2)}});

    REQUIRE_THROWS_AS(compute_changes(Layout{}, broken), InvariantViolation);
    REQUIRE_THROWS_AS(compute_changes(broken, Layout{}), InvariantViolation);
}

// ============================================================
// Completeness
// ============================================================

TEST_CASE("replaying events reproduces the new layout", "[diff][completeness]") {
    std::mt19937 rng(20240611);
    const std::vector<std::string> section_names{"A", "B", "C", "D", "E"};

    auto pick = [&rng](std::size_t n) { return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng); };

    auto random_rows = [&](std::size_t count) {
        std::vector<RowIdentity> rows;
        for (std::size_t i = 0; i < count; ++i) {
            rows.push_back(make_row("r" + std::to_string(i), section_names[pick(section_names.size())],
                                    static_cast<std::int64_t>(pick(6)), static_cast<std::int64_t>(pick(3))));
        }
        return rows;
    };

    for (int iteration = 0; iteration < 300; ++iteration) {
        auto old_rows = random_rows(pick(25));
        std::shuffle(old_rows.begin(), old_rows.end(), rng);

        std::vector<RowIdentity> new_rows;
        for (const auto& row : old_rows) {
            switch (pick(6)) {
                case 0: break; // deleted
                case 1: new_rows.push_back(make_row(row.id, section_names[pick(section_names.size())], 3)); break;
                case 2: new_rows.push_back(make_row(row.id, row.section_key, static_cast<std::int64_t>(pick(6)))); break;
                case 3: new_rows.push_back(make_row(row.id, row.section_key, 0, 9)); break;
                default: new_rows.push_back(row); break;
            }
        }
        for (std::size_t i = 0, extra = pick(5); i < extra; ++i) {
            new_rows.push_back(make_row("n" + std::to_string(i), section_names[pick(section_names.size())], 1));
        }
        std::shuffle(new_rows.begin(), new_rows.end(), rng);
        // Keep part of the old order so anchors exist
        if (pick(2) == 0) {
            std::stable_sort(new_rows.begin(), new_rows.end(), [](const RowIdentity& a, const RowIdentity& b) {
                return a.id < b.id;
            });
        }

        auto old_layout = build_layout(old_rows);
        auto new_layout = build_layout(new_rows);

        auto changes = compute_changes(old_layout, new_layout);
        INFO("iteration " << iteration);
        REQUIRE(replay(old_layout, changes) == new_layout);
        REQUIRE(changes.layout == new_layout);

        for (std::size_t i = 0; i < changes.events.size(); ++i) {
            REQUIRE(is_section_change(changes.events[i]) == (i < changes.section_event_count));
            if (const auto* move = std::get_if<changes::RowMove>(&changes.events[i])) {
                REQUIRE_FALSE(move->from == move->to);
            }
        }
    }
}

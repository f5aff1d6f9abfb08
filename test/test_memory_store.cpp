// test_memory_store.cpp - Tests for MemoryObjectStore
// Query execution, write transactions and change batch coalescing

#include <catch2/catch_all.hpp>
#include <fetched_results/error.h>
#include <fetched_results/memory_store.h>

#include <string>
#include <vector>

using namespace fetched_results;

namespace {

RawObject make_person(const std::string& id, const std::string& team, std::int64_t age)
{
    return RawObject{"Person", id}.set("team", team).set("age", age);
}

FetchRequest by_team_and_age()
{
    FetchRequest request;
    request.entity_name = "Person";
    request.sort_descriptors = {{"team", true}, {"age", true}};
    return request;
}

std::vector<std::string> ids_of(const std::vector<RawObject>& objects)
{
    std::vector<std::string> ids;
    for (const auto& object : objects) {
        ids.push_back(object.primary_key());
    }
    return ids;
}

} // anonymous namespace

// ============================================================
// execute
// ============================================================

TEST_CASE("MemoryObjectStore execute", "[store][execute]") {
    MemoryObjectStore store;
    store.register_entity("Person", {"team", "age", "email"});
    store.add(make_person("p1", "red", 30));
    store.add(make_person("p2", "blue", 40));
    store.add(make_person("p3", "red", 20));
    store.add(make_person("p4", "blue", 40));

    SECTION("sorted by descriptors, ties in insertion order") {
        REQUIRE(ids_of(store.execute(by_team_and_age())) == std::vector<std::string>{"p2", "p4", "p3", "p1"});
    }

    SECTION("descending") {
        auto request = by_team_and_age();
        request.sort_descriptors = {{"age", false}};
        REQUIRE(ids_of(store.execute(request)) == std::vector<std::string>{"p2", "p4", "p1", "p3"});
    }

    SECTION("predicate filters") {
        auto request = by_team_and_age();
        request.predicate = [](const RawObject& object) { return object.field("team") == FieldValue{"red"}; };
        REQUIRE(ids_of(store.execute(request)) == std::vector<std::string>{"p3", "p1"});
    }

    SECTION("replacing an object keeps its insertion order") {
        store.add(make_person("p2", "blue", 40).set("email", "p2@example.com"));
        REQUIRE(ids_of(store.execute(by_team_and_age())) == std::vector<std::string>{"p2", "p4", "p3", "p1"});
    }

    SECTION("unknown entity") {
        auto request = by_team_and_age();
        request.entity_name = "Robot";
        REQUIRE_THROWS_AS(store.execute(request), QueryExecutionError);
    }

    SECTION("undeclared attribute") {
        auto request = by_team_and_age();
        request.tracked_key_paths = {"salary"};
        REQUIRE_THROWS_AS(store.execute(request), QueryExecutionError);
    }

    SECTION("failing predicate") {
        auto request = by_team_and_age();
        request.predicate = [](const RawObject&) -> bool { throw std::runtime_error("boom"); };
        REQUIRE_THROWS_AS(store.execute(request), QueryExecutionError);
    }

    SECTION("find and get") {
        REQUIRE(store.find(by_team_and_age(), "p3")->field("age") == FieldValue{20});
        REQUIRE_FALSE(store.get("Person", "p9").has_value());
        REQUIRE(store.count("Person") == 4);
    }
}

// ============================================================
// Change batches
// ============================================================

TEST_CASE("MemoryObjectStore change batches", "[store][batch]") {
    MemoryObjectStore store;
    store.add(make_person("p1", "red", 30));
    store.add(make_person("p2", "red", 31));

    std::vector<ChangeBatch> batches;
    auto conn = store.subscribe(by_team_and_age(), [&](const ChangeBatch& batch) { batches.push_back(batch); });
    REQUIRE(conn.connected());
    REQUIRE(store.subscriber_count() == 1);

    SECTION("writes outside a transaction publish immediately") {
        store.add(make_person("p3", "blue", 1));
        store.remove("Person", "p1");
        REQUIRE(batches.size() == 2);
        REQUIRE(batches[0].added.size() == 1);
        REQUIRE(batches[1].removed.size() == 1);
        REQUIRE(batches[1].removed[0].primary_key() == "p1");
    }

    SECTION("a transaction publishes one batch") {
        store.begin_write();
        store.add(make_person("p3", "blue", 1));
        store.add(make_person("p1", "red", 35));
        store.remove("Person", "p2");
        REQUIRE(batches.empty());
        store.commit_write();

        REQUIRE(batches.size() == 1);
        REQUIRE(batches[0].added.size() == 1);
        REQUIRE(batches[0].modified.size() == 1);
        REQUIRE(batches[0].removed.size() == 1);
    }

    SECTION("changes to one object are coalesced") {
        store.begin_write();
        store.add(make_person("p3", "blue", 1));
        store.add(make_person("p3", "blue", 2));
        store.remove("Person", "p1");
        store.add(make_person("p1", "red", 30));
        store.add(make_person("p4", "blue", 1));
        store.remove("Person", "p4");
        store.commit_write();

        REQUIRE(batches.size() == 1);
        const auto& batch = batches[0];
        REQUIRE(batch.added.size() == 1);
        REQUIRE(batch.added[0].field("age") == FieldValue{2});
        REQUIRE(batch.modified.size() == 1);
        REQUIRE(batch.modified[0].primary_key() == "p1");
        REQUIRE(batch.removed.empty());
    }

    SECTION("cancel restores the store") {
        store.begin_write();
        store.add(make_person("p3", "blue", 1));
        store.remove("Person", "p1");
        store.cancel_write();

        REQUIRE(batches.empty());
        REQUIRE(store.count("Person") == 2);
        REQUIRE(store.get("Person", "p1").has_value());
    }

    SECTION("unchanged writes publish nothing") {
        store.add(make_person("p1", "red", 30));
        REQUIRE_FALSE(store.remove("Person", "p9"));
        REQUIRE(batches.empty());
    }

    SECTION("nested transaction is refused") {
        store.begin_write();
        REQUIRE_THROWS_AS(store.begin_write(), PreconditionViolation);
        store.cancel_write();
        REQUIRE_THROWS_AS(store.commit_write(), PreconditionViolation);
    }

    SECTION("other entities are not delivered") {
        store.add(RawObject{"Robot", "r1"}.set("model", "T1"));
        REQUIRE(batches.empty());
    }

    SECTION("disconnect stops delivery") {
        conn.disconnect();
        REQUIRE_FALSE(conn.connected());
        store.add(make_person("p3", "blue", 1));
        REQUIRE(batches.empty());
        REQUIRE(store.subscriber_count() == 0);
    }
}

TEST_CASE("ChangeBatch touches", "[store][batch]") {
    ChangeBatch batch;
    REQUIRE(batch.empty());
    REQUIRE_FALSE(batch.touches("Person"));

    batch.modified.push_back(RawObject{"Person", "p1"});
    REQUIRE(batch.touches("Person"));
    REQUIRE_FALSE(batch.touches("Robot"));
}

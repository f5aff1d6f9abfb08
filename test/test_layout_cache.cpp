// test_layout_cache.cpp - Tests for the layout cache and its storage
// Record codec, memory/file storage, LayoutCache mutators and deletion

#include <catch2/catch_all.hpp>
#include <fetched_results/error.h>
#include <fetched_results/layout_cache.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace fetched_results;

namespace {

RowIdentity make_row(std::string id, std::optional<std::string> section, std::int64_t sort,
                     std::string tracked = {})
{
    RowIdentity row;
    row.id = std::move(id);
    row.section_key = section;
    if (section) {
        row.sort_values.push_back(FieldValue{*section});
    }
    row.sort_values.push_back(FieldValue{sort});
    row.tracked_values.push_back(tracked.empty() ? FieldValue{} : FieldValue{tracked});
    return row;
}

Layout sample_layout()
{
    return build_layout({make_row("1", "A", 1, "x"), make_row("2", "A", 2), make_row("3", "B", 1, "y")});
}

/// Fresh directory under the system temp dir, removed on destruction
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("fetched_results_test_" + name))
    {
        std::filesystem::remove_all(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // anonymous namespace

// ============================================================
// Codec
// ============================================================

TEST_CASE("cache record codec", "[cache][codec]") {
    SECTION("round trip keeps every value type") {
        RowIdentity row;
        row.id = "obj-1";
        row.section_key = std::nullopt;
        row.sort_values = {FieldValue{}, FieldValue{true}, FieldValue{-42}, FieldValue{2.5}, FieldValue{"text"}};
        CacheRecord record{"sig", build_layout({row})};

        auto decoded = decode_record(encode_record(record));
        REQUIRE(decoded.signature == "sig");
        REQUIRE(decoded.layout == record.layout);
        REQUIRE(decoded.layout.sections[0].rows[0].sort_values[2].get_if<std::int64_t>() != nullptr);
    }

    SECTION("empty layout") {
        auto decoded = decode_record(encode_record(CacheRecord{"", Layout{}}));
        REQUIRE(decoded.layout.empty());
    }

    SECTION("corrupt input") {
        auto bytes = encode_record(CacheRecord{"sig", sample_layout()});

        REQUIRE_THROWS_AS(decode_record(ByteBuffer{}), CacheIOError);

        auto bad_magic = bytes;
        bad_magic[0] ^= 0xFF;
        REQUIRE_THROWS_AS(decode_record(bad_magic), CacheIOError);

        auto truncated = bytes;
        truncated.resize(bytes.size() - 3);
        REQUIRE_THROWS_AS(decode_record(truncated), CacheIOError);

        auto trailing = bytes;
        trailing.push_back(0);
        REQUIRE_THROWS_AS(decode_record(trailing), CacheIOError);
    }
}

// ============================================================
// Storage
// ============================================================

TEST_CASE("MemoryCacheStorage", "[cache][storage]") {
    MemoryCacheStorage storage;

    REQUIRE_FALSE(storage.read("a").has_value());

    storage.write("a", ByteBuffer{1, 2, 3});
    storage.write("b", ByteBuffer{4});
    REQUIRE(storage.read("a") == ByteBuffer{1, 2, 3});
    REQUIRE(storage.names().size() == 2);

    storage.remove("a");
    storage.remove("a");
    REQUIRE_FALSE(storage.read("a").has_value());

    storage.remove_all();
    REQUIRE(storage.names().empty());
}

TEST_CASE("FileCacheStorage", "[cache][storage]") {
    TempDir dir("storage");
    FileCacheStorage storage(dir.path);

    SECTION("missing directory reads as no record") {
        REQUIRE_FALSE(storage.read("people").has_value());
        REQUIRE(storage.names().empty());
    }

    SECTION("write then read") {
        storage.write("people", ByteBuffer{9, 8, 7});
        REQUIRE(storage.read("people") == ByteBuffer{9, 8, 7});

        storage.write("people", ByteBuffer{1});
        REQUIRE(storage.read("people") == ByteBuffer{1});
        REQUIRE_FALSE(std::filesystem::exists(storage.path_for("people").string() + ".tmp"));
    }

    SECTION("names with separators map to distinct files") {
        storage.write("a/b", ByteBuffer{1});
        storage.write("a b", ByteBuffer{2});
        REQUIRE(storage.path_for("a/b").parent_path() == dir.path);
        REQUIRE(storage.read("a/b") == ByteBuffer{1});
        REQUIRE(storage.read("a b") == ByteBuffer{2});

        auto names = storage.names();
        std::sort(names.begin(), names.end());
        REQUIRE(names == std::vector<std::string>{"a b", "a/b"});
    }

    SECTION("remove is idempotent") {
        storage.write("x", ByteBuffer{1});
        storage.remove("x");
        REQUIRE_NOTHROW(storage.remove("x"));
        REQUIRE_FALSE(storage.read("x").has_value());
    }

    SECTION("remove_all") {
        storage.write("x", ByteBuffer{1});
        storage.write("y", ByteBuffer{1});
        storage.remove_all();
        REQUIRE(storage.names().empty());
    }

    SECTION("foreign files in the directory are skipped") {
        storage.write("x", ByteBuffer{1});
        std::ofstream(dir.path / "%zz.frcache") << "junk";
        std::ofstream(dir.path / "trailing%4.frcache") << "junk";

        REQUIRE(storage.names() == std::vector<std::string>{"x"});
        REQUIRE_NOTHROW(storage.remove_all());
        REQUIRE_FALSE(storage.read("x").has_value());
        REQUIRE(std::filesystem::exists(dir.path / "%zz.frcache"));
    }
}

// ============================================================
// LayoutCache
// ============================================================

TEST_CASE("LayoutCache load and store", "[cache][layout_cache]") {
    auto storage = std::make_shared<MemoryCacheStorage>();

    SECTION("first use is empty") {
        LayoutCache cache(std::string{"people"}, "sig", storage);
        REQUIRE(cache.load().empty());
        REQUIRE(cache.is_persistent());
    }

    SECTION("stored layout survives the cache") {
        {
            LayoutCache cache(std::string{"people"}, "sig", storage);
            cache.load();
            cache.store(sample_layout());
            REQUIRE(cache.layout() == sample_layout());
        }
        LayoutCache reopened(std::string{"people"}, "sig", storage);
        REQUIRE(reopened.load() == sample_layout());
        // Sort and tracked values are persisted with the rows
        REQUIRE(reopened.layout().sections[0].rows[0].tracked_values[0] == FieldValue{"x"});
    }

    SECTION("record of another configuration is ignored") {
        {
            LayoutCache cache(std::string{"people"}, "sig-1", storage);
            cache.store(sample_layout());
        }
        LayoutCache other(std::string{"people"}, "sig-2", storage);
        REQUIRE(other.load().empty());
    }

    SECTION("unreadable record is an error") {
        storage->write("people", ByteBuffer{1, 2, 3});
        LayoutCache cache(std::string{"people"}, "sig", storage);
        REQUIRE_THROWS_AS(cache.load(), CacheIOError);
        // The record is left for inspection
        REQUIRE(storage->read("people") == ByteBuffer{1, 2, 3});
    }

    SECTION("file storage") {
        TempDir dir("layout_cache");
        auto files = std::make_shared<FileCacheStorage>(dir.path);
        {
            LayoutCache cache(std::string{"people"}, "sig", files);
            cache.store(sample_layout());
        }
        REQUIRE(std::filesystem::exists(files->path_for("people")));
        LayoutCache reopened(std::string{"people"}, "sig", files);
        REQUIRE(reopened.load() == sample_layout());
    }
}

TEST_CASE("LayoutCache incremental mutation", "[cache][layout_cache]") {
    auto storage = std::make_shared<MemoryCacheStorage>();
    LayoutCache cache(std::string{"people"}, "sig", storage);
    cache.store(sample_layout());

    SECTION("mutators follow apply_change") {
        cache.apply_section_insert(SectionInfo{std::string{"C"}, 0}, 2);
        cache.apply_row_move(make_row("3", "C", 1), {1, 0}, {2, 0});
        cache.apply_section_delete(1);
        cache.apply_row_insert(make_row("4", "A", 3), {0, 2});
        cache.apply_row_delete({0, 0});
        cache.apply_row_update(make_row("2", "A", 2, "z"), {0, 0});

        const auto& layout = cache.layout();
        REQUIRE(layout.section_count() == 2);
        REQUIRE(layout.sections[0].rows.size() == 2);
        REQUIRE(layout.sections[0].rows[0].tracked_values[0] == FieldValue{"z"});
        REQUIRE(layout.sections[1].name == "C");
        REQUIRE(cache.index_path_for("3") == IndexPath{1, 0});
        REQUIRE(cache.index_path_for("4") == IndexPath{0, 1});
        REQUIRE_FALSE(cache.index_path_for("1").has_value());
    }

    SECTION("invalid event leaves the layout unchanged") {
        REQUIRE_THROWS_AS(cache.apply_row_delete({5, 0}), InvariantViolation);
        REQUIRE_THROWS_AS(cache.apply_row_move(make_row("9", "A", 1), {0, 0}, {0, 1}), InvariantViolation);
        REQUIRE(cache.layout() == sample_layout());
        REQUIRE_FALSE(cache.has_uncommitted_changes());
    }

    SECTION("commit persists, discard reverts") {
        cache.apply_row_delete({0, 0});
        REQUIRE(cache.has_uncommitted_changes());
        cache.commit();
        REQUIRE_FALSE(cache.has_uncommitted_changes());

        cache.apply_row_delete({0, 0});
        cache.discard();
        REQUIRE(cache.layout().sections[0].rows.size() == 1);

        LayoutCache reader(std::string{"people-reader"}, "sig", storage);
        storage->write("people-reader", *storage->read("people"));
        REQUIRE(reader.load().row_count() == 2);
    }

    SECTION("clear removes the record") {
        cache.clear();
        REQUIRE(cache.layout().empty());
        REQUIRE_FALSE(storage->read("people").has_value());
    }

    SECTION("index is rebuilt after mutation") {
        REQUIRE(cache.index_path_for("2") == IndexPath{0, 1});
        cache.apply_row_delete({0, 0});
        REQUIRE(cache.index_path_for("2") == IndexPath{0, 0});
    }
}

TEST_CASE("in-memory LayoutCache", "[cache][layout_cache]") {
    LayoutCache cache(std::nullopt, "sig");
    REQUIRE_FALSE(cache.is_persistent());

    cache.store(sample_layout());
    REQUIRE(cache.load() == sample_layout());

    cache.apply_row_delete({1, 0});
    cache.commit();
    REQUIRE(cache.load().row_count() == 2);
}

TEST_CASE("named caches attach from several threads", "[cache][layout_cache][thread]") {
    constexpr int THREADS = 4;
    constexpr int ROUNDS = 200;

    std::atomic<int> missing{0};
    std::vector<std::thread> workers;
    std::vector<std::shared_ptr<CacheStorage>> seen(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([t, &seen, &missing]() {
            auto storage = std::make_shared<MemoryCacheStorage>();
            const auto name = "worker-" + std::to_string(t);
            for (int i = 0; i < ROUNDS; ++i) {
                LayoutCache cache(name, "sig", storage);
                if (!is_cache_in_use(name)) {
                    ++missing;
                }
            }
            seen[t] = default_storage();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(missing == 0);
    for (int t = 0; t < THREADS; ++t) {
        REQUIRE_FALSE(is_cache_in_use("worker-" + std::to_string(t)));
        REQUIRE(seen[t] == seen[0]);
    }
}

// ============================================================
// Deletion
// ============================================================

TEST_CASE("delete_cache", "[cache][delete]") {
    auto storage = std::make_shared<MemoryCacheStorage>();

    SECTION("idempotent") {
        {
            LayoutCache cache(std::string{"people"}, "sig", storage);
            cache.store(sample_layout());
        }
        REQUIRE_NOTHROW(delete_cache("people", storage));
        REQUIRE_FALSE(storage->read("people").has_value());
        REQUIRE_NOTHROW(delete_cache("people", storage));
        REQUIRE_NOTHROW(delete_cache("never-created", storage));
    }

    SECTION("refused while attached") {
        LayoutCache cache(std::string{"people"}, "sig", storage);
        cache.store(sample_layout());

        REQUIRE(is_cache_in_use("people"));
        REQUIRE_THROWS_AS(delete_cache("people", storage), PreconditionViolation);
        REQUIRE_THROWS_AS(delete_all_caches(storage), PreconditionViolation);
        REQUIRE(storage->read("people").has_value());
    }

    SECTION("released on destruction") {
        {
            LayoutCache cache(std::string{"people"}, "sig", storage);
        }
        REQUIRE_FALSE(is_cache_in_use("people"));
    }

    SECTION("delete all") {
        {
            LayoutCache a(std::string{"a"}, "sig", storage);
            LayoutCache b(std::string{"b"}, "sig", storage);
            a.store(sample_layout());
            b.store(sample_layout());
        }
        delete_all_caches(storage);
        REQUIRE(storage->names().empty());
        REQUIRE_NOTHROW(delete_all_caches(storage));
    }

    SECTION("in-memory caches are not registered") {
        LayoutCache anonymous(std::nullopt, "sig", storage);
        REQUIRE_NOTHROW(delete_all_caches(storage));
    }
}

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file memory_store.h
/// @brief MemoryObjectStore - in-process reference QueryEngine.
///
/// Objects are kept per entity in immer maps keyed by primary key. Each
/// object remembers the sequence number of its first insertion; execute()
/// sorts stably by the request's descriptors and falls back to that
/// sequence, so equal sort keys keep their insertion order.
///
/// Writes are grouped in transactions:
/// @code
///   store.begin_write();
///   store.add(RawObject{"Person", "p1", {...}});
///   store.remove("Person", "p2");
///   store.commit_write();   // subscribers receive one ChangeBatch
/// @endcode
/// add()/remove() outside a transaction commit immediately. Within a
/// transaction, changes to the same object are coalesced: an object added
/// and removed again does not appear in the batch at all.

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/query_engine.h>

#include <immer/map.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fetched_results {

class FETCHED_RESULTS_API MemoryObjectStore : public QueryEngine {
public:
    MemoryObjectStore() = default;
    ~MemoryObjectStore() override;

    MemoryObjectStore(const MemoryObjectStore&) = delete;
    MemoryObjectStore& operator=(const MemoryObjectStore&) = delete;

    /// Declare an entity. With a non-empty attribute list, requests that
    /// sort or track an undeclared attribute fail with QueryExecutionError.
    void register_entity(const std::string& name, std::vector<std::string> attributes = {});
    [[nodiscard]] bool has_entity(const std::string& name) const;

    // QueryEngine
    [[nodiscard]] std::vector<RawObject> execute(const FetchRequest& request) override;
    [[nodiscard]] Connection subscribe(const FetchRequest& request, ChangeHandler handler) override;
    [[nodiscard]] std::optional<RawObject> find(const FetchRequest& request, const std::string& id) const override;

    // Write transactions
    void begin_write();
    void commit_write();
    void cancel_write();
    [[nodiscard]] bool in_write() const noexcept { return in_write_; }

    /// Insert or replace an object. Registers its entity on first use.
    void add(RawObject object);

    /// Returns false if there is no such object
    bool remove(const std::string& entity, const std::string& primary_key);

    [[nodiscard]] std::optional<RawObject> get(const std::string& entity, const std::string& primary_key) const;
    [[nodiscard]] std::size_t count(const std::string& entity) const;
    [[nodiscard]] std::size_t subscriber_count() const;

private:
    struct StoredObject {
        RawObject object;
        std::uint64_t sequence = 0;

        bool operator==(const StoredObject& other) const {
            return sequence == other.sequence && object == other.object;
        }
    };

    using ObjectMap = immer::map<std::string, StoredObject>;

    struct Entity {
        ObjectMap objects;
        std::unordered_set<std::string> attributes;
    };

    enum class PendingKind { Added, Modified, Removed, Dropped };

    struct PendingChange {
        PendingKind kind;
        RawObject object;
    };

    struct Subscriber {
        std::string entity;
        ChangeHandler handler;
        bool active = true;
    };

    void check_request(const FetchRequest& request) const;
    void record(PendingKind kind, const RawObject& object);
    void publish(const ChangeBatch& batch);
    ChangeBatch take_pending();

    std::unordered_map<std::string, Entity> entities_;
    std::uint64_t next_sequence_ = 0;

    bool in_write_ = false;
    std::unordered_map<std::string, Entity> rollback_;
    std::vector<PendingChange> pending_;
    std::unordered_map<std::string, std::size_t> pending_index_;

    std::vector<std::shared_ptr<Subscriber>> subscribers_;
};

} // namespace fetched_results

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/memory_store.h>
#include <fetched_results/error.h>
#include <fetched_results/log.h>

#include <zug/compose.hpp>
#include <zug/into_vector.hpp>
#include <zug/transducer/filter.hpp>
#include <zug/transducer/map.hpp>

#include <algorithm>
#include <exception>

namespace fetched_results {

namespace {

std::string pending_key(const std::string& entity, const std::string& primary_key)
{
    std::string key;
    key.reserve(entity.size() + primary_key.size() + 1);
    key.append(entity).push_back('\x1f');
    key.append(primary_key);
    return key;
}

} // anonymous namespace

MemoryObjectStore::~MemoryObjectStore()
{
    for (auto& subscriber : subscribers_) {
        subscriber->active = false;
    }
}

void MemoryObjectStore::register_entity(const std::string& name, std::vector<std::string> attributes)
{
    auto& entity = entities_[name];
    entity.attributes.insert(attributes.begin(), attributes.end());
}

bool MemoryObjectStore::has_entity(const std::string& name) const
{
    return entities_.count(name) > 0;
}

// ============================================================
// QueryEngine
// ============================================================

void MemoryObjectStore::check_request(const FetchRequest& request) const
{
    auto it = entities_.find(request.entity_name);
    if (it == entities_.end()) {
        throw QueryExecutionError("unknown entity '" + request.entity_name + "'");
    }

    const auto& attributes = it->second.attributes;
    if (attributes.empty()) {
        return;
    }
    auto check = [&](const std::string& key_path) {
        if (attributes.count(key_path) == 0) {
            throw QueryExecutionError("entity '" + request.entity_name + "' has no attribute '" + key_path + "'");
        }
    };
    for (const auto& descriptor : request.sort_descriptors) {
        check(descriptor.key_path);
    }
    for (const auto& key_path : request.tracked_key_paths) {
        check(key_path);
    }
}

std::vector<RawObject> MemoryObjectStore::execute(const FetchRequest& request)
{
    check_request(request);
    const auto& objects = entities_.at(request.entity_name).objects;

    auto matches = [&request](const StoredObject& stored) {
        return !request.predicate || request.predicate(stored.object);
    };

    std::vector<StoredObject> selected;
    try {
        selected = zug::into_vector(
            zug::comp(zug::map([](const auto& entry) { return entry.second; }), zug::filter(matches)),
            objects);
    } catch (const std::exception& e) {
        throw QueryExecutionError("predicate of '" + request.entity_name + "' failed: " + e.what());
    }

    std::sort(selected.begin(), selected.end(), [&request](const StoredObject& a, const StoredObject& b) {
        auto order = compare_objects(a.object, b.object, request.sort_descriptors);
        if (order != std::weak_ordering::equivalent) {
            return order == std::weak_ordering::less;
        }
        return a.sequence < b.sequence;
    });

    return zug::into_vector(zug::map([](const StoredObject& stored) { return stored.object; }), selected);
}

Connection MemoryObjectStore::subscribe(const FetchRequest& request, ChangeHandler handler)
{
    // Drop subscriptions that were disconnected since the last call
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const auto& subscriber) { return !subscriber->active; }),
                       subscribers_.end());

    auto subscriber = std::make_shared<Subscriber>(Subscriber{request.entity_name, std::move(handler), true});
    subscribers_.push_back(subscriber);

    std::weak_ptr<Subscriber> weak = subscriber;
    return Connection{
        [weak]() {
            if (auto locked = weak.lock()) {
                locked->active = false;
            }
        },
        [weak]() {
            auto locked = weak.lock();
            return locked && locked->active;
        }};
}

std::optional<RawObject> MemoryObjectStore::find(const FetchRequest& request, const std::string& id) const
{
    return get(request.entity_name, id);
}

// ============================================================
// Writes
// ============================================================

void MemoryObjectStore::begin_write()
{
    if (in_write_) {
        throw PreconditionViolation("MemoryObjectStore: write transaction already open");
    }
    in_write_ = true;
    rollback_ = entities_;
}

void MemoryObjectStore::commit_write()
{
    if (!in_write_) {
        throw PreconditionViolation("MemoryObjectStore: commit_write without begin_write");
    }
    in_write_ = false;
    rollback_.clear();

    auto batch = take_pending();
    if (!batch.empty()) {
        publish(batch);
    }
}

void MemoryObjectStore::cancel_write()
{
    if (!in_write_) {
        detail::log_warning("MemoryObjectStore", "cancel_write without an open transaction");
        return;
    }
    in_write_ = false;
    entities_ = std::move(rollback_);
    rollback_.clear();
    pending_.clear();
    pending_index_.clear();
}

void MemoryObjectStore::add(RawObject object)
{
    auto& entity = entities_[object.entity()];
    const StoredObject* existing = entity.objects.find(object.primary_key());
    if (existing && existing->object == object) {
        return;
    }

    StoredObject stored{object, existing ? existing->sequence : ++next_sequence_};
    const PendingKind kind = existing ? PendingKind::Modified : PendingKind::Added;
    entity.objects = entity.objects.set(object.primary_key(), std::move(stored));
    record(kind, object);

    if (!in_write_) {
        publish(take_pending());
    }
}

bool MemoryObjectStore::remove(const std::string& entity_name, const std::string& primary_key)
{
    auto it = entities_.find(entity_name);
    if (it == entities_.end()) {
        return false;
    }
    auto& entity = it->second;
    const StoredObject* existing = entity.objects.find(primary_key);
    if (!existing) {
        return false;
    }

    RawObject removed = existing->object;
    entity.objects = entity.objects.erase(primary_key);
    record(PendingKind::Removed, removed);

    if (!in_write_) {
        publish(take_pending());
    }
    return true;
}

std::optional<RawObject> MemoryObjectStore::get(const std::string& entity_name, const std::string& primary_key) const
{
    auto it = entities_.find(entity_name);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    if (const auto* stored = it->second.objects.find(primary_key)) {
        return stored->object;
    }
    return std::nullopt;
}

std::size_t MemoryObjectStore::count(const std::string& entity_name) const
{
    auto it = entities_.find(entity_name);
    return it == entities_.end() ? 0 : it->second.objects.size();
}

std::size_t MemoryObjectStore::subscriber_count() const
{
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                                  [](const auto& subscriber) { return subscriber->active; }));
}

// ============================================================
// Change batches
// ============================================================

void MemoryObjectStore::record(PendingKind kind, const RawObject& object)
{
    auto key = pending_key(object.entity(), object.primary_key());
    auto it = pending_index_.find(key);
    if (it == pending_index_.end()) {
        pending_index_.emplace(std::move(key), pending_.size());
        pending_.push_back(PendingChange{kind, object});
        return;
    }

    auto& change = pending_[it->second];
    change.object = object;
    if (kind == PendingKind::Removed) {
        // Added and removed within one transaction: nothing to report
        change.kind = change.kind == PendingKind::Added ? PendingKind::Dropped : PendingKind::Removed;
    } else if (change.kind == PendingKind::Removed) {
        change.kind = PendingKind::Modified;
    } else if (change.kind == PendingKind::Dropped) {
        change.kind = PendingKind::Added;
    }
}

ChangeBatch MemoryObjectStore::take_pending()
{
    ChangeBatch batch;
    for (auto& change : pending_) {
        switch (change.kind) {
            case PendingKind::Added:    batch.added.push_back(std::move(change.object)); break;
            case PendingKind::Modified: batch.modified.push_back(std::move(change.object)); break;
            case PendingKind::Removed:  batch.removed.push_back(std::move(change.object)); break;
            case PendingKind::Dropped:  break;
        }
    }
    pending_.clear();
    pending_index_.clear();
    return batch;
}

void MemoryObjectStore::publish(const ChangeBatch& batch)
{
    if (batch.empty()) {
        return;
    }

    // Handlers may subscribe or disconnect while the batch is delivered
    auto targets = subscribers_;
    std::exception_ptr first_failure;
    for (const auto& subscriber : targets) {
        if (!subscriber->active || !batch.touches(subscriber->entity)) {
            continue;
        }
        try {
            subscriber->handler(batch);
        } catch (...) {
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
}

} // namespace fetched_results

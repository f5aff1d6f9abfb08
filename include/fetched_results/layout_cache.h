// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file layout_cache.h
/// @brief LayoutCache - the durable baseline layout of one controller.
///
/// The working layout lives in a lager store (manual event loop) driven by
/// the layout_update reducer. Incremental mutators dispatch change events;
/// commit() writes the working layout as one record; discard() drops
/// everything since the last commit.
///
/// Named caches register themselves in a process-wide registry while alive.
/// delete_cache() refuses to remove a record that a live cache is attached to.
/// A cache constructed without a name is in-memory: it behaves the same but
/// is never registered and its records disappear with its storage.

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/cache_storage.h>
#include <fetched_results/layout.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace fetched_results {

// ============================================================
// Reducer
// ============================================================

namespace cache_actions {

/// Replace the whole working layout
struct ReplaceLayout {
    Layout layout;
};

} // namespace cache_actions

using LayoutAction = std::variant<changes::SectionInsert, changes::SectionDelete,
                                  changes::RowInsert, changes::RowDelete,
                                  changes::RowMove, changes::RowUpdate,
                                  cache_actions::ReplaceLayout>;

/// Reducer of the cache store. Change actions must have been validated
/// against the layout (validate_change) before they are dispatched.
FETCHED_RESULTS_API Layout layout_update(Layout layout, LayoutAction action);

inline auto make_layout_store_impl(Layout initial_layout) {
    return lager::make_store<LayoutAction>(std::move(initial_layout), lager::with_manual_event_loop{},
                                           lager::with_reducer(layout_update));
}

using LayoutStoreType = decltype(make_layout_store_impl(std::declval<Layout>()));

// ============================================================
// LayoutCache
// ============================================================

class FETCHED_RESULTS_API LayoutCache {
public:
    /// @param name      cache name; nullopt for an in-memory cache
    /// @param signature configuration signature stored with the record
    /// @param storage   backing storage; nullptr selects default_storage() for
    ///                  named caches and a private MemoryCacheStorage otherwise
    LayoutCache(std::optional<std::string> name, std::string signature,
                std::shared_ptr<CacheStorage> storage = nullptr);
    ~LayoutCache();

    LayoutCache(const LayoutCache&) = delete;
    LayoutCache& operator=(const LayoutCache&) = delete;
    LayoutCache(LayoutCache&&) = delete;
    LayoutCache& operator=(LayoutCache&&) = delete;

    [[nodiscard]] const std::optional<std::string>& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& signature() const noexcept { return signature_; }
    [[nodiscard]] bool is_persistent() const noexcept { return name_.has_value(); }

    /// Read the durable record into the working layout and return it. A
    /// missing record or one with another signature yields an empty layout.
    /// @throws CacheIOError on a storage failure or an undecodable record
    const Layout& load();

    /// Atomic whole-layout replace (working layout and durable record).
    /// @throws CacheIOError
    void store(Layout layout);

    // Incremental mutators. Each validates against the working layout
    // (InvariantViolation) before dispatching.
    void apply_section_insert(const SectionInfo& section, std::size_t index);
    void apply_section_delete(std::size_t index);
    void apply_row_insert(const RowIdentity& row, const IndexPath& at);
    void apply_row_delete(const IndexPath& at);
    void apply_row_move(const RowIdentity& row, const IndexPath& from, const IndexPath& to);
    void apply_row_update(const RowIdentity& row, const IndexPath& at);
    void apply(const ChangeEvent& event);

    /// Persist the working layout. @throws CacheIOError
    void commit();

    /// Revert the working layout to the last loaded/committed one
    void discard();

    /// Remove the durable record and empty the layout
    void clear();

    [[nodiscard]] const Layout& layout() const;
    [[nodiscard]] bool has_uncommitted_changes() const;

    /// Index path of a row id in the working layout
    [[nodiscard]] std::optional<IndexPath> index_path_for(const std::string& id) const;

private:
    const std::string& storage_key() const;
    void dispatch(LayoutAction action);

    std::optional<std::string> name_;
    std::string anonymous_key_;
    std::string signature_;
    std::shared_ptr<CacheStorage> storage_;
    std::unique_ptr<LayoutStoreType> store_;
    Layout committed_;

    // Lazily rebuilt id -> index path map of the working layout
    mutable std::unordered_map<std::string, IndexPath> index_;
    mutable bool index_valid_ = false;
};

// ============================================================
// Administrative deletion
// ============================================================

/// Remove the record of a named cache. Idempotent.
/// @throws PreconditionViolation if a live LayoutCache is attached to name
FETCHED_RESULTS_API void delete_cache(const std::string& name,
                                      const std::shared_ptr<CacheStorage>& storage = nullptr);

/// Remove every record in storage (default_storage() when nullptr).
/// @throws PreconditionViolation if any named LayoutCache is alive
FETCHED_RESULTS_API void delete_all_caches(const std::shared_ptr<CacheStorage>& storage = nullptr);

/// True while a live LayoutCache is attached to name
[[nodiscard]] FETCHED_RESULTS_API bool is_cache_in_use(const std::string& name);

} // namespace fetched_results

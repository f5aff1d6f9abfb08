// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file results_controller.h
/// @brief FetchedResultsController - keeps a sectioned layout of a query
///        result in sync with the object store and reports every change.
///
/// Usage:
/// @code
///   MemoryObjectStore store;
///   FetchRequest request{"Person", {}, {}, {{"team"}, {"name"}}, {"email"}};
///   FetchedResultsController controller(store, request, {.section_key_path = "team",
///                                                        .cache_name = "people"});
///   ScopedConnection conn = controller.add_listener(my_listener);
///   controller.perform_fetch();
///   // every committed write to "Person" now produces one
///   // will_change_content / did_change_* / did_change_content sequence
/// @endcode
///
/// Lifecycle:
///   Uninitialized -> perform_fetch -> Fetched -> (Observing <-> Diffing)
///   reset -> Reset -> perform_fetch or next change batch -> Fetched
///
/// A controller is affine to the thread that owns it; it does no locking.
/// RowIdentity values returned by row_at() may be handed to other threads.

#pragma once

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/api.h>
#include <fetched_results/connection.h>
#include <fetched_results/diff_engine.h>
#include <fetched_results/layout_cache.h>
#include <fetched_results/query_engine.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fetched_results {

class FetchedResultsController;

enum class ControllerState { Uninitialized, Fetched, Observing, Diffing, Reset };

FETCHED_RESULTS_API const char* to_string(ControllerState state) noexcept;

/// Receives the change events of a controller. Every callback is optional.
///
/// For one change batch the controller calls will_change_content, then
/// did_change_section for each section event, then did_change_object for each
/// row event, then did_change_content. Index paths in an event refer to the
/// layout as left by the events delivered before it.
class FETCHED_RESULTS_API ResultsListener {
public:
    virtual ~ResultsListener() = default;

    virtual void will_change_content(const FetchedResultsController& controller) { (void)controller; }

    /// event holds a changes::SectionInsert or changes::SectionDelete
    virtual void did_change_section(const FetchedResultsController& controller, const ChangeEvent& event) {
        (void)controller;
        (void)event;
    }

    /// event holds a RowInsert, RowDelete, RowMove or RowUpdate
    virtual void did_change_object(const FetchedResultsController& controller, const ChangeEvent& event) {
        (void)controller;
        (void)event;
    }

    virtual void did_change_content(const FetchedResultsController& controller) { (void)controller; }
};

struct ControllerOptions {
    /// Group rows by the value at this key path. Must equal the key path of
    /// the first sort descriptor.
    std::optional<std::string> section_key_path;

    /// Name of the persistent layout cache; nullopt keeps the layout in memory
    std::optional<std::string> cache_name;

    /// Backing storage; nullptr selects default_storage() for named caches
    std::shared_ptr<CacheStorage> storage;
};

class FETCHED_RESULTS_API FetchedResultsController {
public:
    /// @throws ConfigurationError if the request cannot be grouped as asked
    FetchedResultsController(QueryEngine& engine, FetchRequest request, ControllerOptions options = {});
    ~FetchedResultsController();

    FetchedResultsController(const FetchedResultsController&) = delete;
    FetchedResultsController& operator=(const FetchedResultsController&) = delete;
    FetchedResultsController(FetchedResultsController&&) = delete;
    FetchedResultsController& operator=(FetchedResultsController&&) = delete;

    // ============================================================
    // Lifecycle
    // ============================================================

    /// Execute the request, store the layout if it differs from the cached
    /// one and subscribe to change batches. No events are delivered.
    /// @return false if the query failed; the cache is untouched then
    /// @throws CacheIOError
    bool perform_fetch();

    /// Delete the cached layout. The next perform_fetch() or change batch
    /// rebuilds it without delivering events.
    /// @throws CacheIOError
    void reset();

    /// Run one diff cycle for a batch of changes. Called by the query engine
    /// subscription; batches that touch no object of the request's entity
    /// are ignored. Re-entrant calls made while events are delivered are
    /// queued and run once the current cycle is complete.
    /// @throws CacheIOError
    void process_changes(const ChangeBatch& batch);

    // ============================================================
    // Listeners
    // ============================================================

    /// The controller does not own the listener. Disconnect before the
    /// listener is destroyed, or keep the connection in a ScopedConnection.
    [[nodiscard]] Connection add_listener(ResultsListener& listener);
    [[nodiscard]] std::size_t listener_count() const;

    // ============================================================
    // Queries (empty results before the first successful fetch)
    // ============================================================

    [[nodiscard]] std::size_t number_of_sections() const;
    [[nodiscard]] std::size_t number_of_rows(std::size_t section) const;
    [[nodiscard]] std::optional<std::string> section_title(std::size_t section) const;
    [[nodiscard]] std::optional<SectionInfo> section_info(std::size_t section) const;
    [[nodiscard]] immer::flex_vector<Section> sections() const;

    [[nodiscard]] std::optional<RowIdentity> row_at(const IndexPath& path) const;
    [[nodiscard]] std::optional<IndexPath> index_path_for(const RowIdentity& row) const;
    [[nodiscard]] std::optional<IndexPath> index_path_for(const RawObject& object) const;

    /// Live object from the query engine
    [[nodiscard]] std::optional<RawObject> object_at(const IndexPath& path) const;

    /// Live objects in layout order
    [[nodiscard]] std::vector<RawObject> fetched_objects() const;

    // ============================================================
    // Configuration
    // ============================================================

    [[nodiscard]] const FetchRequest& fetch_request() const noexcept { return request_; }
    [[nodiscard]] const std::optional<std::string>& section_key_path() const noexcept { return section_key_path_; }
    [[nodiscard]] const std::optional<std::string>& cache_name() const noexcept { return cache_->name(); }
    [[nodiscard]] ControllerState state() const noexcept { return state_; }

    /// Delete the cache record of one name, or of every name when nullopt.
    /// Idempotent.
    /// @throws PreconditionViolation while a live controller uses the name
    static void delete_cache(const std::optional<std::string>& name,
                             const std::shared_ptr<CacheStorage>& storage = nullptr);

private:
    struct ListenerSlot {
        ResultsListener* listener = nullptr;
        bool active = true;
    };

    [[nodiscard]] bool is_fetched() const noexcept;
    [[nodiscard]] bool check_fetched(const char* func) const;
    [[nodiscard]] Layout fetch_layout();
    bool rebuild();
    void run_cycle();
    void deliver(const ChangeSet& change_set);

    QueryEngine& engine_;
    FetchRequest request_;
    std::optional<std::string> section_key_path_;
    std::unique_ptr<LayoutCache> cache_;
    ControllerState state_ = ControllerState::Uninitialized;

    ScopedConnection subscription_;
    std::vector<std::shared_ptr<ListenerSlot>> listeners_;

    bool cycle_running_ = false;
    bool rerun_requested_ = false;
};

} // namespace fetched_results

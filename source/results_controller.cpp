// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/results_controller.h>
#include <fetched_results/error.h>
#include <fetched_results/log.h>

#include <zug/into_vector.hpp>
#include <zug/transducer/map.hpp>

#include <algorithm>
#include <exception>
#include <sstream>

namespace fetched_results {

const char* to_string(ControllerState state) noexcept
{
    switch (state) {
        case ControllerState::Uninitialized: return "uninitialized";
        case ControllerState::Fetched:       return "fetched";
        case ControllerState::Observing:     return "observing";
        case ControllerState::Diffing:       return "diffing";
        case ControllerState::Reset:         return "reset";
    }
    return "unknown";
}

FetchedResultsController::FetchedResultsController(QueryEngine& engine, FetchRequest request,
                                                   ControllerOptions options)
    : engine_(engine)
    , request_(std::move(request))
    , section_key_path_(std::move(options.section_key_path))
{
    validate_configuration(request_, section_key_path_);
    cache_ = std::make_unique<LayoutCache>(std::move(options.cache_name),
                                           configuration_signature(request_, section_key_path_),
                                           std::move(options.storage));
}

FetchedResultsController::~FetchedResultsController()
{
    subscription_.reset();
    for (auto& slot : listeners_) {
        slot->active = false;
    }
}

// ============================================================
// Lifecycle
// ============================================================

Layout FetchedResultsController::fetch_layout()
{
    auto objects = engine_.execute(request_);
    auto rows = zug::into_vector(zug::map([this](const RawObject& object) {
                                     return engine_.snapshot(object, request_, section_key_path_);
                                 }),
                                 objects);
    return build_layout(rows);
}

bool FetchedResultsController::rebuild()
{
    Layout fresh;
    try {
        fresh = fetch_layout();
    } catch (const QueryExecutionError& e) {
        detail::log_warning("FetchedResultsController", std::string{"fetch failed: "} + e.what());
        return false;
    } catch (const InvariantViolation& e) {
        detail::log_warning("FetchedResultsController", std::string{"fetch failed: "} + e.what());
        return false;
    }

    const Layout& cached = cache_->load();
    if (!(cached == fresh)) {
        cache_->store(std::move(fresh));
    }

    if (!subscription_.connected()) {
        subscription_ = engine_.subscribe(request_, [this](const ChangeBatch& batch) { process_changes(batch); });
    }
    state_ = ControllerState::Fetched;
    return true;
}

bool FetchedResultsController::perform_fetch()
{
    if (cycle_running_) {
        detail::log_warning("FetchedResultsController", "perform_fetch called during change delivery, ignored");
        return false;
    }
    return rebuild();
}

void FetchedResultsController::reset()
{
    cache_->clear();
    state_ = ControllerState::Reset;
    detail::log_info("FetchedResultsController", "cache reset for '" + request_.entity_name + "'");
}

void FetchedResultsController::process_changes(const ChangeBatch& batch)
{
    if (!batch.touches(request_.entity_name)) {
        return;
    }
    if (state_ == ControllerState::Uninitialized) {
        detail::log_info("FetchedResultsController", "change batch before the first fetch, ignored");
        return;
    }
    if (cycle_running_) {
        rerun_requested_ = true;
        return;
    }

    struct CycleGuard {
        FetchedResultsController& self;
        ~CycleGuard() {
            self.cycle_running_ = false;
            self.rerun_requested_ = false;
            if (self.state_ == ControllerState::Diffing) {
                self.state_ = ControllerState::Observing;
            }
        }
    } guard{*this};

    cycle_running_ = true;
    do {
        rerun_requested_ = false;
        run_cycle();
    } while (rerun_requested_);
}

void FetchedResultsController::run_cycle()
{
    if (state_ == ControllerState::Reset) {
        rebuild();
        return;
    }

    state_ = ControllerState::Diffing;

    ChangeSet change_set;
    try {
        auto fresh = fetch_layout();
        change_set = compute_changes(cache_->layout(), fresh);
        for (const auto& event : change_set.events) {
            cache_->apply(event);
        }
        cache_->commit();
    } catch (const QueryExecutionError& e) {
        cache_->discard();
        detail::log_warning("FetchedResultsController", std::string{"diff cycle aborted: "} + e.what());
        return;
    } catch (const InvariantViolation& e) {
        cache_->discard();
        detail::log_warning("FetchedResultsController", std::string{"diff cycle aborted: "} + e.what());
        return;
    } catch (const CacheIOError&) {
        cache_->discard();
        throw;
    }

    if (change_set.empty()) {
        return;
    }

#if FETCHED_RESULTS_VERBOSE_LOG
    std::ostringstream oss;
    oss << change_set.events.size() << " change(s) for '" << request_.entity_name << "'";
    detail::log_info("FetchedResultsController", oss.str());
#endif

    deliver(change_set);
}

void FetchedResultsController::deliver(const ChangeSet& change_set)
{
    // Listeners may connect or disconnect while events are delivered
    auto targets = listeners_;
    const auto section_end = change_set.events.begin() + static_cast<std::ptrdiff_t>(change_set.section_event_count);

    // A failing listener does not keep the others from the cycle; the first
    // failure is rethrown once every listener has been served
    std::exception_ptr first_failure;
    for (const auto& slot : targets) {
        if (!slot->active) {
            continue;
        }
        try {
            slot->listener->will_change_content(*this);
            for (auto it = change_set.events.begin(); it != section_end && slot->active; ++it) {
                slot->listener->did_change_section(*this, *it);
            }
            for (auto it = section_end; it != change_set.events.end() && slot->active; ++it) {
                slot->listener->did_change_object(*this, *it);
            }
            if (slot->active) {
                slot->listener->did_change_content(*this);
            }
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

// ============================================================
// Listeners
// ============================================================

Connection FetchedResultsController::add_listener(ResultsListener& listener)
{
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [](const auto& slot) { return !slot->active; }),
                     listeners_.end());

    auto slot = std::make_shared<ListenerSlot>(ListenerSlot{&listener, true});
    listeners_.push_back(slot);

    std::weak_ptr<ListenerSlot> weak = slot;
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

std::size_t FetchedResultsController::listener_count() const
{
    return static_cast<std::size_t>(
        std::count_if(listeners_.begin(), listeners_.end(), [](const auto& slot) { return slot->active; }));
}

// ============================================================
// Queries
// ============================================================

bool FetchedResultsController::is_fetched() const noexcept
{
    return state_ != ControllerState::Uninitialized && state_ != ControllerState::Reset;
}

bool FetchedResultsController::check_fetched(const char* func) const
{
    if (is_fetched()) {
        return true;
    }
    detail::log_access_error(func, std::string{"no fetched results (state: "} + to_string(state_) + ")");
    return false;
}

std::size_t FetchedResultsController::number_of_sections() const
{
    if (!check_fetched("number_of_sections")) {
        return 0;
    }
    return cache_->layout().section_count();
}

std::size_t FetchedResultsController::number_of_rows(std::size_t section) const
{
    if (!check_fetched("number_of_rows")) {
        return 0;
    }
    const auto& sections = cache_->layout().sections;
    if (section >= sections.size()) {
        detail::log_access_error("number_of_rows", "section " + std::to_string(section) + " out of range");
        return 0;
    }
    return sections[section].rows.size();
}

std::optional<std::string> FetchedResultsController::section_title(std::size_t section) const
{
    if (auto info = section_info(section)) {
        return info->name;
    }
    return std::nullopt;
}

std::optional<SectionInfo> FetchedResultsController::section_info(std::size_t section) const
{
    if (!check_fetched("section_info")) {
        return std::nullopt;
    }
    const auto& layout = cache_->layout();
    if (section >= layout.section_count()) {
        detail::log_access_error("section_info", "section " + std::to_string(section) + " out of range");
        return std::nullopt;
    }
    return layout.section_info(section);
}

immer::flex_vector<Section> FetchedResultsController::sections() const
{
    if (!check_fetched("sections")) {
        return {};
    }
    return cache_->layout().sections;
}

std::optional<RowIdentity> FetchedResultsController::row_at(const IndexPath& path) const
{
    if (!check_fetched("row_at")) {
        return std::nullopt;
    }
    if (const RowIdentity* row = cache_->layout().row_at(path)) {
        return *row;
    }
    return std::nullopt;
}

std::optional<IndexPath> FetchedResultsController::index_path_for(const RowIdentity& row) const
{
    if (!check_fetched("index_path_for")) {
        return std::nullopt;
    }
    return cache_->index_path_for(row.id);
}

std::optional<IndexPath> FetchedResultsController::index_path_for(const RawObject& object) const
{
    if (object.entity() != request_.entity_name) {
        return std::nullopt;
    }
    return index_path_for(engine_.snapshot(object, request_, section_key_path_));
}

std::optional<RawObject> FetchedResultsController::object_at(const IndexPath& path) const
{
    auto row = row_at(path);
    if (!row) {
        return std::nullopt;
    }
    return engine_.find(request_, row->id);
}

std::vector<RawObject> FetchedResultsController::fetched_objects() const
{
    std::vector<RawObject> objects;
    if (!check_fetched("fetched_objects")) {
        return objects;
    }

    const auto& layout = cache_->layout();
    objects.reserve(layout.row_count());
    for (const auto& section : layout.sections) {
        for (const auto& row : section.rows) {
            if (auto object = engine_.find(request_, row.id)) {
                objects.push_back(std::move(*object));
            } else {
                detail::log_warning("FetchedResultsController", "object '" + row.id + "' is gone from the store");
            }
        }
    }
    return objects;
}

void FetchedResultsController::delete_cache(const std::optional<std::string>& name,
                                            const std::shared_ptr<CacheStorage>& storage)
{
    if (name) {
        fetched_results::delete_cache(*name, storage);
    } else {
        delete_all_caches(storage);
    }
}

} // namespace fetched_results

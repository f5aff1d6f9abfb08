// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/layout_cache.h>
#include <fetched_results/error.h>
#include <fetched_results/log.h>

#include <atomic>
#include <mutex>

namespace fetched_results {

// ============================================================
// Reducer
// ============================================================

Layout layout_update(Layout layout, LayoutAction action)
{
    return std::visit([&](auto&& act) -> Layout {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, cache_actions::ReplaceLayout>) {
            return std::move(act.layout);
        } else {
            return apply_change(std::move(layout), ChangeEvent{std::move(act)});
        }
    }, std::move(action));
}

// ============================================================
// Registry of attached named caches
// ============================================================

namespace {

class CacheRegistry {
public:
    static CacheRegistry& instance() {
        static CacheRegistry registry;
        return registry;
    }

    void attach(const std::string& name) {
        std::lock_guard lock(mutex_);
        if (++counts_[name] > 1) {
            detail::log_warning("LayoutCache", "cache '" + name + "' is attached more than once");
        }
    }

    void detach(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = counts_.find(name);
        if (it != counts_.end() && --it->second == 0) {
            counts_.erase(it);
        }
    }

    [[nodiscard]] bool in_use(const std::string& name) const {
        std::lock_guard lock(mutex_);
        return counts_.count(name) > 0;
    }

    [[nodiscard]] bool any_in_use() const {
        std::lock_guard lock(mutex_);
        return !counts_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

std::string next_anonymous_key()
{
    static std::atomic<std::uint64_t> counter{0};
    return "<memory-" + std::to_string(++counter) + ">";
}

} // anonymous namespace

// ============================================================
// LayoutCache
// ============================================================

LayoutCache::LayoutCache(std::optional<std::string> name, std::string signature,
                         std::shared_ptr<CacheStorage> storage)
    : name_(std::move(name))
    , signature_(std::move(signature))
    , storage_(std::move(storage))
    , store_(std::make_unique<LayoutStoreType>(make_layout_store_impl(Layout{})))
{
    if (name_ && name_->empty()) {
        throw PreconditionViolation("cache name must not be empty");
    }
    if (!storage_) {
        storage_ = name_ ? default_storage() : std::make_shared<MemoryCacheStorage>();
    }
    if (name_) {
        CacheRegistry::instance().attach(*name_);
    } else {
        anonymous_key_ = next_anonymous_key();
    }
}

LayoutCache::~LayoutCache()
{
    if (name_) {
        CacheRegistry::instance().detach(*name_);
    } else {
        // In-memory records do not outlive their cache
        try {
            storage_->remove(anonymous_key_);
        } catch (const CacheIOError& e) {
            detail::log_warning("LayoutCache", e.what());
        }
    }
}

const std::string& LayoutCache::storage_key() const
{
    return name_ ? *name_ : anonymous_key_;
}

void LayoutCache::dispatch(LayoutAction action)
{
    store_->dispatch(std::move(action));
    index_valid_ = false;
}

const Layout& LayoutCache::load()
{
    Layout loaded;
    if (auto bytes = storage_->read(storage_key())) {
        CacheRecord record;
        try {
            record = decode_record(*bytes);
        } catch (const CacheIOError& e) {
            throw CacheIOError("unreadable record of '" + storage_key() + "': " + e.what());
        }
        if (record.signature == signature_) {
            loaded = std::move(record.layout);
        } else {
            detail::log_info("LayoutCache", "ignoring record of '" + storage_key() +
                                                "' written for another configuration");
        }
    }

    committed_ = loaded;
    dispatch(cache_actions::ReplaceLayout{std::move(loaded)});
    return layout();
}

void LayoutCache::store(Layout layout)
{
    storage_->write(storage_key(), encode_record(CacheRecord{signature_, layout}));
    committed_ = layout;
    dispatch(cache_actions::ReplaceLayout{std::move(layout)});
}

void LayoutCache::apply_section_insert(const SectionInfo& section, std::size_t index)
{
    apply(changes::SectionInsert{section, index});
}

void LayoutCache::apply_section_delete(std::size_t index)
{
    apply(changes::SectionDelete{layout().section_info(index), index});
}

void LayoutCache::apply_row_insert(const RowIdentity& row, const IndexPath& at)
{
    apply(changes::RowInsert{row, at});
}

void LayoutCache::apply_row_delete(const IndexPath& at)
{
    const RowIdentity* row = layout().row_at(at);
    apply(changes::RowDelete{row ? *row : RowIdentity{}, at});
}

void LayoutCache::apply_row_move(const RowIdentity& row, const IndexPath& from, const IndexPath& to)
{
    apply(changes::RowMove{row, from, to});
}

void LayoutCache::apply_row_update(const RowIdentity& row, const IndexPath& at)
{
    apply(changes::RowUpdate{row, at});
}

void LayoutCache::apply(const ChangeEvent& event)
{
    // Throwing inside the store's reducer would leave the event loop mid-dispatch
    validate_change(layout(), event);
    std::visit([this](const auto& change) { dispatch(change); }, event);
}

void LayoutCache::commit()
{
    if (!has_uncommitted_changes()) {
        return;
    }
    Layout working = layout();
    storage_->write(storage_key(), encode_record(CacheRecord{signature_, working}));
    committed_ = std::move(working);
}

void LayoutCache::discard()
{
    if (has_uncommitted_changes()) {
        dispatch(cache_actions::ReplaceLayout{committed_});
    }
}

void LayoutCache::clear()
{
    storage_->remove(storage_key());
    committed_ = Layout{};
    dispatch(cache_actions::ReplaceLayout{Layout{}});
}

const Layout& LayoutCache::layout() const
{
    return store_->get();
}

bool LayoutCache::has_uncommitted_changes() const
{
    return !(layout() == committed_);
}

std::optional<IndexPath> LayoutCache::index_path_for(const std::string& id) const
{
    if (!index_valid_) {
        index_.clear();
        const auto& sections = layout().sections;
        for (std::size_t s = 0; s < sections.size(); ++s) {
            const auto& rows = sections[s].rows;
            for (std::size_t r = 0; r < rows.size(); ++r) {
                index_.emplace(rows[r].id, IndexPath{s, r});
            }
        }
        index_valid_ = true;
    }

    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================
// Administrative deletion
// ============================================================

void delete_cache(const std::string& name, const std::shared_ptr<CacheStorage>& storage)
{
    if (CacheRegistry::instance().in_use(name)) {
        throw PreconditionViolation("cannot delete cache '" + name + "' while a controller uses it");
    }
    (storage ? storage : default_storage())->remove(name);
    detail::log_info("LayoutCache", "deleted cache '" + name + "'");
}

void delete_all_caches(const std::shared_ptr<CacheStorage>& storage)
{
    if (CacheRegistry::instance().any_in_use()) {
        throw PreconditionViolation("cannot delete all caches while a controller uses one");
    }
    (storage ? storage : default_storage())->remove_all();
}

bool is_cache_in_use(const std::string& name)
{
    return CacheRegistry::instance().in_use(name);
}

} // namespace fetched_results

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file cache_storage.h
/// @brief Keyed byte storage behind layout caches.
///
/// CacheStorage is the durability capability a LayoutCache needs: one record
/// per cache name, written atomically, removable by name or all at once.
///
/// - FileCacheStorage: one file per name in a directory. Writes go to a
///   temporary file that is renamed over the record, so a reader sees either
///   the previous or the new record, never a partial one. Reads map the file
///   with Boost.Interprocess.
/// - MemoryCacheStorage: same contract, lives as long as the object.
///
/// The cache directory used by default_storage() is, in order of priority:
/// set_cache_directory(), the FETCHED_RESULTS_CACHE_DIR environment variable,
/// or <system temp dir>/fetched_results.

#pragma once

#include <fetched_results/api.h>
#include <fetched_results/layout_codec.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetched_results {

class FETCHED_RESULTS_API CacheStorage {
public:
    virtual ~CacheStorage() = default;

    /// nullopt when no record exists. @throws CacheIOError
    [[nodiscard]] virtual std::optional<ByteBuffer> read(const std::string& name) = 0;

    /// All-or-nothing replace. @throws CacheIOError
    virtual void write(const std::string& name, const ByteBuffer& data) = 0;

    /// Idempotent. @throws CacheIOError
    virtual void remove(const std::string& name) = 0;

    /// Idempotent. @throws CacheIOError
    virtual void remove_all() = 0;

    [[nodiscard]] virtual std::vector<std::string> names() const = 0;
};

class FETCHED_RESULTS_API MemoryCacheStorage : public CacheStorage {
public:
    [[nodiscard]] std::optional<ByteBuffer> read(const std::string& name) override;
    void write(const std::string& name, const ByteBuffer& data) override;
    void remove(const std::string& name) override;
    void remove_all() override;
    [[nodiscard]] std::vector<std::string> names() const override;

private:
    std::unordered_map<std::string, ByteBuffer> records_;
};

class FETCHED_RESULTS_API FileCacheStorage : public CacheStorage {
public:
    explicit FileCacheStorage(std::filesystem::path directory);

    [[nodiscard]] std::optional<ByteBuffer> read(const std::string& name) override;
    void write(const std::string& name, const ByteBuffer& data) override;
    void remove(const std::string& name) override;
    void remove_all() override;
    [[nodiscard]] std::vector<std::string> names() const override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    /// File holding the record for name. Characters outside [A-Za-z0-9._-]
    /// are percent-encoded so every name maps to a distinct file.
    [[nodiscard]] std::filesystem::path path_for(const std::string& name) const;

    static constexpr const char* FILE_EXTENSION = ".frcache";

private:
    std::filesystem::path directory_;
};

/// Directory used for persistent caches
[[nodiscard]] FETCHED_RESULTS_API std::filesystem::path cache_directory();

/// Override the cache directory. Controllers created afterwards use it.
FETCHED_RESULTS_API void set_cache_directory(std::filesystem::path directory);

/// Storage for named caches (a FileCacheStorage over cache_directory())
[[nodiscard]] FETCHED_RESULTS_API std::shared_ptr<CacheStorage> default_storage();

} // namespace fetched_results

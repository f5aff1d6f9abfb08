// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/fetched_results_config.h>
#include <fetched_results/cache_storage.h>
#include <fetched_results/error.h>
#include <fetched_results/log.h>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fetched_results {

namespace bip = boost::interprocess;

// ============================================================
// MemoryCacheStorage
// ============================================================

std::optional<ByteBuffer> MemoryCacheStorage::read(const std::string& name)
{
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCacheStorage::write(const std::string& name, const ByteBuffer& data)
{
    records_[name] = data;
}

void MemoryCacheStorage::remove(const std::string& name)
{
    records_.erase(name);
}

void MemoryCacheStorage::remove_all()
{
    records_.clear();
}

std::vector<std::string> MemoryCacheStorage::names() const
{
    std::vector<std::string> result;
    result.reserve(records_.size());
    for (const auto& [name, data] : records_) {
        result.push_back(name);
    }
    return result;
}

// ============================================================
// FileCacheStorage
// ============================================================

namespace {

bool is_plain(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

std::string encode_name(const std::string& name)
{
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (is_plain(c)) {
            out.push_back(c);
        } else {
            const auto byte = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(HEX[byte >> 4]);
            out.push_back(HEX[byte & 0x0F]);
        }
    }
    return out;
}

int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

/// Inverse of encode_name; nullopt for a stem encode_name cannot produce
std::optional<std::string> decode_name(const std::string& file_stem)
{
    std::string out;
    out.reserve(file_stem.size());
    for (std::size_t i = 0; i < file_stem.size(); ++i) {
        if (file_stem[i] != '%') {
            out.push_back(file_stem[i]);
            continue;
        }
        if (i + 2 >= file_stem.size()) {
            return std::nullopt;
        }
        const int high = hex_digit(file_stem[i + 1]);
        const int low = hex_digit(file_stem[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

} // anonymous namespace

FileCacheStorage::FileCacheStorage(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

std::filesystem::path FileCacheStorage::path_for(const std::string& name) const
{
    return directory_ / (encode_name(name) + FILE_EXTENSION);
}

std::optional<ByteBuffer> FileCacheStorage::read(const std::string& name)
{
    const auto path = path_for(name);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw CacheIOError("cannot stat cache file '" + path.string() + "': " + ec.message());
        }
        return std::nullopt;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw CacheIOError("cannot stat cache file '" + path.string() + "': " + ec.message());
    }
    if (size == 0) {
        // An empty region cannot be mapped; let the decoder reject it
        return ByteBuffer{};
    }

    try {
        bip::file_mapping mapping(path.string().c_str(), bip::read_only);
        bip::mapped_region region(mapping, bip::read_only);

        const auto* begin = static_cast<const std::uint8_t*>(region.get_address());
        return ByteBuffer(begin, begin + region.get_size());
    } catch (const bip::interprocess_exception& e) {
        throw CacheIOError("cannot map cache file '" + path.string() + "': " + e.what());
    }
}

void FileCacheStorage::write(const std::string& name, const ByteBuffer& data)
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw CacheIOError("cannot create cache directory '" + directory_.string() + "': " + ec.message());
    }

    const auto path = path_for(name);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CacheIOError("cannot open '" + temp_path.string() + "' for writing");
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(temp_path, ec);
            throw CacheIOError("cannot write '" + temp_path.string() + "'");
        }
    }

    // rename() replaces the destination atomically
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw CacheIOError("cannot replace cache file '" + path.string() + "': " + ec.message());
    }
}

void FileCacheStorage::remove(const std::string& name)
{
    const auto path = path_for(name);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw CacheIOError("cannot delete cache file '" + path.string() + "': " + ec.message());
    }
}

void FileCacheStorage::remove_all()
{
    for (const auto& name : names()) {
        remove(name);
    }
}

std::vector<std::string> FileCacheStorage::names() const
{
    std::vector<std::string> result;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return result;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        const auto& path = entry.path();
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && path.extension() == FILE_EXTENSION) {
            if (auto name = decode_name(path.stem().string())) {
                result.push_back(std::move(*name));
            } else {
                detail::log_warning("FileCacheStorage", "skipping foreign file '" + path.filename().string() + "'");
            }
        }
    }
    if (ec) {
        detail::log_warning("FileCacheStorage", "cannot list '" + directory_.string() + "': " + ec.message());
    }
    return result;
}

// ============================================================
// Default storage
// ============================================================

namespace {

struct DefaultStorageState {
    std::mutex mutex;
    std::optional<std::filesystem::path> directory_override;
    std::shared_ptr<CacheStorage> storage;
};

DefaultStorageState& default_state()
{
    static DefaultStorageState state;
    return state;
}

std::filesystem::path cache_directory_locked(const DefaultStorageState& state)
{
    if (state.directory_override) {
        return *state.directory_override;
    }
    if (const char* env = std::getenv("FETCHED_RESULTS_CACHE_DIR"); env && *env) {
        return std::filesystem::path{env};
    }

    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        detail::log_warning("cache_directory", "no temp directory, using the working directory: " + ec.message());
        temp = std::filesystem::current_path();
    }
    return temp / "fetched_results";
}

} // anonymous namespace

std::filesystem::path cache_directory()
{
    auto& state = default_state();
    std::lock_guard lock(state.mutex);
    return cache_directory_locked(state);
}

void set_cache_directory(std::filesystem::path directory)
{
    auto& state = default_state();
    std::lock_guard lock(state.mutex);
    state.directory_override = std::move(directory);
    state.storage.reset();
}

std::shared_ptr<CacheStorage> default_storage()
{
    auto& state = default_state();
    std::lock_guard lock(state.mutex);
    if (!state.storage) {
        state.storage = std::make_shared<FileCacheStorage>(cache_directory_locked(state));
    }
    return state.storage;
}

} // namespace fetched_results

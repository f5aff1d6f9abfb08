// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file layout_codec.h
/// @brief Binary encoding of cache records.
///
/// Record layout (all integers little-endian):
///
///   u32  magic 'FRLC'
///   u16  format version (1)
///   str  configuration signature
///   u32  section count
///   per section:
///     u8   has name, str name (if has name)
///     u32  row count
///     per row:
///       str  id
///       u8   has section key, str section key (if present)
///       u32  sort value count, values
///       u32  tracked value count, values
///
/// str = u32 length + UTF-8 bytes. Value type tags (1 byte):
///   0x00 = null, 0x01 = bool (1 byte), 0x02 = int64 (8 bytes),
///   0x03 = double (8 bytes, IEEE 754), 0x04 = string

#pragma once

#include <fetched_results/api.h>
#include <fetched_results/layout.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fetched_results {

using ByteBuffer = std::vector<std::uint8_t>;

struct CacheRecord {
    std::string signature;
    Layout layout;
};

[[nodiscard]] FETCHED_RESULTS_API ByteBuffer encode_record(const CacheRecord& record);

/// @throws CacheIOError on a truncated, corrupted or unknown-version record
[[nodiscard]] FETCHED_RESULTS_API CacheRecord decode_record(const std::uint8_t* data, std::size_t size);
[[nodiscard]] FETCHED_RESULTS_API CacheRecord decode_record(const ByteBuffer& buffer);

} // namespace fetched_results

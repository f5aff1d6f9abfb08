// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/layout_codec.h>
#include <fetched_results/error.h>

#include <immer/flex_vector_transient.hpp>

#include <cstring>

namespace fetched_results {

namespace {

constexpr std::uint32_t RECORD_MAGIC = 0x434C5246; // "FRLC"
constexpr std::uint16_t RECORD_VERSION = 1;

enum class TypeTag : std::uint8_t {
    Null   = 0x00,
    Bool   = 0x01,
    Int64  = 0x02,
    Double = 0x03,
    String = 0x04,
};

// memcpy-based writes; the format is little-endian, as is every supported target
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(std::uint8_t v) {
        buffer.push_back(v);
    }

    template <typename T>
    void write_raw(T v) {
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + sizeof(v));
        std::memcpy(buffer.data() + old_size, &v, sizeof(v));
    }

    void write_u16(std::uint16_t v) { write_raw(v); }
    void write_u32(std::uint32_t v) { write_raw(v); }
    void write_i64(std::int64_t v) { write_raw(v); }
    void write_f64(double v) { write_raw(v); }

    void write_string(const std::string& s) {
        write_u32(static_cast<std::uint32_t>(s.size()));
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + s.size());
        std::memcpy(buffer.data() + old_size, s.data(), s.size());
    }

    void write_optional_string(const std::optional<std::string>& s) {
        write_u8(s ? 1 : 0);
        if (s) {
            write_string(*s);
        }
    }
};

class ByteReader {
public:
    const std::uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;

    ByteReader(const std::uint8_t* d, std::size_t s) : data(d), size(s) {}

    [[nodiscard]] bool has_bytes(std::size_t n) const {
        return pos + n <= size;
    }

    std::uint8_t read_u8() {
        if (!has_bytes(1)) throw CacheIOError("cache record: unexpected end of buffer");
        return data[pos++];
    }

    template <typename T>
    T read_raw() {
        if (!has_bytes(sizeof(T))) throw CacheIOError("cache record: unexpected end of buffer");
        T v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    std::uint16_t read_u16() { return read_raw<std::uint16_t>(); }
    std::uint32_t read_u32() { return read_raw<std::uint32_t>(); }
    std::int64_t read_i64() { return read_raw<std::int64_t>(); }
    double read_f64() { return read_raw<double>(); }

    std::string read_string() {
        std::uint32_t len = read_u32();
        if (!has_bytes(len)) throw CacheIOError("cache record: unexpected end of buffer");
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }

    std::optional<std::string> read_optional_string() {
        if (read_u8() == 0) {
            return std::nullopt;
        }
        return read_string();
    }

    /// Guards reserve() against counts a corrupted record could claim
    std::uint32_t read_count(std::size_t min_element_size) {
        std::uint32_t count = read_u32();
        if (!has_bytes(static_cast<std::size_t>(count) * min_element_size)) {
            throw CacheIOError("cache record: element count exceeds record size");
        }
        return count;
    }
};

void write_value(ByteWriter& w, const FieldValue& value)
{
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            w.write_u8(static_cast<std::uint8_t>(TypeTag::Null));
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_u8(static_cast<std::uint8_t>(TypeTag::Bool));
            w.write_u8(arg ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            w.write_u8(static_cast<std::uint8_t>(TypeTag::Int64));
            w.write_i64(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_u8(static_cast<std::uint8_t>(TypeTag::Double));
            w.write_f64(arg);
        } else {
            w.write_u8(static_cast<std::uint8_t>(TypeTag::String));
            w.write_string(arg);
        }
    }, value.data);
}

FieldValue read_value(ByteReader& r)
{
    const auto tag = static_cast<TypeTag>(r.read_u8());
    switch (tag) {
        case TypeTag::Null:   return FieldValue{};
        case TypeTag::Bool:   return FieldValue{r.read_u8() != 0};
        case TypeTag::Int64:  return FieldValue{r.read_i64()};
        case TypeTag::Double: return FieldValue{r.read_f64()};
        case TypeTag::String: return FieldValue{r.read_string()};
    }
    throw CacheIOError("cache record: unknown value tag " + std::to_string(static_cast<int>(tag)));
}

void write_values(ByteWriter& w, const std::vector<FieldValue>& values)
{
    w.write_u32(static_cast<std::uint32_t>(values.size()));
    for (const auto& value : values) {
        write_value(w, value);
    }
}

std::vector<FieldValue> read_values(ByteReader& r)
{
    const std::uint32_t count = r.read_count(1);
    std::vector<FieldValue> values;
    values.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        values.push_back(read_value(r));
    }
    return values;
}

} // anonymous namespace

ByteBuffer encode_record(const CacheRecord& record)
{
    ByteWriter w;
    w.write_u32(RECORD_MAGIC);
    w.write_u16(RECORD_VERSION);
    w.write_string(record.signature);

    w.write_u32(static_cast<std::uint32_t>(record.layout.sections.size()));
    for (const auto& section : record.layout.sections) {
        w.write_optional_string(section.name);
        w.write_u32(static_cast<std::uint32_t>(section.rows.size()));
        for (const auto& row : section.rows) {
            w.write_string(row.id);
            w.write_optional_string(row.section_key);
            write_values(w, row.sort_values);
            write_values(w, row.tracked_values);
        }
    }
    return std::move(w.buffer);
}

CacheRecord decode_record(const std::uint8_t* data, std::size_t size)
{
    ByteReader r{data, size};

    if (r.read_u32() != RECORD_MAGIC) {
        throw CacheIOError("cache record: bad magic");
    }
    const std::uint16_t version = r.read_u16();
    if (version != RECORD_VERSION) {
        throw CacheIOError("cache record: unsupported version " + std::to_string(version));
    }

    CacheRecord record;
    record.signature = r.read_string();

    auto sections = immer::flex_vector_transient<Section>{};
    const std::uint32_t section_count = r.read_count(5);
    for (std::uint32_t s = 0; s < section_count; ++s) {
        Section section;
        section.name = r.read_optional_string();

        auto rows = immer::flex_vector_transient<RowIdentity>{};
        const std::uint32_t row_count = r.read_count(13);
        for (std::uint32_t i = 0; i < row_count; ++i) {
            RowIdentity row;
            row.id = r.read_string();
            row.section_key = r.read_optional_string();
            row.sort_values = read_values(r);
            row.tracked_values = read_values(r);
            rows.push_back(std::move(row));
        }
        section.rows = rows.persistent();
        sections.push_back(std::move(section));
    }
    record.layout.sections = sections.persistent();

    if (r.pos != r.size) {
        throw CacheIOError("cache record: trailing bytes");
    }
    return record;
}

CacheRecord decode_record(const ByteBuffer& buffer)
{
    return decode_record(buffer.data(), buffer.size());
}

} // namespace fetched_results

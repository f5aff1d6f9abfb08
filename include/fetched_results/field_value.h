// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_value.h
/// @brief FieldValue - the comparable value of one object attribute.
///
/// A FieldValue holds one of: null, bool, int64, double, string.
/// Values form a total order used for sorting and grouping:
///
///   null < bool < number < string
///
/// int64 and double are both "number" and compare numerically, so
/// FieldValue{1} == FieldValue{1.0}.

#pragma once

#include <fetched_results/api.h>

#include <compare>
#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace fetched_results {

struct FETCHED_RESULTS_API FieldValue {
    using DataType = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    DataType data;

    FieldValue() = default;
    FieldValue(bool v) : data(v) {}
    FieldValue(double v) : data(v) {}
    FieldValue(const char* v) : data(std::string{v}) {}
    FieldValue(std::string v) : data(std::move(v)) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    FieldValue(T v) : data(static_cast<std::int64_t>(v)) {}

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_number() const noexcept {
        return std::holds_alternative<std::int64_t>(data) || std::holds_alternative<double>(data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    /// Numeric view of an int64 or double, 0.0 otherwise
    [[nodiscard]] double as_number() const noexcept;

    /// Text used for section titles: null is "", bools are "true"/"false".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::weak_ordering operator<=>(const FieldValue& other) const noexcept;
    [[nodiscard]] bool operator==(const FieldValue& other) const noexcept {
        return (*this <=> other) == std::weak_ordering::equivalent;
    }
};

} // namespace fetched_results

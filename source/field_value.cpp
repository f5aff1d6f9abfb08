// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/field_value.h>

#include <sstream>

namespace fetched_results {

namespace {

// Ordering rank of the variant alternatives; int64 and double share a rank.
int type_rank(const FieldValue::DataType& data) noexcept
{
    switch (data.index()) {
        case 0: return 0;          // null
        case 1: return 1;          // bool
        case 2: case 3: return 2;  // number
        default: return 3;         // string
    }
}

} // anonymous namespace

double FieldValue::as_number() const noexcept
{
    if (auto* i = std::get_if<std::int64_t>(&data)) {
        return static_cast<double>(*i);
    }
    if (auto* d = std::get_if<double>(&data)) {
        return *d;
    }
    return 0.0;
}

std::string FieldValue::to_string() const
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else {
            return arg;
        }
    }, data);
}

std::weak_ordering FieldValue::operator<=>(const FieldValue& other) const noexcept
{
    const int lhs_rank = type_rank(data);
    const int rhs_rank = type_rank(other.data);
    if (lhs_rank != rhs_rank) {
        return lhs_rank <=> rhs_rank;
    }

    switch (lhs_rank) {
        case 0:
            return std::weak_ordering::equivalent;
        case 1: {
            const bool a = std::get<bool>(data);
            const bool b = std::get<bool>(other.data);
            return a <=> b;
        }
        case 2: {
            // Exact comparison when both sides are integers
            auto* ai = std::get_if<std::int64_t>(&data);
            auto* bi = std::get_if<std::int64_t>(&other.data);
            if (ai && bi) {
                return *ai <=> *bi;
            }
            const double a = as_number();
            const double b = other.as_number();
            if (a < b) return std::weak_ordering::less;
            if (a > b) return std::weak_ordering::greater;
            return std::weak_ordering::equivalent;
        }
        default: {
            const int c = std::get<std::string>(data).compare(std::get<std::string>(other.data));
            if (c < 0) return std::weak_ordering::less;
            if (c > 0) return std::weak_ordering::greater;
            return std::weak_ordering::equivalent;
        }
    }
}

} // namespace fetched_results

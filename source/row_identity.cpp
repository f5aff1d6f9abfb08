// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/row_identity.h>
#include <fetched_results/error.h>

#include <sstream>

namespace fetched_results {

const FieldValue& RawObject::field(const std::string& key_path) const
{
    static const FieldValue null_value{};
    if (auto* found = fields_.find(key_path)) {
        return *found;
    }
    return null_value;
}

RawObject RawObject::set(const std::string& key_path, FieldValue value) const
{
    return RawObject{entity_, primary_key_, fields_.set(key_path, std::move(value))};
}

RowIdentity make_row_identity(const RawObject& object,
                              const FetchRequest& request,
                              const std::optional<std::string>& section_key_path)
{
    RowIdentity row;
    row.id = object.primary_key();

    if (section_key_path) {
        row.section_key = object.field(*section_key_path).to_string();
    }

    row.sort_values.reserve(request.sort_descriptors.size());
    for (const auto& descriptor : request.sort_descriptors) {
        row.sort_values.push_back(object.field(descriptor.key_path));
    }

    row.tracked_values.reserve(request.tracked_key_paths.size());
    for (const auto& key_path : request.tracked_key_paths) {
        row.tracked_values.push_back(object.field(key_path));
    }

    return row;
}

std::weak_ordering compare_objects(const RawObject& a, const RawObject& b,
                                   const std::vector<SortDescriptor>& descriptors)
{
    for (const auto& descriptor : descriptors) {
        auto order = a.field(descriptor.key_path) <=> b.field(descriptor.key_path);
        if (order != std::weak_ordering::equivalent) {
            if (descriptor.ascending) {
                return order;
            }
            return order == std::weak_ordering::less ? std::weak_ordering::greater : std::weak_ordering::less;
        }
    }
    return std::weak_ordering::equivalent;
}

void validate_configuration(const FetchRequest& request, const std::optional<std::string>& section_key_path)
{
    if (request.entity_name.empty()) {
        throw ConfigurationError("fetch request has no entity name");
    }
    if (request.sort_descriptors.empty()) {
        throw ConfigurationError("fetch request for '" + request.entity_name + "' has no sort descriptors");
    }
    for (const auto& descriptor : request.sort_descriptors) {
        if (descriptor.key_path.empty()) {
            throw ConfigurationError("sort descriptor with an empty key path");
        }
    }
    for (const auto& key_path : request.tracked_key_paths) {
        if (key_path.empty()) {
            throw ConfigurationError("tracked key path is empty");
        }
    }
    if (section_key_path) {
        if (section_key_path->empty()) {
            throw ConfigurationError("section key path is empty");
        }
        // Sections must come out of the fetch contiguous and ordered
        if (request.sort_descriptors.front().key_path != *section_key_path) {
            throw ConfigurationError("section key path '" + *section_key_path +
                                     "' must match the first sort descriptor '" +
                                     request.sort_descriptors.front().key_path + "'");
        }
    }
}

std::string configuration_signature(const FetchRequest& request,
                                    const std::optional<std::string>& section_key_path)
{
    std::ostringstream oss;
    oss << request.entity_name << '|' << request.predicate_format << '|';
    for (const auto& descriptor : request.sort_descriptors) {
        oss << (descriptor.ascending ? '+' : '-') << descriptor.key_path << ',';
    }
    oss << '|';
    if (section_key_path) {
        oss << '#' << *section_key_path;
    }
    oss << '|';
    for (const auto& key_path : request.tracked_key_paths) {
        oss << key_path << ',';
    }
    return oss.str();
}

} // namespace fetched_results

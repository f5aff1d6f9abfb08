// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <fetched_results/query_engine.h>

#include <algorithm>

namespace fetched_results {

bool ChangeBatch::touches(const std::string& entity) const
{
    auto of_entity = [&entity](const RawObject& object) { return object.entity() == entity; };
    return std::any_of(added.begin(), added.end(), of_entity) ||
           std::any_of(removed.begin(), removed.end(), of_entity) ||
           std::any_of(modified.begin(), modified.end(), of_entity);
}

} // namespace fetched_results

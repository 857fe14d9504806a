/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/types/parameters.hpp>

#include <algorithm>

namespace raggedform::types {

namespace {

// Every non-null entry of `one` must be present and equal in `two`
bool is_subset_of(const Parameters& one, const Parameters& two) {
    return std::all_of(one.begin(), one.end(), [&two](const auto& entry) {
        return entry.second.is_null() || parameter(two, entry.first) == entry.second;
    });
}

} // namespace

bool parameters_are_empty(const Parameters& parameters) {
    return std::all_of(parameters.begin(), parameters.end(), [](const auto& entry) {
        return entry.second.is_null();
    });
}

bool parameters_are_equal(const Parameters& one, const Parameters& two) {
    return is_subset_of(one, two) && is_subset_of(two, one);
}

bool type_parameters_equal(const Parameters& one, const Parameters& two) {
    return std::all_of(TYPE_PARAMETERS.begin(), TYPE_PARAMETERS.end(), [&](std::string_view key) {
        return parameter(one, key) == parameter(two, key);
    });
}

Parameters parameters_union(const Parameters& one, const Parameters& two) {
    Parameters out = normalize_parameters(one);
    for (const auto& [key, value] : two) {
        if (value.is_null())
            continue;

        if (auto it = out.find(key); it != out.end())
            it->second = value;
        else
            out.emplace(key, Json(value));
    }
    return out;
}

const Json& parameter(const Parameters& parameters, std::string_view key) {
    static const Json null_value{};
    auto it = std::find_if(parameters.begin(), parameters.end(), [key](const auto& entry) {
        return entry.first == key;
    });
    return it == parameters.end() ? null_value : it->second;
}

Parameters normalize_parameters(const Parameters& parameters) {
    Parameters out;
    for (const auto& [key, value] : parameters) {
        if (!value.is_null())
            out.emplace(key, Json(value));
    }
    return out;
}

} // namespace raggedform::types

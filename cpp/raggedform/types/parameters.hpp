/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <string_view>

namespace raggedform::types {

using Json = nlohmann::ordered_json;

/// Semantic hints attached to forms and types. A key whose value is null is the same as an absent key.
using Parameters = Json::object_t;

// Keys that take part in type equality even when general parameters are ignored
inline constexpr std::array<std::string_view, 4> TYPE_PARAMETERS{
    "__array__",
    "__list__",
    "__record__",
    "__categorical__"
};

bool parameters_are_empty(const Parameters& parameters);

/// Exact comparison of two parameter maps, ignoring key order and null-valued keys
bool parameters_are_equal(const Parameters& one, const Parameters& two);

/// Compares only the keys in TYPE_PARAMETERS
bool type_parameters_equal(const Parameters& one, const Parameters& two);

/// Keys of `two` override those of `one`; the result keeps the insertion order of `one` first
Parameters parameters_union(const Parameters& one, const Parameters& two);

/// Returns the value stored under `key`, or null if it is absent
const Json& parameter(const Parameters& parameters, std::string_view key);

/// Drops null-valued keys
Parameters normalize_parameters(const Parameters& parameters);

} // namespace raggedform::types

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace raggedform {

/// Parameters from a JSON object literal, e.g. make_parameters(R"({"__array__": "string"})")
inline types::Parameters make_parameters(std::string_view json) {
    return types::Json::parse(json).get_ref<const types::Json::object_t&>();
}

inline FormMeta with_parameters(std::string_view json) {
    return FormMeta{make_parameters(json), std::nullopt};
}

inline FormMeta with_form_key(std::string form_key) {
    return FormMeta{{}, std::move(form_key)};
}

} // namespace raggedform

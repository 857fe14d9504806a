/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace raggedform {

/*
 * Serializes a Form to its JSON-compatible description. With `verbose` every node carries its parameters
 * and form_key; without it they only appear when set, and plain nested NumpyForms shrink to their
 * primitive string.
 */
Json to_dict(const Form& form, bool verbose = true);

/// `indent` < 0 gives the compact single-line encoding
std::string to_json(const Form& form, int indent = -1);

/*
 * Reads the output of to_dict, as well as the older spellings: width-suffixed class tags such as
 * "ListOffsetArray64" and records whose contents are a name->form mapping or a bare list.
 */
FormPtr from_dict(const Json& input);

FormPtr from_json(std::string_view input);

/// Human-readable non-verbose rendering, indented by the Form.StrIndent config
std::string to_str(const Form& form);

} // namespace raggedform

namespace fmt {

template<>
struct formatter<raggedform::Form> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const raggedform::Form& form, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", raggedform::to_json(form));
    }
};

} // namespace fmt

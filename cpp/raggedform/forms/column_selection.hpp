/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raggedform {

/*
 * Expands `{a,b}` alternation groups into every combination of literal alternatives, e.g. "x.{a,b}"
 * becomes "x.a" and "x.b". Nested groups are expanded innermost first and textually identical results are
 * only returned once, in order of first appearance.
 */
std::vector<std::string> expand_braces(std::string_view text);

/*
 * Dotted paths to every leaf (NumpyForm or EmptyForm) of the tree, in depth-first order. When
 * `list_indicator` is given, each list dimension crossed on the way adds that token as a path segment.
 */
std::vector<std::string> columns(
    const Form& form,
    const std::optional<std::string>& list_indicator = std::nullopt,
    const std::vector<std::string>& column_prefix = {});

/// The Type of each leaf, in the same order as columns()
std::vector<types::TypePtr> column_types(const Form& form);

/*
 * Restricts the tree to the record fields matched by the specifiers. Each specifier is a dotted path
 * whose segments are case-sensitive glob patterns matched against field names at successive record
 * levels; a path that runs out of segments keeps everything below it, so "" keeps the whole tree.
 * With `prune_unions_and_records` the result is passed through prune_columns.
 */
FormPtr select_columns(
    const FormPtr& form,
    const std::vector<std::string>& specifiers,
    bool expand_braces = true,
    bool prune_unions_and_records = true);

FormPtr select_columns(
    const FormPtr& form,
    const std::string& specifier,
    bool expand_braces = true,
    bool prune_unions_and_records = true);

/*
 * Drops records and unions left without any leaf. Inside a record or union, an emptied record and an
 * emptied union are removed from their parent, signalled by a nullptr return; at the top, an emptied
 * record is kept as an empty record and an emptied union becomes an EmptyForm. Wrappers disappear with
 * their content. A union left with one branch is replaced by that branch.
 */
FormPtr prune_columns(const FormPtr& form, bool is_inside_record_or_union = false);

} // namespace raggedform

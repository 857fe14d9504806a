/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

namespace raggedform {

/*
 * Canonicalising alternatives to the make_* constructors. Each one checks, in order:
 *   1. a union content absorbs the wrapper, which is distributed over the union's branches
 *   2. an option or indexed content is merged with the wrapper into a single IndexedOptionForm
 *   3. otherwise the requested form is built as is
 * The form_key is only kept in case 3.
 */

FormPtr simplified_indexed(IndexType index, FormPtr content, FormMeta meta = {});

FormPtr simplified_indexed_option(IndexType index, FormPtr content, FormMeta meta = {});

FormPtr simplified_byte_masked(IndexType mask, FormPtr content, bool valid_when, FormMeta meta = {});

FormPtr simplified_bit_masked(IndexType mask, FormPtr content, bool valid_when, bool lsb_order, FormMeta meta = {});

FormPtr simplified_unmasked(FormPtr content, FormMeta meta = {});

/*
 * Branches that are unions are spliced in, EmptyForm branches are dropped when anything else remains and
 * branches with identical types are kept once. A single surviving branch is returned in place of the
 * union and no branches at all give an EmptyForm.
 */
FormPtr simplified_union(IndexType tags, IndexType index, std::vector<FormPtr> contents, FormMeta meta = {});

/// Wraps every non-option branch of `union_form` in an IndexedOptionForm of the given index type
FormPtr union_of_optionarrays(const Form& union_form, IndexType index, const Parameters& parameters);

/// Rebuilds the whole tree bottom-up through the simplified constructors
FormPtr simplify(const FormPtr& form);

} // namespace raggedform

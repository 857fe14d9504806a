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
 * Restores a Form of the given kind from a saved object state.
 *
 * A mapping is the verbose dictionary written by to_dict. A list is the positional layout of the 1.x
 * format, which always starts with (has_identities, parameters, form_key) followed by the variant's own
 * fields, e.g. (has_identities, parameters, form_key, mask, content, valid_when) for a ByteMaskedForm.
 * Children inside a positional state are given as dictionaries. Keys read from 1.x states are prefixed
 * with "part0-" because those states only describe the first partition.
 */
FormPtr from_state(FormKind kind, const Json& state);

} // namespace raggedform

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>
#include <raggedform/types/type.hpp>

namespace raggedform {

/*
 * Lifts a Type into a Form, choosing one physical encoding per node: i64 offsets for lists, i64 index for
 * options and i8 tags with i64 index for unions.
 */
FormPtr from_type(const types::Type& type);

types::ArrayType array_type(const Form& form, ShapeItem length);

} // namespace raggedform

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/ostream.h>
#include <raggedform/forms/form_serialization.hpp>
#include <raggedform/types/type.hpp>

#define MAKE_GTEST_FMT(our_type, fstr)                                                                                 \
    namespace testing::internal {                                                                                      \
    inline void PrintTo(const our_type& val, ::std::ostream* os) { fmt::print(*os, fstr, val); }                       \
    }

MAKE_GTEST_FMT(raggedform::Form, "{}")
MAKE_GTEST_FMT(raggedform::types::Type, "{}")
MAKE_GTEST_FMT(raggedform::types::ArrayType, "{}")
MAKE_GTEST_FMT(raggedform::types::Primitive, "{}")

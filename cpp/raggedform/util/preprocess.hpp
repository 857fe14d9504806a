/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#ifndef _WIN32
#define RAGGEDFORM_UNREACHABLE __builtin_unreachable();

#define RAGGEDFORM_LIKELY(condition) __builtin_expect(condition, 1)
#define RAGGEDFORM_UNLIKELY(condition) __builtin_expect(condition, 0)

#else
#define RAGGEDFORM_UNREACHABLE __assume(0);

#define RAGGEDFORM_LIKELY
#define RAGGEDFORM_UNLIKELY
#endif

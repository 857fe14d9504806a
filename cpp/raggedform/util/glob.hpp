/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fnmatch.h>

#include <string>

namespace raggedform::util {

/*
 * Shell-style, case-sensitive match of a whole name against `*`, `?`, `[seq]` and `[!seq]`. Backslashes
 * and path separators have no special meaning.
 */
inline bool glob_match_case(const std::string& name, const std::string& pattern) {
    return fnmatch(pattern.c_str(), name.c_str(), FNM_NOESCAPE) == 0;
}

inline bool has_glob_characters(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

} // namespace raggedform::util

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <variant>

namespace raggedform::util {

/*
 * Marks a field of a copy request that should keep its current value. Nullable fields are spelled
 * MaybeUnset<std::optional<T>> so that "keep" (Unset) and "clear" (std::nullopt) stay distinct.
 */
struct Unset {
    bool operator==(const Unset&) const = default;
};

inline constexpr Unset UNSET{};

template<typename T>
using MaybeUnset = std::variant<Unset, T>;

template<typename T>
[[nodiscard]] bool is_set(const MaybeUnset<T>& update) {
    return !std::holds_alternative<Unset>(update);
}

template<typename T>
[[nodiscard]] T resolve(const MaybeUnset<T>& update, const T& current) {
    if (const auto* value = std::get_if<T>(&update))
        return *value;

    return current;
}

} // namespace raggedform::util

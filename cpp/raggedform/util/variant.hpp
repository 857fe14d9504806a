/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <variant>
#include <type_traits>

namespace raggedform::util {

template<class... Ts>
struct overload : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overload(Ts...) -> overload<Ts...>;

template<class Variant, class... Ts>
auto variant_match(Variant&& v, Ts&&... ts) {
    return std::visit(overload{std::forward<Ts>(ts)...}, std::forward<Variant>(v));
}

// Lets a static_assert in an `if constexpr` chain fire only on the branch that is instantiated
template<class>
inline constexpr bool always_false = false;

} // namespace raggedform::util

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/log/log.hpp>
#include <raggedform/util/error_code.hpp>
#include <raggedform/util/preprocess.hpp>

#include <fmt/compile.h>

namespace raggedform {

namespace util::detail {

template<ErrorCode code, ErrorCategory error_category>
struct Raise {
    static_assert(get_error_category(code) == error_category);

    template<typename...Args>
    [[noreturn]] void operator()(fmt::format_string<Args...> format, Args&&...args) const {
        std::string combo_format = fmt::format(FMT_COMPILE("{} {}"), error_code_data<code>.name_, static_cast<fmt::string_view>(format));
        std::string msg = fmt::format(fmt::runtime(combo_format), std::forward<Args>(args)...);
        if constexpr(error_category == ErrorCategory::INTERNAL)
            log::root().error(msg);
        throw_error<code>(msg);
    }
};

template<ErrorCode code, ErrorCategory error_category>
struct Check {
    static constexpr Raise<code, error_category> raise{};

    template<typename...Args>
    void operator()(bool cond, fmt::format_string<Args...> format, Args&&...args) const {
        if (RAGGEDFORM_UNLIKELY(!cond)) {
            raise(format, std::forward<Args>(args)...);
        }
    }
};
} // namespace util::detail

namespace internal {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::INTERNAL>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace missing_data {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::MISSING_DATA>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace schema {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::SCHEMA>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace user_input {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::USER_INPUT>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace compatibility {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::COMPATIBILITY>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace util {

constexpr auto check = util::detail::Check<ErrorCode::E_ASSERTION_FAILURE, ErrorCategory::INTERNAL>{};

constexpr auto check_arg = util::detail::Check<ErrorCode::E_INVALID_ARGUMENT, ErrorCategory::INTERNAL>{};

constexpr auto raise_rte = check.raise;

} // namespace util

} // namespace raggedform

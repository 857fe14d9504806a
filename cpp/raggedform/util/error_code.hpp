/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace raggedform {

namespace detail {
using BaseType = std::uint32_t;
constexpr BaseType error_category_scale = 1000u;
}

enum class ErrorCategory : detail::BaseType {
    INTERNAL = 1,
    /// Lookups of record fields or positions that do not exist
    MISSING_DATA = 3,
    /// Payloads that cannot be read as a Form at all
    SCHEMA = 4,
    USER_INPUT = 7,
    /// Legacy serializations that are recognised but refused
    COMPATIBILITY = 8,
};

inline std::unordered_map<ErrorCategory, const char*> get_error_category_names() {
    return {
        {ErrorCategory::INTERNAL, "INTERNAL"},
        {ErrorCategory::MISSING_DATA, "MISSING_DATA"},
        {ErrorCategory::SCHEMA, "SCHEMA"},
        {ErrorCategory::USER_INPUT, "USER_INPUT"},
        {ErrorCategory::COMPATIBILITY, "COMPATIBILITY"},
    };
}

// A macro that will be expanded in different ways by redefining ERROR_CODE():
#define RAGGEDFORM_ERROR_CODES \
    ERROR_CODE(1000, E_INVALID_RANGE) \
    ERROR_CODE(1001, E_INVALID_ARGUMENT) \
    ERROR_CODE(1002, E_ASSERTION_FAILURE) \
    ERROR_CODE(1003, E_RUNTIME_ERROR) \
    ERROR_CODE(3000, E_NO_SUCH_FIELD) \
    ERROR_CODE(3001, E_FIELD_INDEX_OUT_OF_RANGE) \
    ERROR_CODE(4000, E_UNRECOGNISED_FORM_CLASS) \
    ERROR_CODE(4001, E_MALFORMED_FORM_DICT) \
    ERROR_CODE(4002, E_INVALID_JSON) \
    ERROR_CODE(7000, E_INVALID_USER_ARGUMENT) \
    ERROR_CODE(7001, E_INVALID_FIELD_TYPE) \
    ERROR_CODE(7002, E_INVALID_FIELD_VALUE) \
    ERROR_CODE(7003, E_INVALID_COLUMN_SPECIFIER) \
    ERROR_CODE(8000, E_UNSUPPORTED_LEGACY_FORMAT) \
    ERROR_CODE(8001, E_UNRECOGNISED_LEGACY_STATE)

enum class ErrorCode : detail::BaseType {
#define ERROR_CODE(code, Name, ...) Name = code,
    RAGGEDFORM_ERROR_CODES
#undef ERROR_CODE
};

struct ErrorCodeData {
    std::string_view name_;
    std::string_view as_string_;
};

template<ErrorCode code>
inline constexpr ErrorCodeData error_code_data{};

#define ERROR_CODE(code, Name, ...) template<> inline constexpr ErrorCodeData error_code_data<ErrorCode::Name> \
    { #Name, "E" #code };
RAGGEDFORM_ERROR_CODES
#undef ERROR_CODE

inline std::vector<ErrorCode> get_error_codes() {
    static std::vector<ErrorCode> error_codes{
#define ERROR_CODE(code, Name) ErrorCode::Name,
        RAGGEDFORM_ERROR_CODES
#undef ERROR_CODE
    };
    return error_codes;
}

ErrorCodeData get_error_code_data(ErrorCode code);

constexpr ErrorCategory get_error_category(ErrorCode code) {
    return static_cast<ErrorCategory>(static_cast<detail::BaseType>(code) / detail::error_category_scale);
}

struct RaggedFormException : public std::runtime_error {
    explicit RaggedFormException(const std::string& msg_with_error_code):
            std::runtime_error(msg_with_error_code) {
    }
};

template<ErrorCategory error_category>
struct RaggedFormCategorizedException : public RaggedFormException {
    using RaggedFormException::RaggedFormException;
};

using InternalException = RaggedFormCategorizedException<ErrorCategory::INTERNAL>;
using MissingDataException = RaggedFormCategorizedException<ErrorCategory::MISSING_DATA>;
using SchemaException = RaggedFormCategorizedException<ErrorCategory::SCHEMA>;
using UserInputException = RaggedFormCategorizedException<ErrorCategory::USER_INPUT>;
using CompatibilityException = RaggedFormCategorizedException<ErrorCategory::COMPATIBILITY>;

template<ErrorCode error_code>
[[noreturn]] void throw_error(const std::string& msg) {
    throw RaggedFormCategorizedException<get_error_category(error_code)>(msg);
}

} // namespace raggedform

namespace fmt {
template<>
struct formatter<raggedform::ErrorCode> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(raggedform::ErrorCode code, FormatContext &ctx) const {
        std::string_view str = raggedform::get_error_code_data(code).as_string_;
        return std::copy(str.begin(), str.end(), ctx.out());
    }
};
}

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/forms/form.hpp>

#include <fmt/format.h>

namespace raggedform {

/// Variable-length UTF-8 text: i64 offsets over `char` bytes, tagged `__array__: string`
FormPtr string_form();

/// Variable-length raw bytes: i64 offsets over `byte` bytes, tagged `__array__: bytestring`
FormPtr bytestring_form();

enum class HostScalar : uint8_t {
    BOOL,
    INTEGER,
    REAL,
    COMPLEX,
    STRING,
    BYTES
};

/*
 * The element Form a single host value is promoted to when it is wrapped into a length-one array:
 * integers widen to int64, reals to float64 and complex numbers to complex128.
 */
FormPtr form_for_host_scalar(HostScalar scalar);

/// Scalars that already carry a dtype keep it
FormPtr form_for_host_scalar(Primitive primitive);

} // namespace raggedform

namespace fmt {

template<>
struct formatter<raggedform::HostScalar> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(raggedform::HostScalar scalar, FormatContext& ctx) const {
        using raggedform::HostScalar;
        switch (scalar) {
            case HostScalar::BOOL: return fmt::format_to(ctx.out(), "bool");
            case HostScalar::INTEGER: return fmt::format_to(ctx.out(), "integer");
            case HostScalar::REAL: return fmt::format_to(ctx.out(), "real");
            case HostScalar::COMPLEX: return fmt::format_to(ctx.out(), "complex");
            case HostScalar::STRING: return fmt::format_to(ctx.out(), "string");
            case HostScalar::BYTES: return fmt::format_to(ctx.out(), "bytes");
            default: return fmt::format_to(ctx.out(), "unknown");
        }
    }
};

} // namespace fmt

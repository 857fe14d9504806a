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
#include <optional>
#include <string>
#include <string_view>

namespace raggedform::types {

// Beware, the order of the enum values is the order used when rendering the list of valid primitives in errors
enum class PrimitiveKind : uint8_t {
    BOOL,
    INT8,
    UINT8,
    INT16,
    UINT16,
    INT32,
    UINT32,
    INT64,
    UINT64,
    FLOAT16,
    FLOAT32,
    FLOAT64,
    FLOAT128,
    COMPLEX64,
    COMPLEX128,
    COMPLEX256,
    DATETIME64,
    TIMEDELTA64,
    COUNT // Not a real primitive, used to iterate over the enum
};

enum class TimeUnit : uint8_t {
    YEAR,
    MONTH,
    WEEK,
    DAY,
    HOUR,
    MINUTE,
    SECOND,
    MILLISECOND,
    MICROSECOND,
    NANOSECOND,
    PICOSECOND,
    FEMTOSECOND,
    ATTOSECOND
};

constexpr bool is_time_kind(PrimitiveKind kind) {
    return kind == PrimitiveKind::DATETIME64 || kind == PrimitiveKind::TIMEDELTA64;
}

constexpr bool is_complex_kind(PrimitiveKind kind) {
    return kind >= PrimitiveKind::COMPLEX64 && kind <= PrimitiveKind::COMPLEX256;
}

/*
 * The dtype of a leaf node. Only datetime64 and timedelta64 carry a unit, which may be scaled by a step
 * (`datetime64[10s]`). A time kind without a unit is the generic `datetime64`.
 */
struct Primitive {
    PrimitiveKind kind_ = PrimitiveKind::BOOL;
    std::optional<TimeUnit> unit_;
    uint32_t unit_step_ = 1;

    Primitive() = default;

    Primitive(PrimitiveKind kind) :
        kind_(kind) {
    }

    Primitive(PrimitiveKind kind, TimeUnit unit, uint32_t unit_step = 1);

    bool operator==(const Primitive& other) const = default;
};

/// Parses a NumPy spelling such as `int64`, `float32` or `datetime64[ms]`
Primitive parse_primitive(std::string_view str);

std::string primitive_to_str(const Primitive& primitive);

std::size_t primitive_itemsize(const Primitive& primitive);

std::string_view time_unit_to_str(TimeUnit unit);

/*
 * Reads the struct-module style format strings found in buffer-protocol descriptions (`q`, `<d`, `Zf`,
 * `M8[ms]`). The itemsize disambiguates `l`/`L`, whose width is platform dependent.
 */
Primitive primitive_from_buffer_format(std::string_view format, std::size_t itemsize);

// Physical dtypes of the auxiliary index arrays owned by composite forms
enum class IndexType : uint8_t {
    I8,
    U8,
    I32,
    U32,
    I64
};

std::string_view index_type_to_str(IndexType index_type);

std::optional<IndexType> index_type_from_str(std::string_view str);

PrimitiveKind index_to_dtype(IndexType index_type);

std::size_t index_itemsize(IndexType index_type);

/// A length that may be unknown, as for RegularForm sizes and ArrayType lengths
using ShapeItem = std::optional<uint64_t>;

inline constexpr ShapeItem unknown_length = std::nullopt;

} // namespace raggedform::types

namespace fmt {

template<>
struct formatter<raggedform::types::Primitive> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const raggedform::types::Primitive& primitive, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", raggedform::types::primitive_to_str(primitive));
    }
};

template<>
struct formatter<raggedform::types::IndexType> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(raggedform::types::IndexType index_type, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", raggedform::types::index_type_to_str(index_type));
    }
};

} // namespace fmt

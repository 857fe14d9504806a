/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/types/primitive.hpp>
#include <raggedform/util/preconditions.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/ranges.h>

#include <array>
#include <charconv>
#include <vector>

namespace raggedform::types {

namespace {

constexpr std::array<std::string_view, static_cast<size_t>(PrimitiveKind::COUNT)> primitive_names{
    "bool",
    "int8",
    "uint8",
    "int16",
    "uint16",
    "int32",
    "uint32",
    "int64",
    "uint64",
    "float16",
    "float32",
    "float64",
    "float128",
    "complex64",
    "complex128",
    "complex256",
    "datetime64",
    "timedelta64"
};

constexpr std::array<std::size_t, static_cast<size_t>(PrimitiveKind::COUNT)> primitive_itemsizes{
    1, 1, 1, 2, 2, 4, 4, 8, 8, 2, 4, 8, 16, 8, 16, 32, 8, 8
};

constexpr std::array<std::string_view, 13> time_unit_names{
    "Y", "M", "W", "D", "h", "m", "s", "ms", "us", "ns", "ps", "fs", "as"
};

std::optional<TimeUnit> time_unit_from_str(std::string_view str) {
    for (size_t i = 0; i < time_unit_names.size(); ++i) {
        if (time_unit_names[i] == str)
            return static_cast<TimeUnit>(i);
    }
    return std::nullopt;
}

std::optional<PrimitiveKind> primitive_kind_from_str(std::string_view str) {
    for (size_t i = 0; i < primitive_names.size(); ++i) {
        if (primitive_names[i] == str)
            return static_cast<PrimitiveKind>(i);
    }
    return std::nullopt;
}

[[noreturn]] void raise_invalid_primitive(std::string_view str) {
    user_input::raise<ErrorCode::E_INVALID_FIELD_VALUE>(
        "NumpyForm 'primitive' must be one of {}, optionally with a [unit] for the time types, not '{}'",
        primitive_names, str);
}

// Parses the `[10s]` suffix of a time primitive, returns false if it is malformed
bool parse_time_suffix(std::string_view suffix, TimeUnit& unit, uint32_t& step) {
    if (suffix.size() < 3 || suffix.front() != '[' || suffix.back() != ']')
        return false;

    suffix = suffix.substr(1, suffix.size() - 2);
    size_t digits = 0;
    while (digits < suffix.size() && suffix[digits] >= '0' && suffix[digits] <= '9')
        ++digits;

    step = 1;
    if (digits > 0) {
        auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + digits, step);
        if (ec != std::errc() || step == 0)
            return false;
    }

    auto maybe_unit = time_unit_from_str(suffix.substr(digits));
    if (!maybe_unit)
        return false;

    unit = *maybe_unit;
    return true;
}

} // namespace

Primitive::Primitive(PrimitiveKind kind, TimeUnit unit, uint32_t unit_step) :
    kind_(kind),
    unit_(unit),
    unit_step_(unit_step) {
    util::check_arg(is_time_kind(kind), "Only datetime64 and timedelta64 carry a unit, got {}", primitive_names[static_cast<size_t>(kind)]);
    util::check_arg(unit_step > 0, "Time unit step must be positive");
}

Primitive parse_primitive(std::string_view str) {
    if (auto kind = primitive_kind_from_str(str))
        return {*kind};

    for (auto kind : {PrimitiveKind::DATETIME64, PrimitiveKind::TIMEDELTA64}) {
        const auto name = primitive_names[static_cast<size_t>(kind)];
        if (boost::algorithm::starts_with(str, name)) {
            TimeUnit unit;
            uint32_t step;
            if (parse_time_suffix(str.substr(name.size()), unit, step))
                return {kind, unit, step};
        }
    }
    raise_invalid_primitive(str);
}

std::string primitive_to_str(const Primitive& primitive) {
    const auto name = primitive_names[static_cast<size_t>(primitive.kind_)];
    if (!primitive.unit_)
        return std::string{name};

    const auto unit = time_unit_to_str(*primitive.unit_);
    if (primitive.unit_step_ == 1)
        return fmt::format("{}[{}]", name, unit);

    return fmt::format("{}[{}{}]", name, primitive.unit_step_, unit);
}

std::size_t primitive_itemsize(const Primitive& primitive) {
    return primitive_itemsizes[static_cast<size_t>(primitive.kind_)];
}

std::string_view time_unit_to_str(TimeUnit unit) {
    return time_unit_names[static_cast<size_t>(unit)];
}

Primitive primitive_from_buffer_format(std::string_view format, std::size_t itemsize) {
    const auto original = format;
    if (!format.empty() && std::string_view{"<>=!@|"}.find(format.front()) != std::string_view::npos)
        format.remove_prefix(1);

    if (format.size() == 1) {
        switch (format.front()) {
            case '?': return PrimitiveKind::BOOL;
            case 'b': return PrimitiveKind::INT8;
            case 'B': return PrimitiveKind::UINT8;
            case 'h': return PrimitiveKind::INT16;
            case 'H': return PrimitiveKind::UINT16;
            case 'i': return PrimitiveKind::INT32;
            case 'I': return PrimitiveKind::UINT32;
            case 'l': return itemsize == 4 ? PrimitiveKind::INT32 : PrimitiveKind::INT64;
            case 'L': return itemsize == 4 ? PrimitiveKind::UINT32 : PrimitiveKind::UINT64;
            case 'q': return PrimitiveKind::INT64;
            case 'Q': return PrimitiveKind::UINT64;
            case 'e': return PrimitiveKind::FLOAT16;
            case 'f': return PrimitiveKind::FLOAT32;
            case 'd': return PrimitiveKind::FLOAT64;
            case 'g': return PrimitiveKind::FLOAT128;
            default: break;
        }
    } else if (format == "Zf") {
        return PrimitiveKind::COMPLEX64;
    } else if (format == "Zd") {
        return PrimitiveKind::COMPLEX128;
    } else if (format == "Zg") {
        return PrimitiveKind::COMPLEX256;
    } else if (format.size() >= 2 && format[1] == '8' && (format[0] == 'M' || format[0] == 'm')) {
        const auto kind = format[0] == 'M' ? PrimitiveKind::DATETIME64 : PrimitiveKind::TIMEDELTA64;
        if (format.size() == 2)
            return kind;

        TimeUnit unit;
        uint32_t step;
        if (parse_time_suffix(format.substr(2), unit, step))
            return {kind, unit, step};
    }
    compatibility::raise<ErrorCode::E_UNRECOGNISED_LEGACY_STATE>(
        "Buffer format '{}' with itemsize {} does not describe a supported primitive", original, itemsize);
}

std::string_view index_type_to_str(IndexType index_type) {
    switch (index_type) {
        case IndexType::I8: return "i8";
        case IndexType::U8: return "u8";
        case IndexType::I32: return "i32";
        case IndexType::U32: return "u32";
        case IndexType::I64: return "i64";
    }
    RAGGEDFORM_UNREACHABLE
}

std::optional<IndexType> index_type_from_str(std::string_view str) {
    for (auto index_type : {IndexType::I8, IndexType::U8, IndexType::I32, IndexType::U32, IndexType::I64}) {
        if (index_type_to_str(index_type) == str)
            return index_type;
    }
    return std::nullopt;
}

PrimitiveKind index_to_dtype(IndexType index_type) {
    switch (index_type) {
        case IndexType::I8: return PrimitiveKind::INT8;
        case IndexType::U8: return PrimitiveKind::UINT8;
        case IndexType::I32: return PrimitiveKind::INT32;
        case IndexType::U32: return PrimitiveKind::UINT32;
        case IndexType::I64: return PrimitiveKind::INT64;
    }
    RAGGEDFORM_UNREACHABLE
}

std::size_t index_itemsize(IndexType index_type) {
    return primitive_itemsize(index_to_dtype(index_type));
}

} // namespace raggedform::types

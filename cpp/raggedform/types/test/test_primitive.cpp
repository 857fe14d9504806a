/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/types/primitive.hpp>
#include <raggedform/util/error_code.hpp>
#include <raggedform/util/test/gtest_custom_formatters.hpp>

using namespace raggedform::types;

TEST(Primitive, ParseAndFormat) {
    for (auto name : {"bool", "int8", "uint16", "int64", "float16", "float128", "complex256", "datetime64", "timedelta64"})
        ASSERT_EQ(primitive_to_str(parse_primitive(name)), name);

    const auto seconds = parse_primitive("datetime64[s]");
    ASSERT_EQ(seconds.kind_, PrimitiveKind::DATETIME64);
    ASSERT_EQ(seconds.unit_, TimeUnit::SECOND);
    ASSERT_EQ(primitive_to_str(seconds), "datetime64[s]");

    const auto stepped = parse_primitive("timedelta64[10ms]");
    ASSERT_EQ(stepped.unit_step_, 10u);
    ASSERT_EQ(fmt::format("{}", stepped), "timedelta64[10ms]");
}

TEST(Primitive, RejectsUnknownNames) {
    ASSERT_THROW(parse_primitive("int128"), raggedform::UserInputException);
    ASSERT_THROW(parse_primitive("datetime64[parsec]"), raggedform::UserInputException);
    ASSERT_THROW(parse_primitive("int64[s]"), raggedform::UserInputException);
    ASSERT_THROW(parse_primitive("datetime64[0s]"), raggedform::UserInputException);
    ASSERT_THROW(Primitive(PrimitiveKind::INT64, TimeUnit::SECOND), raggedform::InternalException);
}

TEST(Primitive, ItemSizes) {
    ASSERT_EQ(primitive_itemsize(PrimitiveKind::BOOL), 1u);
    ASSERT_EQ(primitive_itemsize(PrimitiveKind::FLOAT16), 2u);
    ASSERT_EQ(primitive_itemsize(PrimitiveKind::COMPLEX128), 16u);
    ASSERT_EQ(primitive_itemsize(parse_primitive("datetime64[ns]")), 8u);
}

TEST(Primitive, BufferFormats) {
    ASSERT_EQ(primitive_from_buffer_format("?", 1), Primitive{PrimitiveKind::BOOL});
    ASSERT_EQ(primitive_from_buffer_format("<q", 8), Primitive{PrimitiveKind::INT64});
    ASSERT_EQ(primitive_from_buffer_format("l", 4), Primitive{PrimitiveKind::INT32});
    ASSERT_EQ(primitive_from_buffer_format("l", 8), Primitive{PrimitiveKind::INT64});
    ASSERT_EQ(primitive_from_buffer_format("=L", 8), Primitive{PrimitiveKind::UINT64});
    ASSERT_EQ(primitive_from_buffer_format("Zd", 16), Primitive{PrimitiveKind::COMPLEX128});
    ASSERT_EQ(primitive_from_buffer_format("e", 2), Primitive{PrimitiveKind::FLOAT16});
    ASSERT_EQ(primitive_from_buffer_format("M8[us]", 8), (Primitive{PrimitiveKind::DATETIME64, TimeUnit::MICROSECOND}));
    ASSERT_EQ(primitive_from_buffer_format("m8", 8), Primitive{PrimitiveKind::TIMEDELTA64});
    ASSERT_THROW(primitive_from_buffer_format("x", 1), raggedform::CompatibilityException);
    ASSERT_THROW(primitive_from_buffer_format("M8[lightyear]", 8), raggedform::CompatibilityException);
}

TEST(IndexType, Names) {
    for (auto index_type : {IndexType::I8, IndexType::U8, IndexType::I32, IndexType::U32, IndexType::I64})
        ASSERT_EQ(index_type_from_str(index_type_to_str(index_type)), index_type);

    ASSERT_FALSE(index_type_from_str("i16").has_value());
    ASSERT_EQ(index_to_dtype(IndexType::U32), PrimitiveKind::UINT32);
    ASSERT_EQ(index_itemsize(IndexType::I64), 8u);
    ASSERT_EQ(fmt::format("{}", IndexType::U8), "u8");
}

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/forms/form_serialization.hpp>
#include <raggedform/forms/form_state.hpp>
#include <raggedform/util/error_code.hpp>
#include <raggedform/util/test/gtest_custom_formatters.hpp>
#include <raggedform/util/test/test_utils.hpp>

using namespace raggedform;

TEST(FormState, CurrentStateIsAFormDict) {
    auto form = make_list_offset_form(IndexType::I32, make_numpy_form("int16"), with_form_key("node0"));
    ASSERT_EQ(*from_state(FormKind::LIST_OFFSET, to_dict(*form)), *form);
    ASSERT_THROW(from_state(FormKind::LIST, to_dict(*form)), CompatibilityException);
}

TEST(FormState, PositionalNumpy) {
    auto state = Json::parse(R"([false, {"unit": "m"}, "k", [3], 8, "<d"])");
    auto form = from_state(FormKind::NUMPY, state);
    auto expected = make_numpy_form("float64", InnerShape{3}, FormMeta{make_parameters(R"({"unit": "m"})"), "part0-k"});
    ASSERT_EQ(*form, *expected);

    auto datetime = from_state(FormKind::NUMPY, Json::parse(R"([false, null, null, [], 8, "M8[ms]"])"));
    ASSERT_EQ(datetime->as<NumpyForm>()->primitive_, types::parse_primitive("datetime64[ms]"));
}

TEST(FormState, PositionalWrappers) {
    auto regular = from_state(FormKind::REGULAR, Json::parse(R"([false, null, null, "bool", 4])"));
    ASSERT_EQ(*regular, *make_regular_form(make_numpy_form("bool"), 4));

    auto list = from_state(FormKind::LIST, Json::parse(R"([false, null, null, "i64", "i64", "int8"])"));
    ASSERT_EQ(*list, *make_list_form(IndexType::I64, IndexType::I64, make_numpy_form("int8")));

    auto bit_masked = from_state(FormKind::BIT_MASKED, Json::parse(R"([false, null, "m", "u8", "int8", false, true])"));
    ASSERT_EQ(*bit_masked, *make_bit_masked_form(IndexType::U8, make_numpy_form("int8"), false, true, with_form_key("part0-m")));

    auto unmasked = from_state(FormKind::UNMASKED, Json::parse(R"([false, null, null, "int8"])"));
    ASSERT_EQ(unmasked->kind(), FormKind::UNMASKED);

    auto empty = from_state(FormKind::EMPTY, Json::parse(R"([false, null, null])"));
    ASSERT_EQ(empty->kind(), FormKind::EMPTY);
}

TEST(FormState, PositionalRecordsAndUnions) {
    auto record = from_state(FormKind::RECORD, Json::parse(R"([false, null, null, ["a", "b"], ["int64", "float64"]])"));
    ASSERT_EQ(record->fields(), (std::vector<std::string>{"a", "b"}));

    auto tuple = from_state(FormKind::RECORD, Json::parse(R"([false, null, null, null, ["int64"]])"));
    ASSERT_TRUE(tuple->is_tuple());

    auto union_form = from_state(FormKind::UNION, Json::parse(R"([false, null, null, "i8", "i64", ["int64", "bool"]])"));
    ASSERT_EQ(union_form->contents().size(), 2u);
}

TEST(FormState, RejectsMalformedStates) {
    ASSERT_THROW(from_state(FormKind::REGULAR, Json::parse(R"([false, null, null, "bool"])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::REGULAR, Json::parse(R"([false, null, null, "bool", -2])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::LIST_OFFSET, Json::parse(R"([false, null, null, "i128", "bool"])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::EMPTY, Json::parse(R"([false, 7, null])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::EMPTY, Json::parse(R"([false, null, 7])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::NUMPY, Json::parse(R"([false, null, null, [], 8, "x"])")), CompatibilityException);
    ASSERT_THROW(from_state(FormKind::EMPTY, Json::parse("3")), CompatibilityException);
}

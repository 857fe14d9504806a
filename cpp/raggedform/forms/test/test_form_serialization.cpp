/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/forms/builtin_forms.hpp>
#include <raggedform/forms/form_serialization.hpp>
#include <raggedform/util/configs_map.hpp>
#include <raggedform/util/error_code.hpp>
#include <raggedform/util/test/gtest_custom_formatters.hpp>
#include <raggedform/util/test/test_utils.hpp>

using namespace raggedform;

namespace {

FormPtr nested_example() {
    auto point = make_record_form(
        {make_numpy_form("float64", {}, with_form_key("x")), make_numpy_form("float64")},
        std::vector<std::string>{"x", "y"},
        with_parameters(R"({"__record__": "Point"})"));
    auto tuple = make_record_form({make_numpy_form("int32"), make_empty_form()}, std::nullopt);
    auto union_form = make_union_form(IndexType::I8, IndexType::I32, {point, tuple});
    return make_list_offset_form(
        IndexType::I64,
        make_bit_masked_form(
            IndexType::U8,
            make_regular_form(union_form, types::unknown_length),
            true,
            false),
        with_form_key("top"));
}

} // namespace

TEST(FormSerialization, VerboseNumpy) {
    auto form = make_numpy_form("int64");
    ASSERT_EQ(
        to_json(*form),
        R"({"class":"NumpyArray","primitive":"int64","inner_shape":[],"parameters":{},"form_key":null})");
}

TEST(FormSerialization, TerseNumpyChildBecomesString) {
    auto form = make_list_offset_form(IndexType::I64, make_numpy_form("int64"));
    ASSERT_EQ(to_dict(*form, false).dump(), R"({"class":"ListOffsetArray","offsets":"i64","content":"int64"})");

    auto top = make_numpy_form("int64");
    ASSERT_EQ(to_dict(*top, false).dump(), R"({"class":"NumpyArray","primitive":"int64"})");

    auto shaped = make_list_offset_form(IndexType::I64, make_numpy_form("int64", InnerShape{3}));
    ASSERT_EQ(
        to_dict(*shaped, false).dump(),
        R"({"class":"ListOffsetArray","offsets":"i64","content":{"class":"NumpyArray","primitive":"int64","inner_shape":[3]}})");
}

TEST(FormSerialization, RoundTripsNestedTree) {
    auto form = nested_example();
    ASSERT_EQ(*from_json(to_json(*form)), *form);
    ASSERT_EQ(*from_json(to_json(*form, 2)), *form);
    ASSERT_EQ(*from_dict(to_dict(*form, false)), *form);
    ASSERT_EQ(*from_dict(to_dict(*string_form(), false)), *string_form());
}

TEST(FormSerialization, UnknownRegularSizeIsNull) {
    auto form = make_regular_form(make_numpy_form("int8"), types::unknown_length);
    ASSERT_TRUE(to_dict(*form)["size"].is_null());
    ASSERT_FALSE(from_dict(to_dict(*form))->as<RegularForm>()->size_.has_value());
}

TEST(FormSerialization, ShortNumpyStrings) {
    ASSERT_EQ(*from_json(R"("float32")"), *make_numpy_form("float32"));
    ASSERT_EQ(*from_json(R"({"class": "RegularArray", "size": 2, "content": "bool"})"),
              *make_regular_form(make_numpy_form("bool"), 2));
    ASSERT_THROW(from_json(R"("float31")"), UserInputException);
}

TEST(FormSerialization, LegacyClassAliases) {
    auto list = from_json(R"({"class": "ListOffsetArray64", "offsets": "i64", "content": "int64"})");
    ASSERT_EQ(list->kind(), FormKind::LIST_OFFSET);

    auto indexed = from_json(R"({"class": "IndexedOptionArray32", "index": "i32", "content": "int64"})");
    ASSERT_EQ(indexed->kind(), FormKind::INDEXED_OPTION);

    auto union_form = from_json(R"({"class": "UnionArray8_U32", "tags": "i8", "index": "u32", "contents": ["int64", "bool"]})");
    ASSERT_EQ(union_form->kind(), FormKind::UNION);
    ASSERT_EQ(to_dict(*union_form)["class"], "UnionArray");
}

TEST(FormSerialization, LegacyRecordLayouts) {
    auto mapping = from_json(R"({"class": "RecordArray", "contents": {"b": "int64", "a": "float64"}})");
    ASSERT_EQ(mapping->fields(), (std::vector<std::string>{"b", "a"}));
    ASSERT_EQ(*mapping->content("a"), *make_numpy_form("float64"));

    auto tuple = from_json(R"({"class": "RecordArray", "contents": ["int64", "float64"]})");
    ASSERT_TRUE(tuple->is_tuple());

    auto explicit_tuple = from_json(R"({"class": "RecordArray", "fields": null, "contents": ["int64"]})");
    ASSERT_TRUE(explicit_tuple->is_tuple());

    ASSERT_THROW(
        from_json(R"({"class": "RecordArray", "fields": ["a"], "contents": {"a": "int64"}})"),
        UserInputException);
}

TEST(FormSerialization, MetadataIsRead) {
    auto form = from_json(R"({"class": "EmptyArray", "parameters": {"note": [1, 2]}, "form_key": "e0"})");
    ASSERT_EQ(form->form_key(), "e0");
    ASSERT_EQ(form->parameter("note"), Json::parse("[1, 2]"));

    auto nulls = from_json(R"({"class": "EmptyArray", "parameters": null, "form_key": null})");
    ASSERT_TRUE(nulls->parameters().empty());
    ASSERT_FALSE(nulls->form_key().has_value());
}

TEST(FormSerialization, RejectsBadInput) {
    ASSERT_THROW(from_json("{not json"), SchemaException);
    ASSERT_THROW(from_json("[1, 2]"), SchemaException);
    ASSERT_THROW(from_json(R"({"primitive": "int64"})"), SchemaException);
    ASSERT_THROW(from_json(R"({"class": "FancyArray"})"), SchemaException);
    ASSERT_THROW(from_json(R"({"class": "ListOffsetArray", "offsets": "i64"})"), SchemaException);
    ASSERT_THROW(from_json(R"({"class": "VirtualArray", "form": "int64"})"), CompatibilityException);

    ASSERT_THROW(from_json(R"({"class": "ListOffsetArray", "offsets": 64, "content": "int64"})"), UserInputException);
    ASSERT_THROW(from_json(R"({"class": "ListOffsetArray", "offsets": "i16", "content": "int64"})"), UserInputException);
    ASSERT_THROW(from_json(R"({"class": "RegularArray", "size": -1, "content": "int64"})"), UserInputException);
    ASSERT_THROW(from_json(R"({"class": "ByteMaskedArray", "mask": "i8", "valid_when": 1, "content": "int64"})"), UserInputException);
    ASSERT_THROW(from_json(R"({"class": "EmptyArray", "parameters": [1]})"), UserInputException);
    ASSERT_THROW(from_json(R"({"class": "EmptyArray", "form_key": 3})"), UserInputException);
}

TEST(FormSerialization, UnrecognisedClassMessage) {
    try {
        from_json(R"({"class": "FancyArray"})");
        FAIL() << "expected an unrecognised class";
    } catch (const SchemaException& e) {
        ASSERT_STREQ(e.what(), "E_UNRECOGNISED_FORM_CLASS input class: 'FancyArray' was not recognised");
    }
}

TEST(FormSerialization, StrUsesConfiguredIndent) {
    auto form = make_list_offset_form(IndexType::I64, make_numpy_form("int64"));
    {
        ScopedConfig indent("Form.StrIndent", 1);
        ASSERT_EQ(to_str(*form), "{\n \"class\": \"ListOffsetArray\",\n \"offsets\": \"i64\",\n \"content\": \"int64\"\n}");
    }
    ASSERT_EQ(to_str(*form), to_dict(*form, false).dump(4));
    ASSERT_EQ(fmt::format("{}", *form), to_json(*form));
}

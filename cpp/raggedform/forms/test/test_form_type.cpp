/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/forms/builtin_forms.hpp>
#include <raggedform/forms/form_type.hpp>
#include <raggedform/util/test/gtest_custom_formatters.hpp>
#include <raggedform/util/test/test_utils.hpp>

using namespace raggedform;

TEST(FormType, Leaves) {
    ASSERT_EQ(make_numpy_form("int64")->type()->to_str(), "int64");
    ASSERT_EQ(make_empty_form()->type()->to_str(), "unknown");
    ASSERT_EQ(make_numpy_form("float32", InnerShape{2, 3})->type()->to_str(), "2 * 3 * float32");
}

TEST(FormType, InnerShapeParametersGoOutermost) {
    auto form = make_numpy_form("float32", InnerShape{2}, with_parameters(R"({"unit": "m"})"));
    auto type = form->type();
    ASSERT_EQ(type->parameter("unit"), "m");
    ASSERT_TRUE(type->as<types::RegularType>()->content_->parameters().empty());
}

TEST(FormType, ListsAndOptions) {
    auto list = make_list_offset_form(IndexType::I64, make_numpy_form("int64"));
    ASSERT_EQ(list->type()->to_str(), "var * int64");
    ASSERT_EQ(make_list_form(IndexType::I32, IndexType::I32, make_numpy_form("int64"))->type()->to_str(), "var * int64");
    ASSERT_EQ(make_regular_form(make_numpy_form("int64"), 3)->type()->to_str(), "3 * int64");
    ASSERT_EQ(make_unmasked_form(list)->type()->to_str(), "option[var * int64]");
    ASSERT_EQ(make_byte_masked_form(IndexType::I8, make_numpy_form("int64"), true)->type()->to_str(), "?int64");
}

TEST(FormType, IndexedIsTransparent) {
    auto indexed = make_indexed_form(IndexType::I64, make_numpy_form("int64"), with_parameters(R"({"__array__": "categorical"})"));
    ASSERT_EQ(*indexed->type(), *types::make_numpy_type(types::PrimitiveKind::INT64, make_parameters(R"({"__array__": "categorical"})")));
}

TEST(FormType, NestedOptionsFlatten) {
    auto form = make_unmasked_form(make_indexed_option_form(IndexType::I64, make_numpy_form("int64")));
    ASSERT_EQ(form->type()->to_str(), "?int64");
}

TEST(FormType, RecordsAndStrings) {
    auto record = make_record_form(
        {make_numpy_form("int64"), string_form()},
        std::vector<std::string>{"id", "name"});
    ASSERT_EQ(record->type()->to_str(), "{id: int64, name: string}");
}

TEST(FormType, FromTypeUsesCanonicalLayouts) {
    auto type = types::make_option_type(types::make_list_type(types::make_numpy_type(types::PrimitiveKind::FLOAT64)));
    auto form = from_type(*type);
    ASSERT_EQ(form->kind(), FormKind::INDEXED_OPTION);
    ASSERT_EQ(form->as<IndexedOptionForm>()->index_, IndexType::I64);
    ASSERT_EQ(form->content()->kind(), FormKind::LIST_OFFSET);
    ASSERT_EQ(form->content()->as<ListOffsetForm>()->offsets_, IndexType::I64);
    ASSERT_EQ(*form->type(), *type);

    auto union_type = types::make_union_type({types::make_numpy_type(types::PrimitiveKind::INT64), types::make_unknown_type()});
    auto union_form = from_type(*union_type);
    ASSERT_EQ(union_form->as<UnionForm>()->tags_, IndexType::I8);
    ASSERT_EQ(union_form->contents().size(), 2u);
}

TEST(FormType, ArrayType) {
    auto form = string_form();
    ASSERT_EQ(array_type(*form, 1).to_str(), "1 * string");
    ASSERT_EQ(array_type(*form, types::unknown_length).to_str(), "## * string");
}

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/forms/form.hpp>
#include <raggedform/forms/builtin_forms.hpp>
#include <raggedform/util/error_code.hpp>
#include <raggedform/util/test/gtest_custom_formatters.hpp>
#include <raggedform/util/test/test_utils.hpp>

using namespace raggedform;

namespace {

FormPtr int64_form() {
    return make_numpy_form("int64");
}

FormPtr point_record() {
    return make_record_form({int64_form(), make_numpy_form("float64")}, std::vector<std::string>{"x", "y"});
}

} // namespace

TEST(Form, ConstructionValidatesIndexTypes) {
    ASSERT_THROW(make_list_offset_form(IndexType::I8, int64_form()), UserInputException);
    ASSERT_THROW(make_list_form(IndexType::I32, IndexType::I64, int64_form()), UserInputException);
    ASSERT_THROW(make_indexed_option_form(IndexType::U32, int64_form()), UserInputException);
    ASSERT_THROW(make_byte_masked_form(IndexType::U8, int64_form(), true), UserInputException);
    ASSERT_THROW(make_bit_masked_form(IndexType::I8, int64_form(), true, false), UserInputException);
    ASSERT_THROW(make_union_form(IndexType::I32, IndexType::I64, {int64_form()}), UserInputException);
    ASSERT_NO_THROW(make_list_form(IndexType::U32, IndexType::U32, int64_form()));
    ASSERT_NO_THROW(make_indexed_form(IndexType::U32, int64_form()));
}

TEST(Form, ConstructionValidatesContents) {
    ASSERT_THROW(make_regular_form(nullptr, 2), UserInputException);
    ASSERT_THROW(make_record_form({int64_form(), nullptr}, std::nullopt), UserInputException);
    ASSERT_THROW(make_record_form({int64_form()}, std::vector<std::string>{"a", "b"}), UserInputException);
    ASSERT_THROW(make_record_form({int64_form(), int64_form()}, std::vector<std::string>{"a", "a"}), UserInputException);
    ASSERT_THROW(make_numpy_form("int128"), UserInputException);
}

TEST(Form, Classification) {
    auto list = make_list_offset_form(IndexType::I64, int64_form());
    ASSERT_TRUE(list->is_list());
    ASSERT_FALSE(list->is_regular());
    ASSERT_TRUE(make_regular_form(int64_form(), 3)->is_list());
    ASSERT_TRUE(make_unmasked_form(int64_form())->is_option());
    ASSERT_TRUE(make_indexed_option_form(IndexType::I64, int64_form())->is_indexed());
    ASSERT_TRUE(make_indexed_option_form(IndexType::I64, int64_form())->is_option());
    ASSERT_TRUE(make_empty_form()->is_unknown());
    ASSERT_EQ(list->kind(), FormKind::LIST_OFFSET);
    ASSERT_EQ(form_class_name(list->kind()), "ListOffsetArray");
    ASSERT_EQ(form_type_name(list->kind()), "ListOffsetForm");
}

TEST(Form, FieldLookup) {
    auto record = point_record();
    ASSERT_EQ(record->fields(), (std::vector<std::string>{"x", "y"}));
    ASSERT_EQ(record->field_to_index("y"), 1u);
    ASSERT_EQ(record->index_to_field(0), "x");
    ASSERT_TRUE(record->has_field("x"));
    ASSERT_FALSE(record->has_field("z"));
    ASSERT_EQ(*record->content("y"), *make_numpy_form("float64"));
    ASSERT_FALSE(record->is_tuple());

    ASSERT_THROW(record->field_to_index("z"), MissingDataException);
    ASSERT_THROW(record->index_to_field(2), MissingDataException);
    ASSERT_THROW(record->content(size_t{5}), MissingDataException);
    ASSERT_THROW(int64_form()->field_to_index("x"), UserInputException);
    ASSERT_THROW(int64_form()->content(size_t{0}), UserInputException);
}

TEST(Form, MissingFieldMessage) {
    try {
        point_record()->field_to_index("z");
        FAIL() << "expected a lookup failure";
    } catch (const MissingDataException& e) {
        ASSERT_STREQ(e.what(), "E_NO_SUCH_FIELD no field 'z' in record with 2 fields");
    }
}

TEST(Form, TupleFields) {
    auto tuple = make_record_form({int64_form(), int64_form()}, std::nullopt);
    ASSERT_TRUE(tuple->is_tuple());
    ASSERT_EQ(tuple->fields(), (std::vector<std::string>{"0", "1"}));
    ASSERT_EQ(tuple->field_to_index("1"), 1u);
    ASSERT_TRUE(tuple->has_field("0"));
    ASSERT_FALSE(tuple->has_field("2"));
    ASSERT_FALSE(tuple->has_field("01x"));
    ASSERT_THROW(tuple->field_to_index("x"), MissingDataException);
}

TEST(Form, FieldsPassThroughWrappersAndIntersectUnions) {
    auto wrapped = make_list_offset_form(IndexType::I64, make_unmasked_form(point_record()));
    ASSERT_EQ(wrapped->fields(), (std::vector<std::string>{"x", "y"}));

    auto other = make_record_form({int64_form(), int64_form()}, std::vector<std::string>{"y", "z"});
    auto union_form = make_union_form(IndexType::I8, IndexType::I64, {point_record(), other});
    ASSERT_EQ(union_form->fields(), (std::vector<std::string>{"y"}));
    ASSERT_FALSE(union_form->is_tuple());
    ASSERT_TRUE(int64_form()->fields().empty());
}

TEST(Form, Depths) {
    auto nested = make_list_offset_form(IndexType::I64, make_list_form(IndexType::I32, IndexType::I32, int64_form()));
    ASSERT_EQ(nested->purelist_depth(), 3);
    ASSERT_EQ(nested->minmax_depth(), std::make_pair(int64_t{3}, int64_t{3}));
    ASSERT_FALSE(nested->purelist_isregular());

    auto shaped = make_numpy_form("float32", InnerShape{2, 3});
    ASSERT_EQ(shaped->purelist_depth(), 3);
    ASSERT_TRUE(make_regular_form(shaped, 4)->purelist_isregular());

    ASSERT_EQ(string_form()->purelist_depth(), 1);
    ASSERT_EQ(string_form()->minmax_depth(), std::make_pair(int64_t{1}, int64_t{1}));

    auto ragged = make_record_form({int64_form(), nested}, std::vector<std::string>{"a", "b"});
    ASSERT_EQ(ragged->purelist_depth(), 1);
    ASSERT_EQ(ragged->minmax_depth(), std::make_pair(int64_t{1}, int64_t{3}));
    ASSERT_EQ(ragged->branch_depth(), std::make_pair(true, int64_t{1}));
    ASSERT_EQ(point_record()->branch_depth(), std::make_pair(false, int64_t{1}));

    auto mixed = make_union_form(IndexType::I8, IndexType::I64, {int64_form(), nested});
    ASSERT_EQ(mixed->purelist_depth(), -1);
}

TEST(Form, PurelistParameter) {
    auto inner = make_numpy_form("int64", {}, with_parameters(R"({"unit": "m"})"));
    auto list = make_list_offset_form(IndexType::I64, inner);
    ASSERT_EQ(list->purelist_parameter("unit"), "m");
    ASSERT_TRUE(list->purelist_parameter("other").is_null());

    auto disagreeing = make_union_form(IndexType::I8, IndexType::I64, {inner, int64_form()});
    ASSERT_TRUE(disagreeing->purelist_parameter("unit").is_null());
}

TEST(Form, IdentityLike) {
    ASSERT_TRUE(make_empty_form()->is_identity_like());
    ASSERT_TRUE(make_unmasked_form(make_empty_form())->is_identity_like());
    ASSERT_FALSE(make_unmasked_form(int64_form())->is_identity_like());
}

TEST(Form, CopyReplacesOnlyWhatIsGiven) {
    auto list = make_list_offset_form(IndexType::I32, int64_form(), with_form_key("node0"));
    auto copied = list->copy(FormCopy{.offsets_ = IndexType::I64});
    ASSERT_EQ(copied->as<ListOffsetForm>()->offsets_, IndexType::I64);
    ASSERT_EQ(copied->form_key(), "node0");
    ASSERT_EQ(*copied->content(), *int64_form());

    auto cleared = list->copy(FormCopy{.form_key_ = std::optional<std::string>{}});
    ASSERT_FALSE(cleared->form_key().has_value());

    auto record = point_record()->copy(FormCopy{.fields_ = std::optional<std::vector<std::string>>{}});
    ASSERT_TRUE(record->is_tuple());
}

TEST(Form, CopyRejectsForeignFields) {
    ASSERT_THROW(int64_form()->copy(FormCopy{.content_ = int64_form()}), UserInputException);
    ASSERT_THROW(point_record()->copy(FormCopy{.size_ = ShapeItem{3}}), UserInputException);
    ASSERT_THROW(
        make_list_offset_form(IndexType::I64, int64_form())->copy(FormCopy{.offsets_ = IndexType::I8}),
        UserInputException);
}

TEST(Form, EqualityIsStructural) {
    ASSERT_EQ(*point_record(), *point_record());

    auto reordered = make_record_form({make_numpy_form("float64"), int64_form()}, std::vector<std::string>{"y", "x"});
    ASSERT_EQ(*point_record(), *reordered);

    auto keyed = make_numpy_form("int64", {}, with_form_key("k"));
    ASSERT_NE(*int64_form(), *keyed);

    auto noted = make_numpy_form("int64", {}, with_parameters(R"({"note": 1})"));
    auto null_note = make_numpy_form("int64", {}, with_parameters(R"({"note": null})"));
    ASSERT_NE(*int64_form(), *noted);
    ASSERT_EQ(*int64_form(), *null_note);

    auto ab = make_union_form(IndexType::I8, IndexType::I64, {int64_form(), make_numpy_form("float64")});
    auto ba = make_union_form(IndexType::I8, IndexType::I64, {make_numpy_form("float64"), int64_form()});
    ASSERT_NE(*ab, *ba);

    ASSERT_TRUE(forms_equal(nullptr, nullptr));
    ASSERT_FALSE(forms_equal(int64_form(), nullptr));
}

TEST(Form, SetFormKey) {
    auto form = int64_form();
    form->set_form_key("renamed");
    ASSERT_EQ(form->form_key(), "renamed");
    form->set_form_key(std::nullopt);
    ASSERT_FALSE(form->form_key().has_value());
}

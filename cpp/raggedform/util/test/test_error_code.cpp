/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <raggedform/util/preconditions.hpp>

#include <set>

using ErrorCode = raggedform::ErrorCode;

TEST(ErrorCode, DoesThrow) {
    ASSERT_THROW(
            raggedform::schema::raise<ErrorCode::E_UNRECOGNISED_FORM_CLASS>("msg {}", 1),
            raggedform::SchemaException
    );
    ASSERT_THROW(
            raggedform::user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(false, "msg {}", 2),
            raggedform::UserInputException
    );
    ASSERT_NO_THROW(raggedform::user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(true, "msg {}", 3));
}

TEST(ErrorCode, CategoriesAreCatchableAsBase) {
    ASSERT_THROW(
            raggedform::compatibility::raise<ErrorCode::E_UNSUPPORTED_LEGACY_FORMAT>("old"),
            raggedform::RaggedFormException
    );
    ASSERT_THROW(
            raggedform::missing_data::raise<ErrorCode::E_NO_SUCH_FIELD>("gone"),
            std::runtime_error
    );
}

TEST(ErrorCode, MessageIsPrefixedWithName) {
    try {
        raggedform::missing_data::raise<ErrorCode::E_NO_SUCH_FIELD>("no field '{}' in record with {} fields", "z", 2);
        FAIL() << "Expected an exception";
    } catch (const raggedform::MissingDataException& e) {
        ASSERT_STREQ(e.what(), "E_NO_SUCH_FIELD no field 'z' in record with 2 fields");
    }
}

TEST(ErrorCode, InternalChecks) {
    ASSERT_THROW(raggedform::util::check_arg(false, "bad argument {}", 1), raggedform::InternalException);
    ASSERT_THROW(raggedform::util::check(false, "broken"), raggedform::InternalException);
}

TEST(ErrorCode, CodesAreUniqueAndCategorised) {
    std::set<std::string_view> names;
    for (auto code : raggedform::get_error_codes()) {
        const auto data = raggedform::get_error_code_data(code);
        ASSERT_TRUE(names.insert(data.name_).second) << data.name_;
        ASSERT_EQ(fmt::format("{}", code), data.as_string_);
        ASSERT_TRUE(raggedform::get_error_category_names().contains(raggedform::get_error_category(code)));
    }
    ASSERT_EQ(raggedform::get_error_category(ErrorCode::E_INVALID_JSON), raggedform::ErrorCategory::SCHEMA);
    ASSERT_EQ(raggedform::get_error_code_data(ErrorCode::E_INVALID_COLUMN_SPECIFIER).as_string_, "E7003");
}

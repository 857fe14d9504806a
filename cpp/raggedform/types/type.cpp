/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/types/type.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace raggedform::types {

namespace {

void check_content(const TypePtr& content, std::string_view type_name) {
    user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
        static_cast<bool>(content),
        "{} all 'contents' must be Type instances, not null", type_name);
}

bool parameters_match(const Parameters& one, const Parameters& two, bool all_parameters) {
    return all_parameters ? parameters_are_equal(one, two) : type_parameters_equal(one, two);
}

bool contents_equal(const TypePtr& one, const TypePtr& two, bool all_parameters) {
    return one->is_equal_to(*two, all_parameters);
}

bool records_equal(const RecordType& one, const RecordType& two, bool all_parameters) {
    if (one.contents_.size() != two.contents_.size() || one.fields_.has_value() != two.fields_.has_value())
        return false;

    if (!one.fields_) {
        for (size_t i = 0; i < one.contents_.size(); ++i) {
            if (!contents_equal(one.contents_[i], two.contents_[i], all_parameters))
                return false;
        }
        return true;
    }

    for (size_t i = 0; i < one.contents_.size(); ++i) {
        const auto& field = (*one.fields_)[i];
        auto it = std::find(two.fields_->begin(), two.fields_->end(), field);
        if (it == two.fields_->end())
            return false;

        const auto other_index = static_cast<size_t>(std::distance(two.fields_->begin(), it));
        if (!contents_equal(one.contents_[i], two.contents_[other_index], all_parameters))
            return false;
    }
    return true;
}

bool unions_equal(const UnionType& one, const UnionType& two, bool all_parameters) {
    if (one.contents_.size() != two.contents_.size())
        return false;

    std::vector<bool> used(two.contents_.size(), false);
    for (const auto& content : one.contents_) {
        bool found = false;
        for (size_t i = 0; i < two.contents_.size(); ++i) {
            if (!used[i] && contents_equal(content, two.contents_[i], all_parameters)) {
                used[i] = true;
                found = true;
                break;
            }
        }
        if (!found)
            return false;
    }
    return true;
}

bool is_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
        return false;

    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::string field_str(const std::string& name) {
    return is_identifier(name) ? name : Json(name).dump();
}

// Parameters that are not already expressed by the rendering, as a JSON object, or empty
std::string extra_parameters(const Parameters& parameters, std::initializer_list<std::string_view> hidden) {
    Json shown = Json::object();
    for (const auto& [key, value] : parameters) {
        if (value.is_null() || key == "__categorical__")
            continue;

        if (std::find(hidden.begin(), hidden.end(), key) != hidden.end())
            continue;

        shown[key] = value;
    }
    return shown.empty() ? std::string{} : shown.dump();
}

std::string leaf_str(std::string base, const std::string& extra) {
    if (extra.empty())
        return base;

    return fmt::format("{}[parameters={}]", base, extra);
}

std::string wrapper_str(std::string_view name, const std::string& body, const std::string& extra) {
    if (extra.empty())
        return fmt::format("{}[{}]", name, body);

    return fmt::format("{}[{}, parameters={}]", name, body, extra);
}

bool is_string_like_list(const Type& type) {
    const auto& array = type.parameter("__array__");
    return array == "string" || array == "bytestring";
}

std::string render(const Type& type, bool hide_categorical);

std::string render_contents(const std::vector<TypePtr>& contents, const std::optional<std::vector<std::string>>& fields) {
    std::vector<std::string> items;
    for (size_t i = 0; i < contents.size(); ++i) {
        if (fields)
            items.push_back(fmt::format("{}: {}", field_str((*fields)[i]), render(*contents[i], false)));
        else
            items.push_back(render(*contents[i], false));
    }
    return fmt::format("{}", fmt::join(items, ", "));
}

std::string render(const Type& type, bool hide_categorical) {
    if (!hide_categorical && type.parameter("__categorical__") == true)
        return fmt::format("categorical[type={}]", render(type, true));

    const auto& array = type.parameter("__array__");
    return util::variant_match(type.node(),
        [&](const NumpyType& numpy) {
            if (array == "char")
                return leaf_str("char", extra_parameters(type.parameters(), {"__array__"}));
            if (array == "byte")
                return leaf_str("byte", extra_parameters(type.parameters(), {"__array__"}));

            return leaf_str(primitive_to_str(numpy.primitive_), extra_parameters(type.parameters(), {}));
        },
        [&](const UnknownType&) {
            return leaf_str("unknown", extra_parameters(type.parameters(), {}));
        },
        [&](const ListType& list) {
            if (array == "string")
                return leaf_str("string", extra_parameters(type.parameters(), {"__array__"}));
            if (array == "bytestring")
                return leaf_str("bytes", extra_parameters(type.parameters(), {"__array__"}));

            auto body = fmt::format("var * {}", render(*list.content_, false));
            auto extra = extra_parameters(type.parameters(), {});
            return extra.empty() ? body : fmt::format("[{}, parameters={}]", body, extra);
        },
        [&](const RegularType& regular) {
            auto size = regular.size_ ? fmt::format("{}", *regular.size_) : std::string{"##"};
            auto body = fmt::format("{} * {}", size, render(*regular.content_, false));
            auto extra = extra_parameters(type.parameters(), {});
            return extra.empty() ? body : fmt::format("[{}, parameters={}]", body, extra);
        },
        [&](const OptionType& option) {
            const auto& content = *option.content_;
            auto body = render(content, false);
            auto extra = extra_parameters(type.parameters(), {});
            const bool list_like = (content.is<ListType>() || content.is<RegularType>()) && !is_string_like_list(content);
            if (extra.empty() && !list_like)
                return fmt::format("?{}", body);

            return wrapper_str("option", body, extra);
        },
        [&](const RecordType& record) {
            auto body = render_contents(record.contents_, record.fields_);
            auto extra = extra_parameters(type.parameters(), {"__record__"});
            if (const auto& name = type.parameter("__record__"); name.is_string())
                return wrapper_str(name.get<std::string>(), body, extra);

            if (record.fields_) {
                auto braced = fmt::format("{{{}}}", body);
                return extra.empty() ? braced : wrapper_str("struct", braced, extra);
            }
            auto parenthesized = fmt::format("({})", body);
            return extra.empty() ? parenthesized : wrapper_str("tuple", parenthesized, extra);
        },
        [&](const UnionType& union_type) {
            return wrapper_str("union", render_contents(union_type.contents_, std::nullopt),
                extra_parameters(type.parameters(), {}));
        }
    );
}

} // namespace

Type::Type(TypeNode node, Parameters parameters) :
    node_(std::move(node)),
    parameters_(normalize_parameters(parameters)) {
}

bool Type::is_equal_to(const Type& other, bool all_parameters) const {
    if (node_.index() != other.node_.index() || !parameters_match(parameters_, other.parameters_, all_parameters))
        return false;

    return util::variant_match(node_,
        [&](const NumpyType& numpy) {
            return numpy.primitive_ == std::get<NumpyType>(other.node_).primitive_;
        },
        [](const UnknownType&) {
            return true;
        },
        [&](const ListType& list) {
            return contents_equal(list.content_, std::get<ListType>(other.node_).content_, all_parameters);
        },
        [&](const RegularType& regular) {
            const auto& other_regular = std::get<RegularType>(other.node_);
            return regular.size_ == other_regular.size_ &&
                contents_equal(regular.content_, other_regular.content_, all_parameters);
        },
        [&](const OptionType& option) {
            return contents_equal(option.content_, std::get<OptionType>(other.node_).content_, all_parameters);
        },
        [&](const RecordType& record) {
            return records_equal(record, std::get<RecordType>(other.node_), all_parameters);
        },
        [&](const UnionType& union_type) {
            return unions_equal(union_type, std::get<UnionType>(other.node_), all_parameters);
        }
    );
}

std::string Type::to_str() const {
    return render(*this, false);
}

TypePtr make_numpy_type(Primitive primitive, Parameters parameters) {
    return std::make_shared<const Type>(NumpyType{primitive}, std::move(parameters));
}

TypePtr make_unknown_type(Parameters parameters) {
    return std::make_shared<const Type>(UnknownType{}, std::move(parameters));
}

TypePtr make_list_type(TypePtr content, Parameters parameters) {
    check_content(content, "ListType");
    return std::make_shared<const Type>(ListType{std::move(content)}, std::move(parameters));
}

TypePtr make_regular_type(TypePtr content, ShapeItem size, Parameters parameters) {
    check_content(content, "RegularType");
    return std::make_shared<const Type>(RegularType{std::move(content), size}, std::move(parameters));
}

TypePtr make_option_type(TypePtr content, Parameters parameters) {
    check_content(content, "OptionType");
    return std::make_shared<const Type>(OptionType{std::move(content)}, std::move(parameters));
}

TypePtr make_record_type(
    std::vector<TypePtr> contents,
    std::optional<std::vector<std::string>> fields,
    Parameters parameters) {
    for (const auto& content : contents)
        check_content(content, "RecordType");

    if (fields) {
        user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
            fields->size() == contents.size(),
            "RecordType 'fields' must have the same length as 'contents', got {} fields and {} contents",
            fields->size(), contents.size());
    }
    return std::make_shared<const Type>(RecordType{std::move(contents), std::move(fields)}, std::move(parameters));
}

TypePtr make_union_type(std::vector<TypePtr> contents, Parameters parameters) {
    for (const auto& content : contents)
        check_content(content, "UnionType");

    return std::make_shared<const Type>(UnionType{std::move(contents)}, std::move(parameters));
}

TypePtr make_simplified_option_type(TypePtr content, Parameters parameters) {
    check_content(content, "OptionType");
    if (const auto* option = content->as<OptionType>())
        return make_simplified_option_type(option->content_, parameters_union(content->parameters(), parameters));

    if (const auto* union_type = content->as<UnionType>()) {
        std::vector<TypePtr> contents;
        contents.reserve(union_type->contents_.size());
        for (const auto& branch : union_type->contents_)
            contents.push_back(make_simplified_option_type(branch, parameters));

        return make_union_type(std::move(contents), content->parameters());
    }
    return make_option_type(std::move(content), std::move(parameters));
}

ArrayType::ArrayType(TypePtr content, ShapeItem length) :
    content_(std::move(content)),
    length_(length) {
    check_content(content_, "ArrayType");
}

bool ArrayType::is_equal_to(const ArrayType& other, bool all_parameters) const {
    const bool lengths_match = !length_ || !other.length_ || *length_ == *other.length_;
    return lengths_match && content_->is_equal_to(*other.content_, all_parameters);
}

std::string ArrayType::to_str() const {
    if (!length_)
        return fmt::format("## * {}", content_->to_str());

    return fmt::format("{} * {}", *length_, content_->to_str());
}

} // namespace raggedform::types

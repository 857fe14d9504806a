/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/form_type.hpp>
#include <raggedform/util/variant.hpp>

#include <iterator>

namespace raggedform {

namespace {

std::vector<types::TypePtr> types_of(const std::vector<FormPtr>& contents) {
    std::vector<types::TypePtr> out;
    out.reserve(contents.size());
    for (const auto& content : contents)
        out.push_back(content->type());
    return out;
}

std::vector<FormPtr> forms_of(const std::vector<types::TypePtr>& contents) {
    std::vector<FormPtr> out;
    out.reserve(contents.size());
    for (const auto& content : contents)
        out.push_back(from_type(*content));
    return out;
}

} // namespace

types::TypePtr Form::type() const {
    return util::variant_match(node_,
        [this](const NumpyForm& numpy) {
            if (numpy.inner_shape_.empty())
                return types::make_numpy_type(numpy.primitive_, parameters_);

            // The parameters belong on the outermost dimension
            auto out = types::make_numpy_type(numpy.primitive_);
            for (auto it = numpy.inner_shape_.rbegin(); it != numpy.inner_shape_.rend(); ++it) {
                const bool outermost = std::next(it) == numpy.inner_shape_.rend();
                out = types::make_regular_type(std::move(out), *it, outermost ? parameters_ : Parameters{});
            }
            return out;
        },
        [this](const EmptyForm&) {
            return types::make_unknown_type(parameters_);
        },
        [this](const RegularForm& regular) {
            return types::make_regular_type(regular.content_->type(), regular.size_, parameters_);
        },
        [this](const ListForm& list) {
            return types::make_list_type(list.content_->type(), parameters_);
        },
        [this](const ListOffsetForm& list_offset) {
            return types::make_list_type(list_offset.content_->type(), parameters_);
        },
        [this](const IndexedForm& indexed) {
            auto content_type = indexed.content_->type();
            return std::make_shared<const types::Type>(
                content_type->node(),
                types::parameters_union(content_type->parameters(), parameters_));
        },
        [this](const RecordForm& record) {
            return types::make_record_type(types_of(record.contents_), record.fields_, parameters_);
        },
        [this](const UnionForm& union_form) {
            return types::make_union_type(types_of(union_form.contents_), parameters_);
        },
        [this](const auto&) {
            // IndexedOptionForm, ByteMaskedForm, BitMaskedForm and UnmaskedForm
            return types::make_simplified_option_type(content()->type(), parameters_);
        }
    );
}

FormPtr from_type(const types::Type& type) {
    FormMeta meta{type.parameters(), std::nullopt};
    return util::variant_match(type.node(),
        [&meta](const types::NumpyType& numpy) {
            return make_numpy_form(numpy.primitive_, {}, std::move(meta));
        },
        [&meta](const types::UnknownType&) {
            return make_empty_form(std::move(meta));
        },
        [&meta](const types::ListType& list) {
            return make_list_offset_form(IndexType::I64, from_type(*list.content_), std::move(meta));
        },
        [&meta](const types::RegularType& regular) {
            return make_regular_form(from_type(*regular.content_), regular.size_, std::move(meta));
        },
        [&meta](const types::OptionType& option) {
            return make_indexed_option_form(IndexType::I64, from_type(*option.content_), std::move(meta));
        },
        [&meta](const types::RecordType& record) {
            return make_record_form(forms_of(record.contents_), record.fields_, std::move(meta));
        },
        [&meta](const types::UnionType& union_type) {
            return make_union_form(IndexType::I8, IndexType::I64, forms_of(union_type.contents_), std::move(meta));
        }
    );
}

types::ArrayType array_type(const Form& form, ShapeItem length) {
    return types::ArrayType{form.type(), length};
}

} // namespace raggedform

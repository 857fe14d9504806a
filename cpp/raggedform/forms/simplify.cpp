/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/simplify.hpp>
#include <raggedform/log/log.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <algorithm>

namespace raggedform {

namespace {

void check_content(const FormPtr& content, FormKind kind) {
    user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
        static_cast<bool>(content),
        "{} all 'contents' must be Form instances, not null", form_type_name(kind));
}

// Shared by the three mask-based options and UnmaskedForm, which collapse the same way
template<typename BuildFn>
FormPtr simplified_option(FormKind kind, FormPtr content, const FormMeta& meta, BuildFn&& build) {
    check_content(content, kind);
    if (content->is_union()) {
        RAGGEDFORM_DEBUG(log::schema(), "Distributing {} over a union of {} branches", form_type_name(kind), content->contents().size());
        return union_of_optionarrays(*content, IndexType::I64, meta.parameters_);
    }
    if (content->is_indexed() || content->is_option())
        return simplified_indexed_option(IndexType::I64, std::move(content), FormMeta{meta.parameters_, std::nullopt});

    return build();
}

std::vector<FormPtr> simplify_all(const std::vector<FormPtr>& contents) {
    std::vector<FormPtr> out;
    out.reserve(contents.size());
    for (const auto& content : contents)
        out.push_back(simplify(content));
    return out;
}

} // namespace

FormPtr simplified_indexed(IndexType index, FormPtr content, FormMeta meta) {
    check_content(content, FormKind::INDEXED);
    if (const auto* union_form = content->as<UnionForm>()) {
        RAGGEDFORM_DEBUG(log::schema(), "Pushing IndexedForm into a union of {} branches", union_form->contents_.size());
        std::vector<FormPtr> contents;
        contents.reserve(union_form->contents_.size());
        for (const auto& branch : union_form->contents_)
            contents.push_back(simplified_indexed(index, branch));

        return simplified_union(
            union_form->tags_,
            union_form->index_,
            std::move(contents),
            FormMeta{types::parameters_union(content->parameters(), meta.parameters_), std::nullopt});
    }
    if (content->is_option())
        return simplified_indexed_option(IndexType::I64, std::move(content), FormMeta{std::move(meta.parameters_), std::nullopt});

    if (content->is_indexed()) {
        RAGGEDFORM_DEBUG(log::schema(), "Merging nested IndexedForms");
        return make_indexed_form(
            IndexType::I64,
            content->content(),
            FormMeta{types::parameters_union(content->parameters(), meta.parameters_), std::nullopt});
    }
    return make_indexed_form(index, std::move(content), std::move(meta));
}

FormPtr simplified_indexed_option(IndexType index, FormPtr content, FormMeta meta) {
    check_content(content, FormKind::INDEXED_OPTION);
    if (content->is_union())
        return union_of_optionarrays(*content, index, meta.parameters_);

    if (content->is_indexed() || content->is_option()) {
        RAGGEDFORM_DEBUG(log::schema(), "Merging {} into IndexedOptionForm", form_type_name(content->kind()));
        return simplified_indexed_option(
            IndexType::I64,
            content->content(),
            FormMeta{types::parameters_union(content->parameters(), meta.parameters_), std::nullopt});
    }
    return make_indexed_option_form(index, std::move(content), std::move(meta));
}

FormPtr simplified_byte_masked(IndexType mask, FormPtr content, bool valid_when, FormMeta meta) {
    return simplified_option(FormKind::BYTE_MASKED, content, meta, [&]() {
        return make_byte_masked_form(mask, content, valid_when, meta);
    });
}

FormPtr simplified_bit_masked(IndexType mask, FormPtr content, bool valid_when, bool lsb_order, FormMeta meta) {
    return simplified_option(FormKind::BIT_MASKED, content, meta, [&]() {
        return make_bit_masked_form(mask, content, valid_when, lsb_order, meta);
    });
}

FormPtr simplified_unmasked(FormPtr content, FormMeta meta) {
    return simplified_option(FormKind::UNMASKED, content, meta, [&]() {
        return make_unmasked_form(content, meta);
    });
}

FormPtr union_of_optionarrays(const Form& union_form, IndexType index, const Parameters& parameters) {
    const auto* node = union_form.as<UnionForm>();
    util::check_arg(node != nullptr, "union_of_optionarrays expects a UnionForm, got {}", form_type_name(union_form.kind()));

    std::vector<FormPtr> contents;
    contents.reserve(node->contents_.size());
    for (const auto& content : node->contents_) {
        if (content->is_option())
            contents.push_back(content);
        else
            contents.push_back(simplified_indexed_option(index, content));
    }
    return simplified_union(
        node->tags_,
        node->index_,
        std::move(contents),
        FormMeta{types::parameters_union(union_form.parameters(), parameters), std::nullopt});
}

FormPtr simplified_union(IndexType tags, IndexType index, std::vector<FormPtr> contents, FormMeta meta) {
    bool changed = false;
    std::vector<FormPtr> flat;
    for (auto& content : contents) {
        check_content(content, FormKind::UNION);
        if (const auto* inner = content->as<UnionForm>()) {
            flat.insert(flat.end(), inner->contents_.begin(), inner->contents_.end());
            changed = true;
        } else {
            flat.push_back(std::move(content));
        }
    }

    const bool has_non_empty = std::any_of(flat.begin(), flat.end(), [](const FormPtr& content) {
        return !content->is_unknown();
    });
    if (has_non_empty) {
        const auto before = flat.size();
        flat.erase(std::remove_if(flat.begin(), flat.end(), [](const FormPtr& content) {
            return content->is_unknown();
        }), flat.end());
        changed |= flat.size() != before;
    }

    std::vector<FormPtr> distinct;
    std::vector<types::TypePtr> distinct_types;
    for (auto& content : flat) {
        auto type = content->type();
        const bool seen = std::any_of(distinct_types.begin(), distinct_types.end(), [&type](const types::TypePtr& other) {
            return other->is_equal_to(*type, true);
        });
        if (seen) {
            changed = true;
            continue;
        }
        distinct_types.push_back(std::move(type));
        distinct.push_back(std::move(content));
    }

    if (distinct.empty())
        return make_empty_form(FormMeta{std::move(meta.parameters_), std::nullopt});

    if (distinct.size() == 1) {
        RAGGEDFORM_DEBUG(log::schema(), "Union collapsed to its single {} branch", form_type_name(distinct.front()->kind()));
        const auto& branch = distinct.front();
        return branch->copy(FormCopy{.parameters_ = types::parameters_union(branch->parameters(), meta.parameters_)});
    }

    if (changed)
        meta.form_key_.reset();

    return make_union_form(tags, index, std::move(distinct), std::move(meta));
}

FormPtr simplify(const FormPtr& form) {
    util::check_arg(static_cast<bool>(form), "simplify requires a Form, got null");
    FormMeta meta{form->parameters(), form->form_key()};
    return util::variant_match(form->node(),
        [&form](const NumpyForm&) -> FormPtr {
            return form;
        },
        [&form](const EmptyForm&) -> FormPtr {
            return form;
        },
        [&form](const RecordForm& record) -> FormPtr {
            return form->copy(FormCopy{.contents_ = simplify_all(record.contents_)});
        },
        [&](const UnionForm& union_form) -> FormPtr {
            return simplified_union(union_form.tags_, union_form.index_, simplify_all(union_form.contents_), std::move(meta));
        },
        [&](const IndexedForm& indexed) -> FormPtr {
            return simplified_indexed(indexed.index_, simplify(indexed.content_), std::move(meta));
        },
        [&](const IndexedOptionForm& indexed_option) -> FormPtr {
            return simplified_indexed_option(indexed_option.index_, simplify(indexed_option.content_), std::move(meta));
        },
        [&](const ByteMaskedForm& byte_masked) -> FormPtr {
            return simplified_byte_masked(
                byte_masked.mask_, simplify(byte_masked.content_), byte_masked.valid_when_, std::move(meta));
        },
        [&](const BitMaskedForm& bit_masked) -> FormPtr {
            return simplified_bit_masked(
                bit_masked.mask_, simplify(bit_masked.content_), bit_masked.valid_when_, bit_masked.lsb_order_, std::move(meta));
        },
        [&](const UnmaskedForm& unmasked) -> FormPtr {
            return simplified_unmasked(simplify(unmasked.content_), std::move(meta));
        },
        [&form](const auto&) -> FormPtr {
            // RegularForm, ListForm and ListOffsetForm only need their content rebuilt
            return form->copy(FormCopy{.content_ = simplify(form->content())});
        }
    );
}

} // namespace raggedform

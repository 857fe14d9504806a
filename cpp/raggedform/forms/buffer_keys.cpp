/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/buffer_keys.hpp>
#include <raggedform/log/log.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace raggedform {

namespace {

constexpr uint64_t length_zero_stub_bytes = 8;
constexpr uint64_t length_one_stub_bytes = 32;

FormPtr assign_form_keys(const Form& form, std::string_view prefix, size_t& counter) {
    FormCopy update;
    update.form_key_ = std::make_optional(fmt::format("{}{}", prefix, counter++));
    if (const auto& content = form.content()) {
        update.content_ = assign_form_keys(*content, prefix, counter);
    } else if (form.is_record() || form.is_union()) {
        std::vector<FormPtr> contents;
        contents.reserve(form.contents().size());
        for (const auto& child : form.contents())
            contents.push_back(assign_form_keys(*child, prefix, counter));
        update.contents_ = std::move(contents);
    }
    return form.copy(update);
}

uint64_t checked_multiply(uint64_t one, uint64_t two, const Form& form) {
    uint64_t out;
    user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
        !__builtin_mul_overflow(one, two, &out),
        "Buffer size of a {} overflows: {} * {}", form_type_name(form.kind()), one, two);
    return out;
}

uint64_t index_bytes(const Form& form, IndexType index_type, uint64_t length) {
    return checked_multiply(length, types::index_itemsize(index_type), form);
}

// An all-zero index points every element at the first item of the content
uint64_t indexed_content_length(uint64_t length) {
    return length > 0 ? 1 : 0;
}

StubBuffers make_stub_buffers(const Form& form, uint64_t length, uint64_t minimum_bytes) {
    const auto bytes = std::max(minimum_bytes, stub_buffer_size(form, length));
    RAGGEDFORM_DEBUG(log::root(), "Stubbing a {} of length {} with {} bytes", form_type_name(form.kind()), length, bytes);
    StubBuffers out{length, {}, [](const Form&, std::string_view) { return std::string{}; }};
    out.container_.try_emplace("", bytes, uint8_t{0});
    return out;
}

} // namespace

void visit_expected_buffers(
    const Form& form,
    const BufferKeyFn& getkey,
    bool recursive,
    folly::FunctionRef<void(const ExpectedBuffer&)> visitor) {
    const auto own = [&](std::string_view attribute, IndexType index_type) {
        visitor(ExpectedBuffer{getkey(form, attribute), types::index_to_dtype(index_type)});
    };

    util::variant_match(form.node(),
        [&](const NumpyForm& numpy) {
            visitor(ExpectedBuffer{getkey(form, "data"), numpy.primitive_});
        },
        [](const EmptyForm&) {},
        [](const RegularForm&) {},
        [&](const ListForm& list) {
            own("starts", list.starts_);
            own("stops", list.stops_);
        },
        [&](const ListOffsetForm& list_offset) {
            own("offsets", list_offset.offsets_);
        },
        [&](const IndexedForm& indexed) {
            own("index", indexed.index_);
        },
        [&](const IndexedOptionForm& indexed_option) {
            own("index", indexed_option.index_);
        },
        [&](const ByteMaskedForm& byte_masked) {
            own("mask", byte_masked.mask_);
        },
        [&](const BitMaskedForm& bit_masked) {
            own("mask", bit_masked.mask_);
        },
        [](const UnmaskedForm&) {},
        [](const RecordForm&) {},
        [&](const UnionForm& union_form) {
            own("tags", union_form.tags_);
            own("index", union_form.index_);
        }
    );

    if (!recursive)
        return;

    if (const auto& content = form.content()) {
        visit_expected_buffers(*content, getkey, recursive, visitor);
        return;
    }
    for (const auto& content : form.contents())
        visit_expected_buffers(*content, getkey, recursive, visitor);
}

std::vector<ExpectedBuffer> expected_from_buffers(const Form& form, const BufferKeyFn& getkey, bool recursive) {
    std::vector<ExpectedBuffer> out;
    visit_expected_buffers(form, getkey, recursive, [&out](const ExpectedBuffer& buffer) {
        out.push_back(buffer);
    });
    return out;
}

BufferKeyFn form_key_buffer_namer() {
    return [](const Form& form, std::string_view attribute) {
        const auto& form_key = form.form_key();
        user_input::check<ErrorCode::E_INVALID_USER_ARGUMENT>(
            form_key.has_value(),
            "Cannot name the '{}' buffer of a {} without a form_key", attribute, form_type_name(form.kind()));
        return fmt::format("{}-{}", *form_key, attribute);
    };
}

FormPtr with_form_keys(const Form& form, std::string_view prefix) {
    size_t counter = 0;
    return assign_form_keys(form, prefix, counter);
}

uint64_t stub_buffer_size(const Form& form, uint64_t length) {
    return util::variant_match(form.node(),
        [&form, length](const NumpyForm& numpy) -> uint64_t {
            uint64_t items = length;
            for (auto dim : numpy.inner_shape_)
                items = checked_multiply(items, dim, form);
            return checked_multiply(items, types::primitive_itemsize(numpy.primitive_), form);
        },
        [](const EmptyForm&) -> uint64_t {
            return 0;
        },
        [&form, length](const RegularForm& regular) -> uint64_t {
            return stub_buffer_size(*regular.content_, checked_multiply(length, regular.size_.value_or(0), form));
        },
        [&form, length](const ListForm& list) -> uint64_t {
            return std::max({
                index_bytes(form, list.starts_, length),
                index_bytes(form, list.stops_, length),
                stub_buffer_size(*list.content_, 0)});
        },
        [&form, length](const ListOffsetForm& list_offset) -> uint64_t {
            return std::max(index_bytes(form, list_offset.offsets_, length + 1), stub_buffer_size(*list_offset.content_, 0));
        },
        [&form, length](const IndexedForm& indexed) -> uint64_t {
            return std::max(
                index_bytes(form, indexed.index_, length),
                stub_buffer_size(*indexed.content_, indexed_content_length(length)));
        },
        [&form, length](const IndexedOptionForm& indexed_option) -> uint64_t {
            return std::max(
                index_bytes(form, indexed_option.index_, length),
                stub_buffer_size(*indexed_option.content_, indexed_content_length(length)));
        },
        [&form, length](const ByteMaskedForm& byte_masked) -> uint64_t {
            return std::max(index_bytes(form, byte_masked.mask_, length), stub_buffer_size(*byte_masked.content_, length));
        },
        [length](const BitMaskedForm& bit_masked) -> uint64_t {
            return std::max((length + 7) / 8, stub_buffer_size(*bit_masked.content_, length));
        },
        [length](const UnmaskedForm& unmasked) -> uint64_t {
            return stub_buffer_size(*unmasked.content_, length);
        },
        [length](const RecordForm& record) -> uint64_t {
            uint64_t out = 0;
            for (const auto& content : record.contents_)
                out = std::max(out, stub_buffer_size(*content, length));
            return out;
        },
        [&form, length](const UnionForm& union_form) -> uint64_t {
            // Zero tags select the first branch for every element
            uint64_t out = std::max(index_bytes(form, union_form.tags_, length), index_bytes(form, union_form.index_, length));
            for (size_t i = 0; i < union_form.contents_.size(); ++i) {
                const auto branch_length = i == 0 ? indexed_content_length(length) : 0;
                out = std::max(out, stub_buffer_size(*union_form.contents_[i], branch_length));
            }
            return out;
        }
    );
}

StubBuffers length_zero_buffers(const Form& form) {
    return make_stub_buffers(form, 0, length_zero_stub_bytes);
}

StubBuffers length_one_buffers(const Form& form) {
    return make_stub_buffers(form, 1, length_one_stub_bytes);
}

} // namespace raggedform

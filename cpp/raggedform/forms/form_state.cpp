/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/form_state.hpp>
#include <raggedform/forms/form_serialization.hpp>
#include <raggedform/log/log.hpp>
#include <raggedform/util/preconditions.hpp>

namespace raggedform {

namespace {

// Number of entries in the 1.x positional state of each FormKind, including the three common ones
constexpr size_t legacy_state_size(FormKind kind) {
    switch (kind) {
        case FormKind::EMPTY:
            return 3;
        case FormKind::UNMASKED:
            return 4;
        case FormKind::REGULAR:
        case FormKind::LIST_OFFSET:
        case FormKind::INDEXED:
        case FormKind::INDEXED_OPTION:
        case FormKind::RECORD:
            return 5;
        case FormKind::NUMPY:
        case FormKind::LIST:
        case FormKind::BYTE_MASKED:
        case FormKind::UNION:
            return 6;
        case FormKind::BIT_MASKED:
            return 7;
    }
    RAGGEDFORM_UNREACHABLE
}

class LegacyStateReader {
  public:
    LegacyStateReader(const Json& state, FormKind kind) :
        state_(state),
        kind_(kind) {
        compatibility::check<ErrorCode::E_UNRECOGNISED_LEGACY_STATE>(
            state_.size() == legacy_state_size(kind_),
            "{} state must have {} entries, got {}", form_type_name(kind_), legacy_state_size(kind_), state_.size());
    }

    FormMeta meta() const {
        FormMeta meta;
        const auto& parameters = state_[1];
        if (!parameters.is_null()) {
            expect(parameters.is_object(), 1, "a mapping of parameters");
            meta.parameters_ = Parameters(parameters.get_ref<const Json::object_t&>());
        }
        const auto& form_key = state_[2];
        if (!form_key.is_null()) {
            expect(form_key.is_string(), 2, "a string form_key");
            meta.form_key_ = "part0-" + form_key.get<std::string>();
        }
        return meta;
    }

    IndexType index(size_t pos) const {
        const auto& value = state_[pos];
        expect(value.is_string(), pos, "an index type name");
        auto index_type = types::index_type_from_str(value.get_ref<const Json::string_t&>());
        expect(index_type.has_value(), pos, "an index type name");
        return *index_type;
    }

    bool boolean(size_t pos) const {
        expect(state_[pos].is_boolean(), pos, "a boolean");
        return state_[pos].get<bool>();
    }

    uint64_t size(const Json& value, size_t pos) const {
        expect(value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0), pos, "a non-negative integer");
        return value.get<uint64_t>();
    }

    uint64_t size(size_t pos) const {
        return size(state_[pos], pos);
    }

    std::string string(size_t pos) const {
        expect(state_[pos].is_string(), pos, "a string");
        return state_[pos].get<std::string>();
    }

    FormPtr content(size_t pos) const {
        return from_dict(state_[pos]);
    }

    std::vector<FormPtr> contents(size_t pos) const {
        const auto& value = state_[pos];
        expect(value.is_array(), pos, "a list of forms");
        std::vector<FormPtr> out;
        out.reserve(value.size());
        for (const auto& content : value)
            out.push_back(from_dict(content));
        return out;
    }

    const Json& at(size_t pos) const {
        return state_[pos];
    }

    void expect(bool cond, size_t pos, std::string_view what) const {
        compatibility::check<ErrorCode::E_UNRECOGNISED_LEGACY_STATE>(
            cond,
            "{} state entry {} must be {}, got {}", form_type_name(kind_), pos, what, state_[pos].dump());
    }

  private:
    const Json& state_;
    FormKind kind_;
};

FormPtr read_numpy_state(const LegacyStateReader& reader) {
    InnerShape inner_shape;
    const auto& shape = reader.at(3);
    reader.expect(shape.is_array(), 3, "a list of inner dimensions");
    for (const auto& item : shape)
        inner_shape.push_back(reader.size(item, 3));

    const auto primitive = types::primitive_from_buffer_format(reader.string(5), reader.size(4));
    return make_numpy_form(primitive, std::move(inner_shape), reader.meta());
}

FormPtr read_record_state(const LegacyStateReader& reader) {
    std::optional<std::vector<std::string>> fields;
    const auto& lookup = reader.at(3);
    if (!lookup.is_null()) {
        reader.expect(lookup.is_array(), 3, "a list of field names or null");
        std::vector<std::string> names;
        for (const auto& name : lookup) {
            reader.expect(name.is_string(), 3, "a list of field names or null");
            names.push_back(name.get<std::string>());
        }
        fields = std::move(names);
    }
    return make_record_form(reader.contents(4), std::move(fields), reader.meta());
}

FormPtr from_positional_state(FormKind kind, const Json& state) {
    const LegacyStateReader reader{state, kind};
    switch (kind) {
        case FormKind::NUMPY:
            return read_numpy_state(reader);
        case FormKind::EMPTY:
            return make_empty_form(reader.meta());
        case FormKind::REGULAR:
            return make_regular_form(reader.content(3), reader.size(4), reader.meta());
        case FormKind::LIST:
            return make_list_form(reader.index(3), reader.index(4), reader.content(5), reader.meta());
        case FormKind::LIST_OFFSET:
            return make_list_offset_form(reader.index(3), reader.content(4), reader.meta());
        case FormKind::INDEXED:
            return make_indexed_form(reader.index(3), reader.content(4), reader.meta());
        case FormKind::INDEXED_OPTION:
            return make_indexed_option_form(reader.index(3), reader.content(4), reader.meta());
        case FormKind::BYTE_MASKED:
            return make_byte_masked_form(reader.index(3), reader.content(4), reader.boolean(5), reader.meta());
        case FormKind::BIT_MASKED:
            return make_bit_masked_form(
                reader.index(3), reader.content(4), reader.boolean(5), reader.boolean(6), reader.meta());
        case FormKind::UNMASKED:
            return make_unmasked_form(reader.content(3), reader.meta());
        case FormKind::RECORD:
            return read_record_state(reader);
        case FormKind::UNION:
            return make_union_form(reader.index(3), reader.index(4), reader.contents(5), reader.meta());
    }
    RAGGEDFORM_UNREACHABLE
}

} // namespace

FormPtr from_state(FormKind kind, const Json& state) {
    if (state.is_object()) {
        auto form = from_dict(state);
        compatibility::check<ErrorCode::E_UNRECOGNISED_LEGACY_STATE>(
            form->kind() == kind,
            "Saved state describes a {} but a {} was expected", form_type_name(form->kind()), form_type_name(kind));
        return form;
    }

    compatibility::check<ErrorCode::E_UNRECOGNISED_LEGACY_STATE>(
        state.is_array(),
        "{} state must be a mapping or a list, got {}", form_type_name(kind), state.dump());
    log::serde().warn("Reading 1.x positional state of a {}", form_type_name(kind));
    return from_positional_state(kind, state);
}

} // namespace raggedform

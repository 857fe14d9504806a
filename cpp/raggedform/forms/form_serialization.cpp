/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/form_serialization.hpp>
#include <raggedform/log/log.hpp>
#include <raggedform/util/configs_map.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <array>
#include <utility>

namespace raggedform {

namespace {

struct ClassAlias {
    std::string_view name_;
    FormKind kind_;
};

// Width-suffixed spellings written by older versions
constexpr std::array<ClassAlias, 14> legacy_class_aliases{{
    {"ListArray32", FormKind::LIST},
    {"ListArrayU32", FormKind::LIST},
    {"ListArray64", FormKind::LIST},
    {"ListOffsetArray32", FormKind::LIST_OFFSET},
    {"ListOffsetArrayU32", FormKind::LIST_OFFSET},
    {"ListOffsetArray64", FormKind::LIST_OFFSET},
    {"IndexedArray32", FormKind::INDEXED},
    {"IndexedArrayU32", FormKind::INDEXED},
    {"IndexedArray64", FormKind::INDEXED},
    {"IndexedOptionArray32", FormKind::INDEXED_OPTION},
    {"IndexedOptionArray64", FormKind::INDEXED_OPTION},
    {"UnionArray8_32", FormKind::UNION},
    {"UnionArray8_U32", FormKind::UNION},
    {"UnionArray8_64", FormKind::UNION},
}};

constexpr std::array<FormKind, 12> all_kinds{
    FormKind::NUMPY,
    FormKind::EMPTY,
    FormKind::REGULAR,
    FormKind::LIST,
    FormKind::LIST_OFFSET,
    FormKind::INDEXED,
    FormKind::INDEXED_OPTION,
    FormKind::BYTE_MASKED,
    FormKind::BIT_MASKED,
    FormKind::UNMASKED,
    FormKind::RECORD,
    FormKind::UNION
};

std::optional<FormKind> kind_from_class(std::string_view class_name) {
    for (auto kind : all_kinds) {
        if (form_class_name(kind) == class_name)
            return kind;
    }
    for (const auto& alias : legacy_class_aliases) {
        if (alias.name_ == class_name) {
            log::serde().warn("Reading legacy class tag '{}' as '{}'", class_name, form_class_name(alias.kind_));
            return alias.kind_;
        }
    }
    return std::nullopt;
}

Json shape_item_to_json(const ShapeItem& item) {
    return item ? Json(*item) : Json(nullptr);
}

void add_extras(Json& out, const Form& form, bool verbose) {
    if (verbose || !types::parameters_are_empty(form.parameters()))
        out["parameters"] = Json(form.parameters());

    if (verbose || form.form_key())
        out["form_key"] = form.form_key() ? Json(*form.form_key()) : Json(nullptr);
}

Json to_dict_part(const Form& form, bool verbose, bool toplevel);

Json contents_to_dict(const std::vector<FormPtr>& contents, bool verbose) {
    Json out = Json::array();
    for (const auto& content : contents)
        out.push_back(to_dict_part(*content, verbose, false));
    return out;
}

Json to_dict_part(const Form& form, bool verbose, bool toplevel) {
    Json out = Json::object();
    out["class"] = std::string{form_class_name(form.kind())};
    util::variant_match(form.node(),
        [&](const NumpyForm& numpy) {
            if (!verbose && !toplevel && numpy.inner_shape_.empty() && types::parameters_are_empty(form.parameters()) &&
                !form.form_key()) {
                out = types::primitive_to_str(numpy.primitive_);
                return;
            }
            out["primitive"] = types::primitive_to_str(numpy.primitive_);
            if (verbose || !numpy.inner_shape_.empty())
                out["inner_shape"] = Json(std::vector<uint64_t>(numpy.inner_shape_.begin(), numpy.inner_shape_.end()));
        },
        [](const EmptyForm&) {},
        [&](const RegularForm& regular) {
            out["size"] = shape_item_to_json(regular.size_);
            out["content"] = to_dict_part(*regular.content_, verbose, false);
        },
        [&](const ListForm& list) {
            out["starts"] = std::string{types::index_type_to_str(list.starts_)};
            out["stops"] = std::string{types::index_type_to_str(list.stops_)};
            out["content"] = to_dict_part(*list.content_, verbose, false);
        },
        [&](const ListOffsetForm& list_offset) {
            out["offsets"] = std::string{types::index_type_to_str(list_offset.offsets_)};
            out["content"] = to_dict_part(*list_offset.content_, verbose, false);
        },
        [&](const IndexedForm& indexed) {
            out["index"] = std::string{types::index_type_to_str(indexed.index_)};
            out["content"] = to_dict_part(*indexed.content_, verbose, false);
        },
        [&](const IndexedOptionForm& indexed_option) {
            out["index"] = std::string{types::index_type_to_str(indexed_option.index_)};
            out["content"] = to_dict_part(*indexed_option.content_, verbose, false);
        },
        [&](const ByteMaskedForm& byte_masked) {
            out["mask"] = std::string{types::index_type_to_str(byte_masked.mask_)};
            out["valid_when"] = byte_masked.valid_when_;
            out["content"] = to_dict_part(*byte_masked.content_, verbose, false);
        },
        [&](const BitMaskedForm& bit_masked) {
            out["mask"] = std::string{types::index_type_to_str(bit_masked.mask_)};
            out["valid_when"] = bit_masked.valid_when_;
            out["lsb_order"] = bit_masked.lsb_order_;
            out["content"] = to_dict_part(*bit_masked.content_, verbose, false);
        },
        [&](const UnmaskedForm& unmasked) {
            out["content"] = to_dict_part(*unmasked.content_, verbose, false);
        },
        [&](const RecordForm& record) {
            out["fields"] = record.fields_ ? Json(*record.fields_) : Json(nullptr);
            out["contents"] = contents_to_dict(record.contents_, verbose);
        },
        [&](const UnionForm& union_form) {
            out["tags"] = std::string{types::index_type_to_str(union_form.tags_)};
            out["index"] = std::string{types::index_type_to_str(union_form.index_)};
            out["contents"] = contents_to_dict(union_form.contents_, verbose);
        }
    );
    if (out.is_object())
        add_extras(out, form, verbose);

    return out;
}

/*
 * Typed access to the entries of one serialized node. Missing entries are malformed payloads, entries
 * of the wrong JSON type are user errors naming the form and the field.
 */
class NodeReader {
  public:
    NodeReader(const Json& input, FormKind kind) :
        input_(input),
        kind_(kind) {
    }

    const Json& required(std::string_view key) const {
        auto it = input_.find(std::string{key});
        schema::check<ErrorCode::E_MALFORMED_FORM_DICT>(
            it != input_.end(),
            "{} description is missing the required '{}' entry", form_class_name(kind_), key);
        return *it;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return input_.find(std::string{key}) != input_.end();
    }

    IndexType index(std::string_view key) const {
        const auto& value = required(key);
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            value.is_string(),
            "{} '{}' must be of type str, not {}", form_type_name(kind_), key, value.dump());
        auto index_type = types::index_type_from_str(value.get_ref<const Json::string_t&>());
        user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
            index_type.has_value(),
            "{} '{}' must be one of i8, u8, i32, u32, i64, not {}", form_type_name(kind_), key, value.dump());
        return *index_type;
    }

    bool boolean(std::string_view key) const {
        const auto& value = required(key);
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            value.is_boolean(),
            "{} '{}' must be bool, not {}", form_type_name(kind_), key, value.dump());
        return value.get<bool>();
    }

    uint64_t size(const Json& value, std::string_view key) const {
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            value.is_number_integer() && (value.is_number_unsigned() || value.get<int64_t>() >= 0),
            "{} '{}' must be a non-negative integer, not {}", form_type_name(kind_), key, value.dump());
        return value.get<uint64_t>();
    }

    FormMeta meta() const {
        FormMeta meta;
        if (auto it = input_.find("parameters"); it != input_.end() && !it->is_null()) {
            user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
                it->is_object(),
                "{} 'parameters' must be of type dict or None, not {}", form_type_name(kind_), it->dump());
            meta.parameters_ = Parameters(it->get_ref<const Json::object_t&>());
        }
        if (auto it = input_.find("form_key"); it != input_.end() && !it->is_null()) {
            user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
                it->is_string(),
                "{} 'form_key' must be of type string or None, not {}", form_type_name(kind_), it->dump());
            meta.form_key_ = it->get<std::string>();
        }
        return meta;
    }

    std::vector<FormPtr> contents(const Json& value) const {
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            value.is_array(),
            "{} 'contents' must be a list, not {}", form_type_name(kind_), value.dump());
        std::vector<FormPtr> out;
        out.reserve(value.size());
        for (const auto& content : value)
            out.push_back(from_dict(content));
        return out;
    }

  private:
    const Json& input_;
    FormKind kind_;
};

std::vector<std::string> read_fields(const Json& fields) {
    user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
        fields.is_array(),
        "RecordForm 'fields' must be a list of strings or None, not {}", fields.dump());
    std::vector<std::string> out;
    out.reserve(fields.size());
    for (const auto& field : fields) {
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            field.is_string(),
            "RecordForm 'fields' must be a list of strings or None, found {}", field.dump());
        out.push_back(field.get<std::string>());
    }
    return out;
}

// The three record layouts are told apart by the presence of "fields" and the JSON type of "contents"
std::pair<std::vector<FormPtr>, std::optional<std::vector<std::string>>> read_record_layout(const NodeReader& reader) {
    const auto& contents = reader.required("contents");
    if (reader.contains("fields")) {
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            !contents.is_object(),
            "new-style RecordForm contents must not be mappings");
        const auto& fields = reader.required("fields");
        std::optional<std::vector<std::string>> names;
        if (!fields.is_null())
            names = read_fields(fields);
        return {reader.contents(contents), std::move(names)};
    }

    if (contents.is_object()) {
        log::serde().warn("Reading legacy RecordArray whose contents are a mapping of {} fields", contents.size());
        std::vector<FormPtr> forms;
        std::vector<std::string> names;
        for (const auto& [name, content] : contents.items()) {
            names.push_back(name);
            forms.push_back(from_dict(content));
        }
        return {std::move(forms), std::move(names)};
    }

    log::serde().warn("Reading legacy RecordArray tuple without fields");
    return {reader.contents(contents), std::nullopt};
}

FormPtr read_numpy(const NodeReader& reader) {
    const auto& primitive = reader.required("primitive");
    user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
        primitive.is_string(),
        "NumpyForm 'primitive' must be of type str, not {}", primitive.dump());

    InnerShape inner_shape;
    if (reader.contains("inner_shape")) {
        const auto& shape = reader.required("inner_shape");
        user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
            shape.is_array(),
            "NumpyForm 'inner_shape' must be a list of integers, not {}", shape.dump());
        for (const auto& item : shape)
            inner_shape.push_back(reader.size(item, "inner_shape"));
    }
    return make_numpy_form(primitive.get_ref<const Json::string_t&>(), std::move(inner_shape), reader.meta());
}

} // namespace

Json to_dict(const Form& form, bool verbose) {
    return to_dict_part(form, verbose, true);
}

std::string to_json(const Form& form, int indent) {
    return to_dict(form, true).dump(indent);
}

FormPtr from_dict(const Json& input) {
    if (input.is_string())
        return make_numpy_form(input.get_ref<const Json::string_t&>());

    schema::check<ErrorCode::E_MALFORMED_FORM_DICT>(
        input.is_object(),
        "Form description must be a mapping or a primitive string, not {}", input.dump());

    auto class_it = input.find("class");
    schema::check<ErrorCode::E_MALFORMED_FORM_DICT>(
        class_it != input.end() && class_it->is_string(),
        "Form description must have a string 'class' entry, got {}", input.dump());

    const auto& class_name = class_it->get_ref<const Json::string_t&>();
    if (class_name == "VirtualArray")
        compatibility::raise<ErrorCode::E_UNSUPPORTED_LEGACY_FORMAT>("VirtualArray forms are not supported");

    auto kind = kind_from_class(class_name);
    if (!kind)
        schema::raise<ErrorCode::E_UNRECOGNISED_FORM_CLASS>("input class: '{}' was not recognised", class_name);

    const NodeReader reader{input, *kind};
    switch (*kind) {
        case FormKind::NUMPY:
            return read_numpy(reader);
        case FormKind::EMPTY:
            return make_empty_form(reader.meta());
        case FormKind::REGULAR: {
            const auto& size = reader.required("size");
            ShapeItem regular_size = size.is_null() ? types::unknown_length : ShapeItem{reader.size(size, "size")};
            return make_regular_form(from_dict(reader.required("content")), regular_size, reader.meta());
        }
        case FormKind::LIST:
            return make_list_form(
                reader.index("starts"),
                reader.index("stops"),
                from_dict(reader.required("content")),
                reader.meta());
        case FormKind::LIST_OFFSET:
            return make_list_offset_form(reader.index("offsets"), from_dict(reader.required("content")), reader.meta());
        case FormKind::INDEXED:
            return make_indexed_form(reader.index("index"), from_dict(reader.required("content")), reader.meta());
        case FormKind::INDEXED_OPTION:
            return make_indexed_option_form(reader.index("index"), from_dict(reader.required("content")), reader.meta());
        case FormKind::BYTE_MASKED:
            return make_byte_masked_form(
                reader.index("mask"),
                from_dict(reader.required("content")),
                reader.boolean("valid_when"),
                reader.meta());
        case FormKind::BIT_MASKED:
            return make_bit_masked_form(
                reader.index("mask"),
                from_dict(reader.required("content")),
                reader.boolean("valid_when"),
                reader.boolean("lsb_order"),
                reader.meta());
        case FormKind::UNMASKED:
            return make_unmasked_form(from_dict(reader.required("content")), reader.meta());
        case FormKind::RECORD: {
            auto [contents, fields] = read_record_layout(reader);
            return make_record_form(std::move(contents), std::move(fields), reader.meta());
        }
        case FormKind::UNION:
            return make_union_form(
                reader.index("tags"),
                reader.index("index"),
                reader.contents(reader.required("contents")),
                reader.meta());
    }
    RAGGEDFORM_UNREACHABLE
}

FormPtr from_json(std::string_view input) {
    auto parsed = Json::parse(input.begin(), input.end(), nullptr, false);
    schema::check<ErrorCode::E_INVALID_JSON>(
        !parsed.is_discarded(),
        "Form description is not valid JSON: {}", input);
    return from_dict(parsed);
}

std::string to_str(const Form& form) {
    const auto indent = ConfigsMap::instance()->get_int("Form.StrIndent", 4);
    return to_dict(form, false).dump(static_cast<int>(indent));
}

} // namespace raggedform

/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <raggedform/types/parameters.hpp>
#include <raggedform/types/primitive.hpp>
#include <raggedform/types/type.hpp>
#include <raggedform/util/unset.hpp>

#include <boost/container/small_vector.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace raggedform {

using types::IndexType;
using types::Json;
using types::Parameters;
using types::Primitive;
using types::ShapeItem;

class Form;
using FormPtr = std::shared_ptr<Form>;

/// Fixed trailing dimensions of every element of a NumpyForm, empty for one scalar per element
using InnerShape = boost::container::small_vector<uint64_t, 2>;

struct NumpyForm {
    Primitive primitive_;
    InnerShape inner_shape_;
};

struct EmptyForm {
};

struct RegularForm {
    FormPtr content_;
    ShapeItem size_;
};

struct ListForm {
    IndexType starts_;
    IndexType stops_;
    FormPtr content_;
};

struct ListOffsetForm {
    IndexType offsets_;
    FormPtr content_;
};

struct IndexedForm {
    IndexType index_;
    FormPtr content_;
};

// A negative index marks a missing value
struct IndexedOptionForm {
    IndexType index_;
    FormPtr content_;
};

struct ByteMaskedForm {
    IndexType mask_;
    FormPtr content_;
    bool valid_when_;
};

struct BitMaskedForm {
    IndexType mask_;
    FormPtr content_;
    bool valid_when_;
    bool lsb_order_;
};

struct UnmaskedForm {
    FormPtr content_;
};

struct RecordForm {
    std::vector<FormPtr> contents_;
    // Absent for tuples, whose fields are the positions "0", "1", ...
    std::optional<std::vector<std::string>> fields_;
};

struct UnionForm {
    IndexType tags_;
    IndexType index_;
    std::vector<FormPtr> contents_;
};

// Beware, the order of the alternatives must match FormKind
using FormNode = std::variant<
    NumpyForm,
    EmptyForm,
    RegularForm,
    ListForm,
    ListOffsetForm,
    IndexedForm,
    IndexedOptionForm,
    ByteMaskedForm,
    BitMaskedForm,
    UnmaskedForm,
    RecordForm,
    UnionForm>;

enum class FormKind : uint8_t {
    NUMPY,
    EMPTY,
    REGULAR,
    LIST,
    LIST_OFFSET,
    INDEXED,
    INDEXED_OPTION,
    BYTE_MASKED,
    BIT_MASKED,
    UNMASKED,
    RECORD,
    UNION
};

/// The `class` tag used in the serialized form, e.g. "ListOffsetArray"
std::string_view form_class_name(FormKind kind);

/// The name used in error messages, e.g. "ListOffsetForm"
std::string_view form_type_name(FormKind kind);

struct FormMeta {
    Parameters parameters_;
    std::optional<std::string> form_key_;
};

/*
 * Field updates for Form::copy. Every field defaults to UNSET, which keeps the current value. Setting a
 * field the variant does not have is an error.
 */
struct FormCopy {
    util::MaybeUnset<Primitive> primitive_;
    util::MaybeUnset<InnerShape> inner_shape_;
    util::MaybeUnset<FormPtr> content_;
    util::MaybeUnset<ShapeItem> size_;
    util::MaybeUnset<IndexType> starts_;
    util::MaybeUnset<IndexType> stops_;
    util::MaybeUnset<IndexType> offsets_;
    util::MaybeUnset<IndexType> index_;
    util::MaybeUnset<IndexType> mask_;
    util::MaybeUnset<IndexType> tags_;
    util::MaybeUnset<bool> valid_when_;
    util::MaybeUnset<bool> lsb_order_;
    util::MaybeUnset<std::vector<FormPtr>> contents_;
    util::MaybeUnset<std::optional<std::vector<std::string>>> fields_;
    util::MaybeUnset<Parameters> parameters_;
    util::MaybeUnset<std::optional<std::string>> form_key_;
};

/*
 * One node of a schema tree. Everything except the form_key is fixed at construction and validated
 * there, so subtrees can be shared freely between trees.
 */
class Form {
  public:
    Form(FormNode node, FormMeta meta);

    [[nodiscard]] FormKind kind() const {
        return static_cast<FormKind>(node_.index());
    }

    [[nodiscard]] const FormNode& node() const {
        return node_;
    }

    template<class NodeType>
    [[nodiscard]] const NodeType* as() const {
        return std::get_if<NodeType>(&node_);
    }

    template<class NodeType>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<NodeType>(node_);
    }

    [[nodiscard]] const Parameters& parameters() const {
        return parameters_;
    }

    [[nodiscard]] const Json& parameter(std::string_view key) const {
        return types::parameter(parameters_, key);
    }

    [[nodiscard]] const std::optional<std::string>& form_key() const {
        return form_key_;
    }

    /*
     * The only mutation a Form allows. It is not thread-safe: callers must not call it once the Form is
     * visible to other threads, nor from two threads at once.
     */
    void set_form_key(std::optional<std::string> form_key) {
        form_key_ = std::move(form_key);
    }

    [[nodiscard]] bool is_numpy() const;
    [[nodiscard]] bool is_unknown() const;
    [[nodiscard]] bool is_list() const;
    [[nodiscard]] bool is_regular() const;
    [[nodiscard]] bool is_option() const;
    [[nodiscard]] bool is_indexed() const;
    [[nodiscard]] bool is_record() const;
    [[nodiscard]] bool is_union() const;

    /// The single child of a wrapper form, nullptr for leaves, records and unions
    [[nodiscard]] const FormPtr& content() const;

    [[nodiscard]] const FormPtr& content(size_t index) const;
    [[nodiscard]] const FormPtr& content(std::string_view field) const;

    /// The children of records and unions, empty for every other form
    [[nodiscard]] const std::vector<FormPtr>& contents() const;

    [[nodiscard]] std::vector<std::string> fields() const;
    [[nodiscard]] bool is_tuple() const;
    [[nodiscard]] std::string index_to_field(size_t index) const;
    [[nodiscard]] size_t field_to_index(std::string_view field) const;
    [[nodiscard]] bool has_field(std::string_view field) const;

    [[nodiscard]] int64_t purelist_depth() const;
    [[nodiscard]] std::pair<int64_t, int64_t> minmax_depth() const;
    [[nodiscard]] std::pair<bool, int64_t> branch_depth() const;
    [[nodiscard]] bool purelist_isregular() const;
    [[nodiscard]] Json purelist_parameter(std::string_view key) const;
    [[nodiscard]] bool is_identity_like() const;

    /// Implemented in form_type.cpp
    [[nodiscard]] types::TypePtr type() const;

    [[nodiscard]] FormPtr copy(const FormCopy& update) const;

    bool operator==(const Form& other) const;

  private:
    [[nodiscard]] const RecordForm& record() const;
    [[nodiscard]] const std::vector<FormPtr>* children() const;

    FormNode node_;
    Parameters parameters_;
    std::optional<std::string> form_key_;
};

/// Compares the pointees, treating two null pointers as equal
bool forms_equal(const FormPtr& one, const FormPtr& two);

FormPtr make_numpy_form(Primitive primitive, InnerShape inner_shape = {}, FormMeta meta = {});

/// Parses the primitive from its NumPy spelling
FormPtr make_numpy_form(std::string_view primitive, InnerShape inner_shape = {}, FormMeta meta = {});

FormPtr make_empty_form(FormMeta meta = {});

FormPtr make_regular_form(FormPtr content, ShapeItem size, FormMeta meta = {});

FormPtr make_list_form(IndexType starts, IndexType stops, FormPtr content, FormMeta meta = {});

FormPtr make_list_offset_form(IndexType offsets, FormPtr content, FormMeta meta = {});

FormPtr make_indexed_form(IndexType index, FormPtr content, FormMeta meta = {});

FormPtr make_indexed_option_form(IndexType index, FormPtr content, FormMeta meta = {});

FormPtr make_byte_masked_form(IndexType mask, FormPtr content, bool valid_when, FormMeta meta = {});

FormPtr make_bit_masked_form(IndexType mask, FormPtr content, bool valid_when, bool lsb_order, FormMeta meta = {});

FormPtr make_unmasked_form(FormPtr content, FormMeta meta = {});

FormPtr make_record_form(
    std::vector<FormPtr> contents,
    std::optional<std::vector<std::string>> fields,
    FormMeta meta = {});

FormPtr make_union_form(IndexType tags, IndexType index, std::vector<FormPtr> contents, FormMeta meta = {});

} // namespace raggedform

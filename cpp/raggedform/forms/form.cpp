/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/form.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <fmt/ranges.h>

#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <unordered_set>

namespace raggedform {

namespace {

const FormPtr null_form{};
const std::vector<FormPtr> no_contents{};

void check_content(const FormPtr& content, FormKind kind) {
    user_input::check<ErrorCode::E_INVALID_FIELD_TYPE>(
        static_cast<bool>(content),
        "{} all 'contents' must be Form instances, not null", form_type_name(kind));
}

void check_index(IndexType value, std::initializer_list<IndexType> allowed, FormKind kind, std::string_view field) {
    if (std::find(allowed.begin(), allowed.end(), value) != allowed.end())
        return;

    user_input::raise<ErrorCode::E_INVALID_FIELD_VALUE>(
        "{} '{}' must be one of {}, not {}", form_type_name(kind), field, fmt::join(allowed, ", "), value);
}

constexpr std::initializer_list<IndexType> list_indices{IndexType::I32, IndexType::U32, IndexType::I64};

void validate(const FormNode& node) {
    const auto kind = static_cast<FormKind>(node.index());
    util::variant_match(node,
        [](const NumpyForm&) {},
        [](const EmptyForm&) {},
        [kind](const RegularForm& regular) {
            check_content(regular.content_, kind);
        },
        [kind](const ListForm& list) {
            check_index(list.starts_, list_indices, kind, "starts");
            check_index(list.stops_, list_indices, kind, "stops");
            user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
                list.starts_ == list.stops_,
                "ListForm 'starts' and 'stops' must have the same index type, not {} and {}", list.starts_, list.stops_);
            check_content(list.content_, kind);
        },
        [kind](const ListOffsetForm& list_offset) {
            check_index(list_offset.offsets_, list_indices, kind, "offsets");
            check_content(list_offset.content_, kind);
        },
        [kind](const IndexedForm& indexed) {
            check_index(indexed.index_, list_indices, kind, "index");
            check_content(indexed.content_, kind);
        },
        [kind](const IndexedOptionForm& indexed_option) {
            check_index(indexed_option.index_, {IndexType::I32, IndexType::I64}, kind, "index");
            check_content(indexed_option.content_, kind);
        },
        [kind](const ByteMaskedForm& byte_masked) {
            check_index(byte_masked.mask_, {IndexType::I8}, kind, "mask");
            check_content(byte_masked.content_, kind);
        },
        [kind](const BitMaskedForm& bit_masked) {
            check_index(bit_masked.mask_, {IndexType::U8}, kind, "mask");
            check_content(bit_masked.content_, kind);
        },
        [kind](const UnmaskedForm& unmasked) {
            check_content(unmasked.content_, kind);
        },
        [kind](const RecordForm& record) {
            for (const auto& content : record.contents_)
                check_content(content, kind);

            if (!record.fields_)
                return;

            const auto& fields = *record.fields_;
            user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
                fields.size() == record.contents_.size(),
                "RecordForm 'fields' must have the same length as 'contents', got {} fields and {} contents",
                fields.size(), record.contents_.size());

            std::unordered_set<std::string_view> seen;
            for (const auto& field : fields) {
                user_input::check<ErrorCode::E_INVALID_FIELD_VALUE>(
                    seen.insert(field).second,
                    "RecordForm 'fields' must be unique, '{}' appears more than once", field);
            }
        },
        [kind](const UnionForm& union_form) {
            check_index(union_form.tags_, {IndexType::I8}, kind, "tags");
            check_index(union_form.index_, list_indices, kind, "index");
            for (const auto& content : union_form.contents_)
                check_content(content, kind);
        }
    );
}

const FormPtr* single_content(const FormNode& node) {
    return util::variant_match(node,
        [](const RegularForm& n) -> const FormPtr* { return &n.content_; },
        [](const ListForm& n) -> const FormPtr* { return &n.content_; },
        [](const ListOffsetForm& n) -> const FormPtr* { return &n.content_; },
        [](const IndexedForm& n) -> const FormPtr* { return &n.content_; },
        [](const IndexedOptionForm& n) -> const FormPtr* { return &n.content_; },
        [](const ByteMaskedForm& n) -> const FormPtr* { return &n.content_; },
        [](const BitMaskedForm& n) -> const FormPtr* { return &n.content_; },
        [](const UnmaskedForm& n) -> const FormPtr* { return &n.content_; },
        [](const auto&) -> const FormPtr* { return nullptr; }
    );
}

std::optional<size_t> parse_position(std::string_view field) {
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    if (ec != std::errc() || ptr != field.data() + field.size() || field.empty())
        return std::nullopt;

    return out;
}

bool contents_equal(const std::vector<FormPtr>& one, const std::vector<FormPtr>& two) {
    return std::equal(one.begin(), one.end(), two.begin(), two.end(), forms_equal);
}

bool records_equal(const RecordForm& one, const RecordForm& two) {
    if (one.fields_.has_value() != two.fields_.has_value() || one.contents_.size() != two.contents_.size())
        return false;

    if (!one.fields_)
        return contents_equal(one.contents_, two.contents_);

    for (size_t i = 0; i < one.contents_.size(); ++i) {
        auto it = std::find(two.fields_->begin(), two.fields_->end(), (*one.fields_)[i]);
        if (it == two.fields_->end())
            return false;

        if (!forms_equal(one.contents_[i], two.contents_[std::distance(two.fields_->begin(), it)]))
            return false;
    }
    return true;
}

std::vector<std::string_view> updated_fields(const FormCopy& update) {
    std::vector<std::string_view> out;
    auto add = [&out](bool is_set, std::string_view name) {
        if (is_set)
            out.push_back(name);
    };
    add(util::is_set(update.primitive_), "primitive");
    add(util::is_set(update.inner_shape_), "inner_shape");
    add(util::is_set(update.content_), "content");
    add(util::is_set(update.size_), "size");
    add(util::is_set(update.starts_), "starts");
    add(util::is_set(update.stops_), "stops");
    add(util::is_set(update.offsets_), "offsets");
    add(util::is_set(update.index_), "index");
    add(util::is_set(update.mask_), "mask");
    add(util::is_set(update.tags_), "tags");
    add(util::is_set(update.valid_when_), "valid_when");
    add(util::is_set(update.lsb_order_), "lsb_order");
    add(util::is_set(update.contents_), "contents");
    add(util::is_set(update.fields_), "fields");
    return out;
}

std::vector<std::string_view> copyable_fields(FormKind kind) {
    switch (kind) {
        case FormKind::NUMPY: return {"primitive", "inner_shape"};
        case FormKind::EMPTY: return {};
        case FormKind::REGULAR: return {"content", "size"};
        case FormKind::LIST: return {"starts", "stops", "content"};
        case FormKind::LIST_OFFSET: return {"offsets", "content"};
        case FormKind::INDEXED:
        case FormKind::INDEXED_OPTION: return {"index", "content"};
        case FormKind::BYTE_MASKED: return {"mask", "content", "valid_when"};
        case FormKind::BIT_MASKED: return {"mask", "content", "valid_when", "lsb_order"};
        case FormKind::UNMASKED: return {"content"};
        case FormKind::RECORD: return {"contents", "fields"};
        case FormKind::UNION: return {"tags", "index", "contents"};
    }
    RAGGEDFORM_UNREACHABLE
}

} // namespace

std::string_view form_class_name(FormKind kind) {
    switch (kind) {
        case FormKind::NUMPY: return "NumpyArray";
        case FormKind::EMPTY: return "EmptyArray";
        case FormKind::REGULAR: return "RegularArray";
        case FormKind::LIST: return "ListArray";
        case FormKind::LIST_OFFSET: return "ListOffsetArray";
        case FormKind::INDEXED: return "IndexedArray";
        case FormKind::INDEXED_OPTION: return "IndexedOptionArray";
        case FormKind::BYTE_MASKED: return "ByteMaskedArray";
        case FormKind::BIT_MASKED: return "BitMaskedArray";
        case FormKind::UNMASKED: return "UnmaskedArray";
        case FormKind::RECORD: return "RecordArray";
        case FormKind::UNION: return "UnionArray";
    }
    RAGGEDFORM_UNREACHABLE
}

std::string_view form_type_name(FormKind kind) {
    switch (kind) {
        case FormKind::NUMPY: return "NumpyForm";
        case FormKind::EMPTY: return "EmptyForm";
        case FormKind::REGULAR: return "RegularForm";
        case FormKind::LIST: return "ListForm";
        case FormKind::LIST_OFFSET: return "ListOffsetForm";
        case FormKind::INDEXED: return "IndexedForm";
        case FormKind::INDEXED_OPTION: return "IndexedOptionForm";
        case FormKind::BYTE_MASKED: return "ByteMaskedForm";
        case FormKind::BIT_MASKED: return "BitMaskedForm";
        case FormKind::UNMASKED: return "UnmaskedForm";
        case FormKind::RECORD: return "RecordForm";
        case FormKind::UNION: return "UnionForm";
    }
    RAGGEDFORM_UNREACHABLE
}

Form::Form(FormNode node, FormMeta meta) :
    node_(std::move(node)),
    parameters_(std::move(meta.parameters_)),
    form_key_(std::move(meta.form_key_)) {
    validate(node_);
}

bool Form::is_numpy() const {
    return is<NumpyForm>();
}

bool Form::is_unknown() const {
    return is<EmptyForm>();
}

bool Form::is_list() const {
    return is<RegularForm>() || is<ListForm>() || is<ListOffsetForm>();
}

bool Form::is_regular() const {
    return is<RegularForm>();
}

bool Form::is_option() const {
    return is<IndexedOptionForm>() || is<ByteMaskedForm>() || is<BitMaskedForm>() || is<UnmaskedForm>();
}

bool Form::is_indexed() const {
    return is<IndexedForm>() || is<IndexedOptionForm>();
}

bool Form::is_record() const {
    return is<RecordForm>();
}

bool Form::is_union() const {
    return is<UnionForm>();
}

const FormPtr& Form::content() const {
    const auto* content = single_content(node_);
    return content ? *content : null_form;
}

const std::vector<FormPtr>* Form::children() const {
    if (const auto* record = as<RecordForm>())
        return &record->contents_;

    if (const auto* union_form = as<UnionForm>())
        return &union_form->contents_;

    return nullptr;
}

const std::vector<FormPtr>& Form::contents() const {
    const auto* contents = children();
    return contents ? *contents : no_contents;
}

const RecordForm& Form::record() const {
    const auto* record = as<RecordForm>();
    user_input::check<ErrorCode::E_INVALID_USER_ARGUMENT>(
        record != nullptr,
        "{} has no fields to look up, only RecordForm does", form_type_name(kind()));
    return *record;
}

const FormPtr& Form::content(size_t index) const {
    const auto* contents = children();
    user_input::check<ErrorCode::E_INVALID_USER_ARGUMENT>(
        contents != nullptr,
        "{} has no indexed contents, only RecordForm and UnionForm do", form_type_name(kind()));
    missing_data::check<ErrorCode::E_FIELD_INDEX_OUT_OF_RANGE>(
        index < contents->size(),
        "no index {} in {} with {} {}", index, is_record() ? "record" : "union", contents->size(),
        is_record() ? "fields" : "contents");
    return (*contents)[index];
}

const FormPtr& Form::content(std::string_view field) const {
    return record().contents_[field_to_index(field)];
}

std::vector<std::string> Form::fields() const {
    return util::variant_match(node_,
        [](const RecordForm& record) {
            if (record.fields_)
                return *record.fields_;

            std::vector<std::string> out;
            for (size_t i = 0; i < record.contents_.size(); ++i)
                out.push_back(std::to_string(i));
            return out;
        },
        [](const UnionForm& union_form) {
            std::vector<std::string> out;
            if (union_form.contents_.empty())
                return out;

            out = union_form.contents_.front()->fields();
            for (size_t i = 1; i < union_form.contents_.size(); ++i) {
                const auto others = union_form.contents_[i]->fields();
                out.erase(std::remove_if(out.begin(), out.end(), [&others](const std::string& field) {
                    return std::find(others.begin(), others.end(), field) == others.end();
                }), out.end());
            }
            return out;
        },
        [this](const auto&) {
            const auto& child = content();
            return child ? child->fields() : std::vector<std::string>{};
        }
    );
}

bool Form::is_tuple() const {
    if (const auto* record = as<RecordForm>())
        return !record->fields_.has_value();

    if (const auto* union_form = as<UnionForm>()) {
        return !union_form->contents_.empty() &&
            std::all_of(union_form->contents_.begin(), union_form->contents_.end(), [](const FormPtr& content) {
                return content->is_tuple();
            });
    }
    const auto& child = content();
    return child && child->is_tuple();
}

std::string Form::index_to_field(size_t index) const {
    const auto& rec = record();
    missing_data::check<ErrorCode::E_FIELD_INDEX_OUT_OF_RANGE>(
        index < rec.contents_.size(),
        "no index {} in record with {} fields", index, rec.contents_.size());
    return rec.fields_ ? (*rec.fields_)[index] : std::to_string(index);
}

size_t Form::field_to_index(std::string_view field) const {
    const auto& rec = record();
    if (rec.fields_) {
        auto it = std::find(rec.fields_->begin(), rec.fields_->end(), field);
        if (it != rec.fields_->end())
            return static_cast<size_t>(std::distance(rec.fields_->begin(), it));
    } else if (auto position = parse_position(field); position && *position < rec.contents_.size()) {
        return *position;
    }
    missing_data::raise<ErrorCode::E_NO_SUCH_FIELD>(
        "no field '{}' in record with {} fields", field, rec.contents_.size());
}

bool Form::has_field(std::string_view field) const {
    const auto& rec = record();
    if (rec.fields_)
        return std::find(rec.fields_->begin(), rec.fields_->end(), field) != rec.fields_->end();

    auto position = parse_position(field);
    return position && *position < rec.contents_.size();
}

int64_t Form::purelist_depth() const {
    return util::variant_match(node_,
        [](const NumpyForm& numpy) {
            return static_cast<int64_t>(numpy.inner_shape_.size()) + 1;
        },
        [](const EmptyForm&) -> int64_t {
            return 1;
        },
        [](const RecordForm&) -> int64_t {
            return 1;
        },
        [](const UnionForm& union_form) -> int64_t {
            if (union_form.contents_.empty())
                return 1;

            const auto depth = union_form.contents_.front()->purelist_depth();
            for (const auto& content : union_form.contents_) {
                if (content->purelist_depth() != depth)
                    return -1;
            }
            return depth;
        },
        [this](const auto&) -> int64_t {
            if (!is_list())
                return content()->purelist_depth();

            const auto& array = parameter("__array__");
            if (array == "string" || array == "bytestring")
                return 1;

            return content()->purelist_depth() + 1;
        }
    );
}

std::pair<int64_t, int64_t> Form::minmax_depth() const {
    auto minmax_over = [](const std::vector<FormPtr>& contents) {
        if (contents.empty())
            return std::make_pair<int64_t, int64_t>(1, 1);

        auto out = contents.front()->minmax_depth();
        for (const auto& content : contents) {
            const auto [min_depth, max_depth] = content->minmax_depth();
            out.first = std::min(out.first, min_depth);
            out.second = std::max(out.second, max_depth);
        }
        return out;
    };

    return util::variant_match(node_,
        [](const NumpyForm& numpy) {
            const auto depth = static_cast<int64_t>(numpy.inner_shape_.size()) + 1;
            return std::make_pair(depth, depth);
        },
        [](const EmptyForm&) {
            return std::make_pair<int64_t, int64_t>(1, 1);
        },
        [&minmax_over](const RecordForm& record) {
            return minmax_over(record.contents_);
        },
        [&minmax_over](const UnionForm& union_form) {
            return minmax_over(union_form.contents_);
        },
        [this](const auto&) {
            auto depths = content()->minmax_depth();
            if (!is_list())
                return depths;

            const auto& array = parameter("__array__");
            if (array == "string" || array == "bytestring")
                return std::make_pair<int64_t, int64_t>(1, 1);

            return std::make_pair(depths.first + 1, depths.second + 1);
        }
    );
}

std::pair<bool, int64_t> Form::branch_depth() const {
    auto branch_over = [](const std::vector<FormPtr>& contents, int64_t offset) {
        if (contents.empty())
            return std::make_pair(false, int64_t{1});

        bool any_branch = false;
        std::optional<int64_t> min_depth;
        for (const auto& content : contents) {
            const auto [branch, depth] = content->branch_depth();
            if (!min_depth)
                min_depth = depth;
            if (branch || *min_depth != depth)
                any_branch = true;
            min_depth = std::min(*min_depth, depth);
        }
        return std::make_pair(any_branch, *min_depth + offset);
    };

    return util::variant_match(node_,
        [](const NumpyForm& numpy) {
            return std::make_pair(false, static_cast<int64_t>(numpy.inner_shape_.size()) + 1);
        },
        [](const EmptyForm&) {
            return std::make_pair(false, int64_t{1});
        },
        [&branch_over](const RecordForm& record) {
            if (record.contents_.empty())
                return std::make_pair(false, int64_t{1});

            return branch_over(record.contents_, 0);
        },
        [&branch_over](const UnionForm& union_form) {
            return branch_over(union_form.contents_, 0);
        },
        [this](const auto&) {
            auto [branch, depth] = content()->branch_depth();
            if (!is_list())
                return std::make_pair(branch, depth);

            const auto& array = parameter("__array__");
            if (array == "string" || array == "bytestring")
                return std::make_pair(false, int64_t{1});

            return std::make_pair(branch, depth + 1);
        }
    );
}

bool Form::purelist_isregular() const {
    return util::variant_match(node_,
        [](const NumpyForm&) { return true; },
        [](const EmptyForm&) { return true; },
        [](const RecordForm&) { return true; },
        [](const ListForm&) { return false; },
        [](const ListOffsetForm&) { return false; },
        [](const UnionForm& union_form) {
            return std::all_of(union_form.contents_.begin(), union_form.contents_.end(), [](const FormPtr& content) {
                return content->purelist_isregular();
            });
        },
        [this](const auto&) { return content()->purelist_isregular(); }
    );
}

Json Form::purelist_parameter(std::string_view key) const {
    if (const auto& own = parameter(key); !own.is_null())
        return own;

    if (const auto* union_form = as<UnionForm>()) {
        if (union_form->contents_.empty())
            return {};

        auto first = union_form->contents_.front()->purelist_parameter(key);
        for (const auto& content : union_form->contents_) {
            if (content->purelist_parameter(key) != first)
                return {};
        }
        return first;
    }
    const auto& child = content();
    return child ? child->purelist_parameter(key) : Json{};
}

bool Form::is_identity_like() const {
    if (is<EmptyForm>())
        return true;

    if (is<UnmaskedForm>())
        return content()->is_identity_like();

    return false;
}

FormPtr Form::copy(const FormCopy& update) const {
    const auto allowed = copyable_fields(kind());
    for (auto field : updated_fields(update)) {
        user_input::check<ErrorCode::E_INVALID_USER_ARGUMENT>(
            std::find(allowed.begin(), allowed.end(), field) != allowed.end(),
            "{} has no field '{}' to replace in copy", form_type_name(kind()), field);
    }

    using util::resolve;
    FormNode node = util::variant_match(node_,
        [&](const NumpyForm& n) -> FormNode {
            return NumpyForm{resolve(update.primitive_, n.primitive_), resolve(update.inner_shape_, n.inner_shape_)};
        },
        [](const EmptyForm& n) -> FormNode {
            return n;
        },
        [&](const RegularForm& n) -> FormNode {
            return RegularForm{resolve(update.content_, n.content_), resolve(update.size_, n.size_)};
        },
        [&](const ListForm& n) -> FormNode {
            return ListForm{resolve(update.starts_, n.starts_), resolve(update.stops_, n.stops_), resolve(update.content_, n.content_)};
        },
        [&](const ListOffsetForm& n) -> FormNode {
            return ListOffsetForm{resolve(update.offsets_, n.offsets_), resolve(update.content_, n.content_)};
        },
        [&](const IndexedForm& n) -> FormNode {
            return IndexedForm{resolve(update.index_, n.index_), resolve(update.content_, n.content_)};
        },
        [&](const IndexedOptionForm& n) -> FormNode {
            return IndexedOptionForm{resolve(update.index_, n.index_), resolve(update.content_, n.content_)};
        },
        [&](const ByteMaskedForm& n) -> FormNode {
            return ByteMaskedForm{
                resolve(update.mask_, n.mask_),
                resolve(update.content_, n.content_),
                resolve(update.valid_when_, n.valid_when_)};
        },
        [&](const BitMaskedForm& n) -> FormNode {
            return BitMaskedForm{
                resolve(update.mask_, n.mask_),
                resolve(update.content_, n.content_),
                resolve(update.valid_when_, n.valid_when_),
                resolve(update.lsb_order_, n.lsb_order_)};
        },
        [&](const UnmaskedForm& n) -> FormNode {
            return UnmaskedForm{resolve(update.content_, n.content_)};
        },
        [&](const RecordForm& n) -> FormNode {
            return RecordForm{resolve(update.contents_, n.contents_), resolve(update.fields_, n.fields_)};
        },
        [&](const UnionForm& n) -> FormNode {
            return UnionForm{resolve(update.tags_, n.tags_), resolve(update.index_, n.index_), resolve(update.contents_, n.contents_)};
        }
    );
    return std::make_shared<Form>(
        std::move(node),
        FormMeta{resolve(update.parameters_, parameters_), resolve(update.form_key_, form_key_)});
}

bool Form::operator==(const Form& other) const {
    if (kind() != other.kind() || form_key_ != other.form_key_ ||
        !types::parameters_are_equal(parameters_, other.parameters_))
        return false;

    const auto& o = other.node_;
    return util::variant_match(node_,
        [&o](const NumpyForm& n) {
            const auto& on = std::get<NumpyForm>(o);
            return n.primitive_ == on.primitive_ && n.inner_shape_ == on.inner_shape_;
        },
        [](const EmptyForm&) {
            return true;
        },
        [&o](const RegularForm& n) {
            const auto& on = std::get<RegularForm>(o);
            return n.size_ == on.size_ && forms_equal(n.content_, on.content_);
        },
        [&o](const ListForm& n) {
            const auto& on = std::get<ListForm>(o);
            return n.starts_ == on.starts_ && n.stops_ == on.stops_ && forms_equal(n.content_, on.content_);
        },
        [&o](const ListOffsetForm& n) {
            const auto& on = std::get<ListOffsetForm>(o);
            return n.offsets_ == on.offsets_ && forms_equal(n.content_, on.content_);
        },
        [&o](const IndexedForm& n) {
            const auto& on = std::get<IndexedForm>(o);
            return n.index_ == on.index_ && forms_equal(n.content_, on.content_);
        },
        [&o](const IndexedOptionForm& n) {
            const auto& on = std::get<IndexedOptionForm>(o);
            return n.index_ == on.index_ && forms_equal(n.content_, on.content_);
        },
        [&o](const ByteMaskedForm& n) {
            const auto& on = std::get<ByteMaskedForm>(o);
            return n.mask_ == on.mask_ && n.valid_when_ == on.valid_when_ && forms_equal(n.content_, on.content_);
        },
        [&o](const BitMaskedForm& n) {
            const auto& on = std::get<BitMaskedForm>(o);
            return n.mask_ == on.mask_ && n.valid_when_ == on.valid_when_ && n.lsb_order_ == on.lsb_order_ &&
                forms_equal(n.content_, on.content_);
        },
        [&o](const UnmaskedForm& n) {
            return forms_equal(n.content_, std::get<UnmaskedForm>(o).content_);
        },
        [&o](const RecordForm& n) {
            return records_equal(n, std::get<RecordForm>(o));
        },
        [&o](const UnionForm& n) {
            const auto& on = std::get<UnionForm>(o);
            return n.tags_ == on.tags_ && n.index_ == on.index_ && contents_equal(n.contents_, on.contents_);
        }
    );
}

bool forms_equal(const FormPtr& one, const FormPtr& two) {
    if (!one || !two)
        return !one && !two;

    return one == two || *one == *two;
}

FormPtr make_numpy_form(Primitive primitive, InnerShape inner_shape, FormMeta meta) {
    return std::make_shared<Form>(NumpyForm{primitive, std::move(inner_shape)}, std::move(meta));
}

FormPtr make_numpy_form(std::string_view primitive, InnerShape inner_shape, FormMeta meta) {
    return make_numpy_form(types::parse_primitive(primitive), std::move(inner_shape), std::move(meta));
}

FormPtr make_empty_form(FormMeta meta) {
    return std::make_shared<Form>(EmptyForm{}, std::move(meta));
}

FormPtr make_regular_form(FormPtr content, ShapeItem size, FormMeta meta) {
    return std::make_shared<Form>(RegularForm{std::move(content), size}, std::move(meta));
}

FormPtr make_list_form(IndexType starts, IndexType stops, FormPtr content, FormMeta meta) {
    return std::make_shared<Form>(ListForm{starts, stops, std::move(content)}, std::move(meta));
}

FormPtr make_list_offset_form(IndexType offsets, FormPtr content, FormMeta meta) {
    return std::make_shared<Form>(ListOffsetForm{offsets, std::move(content)}, std::move(meta));
}

FormPtr make_indexed_form(IndexType index, FormPtr content, FormMeta meta) {
    return std::make_shared<Form>(IndexedForm{index, std::move(content)}, std::move(meta));
}

FormPtr make_indexed_option_form(IndexType index, FormPtr content, FormMeta meta) {
    return std::make_shared<Form>(IndexedOptionForm{index, std::move(content)}, std::move(meta));
}

FormPtr make_byte_masked_form(IndexType mask, FormPtr content, bool valid_when, FormMeta meta) {
    return std::make_shared<Form>(ByteMaskedForm{mask, std::move(content), valid_when}, std::move(meta));
}

FormPtr make_bit_masked_form(IndexType mask, FormPtr content, bool valid_when, bool lsb_order, FormMeta meta) {
    return std::make_shared<Form>(BitMaskedForm{mask, std::move(content), valid_when, lsb_order}, std::move(meta));
}

FormPtr make_unmasked_form(FormPtr content, FormMeta meta) {
    return std::make_shared<Form>(UnmaskedForm{std::move(content)}, std::move(meta));
}

FormPtr make_record_form(
    std::vector<FormPtr> contents,
    std::optional<std::vector<std::string>> fields,
    FormMeta meta) {
    return std::make_shared<Form>(RecordForm{std::move(contents), std::move(fields)}, std::move(meta));
}

FormPtr make_union_form(IndexType tags, IndexType index, std::vector<FormPtr> contents, FormMeta meta) {
    return std::make_shared<Form>(UnionForm{tags, index, std::move(contents)}, std::move(meta));
}

} // namespace raggedform

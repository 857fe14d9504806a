/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/builtin_forms.hpp>
#include <raggedform/util/preconditions.hpp>

namespace raggedform {

namespace {

FormMeta array_meta(std::string_view name) {
    FormMeta meta;
    meta.parameters_["__array__"] = std::string{name};
    return meta;
}

FormPtr text_form(std::string_view element, std::string_view array) {
    auto content = make_numpy_form(types::PrimitiveKind::UINT8, {}, array_meta(element));
    return make_list_offset_form(IndexType::I64, std::move(content), array_meta(array));
}

} // namespace

FormPtr string_form() {
    return text_form("char", "string");
}

FormPtr bytestring_form() {
    return text_form("byte", "bytestring");
}

FormPtr form_for_host_scalar(HostScalar scalar) {
    switch (scalar) {
        case HostScalar::BOOL:
            return make_numpy_form(types::PrimitiveKind::BOOL);
        case HostScalar::INTEGER:
            return make_numpy_form(types::PrimitiveKind::INT64);
        case HostScalar::REAL:
            return make_numpy_form(types::PrimitiveKind::FLOAT64);
        case HostScalar::COMPLEX:
            return make_numpy_form(types::PrimitiveKind::COMPLEX128);
        case HostScalar::STRING:
            return string_form();
        case HostScalar::BYTES:
            return bytestring_form();
    }
    util::raise_rte("Unhandled host scalar kind {}", static_cast<int>(scalar));
}

FormPtr form_for_host_scalar(Primitive primitive) {
    return make_numpy_form(primitive);
}

} // namespace raggedform

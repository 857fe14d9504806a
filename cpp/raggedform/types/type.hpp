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

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace raggedform::types {

class Type;
using TypePtr = std::shared_ptr<const Type>;

struct NumpyType {
    Primitive primitive_;
};

struct UnknownType {
};

struct ListType {
    TypePtr content_;
};

struct RegularType {
    TypePtr content_;
    ShapeItem size_;
};

struct OptionType {
    TypePtr content_;
};

struct RecordType {
    std::vector<TypePtr> contents_;
    // Absent for tuples
    std::optional<std::vector<std::string>> fields_;
};

struct UnionType {
    std::vector<TypePtr> contents_;
};

using TypeNode = std::variant<NumpyType, UnknownType, ListType, RegularType, OptionType, RecordType, UnionType>;

/*
 * Semantic description of an array shape with the physical encoding erased. Types are immutable and
 * shared between trees.
 */
class Type {
  public:
    Type(TypeNode node, Parameters parameters);

    [[nodiscard]] const TypeNode& node() const {
        return node_;
    }

    [[nodiscard]] const Parameters& parameters() const {
        return parameters_;
    }

    [[nodiscard]] const Json& parameter(std::string_view key) const {
        return types::parameter(parameters_, key);
    }

    template<class NodeType>
    [[nodiscard]] const NodeType* as() const {
        return std::get_if<NodeType>(&node_);
    }

    template<class NodeType>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<NodeType>(node_);
    }

    /*
     * Structural equality. Unless `all_parameters` is set only the keys in TYPE_PARAMETERS are compared.
     * Record fields are compared by name regardless of order and union branches as an unordered collection.
     */
    [[nodiscard]] bool is_equal_to(const Type& other, bool all_parameters = false) const;

    bool operator==(const Type& other) const {
        return is_equal_to(other);
    }

    [[nodiscard]] std::string to_str() const;

  private:
    TypeNode node_;
    Parameters parameters_;
};

TypePtr make_numpy_type(Primitive primitive, Parameters parameters = {});

TypePtr make_unknown_type(Parameters parameters = {});

TypePtr make_list_type(TypePtr content, Parameters parameters = {});

TypePtr make_regular_type(TypePtr content, ShapeItem size, Parameters parameters = {});

TypePtr make_option_type(TypePtr content, Parameters parameters = {});

TypePtr make_record_type(
    std::vector<TypePtr> contents,
    std::optional<std::vector<std::string>> fields,
    Parameters parameters = {});

TypePtr make_union_type(std::vector<TypePtr> contents, Parameters parameters = {});

/*
 * Builds an option over `content` with no nested option layers: an option content is merged into one
 * layer and a union content gets the option distributed over its branches.
 */
TypePtr make_simplified_option_type(TypePtr content, Parameters parameters = {});

/// A Type together with the length of the top-level array
struct ArrayType {
    TypePtr content_;
    ShapeItem length_;

    ArrayType(TypePtr content, ShapeItem length);

    /// An unknown length on either side matches any length
    [[nodiscard]] bool is_equal_to(const ArrayType& other, bool all_parameters = false) const;

    bool operator==(const ArrayType& other) const {
        return is_equal_to(other);
    }

    [[nodiscard]] std::string to_str() const;
};

} // namespace raggedform::types

namespace fmt {

template<>
struct formatter<raggedform::types::Type> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const raggedform::types::Type& type, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", type.to_str());
    }
};

template<>
struct formatter<raggedform::types::ArrayType> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const raggedform::types::ArrayType& array_type, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", array_type.to_str());
    }
};

} // namespace fmt

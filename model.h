/******************************************************************************
 * Copyright (C) 2016 Kitsune Ral <kitsune-ral@users.sf.net>
 * Copyright (C) 2026 insogen contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#pragma once

#include "util.h"

#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <variant>

/// A scalar taken verbatim from the API description
struct ScalarLiteral {
    std::string text;
    /// false for bare JSON tokens (numbers, booleans, null)
    bool isString = true;
};

/** @brief A schema from the API description, reduced to what sample synthesis needs
 *
 * Each alternative of the variant stands for one kind of schema. `$ref`
 * entries are kept unresolved (Ref) so that recursive definitions can be
 * represented; resolution happens at synthesis time with an explicit depth.
 * Whatever cannot be recognised ends up as Unknown.
 */
struct SchemaNode {
    struct Unknown {
        std::string typeName;
    };
    struct Ref {
        std::string path;
    };
    struct String {
        std::vector<ScalarLiteral> enumValues;
    };
    struct Integer {};
    struct Number {};
    struct Boolean {};
    struct Array {
        std::unique_ptr<const SchemaNode> items;
    };
    struct Object {
        pair_vector_t<SchemaNode> properties; ///< In the order of declaration
        bool additionalProperties = false;
    };

    using kind_type = std::variant<Unknown, Ref, String, Integer, Number, Boolean, Array, Object>;
    kind_type kind;

    SchemaNode(kind_type k = Unknown{}) : kind(std::move(k)) {}

    template <typename KindT>
    [[nodiscard]] bool is() const
    {
        return std::holds_alternative<KindT>(kind);
    }
    template <typename KindT>
    [[nodiscard]] const KindT& as() const
    {
        return std::get<KindT>(kind);
    }
    [[nodiscard]] std::string_view kindName() const;
};

/** \brief Helper type to visit variants
 *
 * Taken from https://en.cppreference.com/w/cpp/utility/variant/visit
 */
template <class... Ts>
struct overloadedVisitor : Ts... { using Ts::operator()...; };

/** Convenience wrapper around std::visit */
template <typename VariantT, typename... VisitorTs>
inline auto dispatchVisit(VariantT&& var, VisitorTs&&... visitors)
{
    return std::visit(overloadedVisitor{std::forward<VisitorTs>(visitors)...},
                      std::forward<VariantT>(var));
}

struct Path : public std::string
{
    explicit Path(std::string path);

    struct PartType {
        size_type from;
        size_type length;
        enum { Literal, Variable } kind;
    };

    std::vector<PartType> parts;
};

enum Location : unsigned char { InPath = 0, InQuery, InHeaders, InBody, InFormData };

std::optional<Location> parseLocation(std::string_view in);

struct Parameter {
    std::string name;
    Location in;
    /// Missing, null and empty examples are all stored as nullopt
    std::optional<std::string> example;
    /// Only filled for body parameters
    std::optional<SchemaNode> schema;
};

struct Operation {
    using string = std::string;

    Operation(Path opPath, string opVerb)
        : path(std::move(opPath)), verb(std::move(opVerb))
    { }

    [[nodiscard]] const Parameter* bodyParameter() const;
    [[nodiscard]] bool acceptsBody() const;
    [[nodiscard]] string upperCasedVerb() const;

    Path path;
    string verb; ///< As spelled in the API description
    std::optional<string> summary;
    string description;
    std::vector<Parameter> parameters;
    std::vector<string> consumedContentTypes;
    std::vector<string> tags;
    bool needsSecurity = false;
    /// Operations without `responses` are not considered valid and are not rendered
    bool hasResponses = false;
};

struct Model {
    std::string apiVersion = "unknown";
    std::unordered_map<std::string, SchemaNode> definitions;
    /// In the order of the API description
    std::vector<Operation> operations;
};

/******************************************************************************
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

#include "model.h"

struct ReferenceException : Exception {
    enum Kind : unsigned char { UnsupportedReferenceKind, UnresolvableReference };

    ReferenceException(Kind k, const std::string& refPath, std::string_view what)
        : Exception(std::string(what).append(": ").append(refPath)), kind(k)
    {}

    Kind kind;
};

/** @brief Looks up `#/definitions/<Name>` references in the definitions table
 *
 * External references and JSON Pointers into anything other than
 * `definitions` are not supported.
 */
class ReferenceResolver {
public:
    using definitions_type = decltype(Model::definitions);

    static constexpr std::string_view DefinitionsPrefix = "#/definitions/";

    explicit ReferenceResolver(const definitions_type& definitions)
        : _definitions(definitions)
    { }

    /// Throws ReferenceException if the reference is not a supported
    /// kind or points to a definition that doesn't exist
    [[nodiscard]] const SchemaNode& resolve(const std::string& refPath) const;

private:
    const definitions_type& _definitions;
};

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

#include "resolver.h"

#include "yaml.h"

using namespace std;

const SchemaNode& ReferenceResolver::resolve(const string& refPath) const
{
    if (!refPath.starts_with('#'))
        throw ReferenceException(ReferenceException::UnsupportedReferenceKind, refPath,
                                 "Non-local $refs are not supported");
    if (!refPath.starts_with(DefinitionsPrefix) || refPath.size() == DefinitionsPrefix.size())
        throw ReferenceException(ReferenceException::UnsupportedReferenceKind, refPath,
                                 "Only references to #/definitions/ are supported");

    string name;
    try {
        name = unescapeJsonPointerComponent(string_view(refPath).substr(DefinitionsPrefix.size()));
    } catch (const Exception& e) {
        throw ReferenceException(ReferenceException::UnsupportedReferenceKind, refPath,
                                 e.message);
    }

    const auto it = _definitions.find(name);
    if (it == _definitions.end())
        throw ReferenceException(ReferenceException::UnresolvableReference, refPath,
                                 "Could not find the definition pointed to by $ref");
    return it->second;
}

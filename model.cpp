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

#include "model.h"

#include <algorithm>
#include <array>
#include <cctype>

using namespace std;

string_view SchemaNode::kindName() const
{
    // Follows the order of alternatives in kind_type
    static constexpr array<string_view, 8> names{"unknown", "ref",     "string", "integer",
                                                 "number",  "boolean", "array",  "object"};
    return names[kind.index()];
}

Path::Path(string path)
    : string(std::move(path))
{
    // Unlike a URL template parser, this one doesn't reject anything: an
    // unbalanced brace turns the rest of the path into a literal
    for (size_type i = 0; i < size();)
    {
        const auto i1 = find('{', i);
        const auto i2 = i1 == npos ? npos : find('}', i1);
        if (i2 == npos)
        {
            parts.push_back({i, npos, PartType::Literal});
            break;
        }
        if (i1 > i)
            parts.push_back({i, i1 - i, PartType::Literal});
        parts.push_back({i1 + 1, i2 - i1 - 1, PartType::Variable});
        i = i2 + 1;
    }
}

optional<Location> parseLocation(string_view in)
{
    static constexpr array<pair<string_view, Location>, 5> locations{
        {{"path", InPath}, {"query", InQuery}, {"header", InHeaders},
         {"body", InBody}, {"formData", InFormData}}};
    for (const auto& [name, location] : locations)
        if (name == in)
            return location;
    return nullopt;
}

const Parameter* Operation::bodyParameter() const
{
    const auto it = ranges::find(parameters, InBody, &Parameter::in);
    return it != parameters.end() ? &*it : nullptr;
}

bool Operation::acceptsBody() const
{
    const auto v = upperCasedVerb();
    return v == "POST" || v == "PUT" || v == "PATCH";
}

string Operation::upperCasedVerb() const
{
    string result = verb;
    ranges::transform(result, result.begin(),
                      [](unsigned char c) { return char(toupper(c)); });
    return result;
}

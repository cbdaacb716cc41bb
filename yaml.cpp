/******************************************************************************
 * Copyright (C) 2017 Kitsune Ral <kitsune-ral@users.sf.net>
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

#include "yaml.h"

#include <yaml-cpp/node/parse.h>

#include <array>

using namespace std;

YamlException::YamlException(const YamlNode& node, string_view msg) noexcept
    : Exception(node.location().append(": ").append(msg))
{}

YamlNode YamlNode::fromFile(const string& fileName)
{
    return {YAML::LoadFile(fileName), make_shared<Context>(fileName), AllowUndefined{}};
}

YamlNode YamlNode::fromString(const string& text, string sourceName)
{
    return {YAML::Load(text), make_shared<Context>(std::move(sourceName)), AllowUndefined{}};
}

void YamlNode::checkType(YAML::NodeType::value checkedType) const
{
    using namespace string_literals;
    // Follows the YAML::NodeType::value enum
    static const array typenames{"Undefined"s, "Null"s, "Scalar"s, "Sequence"s, "Map"s};

    if (Type() != checkedType)
        throw YamlException(*this, "The node has a wrong type (expected " + typenames[checkedType]
                                       + ", got " + typenames[Type()] + ")");
}

string unescapeJsonPointerComponent(string_view escapedComponent)
{
    string result;
    for (bool escaping = false; auto c : escapedComponent) {
        if (escaping) [[unlikely]] {
            switch (c) {
            case '1': result.push_back('/'); break;
            case '0': result.push_back('~'); break;
            default: throw Exception(string("Incorrect JSON Pointer escaping sequence: ~") + c);
            }
            escaping = false;
        } else if (c == '~')
            escaping = true;
        else
            result.push_back(c);
    }
    return result;
}

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

#include "synthesizer.h"

#include <iostream>

using namespace std;

SampleValue Synthesizer::synthesize(const SchemaNode& schema, int depth) const
{
    // Checked before anything else so that reference cycles terminate, too
    if (depth > MaxDepth)
        return SampleValue::object();

    return dispatchVisit(
        schema.kind,
        [this, depth](const SchemaNode::Ref& ref) -> SampleValue {
            try {
                return synthesize(_resolver.resolve(ref.path), depth + 1);
            } catch (const ReferenceException& e) {
                if (_verbosity != Verbosity::Quiet)
                    clog << "Warning: " << e.message << "; using an empty object instead\n";
                return SampleValue::object();
            }
        },
        [](const SchemaNode::String& s) -> SampleValue {
            if (s.enumValues.empty())
                return "string";
            const auto& firstValue = s.enumValues.front();
            if (firstValue.isString)
                return firstValue.text;
            // Bare tokens from YAML sources need not be valid JSON
            if (auto literal = SampleValue::parse(firstValue.text, nullptr, false);
                !literal.is_discarded())
                return literal;
            return firstValue.text;
        },
        [](const SchemaNode::Integer&) -> SampleValue { return 0; },
        [](const SchemaNode::Number&) -> SampleValue { return 0; },
        [](const SchemaNode::Boolean&) -> SampleValue { return false; },
        [this, depth](const SchemaNode::Array& a) -> SampleValue {
            auto items = SampleValue::array();
            items.push_back(a.items ? synthesize(*a.items, depth + 1) : SampleValue::object());
            return items;
        },
        [this, depth](const SchemaNode::Object& o) -> SampleValue {
            // NB: an object with only additionalProperties yields {} as well
            auto fields = SampleValue::object();
            for (const auto& [fieldName, fieldSchema] : o.properties)
                fields[fieldName] = synthesize(fieldSchema, depth + 1);
            return fields;
        },
        [](const SchemaNode::Unknown&) -> SampleValue { return SampleValue::object(); });
}

string toJson(const SampleValue& sample, int indent)
{
    return sample.dump(indent, ' ', true, SampleValue::error_handler_t::replace);
}

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

#include "emitter.h"

#include "identity.h"

#include <algorithm>

using namespace std;
using namespace YamlFormatting;

namespace {

string_view trimmed(string_view s)
{
    static constexpr string_view Whitespace = " \t\n\r\f\v";
    const auto first = s.find_first_not_of(Whitespace);
    if (first == string_view::npos)
        return {};
    return s.substr(first, s.find_last_not_of(Whitespace) - first + 1);
}

bool hasParameters(const Operation& op, Location in)
{
    return ranges::find(op.parameters, in, &Parameter::in) != op.parameters.end();
}

} // namespace

string RequestEmitter::urlPath(const Operation& op)
{
    string result;
    for (const auto& part : op.path.parts) {
        const auto text = string_view(op.path).substr(part.from, part.length);
        if (part.kind == Path::PartType::Literal) {
            result += text;
            continue;
        }
        const auto paramIt = ranges::find_if(op.parameters, [text](const Parameter& p) {
            return p.in == InPath && p.name == text;
        });
        if (paramIt == op.parameters.end())
            result.append(1, '{').append(text).append(1, '}');
        else if (paramIt->example)
            result += *paramIt->example;
        else
            result.append("{{ _.").append(text).append(" }}");
    }
    return result;
}

void RequestEmitter::emitMeta(oyamlstream& s, const Operation& op, int64_t sortKey) const
{
    const Offset meta(s, "meta:");
    s << offset << "id: " << stableId("req", op.verb + ':' + op.path) << '\n';
    s << offset << "created: " << ItemTimestamp << '\n';
    s << offset << "modified: " << ItemTimestamp << '\n';
    s << offset << "isPrivate: false\n";
    if (!op.description.empty()) {
        const auto description = trimmed(op.description);
        if (description.find('\n') == string_view::npos)
            s << offset << "description: " << yamlEscape(description) << '\n';
        else
            writeBlockScalar(s, "description", "|-", description);
    }
    s << offset << "sortKey: " << sortKey << '\n';
}

void RequestEmitter::emit(oyamlstream& s, const Operation& op, int64_t sortKey) const
{
    const SequenceItem item(s);
    s << "url: >-\n";
    {
        const Offset urlOffset(s, 2);
        s << offset << "{{ _.base_url }}" << urlPath(op) << '\n';
    }
    s << offset << "name: "
      << yamlEscape(op.summary ? *op.summary : op.upperCasedVerb() + ' ' + op.path) << '\n';
    emitMeta(s, op, sortKey);
    s << offset << "method: " << op.upperCasedVerb() << '\n';

    string mimeType;
    if (const auto* bodyParam = op.acceptsBody() ? op.bodyParameter() : nullptr;
        bodyParam && bodyParam->schema) {
        mimeType = op.consumedContentTypes.empty() ? string(DefaultMimeType)
                                                   : op.consumedContentTypes.front();
        const Offset body(s, "body:");
        s << offset << "mimeType: " << yamlEscape(mimeType) << '\n';
        writeBlockScalar(s, "text", "|-",
                         toJson(_synthesizer.synthesize(*bodyParam->schema), 2));
    }

    if (hasParameters(op, InQuery)) {
        const Offset parameters(s, "parameters:");
        for (const auto& p : op.parameters) {
            if (p.in != InQuery)
                continue;
            const SequenceItem paramItem(s);
            s << "name: " << yamlEscape(p.name) << '\n';
            s << offset << "disabled: true\n";
            s << offset << "value: " << yamlQuote(p.example.value_or("")) << '\n';
        }
    }

    if (!mimeType.empty() || op.needsSecurity) {
        const Offset headers(s, "headers:");
        if (!mimeType.empty()) {
            const SequenceItem header(s);
            s << "name: Content-Type\n";
            s << offset << "disabled: false\n";
            s << offset << "value: " << yamlEscape(mimeType) << '\n';
        }
        if (op.needsSecurity) {
            const SequenceItem header(s);
            s << "name: Authorization\n";
            s << offset << "disabled: false\n";
            writeBlockScalar(s, "value", ">-", "{{ _.api_key }}");
        }
    }

    const Offset settings(s, "settings:");
    s << offset << "renderRequestBody: true\n";
    s << offset << "encodeUrl: true\n";
    s << offset << "followRedirects: global\n";
    {
        const Offset cookies(s, "cookies:");
        s << offset << "send: true\n";
        s << offset << "store: true\n";
    }
    s << offset << "rebuildPath: true\n";
}

string RequestEmitter::emit(const Operation& op, int64_t sortKey) const
{
    oyamlstream s;
    emit(s, op, sortKey);
    return s.str();
}

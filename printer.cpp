/******************************************************************************
 * Copyright (C) 2016-2017 Kitsune Ral <kitsune-ral@users.sf.net>
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

#include "printer.h"

#include <iostream>

using namespace std;
using namespace YamlFormatting;
namespace km = kainjow::mustache;

Printer::Printer(const Config& config)
    : _config(config)
{
    if (const auto mstch = makeMustache(_config.collectionName()); !mstch.is_valid())
        throw Exception("Invalid collection name template '" + _config.collectionName()
                        + "': " + mstch.error_message());
}

Printer::template_type Printer::makeMustache(const string& tmpl) const
{
    km::mustache mstch{tmpl};
    mstch.set_custom_escape([](string s) { return s; });
    return mstch;
}

string Printer::collectionName(const string& apiVersion) const
{
    auto mstch = makeMustache(_config.collectionName());
    return mstch.render(km::object{{"version", apiVersion}});
}

void Printer::printFolder(oyamlstream& s, const Folder& folder, const RequestEmitter& emitter,
                          SortKeyCounter& sortKeys) const
{
    if (_config.verbosity() == Verbosity::Debug)
        clog << "Folder " << folder.tag << ": " << folder.operations.size()
             << " request(s)" << endl;

    const SequenceItem item(s);
    s << "name: " << yamlEscape(folder.tag) << '\n';
    {
        const Offset meta(s, "meta:");
        s << offset << "id: " << stableId("fld", "folder:" + folder.tag) << '\n';
        s << offset << "created: " << ItemTimestamp << '\n';
        s << offset << "modified: " << ItemTimestamp << '\n';
        s << offset << "sortKey: " << sortKeys.next() << '\n';
    }
    {
        const Offset children(s, "children:");
        for (const auto* op : folder.operations) {
            if (_config.verbosity() == Verbosity::Debug)
                clog << "  " << op->upperCasedVerb() << ' ' << op->path << endl;
            emitter.emit(s, *op, sortKeys.next());
        }
    }
    if (folder.needsSecurity()) {
        const Offset auth(s, "authentication:");
        s << offset << "type: bearer\n";
        writeBlockScalar(s, "token", ">-", "{{ _.api_key }}");
    }
}

void Printer::printCookieJar(oyamlstream& s) const
{
    const Offset jar(s, "cookieJar:");
    s << offset << "name: Default Jar\n";
    const Offset meta(s, "meta:");
    s << offset << "id: " << stableId("jar", "default-cookie-jar") << '\n';
    s << offset << "created: " << WorkspaceTimestamp + 2 << '\n';
    s << offset << "modified: " << WorkspaceTimestamp + 2 << '\n';
}

void Printer::printEnvironments(oyamlstream& s) const
{
    const auto& env = _config.environment();
    const Offset environments(s, "environments:");
    s << offset << "name: Base Environment\n";
    {
        const Offset meta(s, "meta:");
        s << offset << "id: " << stableId("env", "base-environment") << '\n';
        s << offset << "created: " << WorkspaceTimestamp + 1 << '\n';
        s << offset << "modified: " << WorkspaceTimestamp + 1 << '\n';
        s << offset << "isPrivate: false\n";
    }
    {
        const Offset data(s, "data:");
        s << offset << "scheme: " << yamlEscape(env.scheme) << '\n';
        s << offset << "base_path: " << yamlEscape(env.basePath) << '\n';
        writeBlockScalar(s, "base_url", ">-", "{{ _.scheme }}://{{ _.host }}{{ _.base_path }}");
    }
    const Offset subEnvironments(s, "subEnvironments:");
    const SequenceItem item(s);
    s << "name: " << yamlEscape(env.name) << '\n';
    {
        const Offset meta(s, "meta:");
        s << offset << "id: " << stableId("env", "stillness-environment") << '\n';
        s << offset << "created: " << ItemTimestamp << '\n';
        s << offset << "modified: " << ItemTimestamp << '\n';
        s << offset << "isPrivate: false\n";
        s << offset << "sortKey: " << ItemTimestamp << '\n';
    }
    {
        const Offset data(s, "data:");
        s << offset << "host: " << yamlEscape(env.host) << '\n';
        s << offset << "api_key: " << yamlEscape(env.apiKey) << '\n';
    }
    s << offset << "color: " << yamlEscape(env.color) << '\n';
}

string Printer::print(const Model& model) const
{
    const ReferenceResolver resolver(model.definitions);
    const Synthesizer synthesizer(resolver, _config.verbosity());
    const RequestEmitter emitter(synthesizer);
    SortKeyCounter sortKeys;

    oyamlstream s;
    s << "type: " << DocumentType << '\n';
    s << "name: " << yamlEscape(collectionName(model.apiVersion)) << '\n';
    {
        const Offset meta(s, "meta:");
        s << offset << "id: " << stableId("wrk", "world-api-collection") << '\n';
        s << offset << "created: " << WorkspaceTimestamp << '\n';
        s << offset << "modified: " << WorkspaceTimestamp << '\n';
    }

    const auto folders = groupOperations(model, _config.tagOrder(), _config.fallbackTag());
    if (folders.empty())
        s << "collection: []\n";
    else {
        const Offset collection(s, "collection:");
        for (const auto& f : folders)
            printFolder(s, f, emitter, sortKeys);
    }

    printCookieJar(s);
    printEnvironments(s);
    return s.str();
}

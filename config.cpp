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

#include "config.h"

#include <iostream>

using namespace std;

Config::Config(Verbosity verbosity)
    : _verbosity(verbosity)
{ }

Config::Config(const path& configFilePath, Verbosity verbosity)
    : Config(verbosity)
{
    if (_verbosity != Verbosity::Quiet)
        clog << "Using config file at " << configFilePath << endl;
    load(YamlNode::fromFile(configFilePath.string()).as<YamlMap<>>());
}

void Config::load(const YamlMap<>& configYaml)
{
    if (const auto& collectionYaml = configYaml.maybeGet<YamlMap<>>("collection")) {
        collectionYaml->maybeLoad("name", &_collectionName);
        collectionYaml->maybeLoad("fallbackTag", &_fallbackTag);
        if (const auto& tagOrderYaml = collectionYaml->maybeGet<YamlSequence<string>>("tagOrder")) {
            _tagOrder.clear();
            for (const auto& tag : *tagOrderYaml)
                _tagOrder.emplace_back(tag);
        }
        if (_fallbackTag.empty())
            throw YamlException(*collectionYaml, "fallbackTag cannot be empty");
    }

    if (const auto& envYaml = configYaml.maybeGet<YamlMap<>>("environment")) {
        envYaml->maybeLoad("scheme", &_environment.scheme);
        envYaml->maybeLoad("basePath", &_environment.basePath);
        if (const auto& subEnvYaml = envYaml->maybeGet<YamlMap<>>("subEnvironment")) {
            subEnvYaml->maybeLoad("name", &_environment.name);
            subEnvYaml->maybeLoad("host", &_environment.host);
            subEnvYaml->maybeLoad("apiKey", &_environment.apiKey);
            subEnvYaml->maybeLoad("color", &_environment.color);
        }
    }

    if (_verbosity == Verbosity::Debug) {
        clog << "Collection name template: " << _collectionName << endl
             << "Preferred folder order:";
        for (const auto& t : _tagOrder)
            clog << ' ' << t;
        clog << endl
             << "Fallback folder: " << _fallbackTag << endl
             << "Sub-environment " << _environment.name << " at " << _environment.scheme
             << "://" << _environment.host << _environment.basePath << endl;
    }
}

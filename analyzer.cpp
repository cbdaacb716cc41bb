/******************************************************************************
 * Copyright (C) 2018 Kitsune Ral <kitsune-ral@users.sf.net>
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

#include "analyzer.h"

#include <iostream>

using namespace std;
namespace fs = filesystem;

void Analyzer::warn(const YamlNode& node, string_view message) const
{
    if (_verbosity != Verbosity::Quiet)
        clog << node.location() << ": warning: " << message << '\n';
}

void Analyzer::trace(const YamlNode& node, string_view message) const
{
    if (_verbosity == Verbosity::Debug)
        clog << node.location() << ": " << message << '\n';
}

Model Analyzer::loadModel(const fspath& filePath) const
{
    if (!fs::exists(filePath))
        throw MissingInputDocument("Swagger spec not found at " + filePath.string());

    if (_verbosity != Verbosity::Quiet)
        clog << "Loading from " << filePath << endl;
    return analyze(YamlNode::fromFile(filePath.string()).as<YamlMap<>>());
}

Model Analyzer::analyze(const YamlMap<>& yaml) const
{
    Model model;
    if (const auto yamlInfo = yaml["info"]; yamlInfo && yamlInfo->IsMap()) {
        if (const auto yamlVersion = yamlInfo->as<YamlMap<>>()["version"];
            yamlVersion && yamlVersion->IsScalar())
            model.apiVersion = yamlVersion->as<string>();
        else
            warn(*yamlInfo, "no API version found, using '" + model.apiVersion + "'");
    }

    if (const auto yamlDefinitions = yaml.maybeGet<YamlMap<>>("definitions"))
        for (const auto& [name, yamlSchema] : *yamlDefinitions)
            model.definitions.emplace(name, analyzeSchema(yamlSchema));

    const auto yamlPaths = yaml.maybeGet<YamlMap<>>("paths");
    if (!yamlPaths) {
        warn(yaml, "no paths in the API description");
        return model;
    }
    for (const auto& [path, yamlPathItem] : *yamlPaths) {
        if (!yamlPathItem.IsMap()) {
            warn(yamlPathItem, "path " + path + " is not a map, skipping");
            continue;
        }
        for (const auto& [verb, yamlOp] : yamlPathItem.as<YamlMap<>>()) {
            // Path-level entries, such as a common parameters list, are not maps
            if (!yamlOp.IsMap()) {
                trace(yamlOp, "skipping " + verb + " under " + path);
                continue;
            }
            auto&& op = analyzeOperation(path, verb, yamlOp.as<YamlMap<>>());
            if (!op.hasResponses)
                trace(yamlOp, "no responses in " + verb + ' ' + path + ", it won't be emitted");
            model.operations.push_back(std::move(op));
        }
    }
    if (_verbosity == Verbosity::Debug)
        clog << "Loaded " << model.operations.size() << " operation(s) and "
             << model.definitions.size() << " definition(s), API version "
             << model.apiVersion << endl;
    return model;
}

Operation Analyzer::analyzeOperation(const string& path, const string& verb,
                                     const YamlMap<>& yamlOp) const
{
    Operation op{Path(path), verb};
    trace(yamlOp, "operation " + op.upperCasedVerb() + ' ' + path);

    if (const auto yamlSummary = yamlOp["summary"]; yamlSummary && yamlSummary->IsScalar())
        op.summary = yamlSummary->as<string>();
    if (const auto yamlDescription = yamlOp["description"];
        yamlDescription && yamlDescription->IsScalar())
        op.description = yamlDescription->as<string>();

    op.tags = loadStrings(yamlOp, "tags");
    op.consumedContentTypes = loadStrings(yamlOp, "consumes");

    if (const auto yamlParams = yamlOp["parameters"]) {
        if (yamlParams->IsSequence()) {
            for (const auto& yamlParam : yamlParams->as<YamlSequence<>>())
                if (auto&& param = analyzeParameter(yamlParam))
                    op.parameters.push_back(std::move(*param));
        } else
            warn(*yamlParams, "parameters is not a list, ignoring");
    }

    // An empty security list explicitly turns authentication off
    if (const auto yamlSecurity = yamlOp["security"])
        op.needsSecurity = !yamlSecurity->empty();
    op.hasResponses = bool(yamlOp["responses"]);
    return op;
}

optional<Parameter> Analyzer::analyzeParameter(const YamlNode& yamlParam) const
{
    if (!yamlParam.IsMap()) {
        warn(yamlParam, "a parameter is not a map, skipping");
        return nullopt;
    }
    const auto yamlMap = yamlParam.as<YamlMap<>>();
    const auto yamlName = yamlMap["name"];
    if (!yamlName || !yamlName->IsScalar()) {
        warn(yamlParam, "a parameter without a name, skipping");
        return nullopt;
    }
    auto name = yamlName->as<string>();

    const auto yamlIn = yamlMap["in"];
    const auto in = yamlIn && yamlIn->IsScalar() ? parseLocation(yamlIn->as<string>()) : nullopt;
    if (!in) {
        warn(yamlParam, "parameter " + name + " has no valid location (in), skipping");
        return nullopt;
    }

    Parameter param{std::move(name), *in, nullopt, nullopt};
    if (const auto yamlExample = yamlMap["example"]) {
        if (yamlExample->IsScalar()) {
            if (auto example = yamlExample->as<string>(); !example.empty())
                param.example = std::move(example);
        } else if (!yamlExample->IsNull())
            trace(*yamlExample, "non-scalar example of " + param.name + " ignored");
    }
    if (param.in == InBody) {
        if (const auto yamlSchema = yamlMap["schema"])
            param.schema = analyzeSchema(*yamlSchema);
        else
            warn(yamlParam, "body parameter " + param.name + " has no schema");
    }
    return param;
}

vector<string> Analyzer::loadStrings(const YamlMap<>& yaml, const string& keyName) const
{
    vector<string> result;
    const auto yamlList = yaml[keyName];
    if (!yamlList || yamlList->IsNull())
        return result;
    if (!yamlList->IsSequence()) {
        warn(*yamlList, keyName + " is not a list, ignoring");
        return result;
    }
    for (const auto& yamlItem : yamlList->as<YamlSequence<>>())
        if (yamlItem.IsScalar())
            result.push_back(yamlItem.as<string>());
        else
            warn(yamlItem, "non-string entry in " + keyName + ", skipping");
    return result;
}

optional<ScalarLiteral> Analyzer::loadLiteral(const YamlNode& yaml) const
{
    if (yaml.IsNull())
        return ScalarLiteral{"null", false};
    if (!yaml.IsScalar())
        return nullopt;
    return ScalarLiteral{yaml.as<string>(), yaml.isQuotedScalar()};
}

SchemaNode Analyzer::analyzeSchema(const YamlNode& yamlSchema) const
{
    if (!yamlSchema.IsMap()) {
        warn(yamlSchema, "a schema is not a map, treating as unknown");
        return {};
    }
    const auto yaml = yamlSchema.as<YamlMap<>>();

    if (const auto yamlRef = yaml["$ref"]) {
        if (yamlRef->IsScalar())
            return {SchemaNode::Ref{yamlRef->as<string>()}};
        warn(*yamlRef, "$ref is not a string, treating the schema as unknown");
        return {};
    }

    string typeName = "object";
    if (const auto yamlType = yaml["type"]) {
        if (yamlType->IsScalar())
            typeName = yamlType->as<string>();
        else {
            trace(*yamlType, "only single types are supported");
            typeName.clear();
        }
    }

    if (typeName == "string") {
        SchemaNode::String s;
        if (const auto yamlEnum = yaml["enum"]; yamlEnum && yamlEnum->IsSequence())
            for (const auto& yamlValue : yamlEnum->as<YamlSequence<>>()) {
                if (auto&& literal = loadLiteral(yamlValue))
                    s.enumValues.push_back(std::move(*literal));
                else
                    warn(yamlValue, "non-scalar enum values are not supported, skipping");
            }
        return {std::move(s)};
    }
    if (typeName == "integer")
        return {SchemaNode::Integer{}};
    if (typeName == "number")
        return {SchemaNode::Number{}};
    if (typeName == "boolean")
        return {SchemaNode::Boolean{}};
    if (typeName == "array") {
        SchemaNode::Array a;
        if (const auto yamlItems = yaml["items"])
            a.items = make_unique<const SchemaNode>(analyzeSchema(*yamlItems));
        return {std::move(a)};
    }

    const auto yamlProperties = yaml["properties"];
    if (typeName != "object" && !yamlProperties)
        return {SchemaNode::Unknown{typeName}};

    SchemaNode::Object o;
    o.additionalProperties = bool(yaml["additionalProperties"]);
    if (yamlProperties) {
        if (yamlProperties->IsMap())
            for (const auto& [propertyName, yamlProperty] : yamlProperties->as<YamlMap<>>())
                o.properties.emplace_back(propertyName, analyzeSchema(yamlProperty));
        else if (!yamlProperties->IsNull())
            warn(*yamlProperties, "properties is not a map, ignoring");
    }
    return {std::move(o)};
}

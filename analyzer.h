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

#pragma once

#include "config.h"
#include "model.h"
#include "yaml.h"

#include <filesystem>
#include <optional>

/// Builds a Model out of a Swagger 2.0 document
class Analyzer {
public:
    using string = std::string;
    using fspath = std::filesystem::path;

    explicit Analyzer(Verbosity verbosity = Verbosity::Basic)
        : _verbosity(verbosity)
    { }

    /// Throws MissingInputDocument if the file doesn't exist, YamlException
    /// if it's not a valid document
    [[nodiscard]] Model loadModel(const fspath& filePath) const;
    [[nodiscard]] Model analyze(const YamlMap<>& yaml) const;
    /// Never throws on unexpected shapes; those become Unknown nodes
    [[nodiscard]] SchemaNode analyzeSchema(const YamlNode& yamlSchema) const;

private:
    Verbosity _verbosity;

    [[nodiscard]] Operation analyzeOperation(const string& path, const string& verb,
                                             const YamlMap<>& yamlOp) const;
    [[nodiscard]] std::optional<Parameter> analyzeParameter(const YamlNode& yamlParam) const;
    [[nodiscard]] std::vector<string> loadStrings(const YamlMap<>& yaml,
                                                  const string& keyName) const;
    [[nodiscard]] std::optional<ScalarLiteral> loadLiteral(const YamlNode& yaml) const;

    void warn(const YamlNode& node, std::string_view message) const;
    void trace(const YamlNode& node, std::string_view message) const;
};

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

#pragma once

#include "yaml.h"

#include <filesystem>

enum class Verbosity { Quiet = 0, Basic, Debug };

/// Variables of the environment hierarchy in the generated collection
struct EnvironmentConfig {
    std::string scheme = "https";
    std::string basePath;
    std::string name = "Stillness";
    std::string host = "blockchain-gateway-stillness.live.tech.evefrontier.com";
    std::string apiKey = "eyABC.123";
    std::string color = "#ff4a00";
};

class Config
{
public:
    using string = std::string;
    using path = std::filesystem::path;

    explicit Config(Verbosity verbosity = Verbosity::Basic);
    Config(const path& configFilePath, Verbosity verbosity);

    [[nodiscard]] Verbosity verbosity() const { return _verbosity; }
    /// Mustache template for the collection name, `{{version}}` is available
    [[nodiscard]] const string& collectionName() const { return _collectionName; }
    [[nodiscard]] const std::vector<string>& tagOrder() const { return _tagOrder; }
    [[nodiscard]] const string& fallbackTag() const { return _fallbackTag; }
    [[nodiscard]] const EnvironmentConfig& environment() const { return _environment; }

    void load(const YamlMap<>& configYaml);

private:
    Verbosity _verbosity;
    string _collectionName = "EVE Frontier World API ({{version}})";
    std::vector<string> _tagOrder{"meta", "chain", "game"};
    string _fallbackTag = "other";
    EnvironmentConfig _environment;
};

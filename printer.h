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

#pragma once

#include "config.h"
#include "emitter.h"
#include "grouper.h"
#include "identity.h"

#include <kainjow/mustache.hpp>

/// Assembles the whole Insomnia collection document out of a model
class Printer {
public:
    using template_type = kainjow::mustache::mustache;
    using oyamlstream = YamlFormatting::oyamlstream;
    using string = std::string;

    static constexpr std::string_view DocumentType = "collection.insomnia.rest/5.0";

    /// Throws Exception if the collection name template is not valid mustache
    explicit Printer(const Config& config);

    [[nodiscard]] string collectionName(const string& apiVersion) const;
    /// The output only depends on \p model and the configuration
    [[nodiscard]] string print(const Model& model) const;

private:
    const Config& _config;

    [[nodiscard]] template_type makeMustache(const string& tmpl) const;
    void printFolder(oyamlstream& s, const Folder& folder, const RequestEmitter& emitter,
                     SortKeyCounter& sortKeys) const;
    void printCookieJar(oyamlstream& s) const;
    void printEnvironments(oyamlstream& s) const;
};

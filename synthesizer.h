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

#pragma once

#include "config.h"
#include "resolver.h"

#include <nlohmann/json.hpp>

/// An example JSON value; objects keep the schema's property order
using SampleValue = nlohmann::ordered_json;

/// Renders the value the same way Python's json.dumps(indent=...) does,
/// non-ASCII text included; a negative indent produces the compact form
std::string toJson(const SampleValue& sample, int indent = -1);

class Synthesizer {
public:
    /// Nodes deeper than this turn into empty objects
    static constexpr int MaxDepth = 4;

    explicit Synthesizer(const ReferenceResolver& resolver,
                         Verbosity verbosity = Verbosity::Basic)
        : _resolver(resolver), _verbosity(verbosity)
    { }

    /// Never throws: whatever cannot be synthesized becomes an empty object
    [[nodiscard]] SampleValue synthesize(const SchemaNode& schema, int depth = 0) const;

private:
    const ReferenceResolver& _resolver;
    Verbosity _verbosity;
};

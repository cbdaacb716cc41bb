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

#include "formatting.h"
#include "synthesizer.h"

#include <cstdint>

/** @brief Renders single operations as Insomnia request entries
 *
 * A request entry is an element of a folder's `children` sequence; it
 * starts with `- url:` at the current offset of the stream.
 */
class RequestEmitter {
public:
    using oyamlstream = YamlFormatting::oyamlstream;

    static constexpr std::string_view DefaultMimeType = "application/json";

    explicit RequestEmitter(const Synthesizer& synthesizer)
        : _synthesizer(synthesizer)
    { }

    void emit(oyamlstream& s, const Operation& op, std::int64_t sortKey) const;
    /// Same as above, with the fragment starting at column 0
    [[nodiscard]] std::string emit(const Operation& op, std::int64_t sortKey) const;

    /** @brief Substitutes path parameters in the operation's path
     *
     * Variables with an example get the example value, those without one
     * become Insomnia environment references (`{{ _.name }}`); variables
     * not declared as path parameters are left as they are.
     */
    [[nodiscard]] static std::string urlPath(const Operation& op);

private:
    const Synthesizer& _synthesizer;

    void emitMeta(oyamlstream& s, const Operation& op, std::int64_t sortKey) const;
};

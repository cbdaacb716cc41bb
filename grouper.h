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

#include "model.h"

struct Folder {
    std::string tag;
    /// Ordered by (path, verb)
    std::vector<const Operation*> operations;

    [[nodiscard]] bool needsSecurity() const;
};

/** @brief Distribute operations into folders by their tags
 *
 * Folders named in \p preferredOrder come first (if there are operations
 * for them), followed by the rest in the order the tags were first seen.
 * Operations without tags go to \p fallbackTag; operations without
 * responses are left out. The returned folders point into \p model.
 */
[[nodiscard]] std::vector<Folder> groupOperations(const Model& model,
                                                  const std::vector<std::string>& preferredOrder,
                                                  const std::string& fallbackTag);

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

#include <cstdint>
#include <string>
#include <string_view>

// Fixed time bases; nothing in the generated collection depends on the clock
constexpr inline std::int64_t WorkspaceTimestamp = 1749660438111;
constexpr inline std::int64_t ItemTimestamp = 1749660554120;

/// Makes an Insomnia-style id, `<prefix>_<MD5 of seed in hex>`
std::string stableId(std::string_view prefix, std::string_view seed);

/// Hands out sort keys in strictly decreasing order
class SortKeyCounter {
public:
    explicit SortKeyCounter(std::int64_t first = -ItemTimestamp) : _next(first) {}

    std::int64_t next() { return _next--; }
    [[nodiscard]] std::int64_t peek() const { return _next; }

private:
    std::int64_t _next;
};

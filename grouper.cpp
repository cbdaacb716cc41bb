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

#include "grouper.h"

#include <algorithm>

using namespace std;

bool Folder::needsSecurity() const
{
    return ranges::any_of(operations, &Operation::needsSecurity);
}

vector<Folder> groupOperations(const Model& model, const vector<string>& preferredOrder,
                               const string& fallbackTag)
{
    vector<Folder> seenFolders; // In the order of first appearance
    const auto folderFor = [&seenFolders](const string& tag) -> Folder& {
        auto it = ranges::find(seenFolders, tag, &Folder::tag);
        if (it == seenFolders.end())
            return seenFolders.emplace_back(Folder{tag, {}});
        return *it;
    };

    for (const auto& op : model.operations) {
        if (!op.hasResponses)
            continue;
        if (op.tags.empty())
            folderFor(fallbackTag).operations.push_back(&op);
        for (const auto& tag : op.tags)
            folderFor(tag).operations.push_back(&op);
    }

    for (auto& f : seenFolders)
        ranges::stable_sort(f.operations, [](const Operation* lhs, const Operation* rhs) {
            const string& lhsPath = lhs->path;
            const string& rhsPath = rhs->path;
            return lhsPath != rhsPath ? lhsPath < rhsPath : lhs->verb < rhs->verb;
        });

    vector<Folder> result;
    result.reserve(seenFolders.size());
    for (const auto& tag : preferredOrder)
        if (auto it = ranges::find(seenFolders, tag, &Folder::tag);
            it != seenFolders.end() && ranges::find(result, tag, &Folder::tag) == result.end())
            result.push_back(*it);
    for (const auto& f : seenFolders)
        if (ranges::find(preferredOrder, f.tag) == preferredOrder.end())
            result.push_back(f);
    return result;
}

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

#include "test_helpers.h"

#include <gtest/gtest.h>

namespace {

const std::vector<std::string> DefaultOrder{"meta", "chain", "game"};

std::vector<std::string> folderNames(const std::vector<Folder>& folders)
{
    std::vector<std::string> names;
    for (const auto& f : folders)
        names.push_back(f.tag);
    return names;
}

std::vector<std::string> requestNames(const Folder& folder)
{
    std::vector<std::string> names;
    for (const auto* op : folder.operations)
        names.push_back(op->upperCasedVerb() + ' ' + op->path);
    return names;
}

} // namespace

TEST(GrouperTest, PreferredTagsComeFirst)
{
    const auto model = modelFromJson(R"({"paths": {
        "/a": {"get": {"tags": ["game"], "responses": {}}},
        "/b": {"get": {"tags": ["other"], "responses": {}}},
        "/c": {"get": {"tags": ["chain"], "responses": {}}},
        "/d": {"get": {"tags": ["meta"], "responses": {}}}
    }})");
    EXPECT_EQ(folderNames(groupOperations(model, DefaultOrder, "other")),
              (std::vector<std::string>{"meta", "chain", "game", "other"}));
}

TEST(GrouperTest, ExtraTagsKeepFirstSeenOrder)
{
    const auto model = modelFromJson(R"({"paths": {
        "/z": {"get": {"tags": ["zulu"], "responses": {}}},
        "/a": {"get": {"tags": ["alpha", "game"], "responses": {}}},
        "/m": {"get": {"tags": ["zulu"], "responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "other");
    EXPECT_EQ(folderNames(folders), (std::vector<std::string>{"game", "zulu", "alpha"}));
    EXPECT_EQ(requestNames(folders[1]), (std::vector<std::string>{"GET /m", "GET /z"}));
}

TEST(GrouperTest, UntaggedGoToFallback)
{
    const auto model = modelFromJson(R"({"paths": {
        "/x": {"get": {"responses": {}}},
        "/y": {"get": {"tags": [], "responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "misc");
    ASSERT_EQ(folders.size(), 1u);
    EXPECT_EQ(folders[0].tag, "misc");
    EXPECT_EQ(requestNames(folders[0]), (std::vector<std::string>{"GET /x", "GET /y"}));
}

TEST(GrouperTest, SkipsOperationsWithoutResponses)
{
    const auto model = modelFromJson(R"({"paths": {
        "/x": {"get": {"tags": ["meta"]}, "post": {"tags": ["meta"], "responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "other");
    ASSERT_EQ(folders.size(), 1u);
    EXPECT_EQ(requestNames(folders[0]), (std::vector<std::string>{"POST /x"}));
}

TEST(GrouperTest, MultiTaggedOperationsAppearInEachFolder)
{
    const auto model = modelFromJson(R"({"paths": {
        "/both": {"get": {"tags": ["chain", "meta"], "responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "other");
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders[0].operations, folders[1].operations);
}

TEST(GrouperTest, SortsByPathThenVerb)
{
    const auto model = modelFromJson(R"({"paths": {
        "/b": {"post": {"responses": {}}, "get": {"responses": {}}},
        "/B": {"get": {"responses": {}}},
        "/a/{id}": {"put": {"responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "other");
    ASSERT_EQ(folders.size(), 1u);
    EXPECT_EQ(requestNames(folders[0]),
              (std::vector<std::string>{"GET /B", "PUT /a/{id}", "GET /b", "POST /b"}));
}

TEST(GrouperTest, FolderSecurity)
{
    const auto model = modelFromJson(R"({"paths": {
        "/open": {"get": {"tags": ["meta"], "responses": {}}},
        "/locked": {"get": {"tags": ["game"], "security": [{"bearer": []}], "responses": {}}},
        "/explicitlyOpen": {"get": {"tags": ["game"], "security": [], "responses": {}}}
    }})");
    const auto folders = groupOperations(model, DefaultOrder, "other");
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_FALSE(folders[0].needsSecurity());
    EXPECT_TRUE(folders[1].needsSecurity());
}

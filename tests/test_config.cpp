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

#include "config.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

namespace {

YamlMap<> configYaml(const std::string& text)
{
    return YamlNode::fromString(text, "config.yaml").as<YamlMap<>>();
}

} // namespace

TEST(ConfigTest, Defaults)
{
    const Config config(Verbosity::Quiet);
    EXPECT_EQ(config.verbosity(), Verbosity::Quiet);
    EXPECT_EQ(config.collectionName(), "EVE Frontier World API ({{version}})");
    EXPECT_EQ(config.tagOrder(), (std::vector<std::string>{"meta", "chain", "game"}));
    EXPECT_EQ(config.fallbackTag(), "other");
    const auto& env = config.environment();
    EXPECT_EQ(env.scheme, "https");
    EXPECT_EQ(env.basePath, "");
    EXPECT_EQ(env.name, "Stillness");
    EXPECT_EQ(env.host, "blockchain-gateway-stillness.live.tech.evefrontier.com");
    EXPECT_EQ(env.apiKey, "eyABC.123");
    EXPECT_EQ(env.color, "#ff4a00");
}

TEST(ConfigTest, LoadsFile)
{
    const Config config(testDataPath("sample-config.yaml"), Verbosity::Quiet);
    EXPECT_EQ(config.collectionName(), "World API {{version}}");
    EXPECT_EQ(config.tagOrder(), (std::vector<std::string>{"chain", "meta"}));
    EXPECT_EQ(config.fallbackTag(), "misc");
    EXPECT_EQ(config.environment().scheme, "http");
    EXPECT_EQ(config.environment().name, "Local");
    EXPECT_EQ(config.environment().host, "localhost:8080");
    // Untouched keys keep their defaults
    EXPECT_EQ(config.environment().apiKey, "eyABC.123");
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults)
{
    Config config(Verbosity::Quiet);
    config.load(configYaml("{}"));
    EXPECT_EQ(config.fallbackTag(), "other");
    config.load(configYaml("collection:\nenvironment:\n"));
    EXPECT_EQ(config.tagOrder().size(), 3u);
}

TEST(ConfigTest, WrongNodeTypesAreFatal)
{
    Config config(Verbosity::Quiet);
    EXPECT_THROW(config.load(configYaml("collection: [a, b]")), YamlException);
    EXPECT_THROW(config.load(configYaml("collection:\n  tagOrder: meta\n")), YamlException);
    EXPECT_THROW(config.load(configYaml("environment:\n  scheme: {a: b}\n")), YamlException);
}

TEST(ConfigTest, ErrorsCarryLocation)
{
    Config config(Verbosity::Quiet);
    try {
        config.load(configYaml("collection:\n  name: x\n  fallbackTag: \"\"\n"));
        FAIL() << "An empty fallback tag should be rejected";
    } catch (const YamlException& e) {
        EXPECT_TRUE(e.message.starts_with("config.yaml:2: ")) << e.message;
    }
}

TEST(ConfigTest, MissingFileIsFatal)
{
    EXPECT_ANY_THROW(Config(testDataPath("no-such-config.yaml"), Verbosity::Quiet));
}

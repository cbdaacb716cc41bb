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

#include "synthesizer.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

namespace {

class SynthesizerTest : public ::testing::Test {
protected:
    ReferenceResolver::definitions_type definitions;
    ReferenceResolver resolver{definitions};
    Synthesizer synthesizer{resolver, Verbosity::Quiet};

    void define(const std::string& name, const std::string& json)
    {
        definitions.insert_or_assign(name, schemaFromJson(json));
    }

    SampleValue sample(const std::string& schemaJson, int depth = 0) const
    {
        return synthesizer.synthesize(schemaFromJson(schemaJson), depth);
    }
};

SampleValue json(const char* text) { return SampleValue::parse(text); }

} // namespace

TEST_F(SynthesizerTest, Scalars)
{
    EXPECT_EQ(sample(R"({"type": "string"})"), json(R"("string")"));
    EXPECT_EQ(sample(R"({"type": "integer"})"), json("0"));
    EXPECT_EQ(sample(R"({"type": "number", "format": "double"})"), json("0"));
    EXPECT_EQ(sample(R"({"type": "boolean"})"), json("false"));
}

TEST_F(SynthesizerTest, EnumTakesFirstValue)
{
    EXPECT_EQ(sample(R"({"type": "string", "enum": ["corp", "alliance"]})"), json(R"("corp")"));
    EXPECT_EQ(sample(R"({"type": "string", "enum": [3, 4]})"), json("3"));
    EXPECT_EQ(sample(R"({"type": "string", "enum": []})"), json(R"("string")"));
}

TEST_F(SynthesizerTest, ObjectKeepsDeclarationOrder)
{
    EXPECT_EQ(sample(R"({"type": "object", "properties": {
                  "name": {"type": "string"}, "age": {"type": "integer"}}})"),
              json(R"({"name": "string", "age": 0})"));
    EXPECT_EQ(sample(R"({"properties": {"zeta": {"type": "boolean"}, "alpha": {}}})"),
              json(R"({"zeta": false, "alpha": {}})"));
}

TEST_F(SynthesizerTest, PropertiesImplyObject)
{
    EXPECT_EQ(sample(R"({"type": "mystery", "properties": {"a": {"type": "integer"}}})"),
              json(R"({"a": 0})"));
}

TEST_F(SynthesizerTest, EmptyShapes)
{
    EXPECT_EQ(sample("{}"), json("{}"));
    EXPECT_EQ(sample(R"({"type": "object", "additionalProperties": {"type": "string"}})"), json("{}"));
    EXPECT_EQ(sample(R"({"type": "file"})"), json("{}"));
    EXPECT_EQ(sample(R"({"type": ["string", "null"]})"), json("{}"));
}

TEST_F(SynthesizerTest, Arrays)
{
    EXPECT_EQ(sample(R"({"type": "array", "items": {"type": "string"}})"), json(R"(["string"])"));
    EXPECT_EQ(sample(R"({"type": "array"})"), json("[{}]"));
}

TEST_F(SynthesizerTest, ResolvesReferences)
{
    define("Tribe", R"({"type": "object", "properties": {"id": {"type": "integer"}}})");
    EXPECT_EQ(sample(R"({"$ref": "#/definitions/Tribe"})"), json(R"({"id": 0})"));
    EXPECT_EQ(sample(R"({"type": "array", "items": {"$ref": "#/definitions/Tribe"}})"),
              json(R"([{"id": 0}])"));
}

TEST_F(SynthesizerTest, ReferenceWinsOverType)
{
    define("Flag", R"({"type": "boolean"})");
    EXPECT_EQ(sample(R"({"$ref": "#/definitions/Flag", "type": "string"})"), json("false"));
}

TEST_F(SynthesizerTest, DanglingReferencesBecomeEmptyObjects)
{
    EXPECT_EQ(sample(R"({"$ref": "#/definitions/Missing"})"), json("{}"));
    EXPECT_EQ(sample(R"({"$ref": "common.json#/definitions/Thing"})"), json("{}"));
    EXPECT_EQ(sample(R"({"properties": {"x": {"$ref": "#/parameters/x"}}})"), json(R"({"x": {}})"));
}

TEST_F(SynthesizerTest, SelfReferenceStopsAtMaxDepth)
{
    define("Node", R"({"type": "object", "properties": {"child": {"$ref": "#/definitions/Node"}}})");
    EXPECT_EQ(sample(R"({"$ref": "#/definitions/Node"})"), json(R"({"child": {"child": {}}})"));
}

TEST_F(SynthesizerTest, DepthBound)
{
    EXPECT_EQ(sample(R"({"type": "string"})", Synthesizer::MaxDepth), json(R"("string")"));
    EXPECT_EQ(sample(R"({"type": "string"})", Synthesizer::MaxDepth + 1), json("{}"));
    EXPECT_EQ(sample(R"({"type": "array", "items": {"type": "array", "items": {"type": "array",
                  "items": {"type": "array", "items": {"type": "array",
                  "items": {"type": "integer"}}}}}})"),
              json("[[[[[{}]]]]]"));
}

TEST(ToJsonTest, IndentedLayout)
{
    auto value = SampleValue::object();
    value["name"] = "string";
    value["tags"] = SampleValue::array({"x"});
    value["empty"] = SampleValue::object();
    value["none"] = SampleValue::array();
    value["ratio"] = SampleValue::parse("1e5");

    EXPECT_EQ(toJson(value, 2), "{\n"
                                "  \"name\": \"string\",\n"
                                "  \"tags\": [\n"
                                "    \"x\"\n"
                                "  ],\n"
                                "  \"empty\": {},\n"
                                "  \"none\": [],\n"
                                "  \"ratio\": 100000.0\n"
                                "}");
}

TEST(ToJsonTest, EscapesNonAscii)
{
    EXPECT_EQ(toJson(SampleValue("say \"hi\"\\\n\t")), R"("say \"hi\"\\\n\t")");
    EXPECT_EQ(toJson(SampleValue(std::string("\x01\x7f"))), R"("\u0001\u007f")");
    EXPECT_EQ(toJson(SampleValue("caf\xc3\xa9")), R"("caf\u00e9")");
    EXPECT_EQ(toJson(SampleValue("\xf0\x9f\x9a\x80")), R"("\ud83d\ude80")");
}

TEST(ToJsonTest, MalformedUtf8IsReplaced)
{
    for (const auto* text : {"a\xc0\x80", "a\xed\xa0\x80"}) {
        const auto rendered = toJson(SampleValue(text));
        EXPECT_NE(rendered.find("\\ufffd"), std::string::npos) << rendered;
        EXPECT_EQ(rendered.find("\\u0000"), std::string::npos) << rendered;
        EXPECT_EQ(rendered.find("\\ud800"), std::string::npos) << rendered;
    }
}

TEST_F(SynthesizerTest, EnumLiteralsBecomeJsonValues)
{
    EXPECT_EQ(toJson(sample(R"({"type": "string", "enum": [12.5]})")), "12.5");
    EXPECT_EQ(toJson(sample(R"({"type": "string", "enum": [null]})")), "null");
    EXPECT_EQ(toJson(sample(R"({"type": "string", "enum": [1e5]})")), "100000.0");
    EXPECT_EQ(toJson(sample(R"({"type": "string", "enum": [true]})")), "true");
    EXPECT_EQ(toJson(sample("{type: string, enum: [not json]}")), R"("not json")");
}

// Tests for the AI interaction toolkit
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "gtest/gtest.h"

#include "synthgpt/llmtools.hpp"

namespace json = boost::json;

using namespace synthgpt::llmtools;

TEST(LlmTools, ExpandsKnownVariables)
{
  VariableMap vars = { { "name", "world" }, { "n", "3" } };

  EXPECT_EQ(expandText("hello ${name}, ${n} times ${name}", vars), "hello world, 3 times world");
  EXPECT_EQ(expandText("keep ${unknown} and ${name}", vars), "keep ${unknown} and world");
  EXPECT_EQ(expandText("unterminated ${name", vars), "unterminated ${name");
  EXPECT_EQ(expandText("", vars), "");
}

TEST(LlmTools, ExpandedTextIsNotRescanned)
{
  VariableMap vars = { { "a", "${b}" }, { "b", "B" } };

  EXPECT_EQ(expandText("${a}", vars), "${b}");
}

TEST(LlmTools, SplitsArguments)
{
  std::vector<std::string> args;

  splitArgs("  -s  -d \"a quoted arg\" last", args);

  const std::vector<std::string> expected = { "-s", "-d", "a quoted arg", "last" };

  EXPECT_EQ(args, expected);
}

TEST(LlmTools, SplitArgumentsAppends)
{
  std::vector<std::string> args = { "first" };

  splitArgs("second", args);

  EXPECT_EQ(args.size(), 2u);
  EXPECT_EQ(args.back(), "second");
}

TEST(LlmTools, UnclosedQuoteThrows)
{
  std::vector<std::string> args;

  EXPECT_THROW(splitArgs("\"open", args), std::runtime_error);
}

TEST(LlmTools, ExtractsCodeSections)
{
  const std::string md = "intro\n```python\nx = 1\n```\ntext\n```\ny = 2\n```\n```cpp";

  std::vector<CodeSection> secs = extractCodeSections(md);

  ASSERT_EQ(secs.size(), 2u);
  EXPECT_EQ(secs[0].languageMarker(), "python");
  EXPECT_EQ(secs[0].code(), "x = 1\n");
  EXPECT_EQ(secs[1].languageMarker(), "");
  EXPECT_EQ(secs[1].code(), "y = 2\n");
}

TEST(LlmTools, ExtractsTaggedText)
{
  EXPECT_EQ(extractTaggedText("a <t>inner</t> b", "<t>", "</t>"), "inner");
  EXPECT_EQ(extractTaggedText("a <t>open", "<t>", "</t>"), "");
  EXPECT_EQ(extractTaggedText("none", "<t>", "</t>"), "");
}

TEST(LlmTools, LoadsFieldsWithAlternatives)
{
  JsonValue obj = json::parse(R"({ "s": "text", "i": 42, "b": true, "o": { "arr": [ "x", "y" ] } })");

  EXPECT_EQ(loadField(obj, "s", std::string{"alt"}), "text");
  EXPECT_EQ(loadField(obj, "missing", std::string{"alt"}), "alt");
  EXPECT_EQ(loadField(obj, "i", std::int64_t(0)), 42);
  EXPECT_EQ(loadField(obj, "s", std::int64_t(7)), 7);
  EXPECT_TRUE(loadField(obj, "b", false));
  EXPECT_EQ(loadField(obj, "o.arr[1]", std::string{}), "y");
  EXPECT_TRUE(loadField(obj, "nothing", JsonValue{}).is_null());
}

TEST(LlmTools, ConversationHistory)
{
  Settings            settings;
  ConversationHistory hist{settings, "be helpful"};

  EXPECT_EQ(hist.size(), 1u);
  EXPECT_EQ(hist.lastEntry(), "be helpful");

  hist.appendPrompt("write code");

  EXPECT_EQ(hist.size(), 2u);
  EXPECT_EQ(hist.lastEntry(), "write code");
  EXPECT_EQ(std::string(hist.json().as_array().back().as_object().at("role").as_string()), "user");
}

TEST(LlmTools, FindsProviderByAlternativeName)
{
  Configurations cnf{json::parse(R"({ "local": { "alternativeNames": [ "Llama", "home" ], "modelName": "m1" } })")};

  EXPECT_EQ(provider(cnf, "local"), "local");
  EXPECT_EQ(provider(cnf, "llama"), "local");
  EXPECT_THROW(provider(cnf, "remote"), std::runtime_error);
}

TEST(LlmTools, ConfigureUsesPresetModelUnlessOverridden)
{
  Configurations cnf{json::parse(R"({ "local": { "exec": "/bin/sh", "modelName": "m1" },
                                      "bare":  { "exec": "/bin/sh" } })")};

  EXPECT_EQ(configure(cnf, "local").modelName(), "m1");
  EXPECT_EQ(configure(cnf, "local", "m9").modelName(), "m9");
  EXPECT_EQ(configure(cnf, "bare").modelName(), "");
  EXPECT_EQ(configure(cnf, "local").exec(), "/bin/sh");
}

TEST(LlmTools, ProviderRequiresApiKey)
{
  Configurations cnf{json::parse(R"({ "cloud": { "apiKeyName": "SYNTHGPT_TEST_UNDEFINED_KEY" } })")};

  EXPECT_THROW(provider(cnf, "cloud"), std::runtime_error);
}

TEST(LlmTools, ConfigurationsMustBeObjects)
{
  EXPECT_THROW(Configurations{json::parse("[1, 2]")}, std::runtime_error);
}

TEST(LlmTools, SettingsFromJson)
{
  JsonValue cnf = json::parse(R"({ "exec": "/usr/bin/curl", "modelName": "gpt-4o" })");
  Settings  res = settings(cnf, Settings{});

  EXPECT_EQ(res.exec(), "/usr/bin/curl");
  EXPECT_EQ(res.modelName(), "gpt-4o");
  EXPECT_EQ(res.roleOfAI(), "assistant");
}

TEST(LlmTools, PrettyPrintsNestedValues)
{
  std::stringstream os;

  prettyPrint(os, json::parse(R"({ "a": [ 1, {} ], "b": "x", "c": [] })"));

  EXPECT_EQ(os.str(), "{\n"
                      "  \"a\": [\n"
                      "    1,\n"
                      "    {}\n"
                      "  ],\n"
                      "  \"b\": \"x\",\n"
                      "  \"c\": []\n"
                      "}\n");
}

TEST(LlmTools, PrettyPrintedJsonReadsBack)
{
  JsonValue         orig = json::parse(R"({ "k": [ true, null, 2.5, "s\n" ] })");
  std::stringstream os;

  prettyPrint(os, orig);

  EXPECT_EQ(readJsonStream(os), orig);
}

TEST(LlmTools, ConfigFileReplacesProvider)
{
  const std::string fileName = "synthgpt-test-providers.json";

  {
    std::ofstream of{fileName};

    of << R"({ "local": { "modelName": "m2" }, "remote": { "modelName": "r1" } })";
  }

  Configurations base{json::parse(R"({ "local": { "modelName": "m1", "exec": "curl" } })")};
  Configurations cnf = initializeWithConfigFile(fileName, base);

  std::remove(fileName.c_str());

  EXPECT_EQ(loadField(cnf.json(), "local.modelName", std::string{}), "m2");
  EXPECT_EQ(loadField(cnf.json(), "remote.modelName", std::string{}), "r1");
  EXPECT_EQ(loadField(cnf.json(), "local.exec", std::string{"none"}), "none");
}

TEST(LlmTools, QueryReadsJsonResponseField)
{
  const std::string response = "synthgpt-test-response.json";
  Settings          llm{ "/bin/sh",
                         // \042 is printf's octal escape for "
                         "-c \"printf '{ \\042choices\\042: [ { \\042message\\042: { \\042content\\042: \\042hi\\042 } } ] }' > "
                         "${LLMTOOLS:RESPONSE_FILE}\"",
                         response,
                         "choices[0].message.content",
                         "assistant",
                         "",
                         "synthgpt-test-query.json"
                       };

  ConversationHistory hist = queryResponse(llm, ConversationHistory{llm, "system"}.appendPrompt("hello"));

  std::remove(response.c_str());
  std::remove("synthgpt-test-query.json");

  EXPECT_EQ(hist.size(), 3u);
  EXPECT_EQ(hist.lastEntry(), "hi");
}

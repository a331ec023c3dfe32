// Tests for configuration files
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "gtest/gtest.h"

#include "synthgpt/config.hpp"

#include "fakes.hpp"

namespace json = boost::json;

using namespace synthgpt;

namespace
{

/// sets an environment variable for the lifetime of the object
struct ScopedEnv
{
  ScopedEnv(const char* name, const char* value)
  : var(name)
  {
    ::setenv(var, value, 1);
  }

  ~ScopedEnv() { ::unsetenv(var); }

  const char* var;
};

}

TEST(Config, Defaults)
{
  ::unsetenv("MAX_CORRECTION_ATTEMPTS");

  Settings settings = defaultSettings();

  EXPECT_EQ(settings.loop.maxAttempts, 5);
  EXPECT_EQ(settings.loop.solutionExt, "py");
  EXPECT_EQ(settings.isolation.image, "python_sandbox");
  EXPECT_EQ(settings.isolation.timeout, 15);
  EXPECT_EQ(settings.sessionDir, "outputs/sessions");
  EXPECT_TRUE(settings.illustrator.empty());
  EXPECT_EQ(settings.illustratorTimeout, 300);
}

TEST(Config, MaxAttemptsFromEnvironment)
{
  ScopedEnv env{"MAX_CORRECTION_ATTEMPTS", "8"};

  EXPECT_EQ(defaultMaxAttempts(), 8);
}

TEST(Config, InvalidMaxAttemptsFromEnvironment)
{
  {
    ScopedEnv env{"MAX_CORRECTION_ATTEMPTS", "many"};

    EXPECT_EQ(defaultMaxAttempts(), 5);
  }

  {
    ScopedEnv env{"MAX_CORRECTION_ATTEMPTS", "0"};

    EXPECT_EQ(defaultMaxAttempts(), 5);
  }
}

TEST(Config, LoadsFromJson)
{
  llmtools::JsonValue cnf = json::parse(R"({ "modelName": "llama3",
                                             "codeLang": "python3",
                                             "image": "sandbox:2",
                                             "scriptName": "main.rb",
                                             "maxAttempts": 2,
                                             "sessionDir": "s",
                                             "illustrator": "draw ${output}",
                                             "illustratorTimeout": 45
                                           })");

  Settings settings = loadSettings(cnf, defaultSettings());

  EXPECT_EQ(settings.llmSettings.modelName(), "llama3");
  EXPECT_EQ(settings.prompts.codeLang, "python3");
  EXPECT_EQ(settings.isolation.image, "sandbox:2");
  EXPECT_EQ(settings.loop.maxAttempts, 2);
  EXPECT_EQ(settings.loop.solutionExt, "rb");
  EXPECT_EQ(settings.sessionDir, "s");
  EXPECT_EQ(settings.illustrator, "draw ${output}");
  EXPECT_EQ(settings.imageDir, "outputs/images");
  EXPECT_EQ(settings.illustratorTimeout, 45);
}

TEST(Config, WrittenSettingsReadBack)
{
  Settings orig = defaultSettings();

  orig.llmSettings.modelName() = "gpt-4o";
  orig.prompts.firstPrompt     = "line 1\n\"quoted\" ${problem}";
  orig.isolation.network       = "bridge";
  orig.isolation.cpuShares     = 100;
  orig.loop.maxAttempts        = 9;
  orig.imageDir                = "img";
  orig.illustratorTimeout      = 20;

  for (bool withDoc : { false, true })
  {
    std::stringstream os;

    writeSettings(os, orig, withDoc);

    Settings res = loadSettings(llmtools::readJsonStream(os), Settings{});

    EXPECT_EQ(res.llmSettings.modelName(), "gpt-4o");
    EXPECT_EQ(res.prompts.firstPrompt, orig.prompts.firstPrompt);
    EXPECT_EQ(res.isolation.network, "bridge");
    EXPECT_EQ(res.isolation.cpuShares, 100);
    EXPECT_EQ(res.loop.maxAttempts, 9);
    EXPECT_EQ(res.imageDir, "img");
    EXPECT_EQ(res.illustratorTimeout, 20);
  }
}

TEST(Config, DocumentedSettings)
{
  std::stringstream os;

  writeSettings(os, defaultSettings(), true);

  llmtools::JsonValue cnf = llmtools::readJsonStream(os);

  EXPECT_NE(cnf.as_object().if_contains("timeout-doc"), nullptr);
  EXPECT_NE(cnf.as_object().if_contains("maxAttempts-doc"), nullptr);
}

TEST(Config, UnreadableFileUsesDefaults)
{
  test::TempDir tmp;
  Settings      settings = readSettings(tmp.str("missing.json"));

  EXPECT_EQ(settings.isolation.image, defaultSettings().isolation.image);
}

TEST(Config, ReadsFile)
{
  test::TempDir tmp;

  {
    std::ofstream of{tmp.str("synthgpt.json")};

    of << R"({ "timeout": 30, "network": "none" })" << std::endl;
  }

  Settings settings = readSettings(tmp.str("synthgpt.json"));

  EXPECT_EQ(settings.isolation.timeout, 30);
}

TEST(Config, HelpListsKeys)
{
  std::stringstream os;

  printConfigHelp(os);

  for (const char* key : { "exec", "firstPrompt", "containerExec", "commandBudget", "maxAttempts", "illustrator", "illustratorTimeout" })
    EXPECT_NE(os.str().find(key), std::string::npos) << key;
}

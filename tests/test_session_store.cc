// Tests for JSON session records
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include <fstream>

#include "gtest/gtest.h"

#include "synthgpt/session_store.hpp"

#include "fakes.hpp"

namespace json = boost::json;

using namespace synthgpt;
using synthgpt::test::TempDir;

namespace
{

std::string
str(const json::value& val)
{
  return std::string(val.as_string());
}

const json::value&
field(const json::value& val, const char* key)
{
  return val.as_object().at(key);
}

}

TEST(SessionStore, FirstSessionId)
{
  TempDir tmp;

  EXPECT_EQ(JsonSessionStore{tmp.str("none")}.nextSessionId(), 1);
  EXPECT_EQ(JsonSessionStore{tmp.str()}.nextSessionId(), 1);
}

TEST(SessionStore, NextSessionIdFollowsLargest)
{
  TempDir tmp;

  for (const char* name : { "session_2.json", "session_10.json", "session_x.json", "notes.txt" })
  {
    std::ofstream of{tmp.str(name)};

    of << "{}";
  }

  EXPECT_EQ(JsonSessionStore{tmp.str()}.nextSessionId(), 11);
}

TEST(SessionStore, RecordsSessionProgress)
{
  TempDir          tmp;
  JsonSessionStore store{tmp.str("sessions")};
  Session          session{3, Problem{"square a number", "assert sq(3) == 9"}};

  store.sessionStarted(session);

  const std::string file = store.sessionFile(3);

  {
    json::value doc = llmtools::readJsonFile(file);

    EXPECT_EQ(field(doc, "id").as_int64(), 3);
    EXPECT_EQ(str(field(doc, "problemStatement")), "square a number");
    EXPECT_EQ(str(field(doc, "testCases")), "assert sq(3) == 9");
    EXPECT_EQ(str(field(doc, "status")), "running");
    EXPECT_TRUE(field(doc, "endTime").is_null());
    EXPECT_TRUE(field(doc, "finalCode").is_null());
    EXPECT_TRUE(field(doc, "attempts").as_array().empty());
  }

  session.beginAttempt("multiply", "def sq(x): return x * x");
  store.illustrationRecorded(session, 1, "img/a1.png");
  session.recordResult(ExecutionResult::fromExit(0, "", ""));
  store.attemptRecorded(session, session.attempts().back());
  session.complete();
  store.sessionFinished(session);

  json::value        doc = llmtools::readJsonFile(file);
  const json::value& att = field(doc, "attempts").as_array().at(0);

  EXPECT_EQ(str(field(doc, "status")), "completed");
  EXPECT_EQ(str(field(doc, "finalCode")), "def sq(x): return x * x");
  EXPECT_FALSE(field(doc, "endTime").is_null());
  EXPECT_EQ(field(att, "attempt").as_int64(), 1);
  EXPECT_EQ(str(field(att, "thought")), "multiply");
  EXPECT_EQ(str(field(att, "generatedCode")), "def sq(x): return x * x");
  EXPECT_EQ(str(field(att, "imagePath")), "img/a1.png");
  EXPECT_FALSE(field(att, "timestamp").is_null());
  EXPECT_TRUE(field(field(att, "executionResult"), "success").as_bool());
  EXPECT_EQ(field(field(att, "executionResult"), "exitCode").as_int64(), 0);
  EXPECT_FALSE(field(field(att, "executionResult"), "timedOut").as_bool());
}

TEST(SessionStore, UnexecutedAttempt)
{
  Session session{4, Problem{"p", "t"}};

  session.beginAttempt("no idea", "");
  session.abort();

  JsonSessionStore   store{"unused"};
  json::value        doc = store.toJson(session);
  const json::value& att = field(doc, "attempts").as_array().at(0);

  EXPECT_EQ(str(field(doc, "status")), "aborted");
  EXPECT_TRUE(field(doc, "finalCode").is_null());
  EXPECT_TRUE(field(att, "executionResult").is_null());
  EXPECT_TRUE(field(att, "imagePath").is_null());
  EXPECT_TRUE(field(att, "timestamp").is_null());
}

TEST(SessionStore, IsoTime)
{
  const std::string txt = isoTime(std::chrono::system_clock::now());

  ASSERT_EQ(txt.size(), 19u);
  EXPECT_EQ(txt[4], '-');
  EXPECT_EQ(txt[10], 'T');
  EXPECT_EQ(txt[13], ':');
}

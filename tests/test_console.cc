// Tests for console output and result summaries
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include <sstream>

#include "gtest/gtest.h"

#include "synthgpt/console.hpp"

using namespace synthgpt;

namespace
{

bool contains(const std::string& txt, const std::string& part)
{
  return txt.find(part) != std::string::npos;
}

Session
sampleSession()
{
  Session session{7, Problem{"p", "t"}};

  session.beginAttempt("r1", "c1");
  session.recordResult(ExecutionResult::fromExit(1, "", "boom"));
  session.beginAttempt("r2", "c2");
  session.recordResult(ExecutionResult::timeout(std::chrono::seconds(5)));
  session.beginAttempt("r3", "");
  session.abort();

  return session;
}

}

TEST(Console, PrintsSessionHeader)
{
  std::stringstream os;
  ConsoleSink       sink{os};

  sink.onEvent(StartEvent{3, Problem{"reverse a list\nin place", "assert rev([1]) == [1]"}});

  EXPECT_TRUE(contains(os.str(), "Session 3"));
  EXPECT_TRUE(contains(os.str(), "  reverse a list\n  in place\n"));
  EXPECT_TRUE(contains(os.str(), "  assert rev([1]) == [1]\n"));
}

TEST(Console, PrintsResults)
{
  std::stringstream os;
  ConsoleSink       sink{os};

  sink.onEvent(ResultEvent{2, ExecutionResult::fromExit(1, "partial", "AssertionError")});
  sink.onEvent(ResultEvent{3, ExecutionResult::timeout(std::chrono::seconds(15))});

  EXPECT_TRUE(contains(os.str(), "Result (attempt 2): FAILED (exit 1)"));
  EXPECT_TRUE(contains(os.str(), "stdout:\n  partial\n"));
  EXPECT_TRUE(contains(os.str(), "stderr:\n  AssertionError\n"));
  EXPECT_TRUE(contains(os.str(), "Result (attempt 3): FAILED (timeout)"));
}

TEST(Console, PrintsTerminalEvents)
{
  std::stringstream os;
  ConsoleSink       sink{os};

  sink.onEvent(DoneEvent{"x = 1", "outputs/code/solution_session_1.py"});
  sink.onEvent(DoneEvent{"x = 1", ""});
  sink.onEvent(ErrorEvent{ErrorKind::oracleFault, "AI query failed"});

  EXPECT_TRUE(contains(os.str(), "Solution found. Saved to outputs/code/solution_session_1.py"));
  EXPECT_TRUE(contains(os.str(), "Solution found. (not saved)"));
  EXPECT_TRUE(contains(os.str(), "ERROR (oracle fault): AI query failed"));
}

TEST(Console, PrintsRationaleAndCode)
{
  std::stringstream os;
  ConsoleSink       sink{os};

  sink.onEvent(RationaleEvent{1, ""});
  sink.onEvent(CodeEvent{1, "print(1)"});

  EXPECT_TRUE(contains(os.str(), "Reasoning (attempt 1):\n  <none>\n"));
  EXPECT_TRUE(contains(os.str(), "```\nprint(1)\n```"));
}

TEST(Console, ResultSummary)
{
  const Session     session = sampleSession();
  std::stringstream os;

  reportResults<ResultPrinter>(os, session);

  EXPECT_EQ(os.str(), "attempt  1: false  exit: 1\n"
                      "attempt  2: false  exit: -1  (timeout)\n"
                      "attempt  3: <not executed>\n");
}

TEST(Console, CsvSummary)
{
  const Session     session = sampleSession();
  std::stringstream os;

  reportResults<CsvResultPrinter>(os, session);

  EXPECT_EQ(os.str(), "7,1,false,1,false\n"
                      "7,2,false,-1,true\n"
                      "7,3,,,\n");
}

TEST(Console, CsvSummaryIncludesTiming)
{
  const Session     session = sampleSession();
  RunStatistics     stats{1200, 300};
  std::stringstream os;

  reportCsvSummary(os, session, stats);

  EXPECT_EQ(os.str(), "---\n"
                      "7,1,false,1,false\n"
                      "7,2,false,-1,true\n"
                      "7,3,,,\n"
                      "7,timing,1200,300\n");
}

TEST(Console, Statistics)
{
  RunStatistics     stats{1200, 300};
  std::stringstream os;

  os << StatisticsPrinter{stats};

  EXPECT_EQ(os.str(), "1200ms (AI)   300ms (exec)");
}

// SynthGPT session model
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/session.hpp"

#include <stdexcept>

namespace synthgpt
{

ExecutionResult
ExecutionResult::fromExit(int exitCode, std::string out, std::string err)
{
  const bool success = (exitCode == 0) && err.empty();

  return { success, std::move(out), std::move(err), exitCode, false };
}

ExecutionResult
ExecutionResult::failure(std::string message, int exitCode)
{
  return { false, std::string{}, std::move(message), exitCode, false };
}

ExecutionResult
ExecutionResult::timeout(std::chrono::seconds budget)
{
  std::string msg = "Execution timed out after " + std::to_string(budget.count()) + "s.";

  return { false, std::string{}, std::move(msg), -1, true };
}


const char* as_string(SessionStatus status)
{
  switch (status)
  {
    case SessionStatus::running:   return "running";
    case SessionStatus::completed: return "completed";
    case SessionStatus::failed:    return "failed";
    case SessionStatus::aborted:   return "aborted";
  }

  return "unknown";
}

std::ostream& operator<<(std::ostream& os, SessionStatus status)
{
  return os << as_string(status);
}


Session::Session(std::int64_t sessionId, Problem problem)
: sid(sessionId), prob(std::move(problem)), tries(), solution(), started(clock::now()), ended()
{}

bool
Session::attemptInFlight() const
{
  return !tries.empty() && !tries.back().result.has_value();
}

const Attempt&
Session::beginAttempt(std::string rationale, std::string code)
{
  if (stat != SessionStatus::running)
    throw std::logic_error{"session is no longer running"};

  if (attemptInFlight())
    throw std::logic_error{"attempt " + std::to_string(tries.size()) + " has no result yet"};

  tries.push_back(Attempt{ tries.size() + 1, std::move(rationale), std::move(code), std::nullopt });
  return tries.back();
}

const Attempt&
Session::recordResult(ExecutionResult result)
{
  if (!attemptInFlight())
    throw std::logic_error{"no attempt awaits a result"};

  tries.back().result = std::move(result);
  return tries.back();
}

void
Session::finish(SessionStatus terminal)
{
  if (stat != SessionStatus::running)
    throw std::logic_error{std::string{"session already "} + as_string(stat)};

  stat  = terminal;
  ended = clock::now();
}

void
Session::complete()
{
  if (tries.empty() || !tries.back().result || !tries.back().result->succeeded())
    throw std::logic_error{"completing a session requires a successful attempt"};

  finish(SessionStatus::completed);
  solution = tries.back().code;
}

void
Session::fail()
{
  if (attemptInFlight())
    throw std::logic_error{"cannot fail a session with an attempt in flight"};

  finish(SessionStatus::failed);
}

void
Session::abort()
{
  finish(SessionStatus::aborted);
}

}

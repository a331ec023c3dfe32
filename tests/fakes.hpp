// Test doubles for the SynthGPT unit tests
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_TESTS_FAKES_HPP
#define SYNTHGPT_TESTS_FAKES_HPP 1

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "synthgpt/errors.hpp"
#include "synthgpt/executor.hpp"
#include "synthgpt/illustrator.hpp"
#include "synthgpt/oracle.hpp"
#include "synthgpt/recorder.hpp"

namespace synthgpt
{
namespace test
{

/// the scripted behavior of a unit
struct Outcome
{
  std::optional<int> status = 0;   ///< nothing simulates a unit that never terminates
  std::string        output;
  std::string        errors;
};

/// an in-memory isolation backend.
/// \details
///   reads the script at creation time and decides on the outcome through
///   a user-supplied function.
class FakeBackend : public IsolationBackend
{
  public:
    using Behavior = std::function<Outcome(const std::string& script)>;

    explicit
    FakeBackend(std::string script = "script.py")
    : scriptName(std::move(script))
    {}

    void verify() override
    {
      ++verifyCalls;

      if (unavailable)
        throw IsolationUnavailable{"fake runtime is down"};
    }

    std::string create(const std::filesystem::path& hostDir) override
    {
      if (failCreate)
        throw IsolationError{"cannot create fake unit"};

      std::ifstream     is{(hostDir / scriptName).string()};
      std::stringstream txt;

      txt << is.rdbuf();
      scripts.push_back(txt.str());

      const std::string unit = "unit-" + std::to_string(scripts.size());

      created.push_back(unit);
      live.insert(unit);
      return unit;
    }

    void start(const std::string& unit) override
    {
      if (failStart)
        throw IsolationError{"cannot start " + unit};

      outcome = behavior ? behavior(scripts.back()) : Outcome{};
      active.insert(unit);
    }

    std::optional<int> wait(const std::string& unit, std::chrono::seconds budget) override
    {
      budgets.push_back(budget);

      if (outcome.status)
        active.erase(unit);

      return outcome.status;
    }

    UnitOutput logs(const std::string&) override
    {
      return { outcome.output, outcome.errors };
    }

    bool kill(const std::string& unit) override
    {
      ++killCalls;
      return active.erase(unit) > 0;
    }

    bool remove(const std::string& unit) override
    {
      removed.push_back(unit);
      active.erase(unit);
      return live.erase(unit) > 0;
    }

    bool running(const std::string& unit) override { return active.count(unit) > 0; }
    bool exists(const std::string& unit)  override { return live.count(unit) > 0; }

    Behavior                          behavior;
    bool                              unavailable = false;
    bool                              failCreate  = false;
    bool                              failStart   = false;

    std::string                       scriptName;
    std::vector<std::string>          scripts;
    std::vector<std::string>          created;
    std::vector<std::string>          removed;
    std::vector<std::chrono::seconds> budgets;
    std::size_t                       verifyCalls = 0;
    std::size_t                       killCalls   = 0;

  private:
    Outcome                           outcome;
    std::set<std::string>             live;
    std::set<std::string>             active;
};

/// a backend outcome that passes when the script contains \p marker
inline
FakeBackend::Behavior
passWhenContains(const std::string& marker)
{
  return [marker](const std::string& script) -> Outcome
         {
           if (script.find(marker) != std::string::npos)
             return { 0, "ok", "" };

           return { 1, "", "AssertionError" };
         };
}


/// one scripted reply of a ScriptedOracle
struct Reply
{
  std::string rationale;
  std::string code;
  bool        fault = false;
};

/// an oracle that replays a fixed list of replies and records all requests
class ScriptedOracle : public GenerationOracle
{
  public:
    explicit
    ScriptedOracle(std::vector<Reply> replies)
    : script(std::move(replies))
    {}

    Generation generate(const GenerationRequest& request) override
    {
      requests.push_back(request);

      if (requests.size() > script.size())
        throw OracleFault{"no more scripted replies"};

      const Reply& reply = script[requests.size()-1];

      if (reply.fault)
        throw OracleFault{"AI query failed: quota exceeded"};

      return { reply.rationale, reply.code };
    }

    std::vector<GenerationRequest> requests;

  private:
    std::vector<Reply> script;
};


/// records all recorder notifications as text
class RecorderLog : public SessionRecorder
{
  public:
    void sessionStarted(const Session& session) override
    {
      calls.push_back("started " + std::to_string(session.id()));
    }

    void attemptRecorded(const Session&, const Attempt& attempt) override
    {
      calls.push_back( "attempt " + std::to_string(attempt.index)
                     + (attempt.result ? " executed" : " not executed")
                     );
    }

    void illustrationRecorded(const Session&, std::size_t attempt, const std::string& location) override
    {
      calls.push_back("illustration " + std::to_string(attempt) + " " + location);
    }

    void sessionFinished(const Session& session) override
    {
      calls.push_back(std::string{"finished "} + as_string(session.status()));
    }

    std::vector<std::string> calls;
};


/// an illustrator that returns a fixed location, or throws
class FixedIllustrator : public Illustrator
{
  public:
    explicit
    FixedIllustrator(bool failing)
    : fails(failing)
    {}

    std::optional<std::string>
    illustrate(const std::string&, std::int64_t sessionId, std::size_t attempt) override
    {
      ++calls;

      if (fails)
        throw std::runtime_error{"image service unavailable"};

      return "img_" + std::to_string(sessionId) + "_" + std::to_string(attempt) + ".png";
    }

    std::size_t calls = 0;

  private:
    bool fails;
};


/// a temporary directory that is removed with all its content
class TempDir
{
  public:
    TempDir()
    : dir( std::filesystem::temp_directory_path()
         / ("synthgpt-test-" + std::to_string(::getpid()) + "-" + std::to_string(++counter()))
         )
    {
      std::filesystem::remove_all(dir);
      std::filesystem::create_directories(dir);
    }

    ~TempDir()
    {
      std::error_code ec;

      std::filesystem::remove_all(dir, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return dir; }

    std::string str(const std::string& sub = "") const
    {
      return sub.empty() ? dir.string() : (dir / sub).string();
    }

  private:
    static int& counter()
    {
      static int cnt = 0;
      return cnt;
    }

    std::filesystem::path dir;
};

inline
std::string
readFile(const std::filesystem::path& file)
{
  std::ifstream     is{file.string()};
  std::stringstream txt;

  txt << is.rdbuf();
  return txt.str();
}

}
}

#endif /* SYNTHGPT_TESTS_FAKES_HPP */

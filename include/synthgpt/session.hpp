// SynthGPT session model
//   problems, attempts, execution results and the session state that
//   the correction loop owns.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_SESSION_HPP
#define SYNTHGPT_SESSION_HPP 1

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace synthgpt
{

using ProblemBase = std::tuple<std::string, std::string>;

/// a problem statement together with the executable assertions a solution must pass
struct Problem : ProblemBase
{
  using base = ProblemBase;
  using base::base;

  const std::string& statement() const { return std::get<0>(*this); }
  const std::string& tests()     const { return std::get<1>(*this); }
};


using ExecutionResultBase = std::tuple<bool, std::string, std::string, int, bool>;

/// encapsulates the outcome of one isolated execution.
/// succeeded() holds iff the exit status was zero and stderr is empty.
struct ExecutionResult : ExecutionResultBase
{
  using base = ExecutionResultBase;
  using base::base;

  bool               succeeded() const { return std::get<0>(*this); }
  const std::string& output()    const { return std::get<1>(*this); }
  const std::string& errors()    const { return std::get<2>(*this); }
  int                exitCode()  const { return std::get<3>(*this); }
  bool               timedOut()  const { return std::get<4>(*this); }

  /// creates a result from the exit status and the captured output streams.
  static
  ExecutionResult fromExit(int exitCode, std::string out, std::string err);

  /// creates a failed result carrying the diagnostic \p message.
  static
  ExecutionResult failure(std::string message, int exitCode = -1);

  /// creates a failed result for a run that exceeded its wall-clock budget.
  static
  ExecutionResult timeout(std::chrono::seconds budget);
};


/// one generate-then-execute cycle
struct Attempt
{
  std::size_t                    index = 0;
  std::string                    rationale;
  std::string                    code;
  std::optional<ExecutionResult> result;
};


enum class SessionStatus { running, completed, failed, aborted };

const char* as_string(SessionStatus status);

std::ostream& operator<<(std::ostream& os, SessionStatus status);


/// the bounded sequence of attempts for one problem.
/// \details
///   A Session enforces its invariants and throws std::logic_error
///   when a transition would violate them:
///   - attempt indices start at 1 and have no gaps
///   - at most one attempt is without result at any time
///   - the status leaves running exactly once
///   - the final code is set iff the status is completed
class Session
{
  public:
    using clock      = std::chrono::system_clock;
    using time_point = clock::time_point;

    Session(std::int64_t sessionId, Problem problem);

    std::int64_t                id()         const { return sid; }
    const Problem&              problem()    const { return prob; }
    const std::vector<Attempt>& attempts()   const { return tries; }
    SessionStatus               status()     const { return stat; }
    const std::optional<std::string>&
                                finalCode()  const { return solution; }
    time_point                  startTime()  const { return started; }
    std::optional<time_point>   endTime()    const { return ended; }

    /// true if the most recent attempt has no result yet
    bool attemptInFlight() const;

    /// creates the next attempt and returns it.
    const Attempt& beginAttempt(std::string rationale, std::string code);

    /// records \p result on the attempt in flight.
    const Attempt& recordResult(ExecutionResult result);

    /// transitions to completed; the final code is the latest attempt's code.
    void complete();

    /// transitions to failed (attempts exhausted).
    void fail();

    /// transitions to aborted (generation fault).
    void abort();

  private:
    void finish(SessionStatus terminal);

    std::int64_t               sid;
    Problem                    prob;
    std::vector<Attempt>       tries;
    SessionStatus              stat = SessionStatus::running;
    std::optional<std::string> solution;
    time_point                 started;
    std::optional<time_point>  ended;
};

}

#endif /* SYNTHGPT_SESSION_HPP */

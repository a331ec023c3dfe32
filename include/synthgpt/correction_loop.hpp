// SynthGPT correction loop
//   generate, execute, evaluate and feed back until a candidate passes
//   its tests or the attempts are exhausted.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_CORRECTION_LOOP_HPP
#define SYNTHGPT_CORRECTION_LOOP_HPP 1

#include <cstdint>
#include <string>

#include "synthgpt/events.hpp"
#include "synthgpt/executor.hpp"
#include "synthgpt/illustrator.hpp"
#include "synthgpt/oracle.hpp"
#include "synthgpt/recorder.hpp"
#include "synthgpt/session.hpp"

namespace synthgpt
{

/// termination policy and output location of the loop
struct LoopSettings
{
  std::int64_t maxAttempts = 5;
  std::string  solutionDir = "outputs/code";
  std::string  solutionExt = "py";
};

/// time spent in the collaborators, in milliseconds
struct RunStatistics
{
  std::size_t aiTime   = 0;
  std::size_t execTime = 0;
};


/// orchestrates the attempts of a session.
/// \details
///   The loop is single threaded; an attempt is complete before the
///   next one begins. Events reach the sink in the order
///     start, { status, rationale, [illustration], code, status, result }*,
///     terminal
///   where the terminal event is a DoneEvent or an ErrorEvent.
///   The collaborators are not owned and must outlive the loop.
class CorrectionLoop
{
  public:
    /// \throws std::invalid_argument if settings.maxAttempts < 1
    CorrectionLoop( GenerationOracle& oracle,
                    IsolatedExecutor& executor,
                    EventSink&        sink,
                    LoopSettings      settings,
                    SessionRecorder*  recorder    = nullptr,
                    Illustrator*      illustrator = nullptr
                  );

    /// runs a session for \p problem and returns it in its terminal state.
    Session run(const Problem& problem, std::int64_t sessionId);

    const RunStatistics& statistics() const { return stats; }

    const LoopSettings& settings() const { return config; }

    /// returns the file name for the solution of session \p sessionId
    std::string solutionFile(std::int64_t sessionId) const;

  private:
    void emit(Event ev);

    void illustrate(const Session& session, const Attempt& attempt);

    std::string saveSolution(const Session& session) const;

    void abort(Session& session, ErrorKind kind, std::string message);

    GenerationOracle& gen;
    IsolatedExecutor& exec;
    EventSink&        out;
    LoopSettings      config;
    SessionRecorder*  rec;
    Illustrator*      illu;
    RunStatistics     stats;
};

}

#endif /* SYNTHGPT_CORRECTION_LOOP_HPP */

// SynthGPT correction loop
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/correction_loop.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "synthgpt/trace.hpp"

namespace synthgpt
{

namespace
{

std::string
attemptTag(std::size_t attempt, std::int64_t maxAttempts)
{
  return "Attempt " + std::to_string(attempt) + "/" + std::to_string(maxAttempts);
}

Generation
queryOracle(GenerationOracle& oracle, const GenerationRequest& request, std::size_t& aiTime)
{
  MeasureRuntime timer(aiTime);

  return oracle.generate(request);
}

ExecutionResult
executeCandidate(IsolatedExecutor& executor, const Attempt& attempt, const Problem& problem, std::size_t& execTime)
{
  MeasureRuntime timer(execTime);

  return executor.execute(attempt.code, problem.tests());
}

}


CorrectionLoop::CorrectionLoop( GenerationOracle& oracle,
                                IsolatedExecutor& executor,
                                EventSink&        sink,
                                LoopSettings      settings,
                                SessionRecorder*  recorder,
                                Illustrator*      illustrator
                              )
: gen(oracle), exec(executor), out(sink), config(std::move(settings)),
  rec(recorder), illu(illustrator), stats()
{
  if (config.maxAttempts < 1)
    throw std::invalid_argument{"maxAttempts must be at least 1, got " + std::to_string(config.maxAttempts)};
}

void
CorrectionLoop::emit(Event ev)
{
  out.onEvent(ev);
}

std::string
CorrectionLoop::solutionFile(std::int64_t sessionId) const
{
  std::string name = "solution_session_" + std::to_string(sessionId);

  if (!config.solutionExt.empty())
    name += "." + config.solutionExt;

  return (std::filesystem::path{config.solutionDir} / name).string();
}

std::string
CorrectionLoop::saveSolution(const Session& session) const
{
  const std::string file = solutionFile(session.id());
  std::error_code   ec;

  std::filesystem::create_directories(config.solutionDir, ec);

  if (ec)
  {
    trace(std::cerr, "unable to create ", config.solutionDir, ": ", ec.message(), '\n');
    return {};
  }

  std::ofstream os{file};

  os << *session.finalCode() << std::endl;
  os.close();

  if (!os)
  {
    trace(std::cerr, "unable to write ", file, '\n');
    return {};
  }

  log("solution saved to ", file);
  return file;
}

void
CorrectionLoop::illustrate(const Session& session, const Attempt& attempt)
{
  if (illu == nullptr)
    return;

  try
  {
    std::optional<std::string> location = illu->illustrate(attempt.rationale, session.id(), attempt.index);

    if (!location)
      return;

    emit(IllustrationEvent{attempt.index, *location});

    if (rec) rec->illustrationRecorded(session, attempt.index, *location);
  }
  catch (const std::exception& ex)
  {
    log("illustration of attempt ", attempt.index, " failed: ", ex.what());
  }
}

void
CorrectionLoop::abort(Session& session, ErrorKind kind, std::string message)
{
  log("session ", session.id(), " aborted (", kind, "): ", message);
  session.abort();

  if (rec)
  {
    if (session.attemptInFlight())
      rec->attemptRecorded(session, session.attempts().back());

    rec->sessionFinished(session);
  }

  emit(ErrorEvent{kind, std::move(message)});
}

Session
CorrectionLoop::run(const Problem& problem, std::int64_t sessionId)
{
  Session                 session{sessionId, problem};
  std::optional<Feedback> feedback;

  log("session ", sessionId, " started");
  if (rec) rec->sessionStarted(session);
  emit(StartEvent{sessionId, problem});

  for (std::size_t k = 1; k <= std::size_t(config.maxAttempts); ++k)
  {
    emit(StatusEvent{attemptTag(k, config.maxAttempts) + ": Thinking..."});

    GenerationRequest request{problem, k, std::move(feedback)};
    std::string       rationale;
    std::string       code;

    feedback.reset();

    try
    {
      Generation candidate = queryOracle(gen, request, stats.aiTime);

      rationale = candidate.rationale();
      code      = candidate.code();
    }
    catch (const std::exception& ex)
    {
      abort(session, ErrorKind::oracleFault, ex.what());
      return session;
    }

    const Attempt& attempt = session.beginAttempt(std::move(rationale), std::move(code));

    emit(RationaleEvent{attempt.index, attempt.rationale});

    if (attempt.code.empty())
    {
      abort(session, ErrorKind::missingCode, attemptTag(k, config.maxAttempts) + ": the model did not produce any code.");
      return session;
    }

    illustrate(session, attempt);
    emit(CodeEvent{attempt.index, attempt.code});
    emit(StatusEvent{"Attempt " + std::to_string(k) + ": Executing code in sandbox..."});

    ExecutionResult result = executeCandidate(exec, attempt, problem, stats.execTime);
    const Attempt&  done   = session.recordResult(std::move(result));

    log("attempt ", k, (done.result->succeeded() ? " passed" : " failed"));
    if (rec) rec->attemptRecorded(session, done);
    emit(ResultEvent{done.index, *done.result});

    if (done.result->succeeded())
    {
      session.complete();

      const std::string saved = saveSolution(session);

      if (rec) rec->sessionFinished(session);
      emit(DoneEvent{*session.finalCode(), saved});
      return session;
    }

    feedback = Feedback{done.code, done.result->output(), done.result->errors()};
  }

  session.fail();
  log("session ", sessionId, " failed after ", config.maxAttempts, " attempts");

  if (rec) rec->sessionFinished(session);
  emit(ErrorEvent{ ErrorKind::attemptsExhausted,
                   "Maximum attempts (" + std::to_string(config.maxAttempts) + ") reached without a working solution."
                 });
  return session;
}

}

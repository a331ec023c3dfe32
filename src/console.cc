// SynthGPT console presentation
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/console.hpp"

#include <iomanip>

namespace synthgpt
{

namespace
{

const char* const RULE = "------------------------------------------------------------";

/// prints text indented by two blanks
struct Indented
{
  const std::string& txt;
};

std::ostream& operator<<(std::ostream& os, const Indented& el)
{
  std::size_t beg = 0;

  while (beg < el.txt.size())
  {
    std::size_t lim = el.txt.find('\n', beg);

    if (lim == std::string::npos)
      lim = el.txt.size();

    os << "  " << el.txt.substr(beg, lim - beg) << '\n';
    beg = lim + 1;
  }

  return os;
}

struct ConsoleVisitor
{
  std::ostream& os;

  void operator()(const StartEvent& ev) const
  {
    os << RULE
       << "\nSession " << ev.sessionId
       << "\nProblem:\n" << Indented{ev.problem.statement()}
       << "Tests:\n"     << Indented{ev.problem.tests()}
       << RULE << std::endl;
  }

  void operator()(const StatusEvent& ev) const
  {
    os << "[*] " << ev.message << std::endl;
  }

  void operator()(const RationaleEvent& ev) const
  {
    os << "Reasoning (attempt " << ev.attempt << "):\n";

    if (ev.text.empty())
      os << "  <none>\n";
    else
      os << Indented{ev.text};

    os << std::flush;
  }

  void operator()(const IllustrationEvent& ev) const
  {
    os << "Illustration (attempt " << ev.attempt << "): " << ev.location << std::endl;
  }

  void operator()(const CodeEvent& ev) const
  {
    os << "Code (attempt " << ev.attempt << "):\n"
       << "```\n" << ev.code << "\n```" << std::endl;
  }

  void operator()(const ResultEvent& ev) const
  {
    const ExecutionResult& res = ev.result;

    os << "Result (attempt " << ev.attempt << "): "
       << (res.succeeded() ? "PASSED" : "FAILED");

    if (res.timedOut())
      os << " (timeout)";
    else if (!res.succeeded())
      os << " (exit " << res.exitCode() << ")";

    os << '\n';

    if (!res.output().empty())
      os << "stdout:\n" << Indented{res.output()};

    if (!res.errors().empty())
      os << "stderr:\n" << Indented{res.errors()};

    os << std::flush;
  }

  void operator()(const DoneEvent& ev) const
  {
    os << RULE << "\nSolution found.";

    if (ev.savedPath.empty())
      os << " (not saved)";
    else
      os << " Saved to " << ev.savedPath;

    os << '\n' << RULE << std::endl;
  }

  void operator()(const ErrorEvent& ev) const
  {
    os << RULE << "\nERROR (" << ev.kind << "): " << ev.message
       << '\n' << RULE << std::endl;
  }
};

}


ConsoleSink::ConsoleSink(std::ostream& stream)
: os(stream)
{}

void
ConsoleSink::onEvent(const Event& ev)
{
  std::visit(ConsoleVisitor{os}, ev);
}


const char* as_string(bool v, bool align)
{
  if (!v) return "false";
  if (!align) return "true";

  return "true ";
}

std::ostream& operator<<(std::ostream& os, const ResultPrinter& el)
{
  const Attempt& att = el.obj;

  os << "attempt " << std::setw(2) << att.index << ": ";

  if (!att.result)
    return os << "<not executed>";

  return os << as_string(att.result->succeeded(), true)
            << "  exit: " << att.result->exitCode()
            << (att.result->timedOut() ? "  (timeout)" : "");
}

std::ostream& operator<<(std::ostream& os, const CsvResultPrinter& el)
{
  const Attempt& att = el.obj;

  os << el.session.id() << "," << att.index << ",";

  if (!att.result)
    return os << ",,";

  return os << as_string(att.result->succeeded())
            << "," << att.result->exitCode()
            << "," << as_string(att.result->timedOut());
}

std::ostream& operator<<(std::ostream& os, const StatisticsPrinter& el)
{
  return os << el.obj.aiTime << "ms (AI)   "
            << el.obj.execTime << "ms (exec)";
}

std::ostream& operator<<(std::ostream& os, const CsvStatisticsPrinter& el)
{
  return os << el.session.id() << ",timing," << el.obj.aiTime << "," << el.obj.execTime;
}

void reportCsvSummary(std::ostream& os, const Session& session, const RunStatistics& stats)
{
  os << "---" << '\n';
  reportResults<CsvResultPrinter>(os, session);
  os << CsvStatisticsPrinter{session, stats} << std::endl;
}

}

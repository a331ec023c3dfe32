// SynthGPT console presentation
//   prints the event stream and the session summary.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_CONSOLE_HPP
#define SYNTHGPT_CONSOLE_HPP 1

#include <ostream>

#include "synthgpt/correction_loop.hpp"
#include "synthgpt/events.hpp"
#include "synthgpt/session.hpp"

namespace synthgpt
{

/// an EventSink writing human readable text to a stream
class ConsoleSink : public EventSink
{
  public:
    explicit
    ConsoleSink(std::ostream& stream);

    void onEvent(const Event& ev) override;

  private:
    std::ostream& os;
};


/// returns a C string for a boolean. If \p align is set true gets a trailing blank.
const char* as_string(bool v, bool align = false);

/// prints an attempt in "result" format
struct ResultPrinter
{
  const Session& session;
  const Attempt& obj;
};

std::ostream& operator<<(std::ostream& os, const ResultPrinter& el);

/// prints an attempt in CSV format
struct CsvResultPrinter
{
  const Session& session;
  const Attempt& obj;
};

std::ostream& operator<<(std::ostream& os, const CsvResultPrinter& el);

/// prints the timing of a run
struct StatisticsPrinter
{
  const RunStatistics& obj;
};

std::ostream& operator<<(std::ostream& os, const StatisticsPrinter& el);

/// prints the timing of a run in CSV format: <session>,timing,<ms (AI)>,<ms (exec)>
struct CsvStatisticsPrinter
{
  const Session&       session;
  const RunStatistics& obj;
};

std::ostream& operator<<(std::ostream& os, const CsvStatisticsPrinter& el);

/// prints one line per attempt of \p session using \p Printer
template <class Printer>
void reportResults(std::ostream& os, const Session& session)
{
  for (const Attempt& attempt : session.attempts())
    os << Printer{ session, attempt } << '\n';

  os << std::flush;
}

/// appends the CSV summary of \p session: a separator line, one line per
///   attempt, and the timing line.
void reportCsvSummary(std::ostream& os, const Session& session, const RunStatistics& stats);

}

#endif /* SYNTHGPT_CONSOLE_HPP */

// SynthGPT event stream
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/events.hpp"

namespace synthgpt
{

const char* as_string(ErrorKind kind)
{
  switch (kind)
  {
    case ErrorKind::oracleFault:       return "oracle fault";
    case ErrorKind::missingCode:       return "missing code";
    case ErrorKind::attemptsExhausted: return "attempts exhausted";
  }

  return "unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
  return os << as_string(kind);
}

bool terminal(const Event& ev)
{
  return std::holds_alternative<DoneEvent>(ev) || std::holds_alternative<ErrorEvent>(ev);
}


EventFanout&
EventFanout::add(EventSink& sink)
{
  sinks.push_back(&sink);
  return *this;
}

void
EventFanout::onEvent(const Event& ev)
{
  for (EventSink* sink : sinks)
    sink->onEvent(ev);
}


void
EventLog::onEvent(const Event& ev)
{
  stream.push_back(ev);
}

}

// SynthGPT event stream
//   the observable events emitted by the correction loop and the
//   interface of their consumers.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_EVENTS_HPP
#define SYNTHGPT_EVENTS_HPP 1

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "synthgpt/session.hpp"

namespace synthgpt
{

/// a session begins
struct StartEvent
{
  std::int64_t sessionId = 0;
  Problem      problem;
};

/// progress message, e.g., "Attempt 1/5: Thinking..."
struct StatusEvent
{
  std::string message;
};

/// the oracle's reasoning for an attempt
struct RationaleEvent
{
  std::size_t attempt = 0;
  std::string text;
};

/// the location of an illustration of an attempt's rationale
struct IllustrationEvent
{
  std::size_t attempt = 0;
  std::string location;
};

/// the candidate code of an attempt, emitted before it is executed
struct CodeEvent
{
  std::size_t attempt = 0;
  std::string code;
};

/// the outcome of executing an attempt
struct ResultEvent
{
  std::size_t     attempt = 0;
  ExecutionResult result;
};

/// terminal event of a completed session.
/// savedPath is empty if the solution could not be saved.
struct DoneEvent
{
  std::string finalCode;
  std::string savedPath;
};

enum class ErrorKind { oracleFault, missingCode, attemptsExhausted };

const char* as_string(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/// terminal event of a failed or aborted session
struct ErrorEvent
{
  ErrorKind   kind = ErrorKind::oracleFault;
  std::string message;
};

using Event = std::variant< StartEvent, StatusEvent, RationaleEvent, IllustrationEvent,
                            CodeEvent, ResultEvent, DoneEvent, ErrorEvent
                          >;

/// true for DoneEvent and ErrorEvent
bool terminal(const Event& ev);


/// abstract consumer of events
class EventSink
{
  public:
    virtual ~EventSink() = default;

    virtual void onEvent(const Event& ev) = 0;
};


/// forwards events to several sinks in the order they were added.
/// \note the sinks are not owned and must outlive the fanout.
class EventFanout : public EventSink
{
  public:
    EventFanout() = default;

    EventFanout& add(EventSink& sink);

    void onEvent(const Event& ev) override;

  private:
    std::vector<EventSink*> sinks;
};


/// records the event stream
class EventLog : public EventSink
{
  public:
    void onEvent(const Event& ev) override;

    const std::vector<Event>& events() const { return stream; }

    /// returns the number of events of type \p EventType
    template <class EventType>
    std::size_t count() const
    {
      std::size_t res = 0;

      for (const Event& ev : stream)
        res += std::holds_alternative<EventType>(ev);

      return res;
    }

  private:
    std::vector<Event> stream;
};

}

#endif /* SYNTHGPT_EVENTS_HPP */

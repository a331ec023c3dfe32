// SynthGPT diagnostics
//   trace output and timestamped logging.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_TRACE_HPP
#define SYNTHGPT_TRACE_HPP 1

#include <chrono>
#include <ostream>
#include <utility>

namespace synthgpt
{

inline
void trace(std::ostream& os)
{
  os << std::flush;
}

template <class Arg, class... Rest>
void trace(std::ostream& os, Arg&& arg, Rest&&... rest)
{
  os << std::forward<Arg>(arg);
  trace(os, std::forward<Rest>(rest)...);
}

/// returns the stream receiving log messages; nullptr if logging is disabled.
std::ostream* logStream();

/// sets the log stream; nullptr disables logging.
/// \note the stream must outlive all log calls.
void setLogStream(std::ostream* os);

/// writes the timestamp prefix of a log line to \p os
void logPrefix(std::ostream& os);

/// writes a timestamped line composed of \p args to the log stream.
template <class... Args>
void log(Args&&... args)
{
  std::ostream* os = logStream();

  if (os == nullptr) return;

  logPrefix(*os);
  trace(*os, std::forward<Args>(args)..., '\n');
}


/// simple class to help measuring program timing
struct MeasureRuntime
{
    using time_point = std::chrono::time_point<std::chrono::steady_clock>;

    explicit
    MeasureRuntime(std::size_t& accum)
    : accu(accum), start(std::chrono::steady_clock::now())
    {}

    ~MeasureRuntime()
    {
      const time_point  stop = std::chrono::steady_clock::now();
      const std::size_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(stop-start).count();

      accu += elapsed;
    }

    MeasureRuntime(const MeasureRuntime&)            = delete;
    MeasureRuntime& operator=(const MeasureRuntime&) = delete;

  private:
    std::size_t& accu;
    time_point   start;
};

}

#endif /* SYNTHGPT_TRACE_HPP */

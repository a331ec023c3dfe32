// SynthGPT process invocation
//   runs external commands (container runtime, AI command, illustration
//   command) and captures their output.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_PROCESS_HPP
#define SYNTHGPT_PROCESS_HPP 1

#include <chrono>
#include <string>
#include <tuple>
#include <vector>

namespace synthgpt
{

using CommandResultBase = std::tuple<int, std::string, std::string, bool>;

/// encapsulates the outcome of an external command
struct CommandResult : CommandResultBase
{
  using base = CommandResultBase;
  using base::base;

  int                exitCode() const { return std::get<0>(*this); }
  const std::string& output()   const { return std::get<1>(*this); }
  const std::string& errors()   const { return std::get<2>(*this); }

  /// true if the command was killed because it exceeded its time budget
  bool               timedOut() const { return std::get<3>(*this); }

  bool success() const { return !timedOut() && exitCode() == 0; }
};

/// marks an invocation without time budget
constexpr std::chrono::milliseconds noTimeout{0};

/// runs \p exe with arguments \p args, closes stdin, and captures stdout and stderr.
/// \param  exe     path or name of the executable. Names without '/' are
///                 looked up in PATH.
/// \param  args    the arguments
/// \param  timeout wall-clock budget; the process is killed when it is exceeded.
///                 noTimeout waits for the process to terminate.
/// \return the exit code and captured output. For timed out commands the
///         captured output is empty and the exit code is -1.
/// \throws std::system_error if the process cannot be launched
CommandResult
invokeCommand( const std::string& exe,
               const std::vector<std::string>& args,
               std::chrono::milliseconds timeout = noTimeout
             );

/// returns the full path of \p exe found in PATH, or an empty string.
std::string
searchPath(const std::string& exe);

}

#endif /* SYNTHGPT_PROCESS_HPP */

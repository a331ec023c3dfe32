// SynthGPT process invocation
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/process.hpp"

#include <future>
#include <system_error>

#include <boost/asio.hpp>
#include <boost/version.hpp>

#if BOOST_VERSION < 108800

#include <boost/process.hpp>

namespace boostprocess = boost::process;

#else
// for boost 1.88 and later, include extra header for backward compatibility

#include <boost/process/v1.hpp>

namespace boostprocess = boost::process::v1;

#endif /* BOOST_VERSION */

namespace synthgpt
{

namespace
{

template <class T>
bool
ready(const std::future<T>& fut)
{
  return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}

std::string
searchPath(const std::string& exe)
{
  return boostprocess::search_path(exe).string();
}

CommandResult
invokeCommand( const std::string& exe,
               const std::vector<std::string>& args,
               std::chrono::milliseconds timeout
             )
{
  std::string executable = exe;

  if (executable.find('/') == std::string::npos)
  {
    executable = searchPath(exe);

    if (executable.empty())
      throw std::system_error{ std::make_error_code(std::errc::no_such_file_or_directory),
                               "executable not found in PATH: " + exe
                             };
  }

  boost::asio::io_context  ios;
  std::future<std::string> outstr;
  std::future<std::string> errstr;
  std::future<int>         exitCode;
  boostprocess::child      proc( executable,
                                 boostprocess::args(args),
                                 boostprocess::std_in.close(),
                                 boostprocess::std_out > outstr,
                                 boostprocess::std_err > errstr,
                                 boostprocess::on_exit = exitCode,
                                 ios
                               );

  if (timeout == noTimeout)
  {
    ios.run();
  }
  else
  {
    // returns early once the process has terminated and its output is complete
    ios.run_until(std::chrono::steady_clock::now() + timeout);

    if (!ready(exitCode) || !ready(outstr) || !ready(errstr))
    {
      std::error_code ec;

      proc.terminate(ec);
      ios.stop();

      return { -1, std::string{}, std::string{}, true };
    }
  }

  return { exitCode.get(), outstr.get(), errstr.get(), false };
}

}

// SynthGPT diagnostics
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/trace.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>

namespace synthgpt
{

namespace
{
std::ostream* logFile = nullptr;
std::mutex    logMutex;
}

std::ostream* logStream()
{
  std::lock_guard<std::mutex> guard{logMutex};

  return logFile;
}

void setLogStream(std::ostream* os)
{
  std::lock_guard<std::mutex> guard{logMutex};

  logFile = os;
}

void logPrefix(std::ostream& os)
{
  auto        now      = std::chrono::system_clock::now();
  std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm     time_info;

  localtime_r(&now_time, &time_info);

  os << "[" << std::put_time(&time_info, "%c") << "] ";
}

}

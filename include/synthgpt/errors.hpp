// SynthGPT error kinds
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_ERRORS_HPP
#define SYNTHGPT_ERRORS_HPP 1

#include <stdexcept>

namespace synthgpt
{

/// the generation backend failed (transport, quota, unreadable response).
struct OracleFault : std::runtime_error
{
  using base = std::runtime_error;
  using base::base;
};

/// the executor cannot provision isolation units.
struct IsolationUnavailable : std::runtime_error
{
  using base = std::runtime_error;
  using base::base;
};

/// a command of the isolation backend failed while a unit was in use.
struct IsolationError : std::runtime_error
{
  using base = std::runtime_error;
  using base::base;
};

}

#endif /* SYNTHGPT_ERRORS_HPP */

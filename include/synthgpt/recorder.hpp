// SynthGPT session recording
//   write-only persistence interface used by the correction loop.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_RECORDER_HPP
#define SYNTHGPT_RECORDER_HPP 1

#include <string>

#include "synthgpt/session.hpp"

namespace synthgpt
{

/// persists sessions and their attempts.
/// \details
///   implementations handle their own write failures; none of the
///   functions throws into the caller.
class SessionRecorder
{
  public:
    virtual ~SessionRecorder() = default;

    virtual void sessionStarted(const Session& session) = 0;

    /// called once the attempt is final, i.e., after its result was
    ///   recorded, or when the session aborted without executing it.
    virtual void attemptRecorded(const Session& session, const Attempt& attempt) = 0;

    virtual void illustrationRecorded(const Session& session, std::size_t attempt, const std::string& location) = 0;

    virtual void sessionFinished(const Session& session) = 0;
};

}

#endif /* SYNTHGPT_RECORDER_HPP */

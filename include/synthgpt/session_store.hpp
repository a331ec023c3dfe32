// SynthGPT session persistence
//   stores each session with its attempts as a JSON document.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_SESSION_STORE_HPP
#define SYNTHGPT_SESSION_STORE_HPP 1

#include <cstdint>
#include <map>
#include <string>

#include "synthgpt/llmtools.hpp"
#include "synthgpt/recorder.hpp"

namespace synthgpt
{

/// a SessionRecorder writing <directory>/session_<id>.json.
/// \details
///   the document is rewritten on every notification, so it always
///   reflects the latest state of the session. Write failures are
///   reported on std::cerr.
class JsonSessionStore : public SessionRecorder
{
  public:
    explicit
    JsonSessionStore(std::string directory);

    void sessionStarted(const Session& session) override;
    void attemptRecorded(const Session& session, const Attempt& attempt) override;
    void illustrationRecorded(const Session& session, std::size_t attempt, const std::string& location) override;
    void sessionFinished(const Session& session) override;

    /// returns one more than the largest session id stored in the directory
    std::int64_t nextSessionId() const;

    /// returns the document name of session \p sessionId
    std::string sessionFile(std::int64_t sessionId) const;

    /// returns the JSON representation of \p session
    llmtools::JsonValue toJson(const Session& session) const;

  private:
    void store(const Session& session);

    std::string                        dir;
    std::map<std::size_t, std::string> images;
    std::map<std::size_t, std::string> recorded;
};

/// formats a time point as local ISO-8601 time
std::string isoTime(std::chrono::system_clock::time_point tp);

}

#endif /* SYNTHGPT_SESSION_STORE_HPP */

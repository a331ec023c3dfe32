// SynthGPT session persistence
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/session_store.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "synthgpt/trace.hpp"

namespace json = boost::json;

namespace synthgpt
{

namespace
{

const std::string SESSION_PREFIX = "session_";
const std::string SESSION_SUFFIX = ".json";

json::value
optionalString(const std::optional<std::string>& s)
{
  if (!s) return nullptr;

  return json::string(*s);
}

}


std::string
isoTime(std::chrono::system_clock::time_point tp)
{
  std::time_t       tt = std::chrono::system_clock::to_time_t(tp);
  std::tm           time_info;
  std::stringstream os;

  localtime_r(&tt, &time_info);
  os << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%S");
  return os.str();
}


JsonSessionStore::JsonSessionStore(std::string directory)
: dir(std::move(directory))
{}

std::string
JsonSessionStore::sessionFile(std::int64_t sessionId) const
{
  const std::string name = SESSION_PREFIX + std::to_string(sessionId) + SESSION_SUFFIX;

  return (std::filesystem::path{dir} / name).string();
}

std::int64_t
JsonSessionStore::nextSessionId() const
{
  std::int64_t    maxId = 0;
  std::error_code ec;

  for (const auto& entry : std::filesystem::directory_iterator(dir, ec))
  {
    const std::string name = entry.path().filename().string();

    if (!boost::starts_with(name, SESSION_PREFIX) || !boost::ends_with(name, SESSION_SUFFIX))
      continue;

    const std::string num = name.substr( SESSION_PREFIX.size(),
                                         name.size() - SESSION_PREFIX.size() - SESSION_SUFFIX.size()
                                       );

    try
    {
      maxId = std::max(maxId, boost::lexical_cast<std::int64_t>(num));
    }
    catch (const boost::bad_lexical_cast&)
    {
      log("ignoring ", name, " in session directory");
    }
  }

  // a missing directory has no sessions
  return maxId + 1;
}

json::value
JsonSessionStore::toJson(const Session& session) const
{
  json::array attempts;

  for (const Attempt& attempt : session.attempts())
  {
    json::object rec;
    auto         img   = images.find(attempt.index);
    auto         stamp = recorded.find(attempt.index);

    rec["attempt"]       = attempt.index;
    rec["thought"]       = attempt.rationale;
    rec["generatedCode"] = attempt.code;
    rec["imagePath"]     = (img == images.end()) ? json::value(nullptr) : json::value(json::string(img->second));

    if (attempt.result)
    {
      json::object res;

      res["success"]  = attempt.result->succeeded();
      res["stdout"]   = attempt.result->output();
      res["stderr"]   = attempt.result->errors();
      res["exitCode"] = attempt.result->exitCode();
      res["timedOut"] = attempt.result->timedOut();

      rec["executionResult"] = std::move(res);
    }
    else
    {
      rec["executionResult"] = nullptr;
    }

    rec["timestamp"] = (stamp == recorded.end()) ? json::value(nullptr) : json::value(json::string(stamp->second));

    attempts.emplace_back(std::move(rec));
  }

  std::optional<std::string> endTime;

  if (session.endTime())
    endTime = isoTime(*session.endTime());

  json::object doc;

  doc["id"]               = session.id();
  doc["problemStatement"] = session.problem().statement();
  doc["testCases"]        = session.problem().tests();
  doc["startTime"]        = isoTime(session.startTime());
  doc["endTime"]          = optionalString(endTime);
  doc["status"]           = as_string(session.status());
  doc["finalCode"]        = optionalString(session.finalCode());
  doc["attempts"]         = std::move(attempts);

  return doc;
}

void
JsonSessionStore::store(const Session& session)
{
  try
  {
    std::error_code ec;

    std::filesystem::create_directories(dir, ec);

    if (ec)
      throw std::runtime_error{"cannot create " + dir + ": " + ec.message()};

    const std::string file = sessionFile(session.id());
    std::ofstream     os{file};

    llmtools::prettyPrint(os, toJson(session));
    os.close();

    if (!os)
      throw std::runtime_error{"cannot write " + file};
  }
  catch (const std::exception& ex)
  {
    trace(std::cerr, "session ", session.id(), " not stored: ", ex.what(), '\n');
  }
}

void
JsonSessionStore::sessionStarted(const Session& session)
{
  images.clear();
  recorded.clear();

  store(session);
}

void
JsonSessionStore::attemptRecorded(const Session& session, const Attempt& attempt)
{
  recorded[attempt.index] = isoTime(std::chrono::system_clock::now());

  store(session);
}

void
JsonSessionStore::illustrationRecorded(const Session& session, std::size_t attempt, const std::string& location)
{
  images[attempt] = location;

  store(session);
}

void
JsonSessionStore::sessionFinished(const Session& session)
{
  store(session);
}

}

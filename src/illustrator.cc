// SynthGPT illustration
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/illustrator.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

#include "synthgpt/llmtools.hpp"
#include "synthgpt/process.hpp"
#include "synthgpt/trace.hpp"

namespace synthgpt
{

ScriptIllustrator::ScriptIllustrator(std::string commandLine, std::string imageDir, std::chrono::seconds budget)
: command(std::move(commandLine)), dir(std::move(imageDir)), limit(budget)
{
  if (limit.count() < 1)
    throw std::invalid_argument{"illustratorTimeout must be at least 1s, got " + std::to_string(limit.count())};
}

std::string
ScriptIllustrator::imagePrompt(const std::string& rationale)
{
  return ( "Digital art, an abstract and minimalistic visualization of an AI agent's thought. "
           "Nodes, glowing connections, logic flows, representing the idea: '"
         + rationale
         + "'."
         );
}

std::string
ScriptIllustrator::imageFile(std::int64_t sessionId, std::size_t attempt) const
{
  const std::string name = "session_" + std::to_string(sessionId) + "_attempt_" + std::to_string(attempt) + ".png";

  return (std::filesystem::path{dir} / name).string();
}

std::optional<std::string>
ScriptIllustrator::illustrate(const std::string& rationale, std::int64_t sessionId, std::size_t attempt)
{
  if (command.empty() || rationale.empty())
    return std::nullopt;

  const std::string        output = imageFile(sessionId, attempt);
  llmtools::VariableMap    vars   = { { "prompt", imagePrompt(rationale) }, { "output", output } };
  std::vector<std::string> args;

  // split before expansion, so that a prompt stays a single argument
  llmtools::splitArgs(command, args);

  if (args.empty())
    return std::nullopt;

  for (std::string& arg : args)
    arg = llmtools::expandText(arg, vars);

  const std::string exe = args.front();

  args.erase(args.begin());

  std::error_code ec;

  std::filesystem::create_directories(dir, ec);

  if (ec)
  {
    log("cannot create image directory ", dir, ": ", ec.message());
    return std::nullopt;
  }

  log("illustrating attempt ", attempt, " -> ", output);
  CommandResult res = invokeCommand(exe, args, limit);

  if (!res.success())
  {
    log("illustration failed: ", (res.timedOut() ? std::string{"timeout"} : res.errors()));
    return std::nullopt;
  }

  if (!std::filesystem::exists(output, ec))
  {
    log("illustration command did not produce ", output);
    return std::nullopt;
  }

  return output;
}

}

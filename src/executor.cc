// SynthGPT isolated execution
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/executor.hpp"

#include <unistd.h>

#include <atomic>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "synthgpt/errors.hpp"
#include "synthgpt/trace.hpp"

namespace synthgpt
{

namespace
{

std::atomic<std::uint64_t> uniqueCounter{0};

/// returns a name that is unique within this host for the lifetime of the process
std::string
uniqueName(const std::string& prefix)
{
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();

  return ( prefix
         + "-" + std::to_string(::getpid())
         + "-" + std::to_string(++uniqueCounter)
         + "-" + std::to_string(ticks % 1000000)
         );
}

std::string
firstLine(const std::string& s)
{
  std::string res = boost::trim_copy(s);

  return res.substr(0, res.find('\n'));
}

std::string
commandFailure(const std::string& what, const CommandResult& res)
{
  if (res.timedOut())
    return what + ": command timed out";

  std::string reason = firstLine(res.errors());

  if (reason.empty())
    reason = "exit status " + std::to_string(res.exitCode());

  return what + ": " + reason;
}

}


void
checkBudgets(const IsolationSettings& settings)
{
  if (settings.timeout < 1)
    throw std::invalid_argument{"timeout must be at least 1s, got " + std::to_string(settings.timeout)};

  if (settings.commandBudget < 1)
    throw std::invalid_argument{"commandBudget must be at least 1s, got " + std::to_string(settings.commandBudget)};
}

IsolationSettings
isolationSettings(const llmtools::JsonValue& cnf, IsolationSettings settings)
{
  settings.containerExec = llmtools::loadField(cnf, "containerExec", settings.containerExec);
  settings.image         = llmtools::loadField(cnf, "image",         settings.image);
  settings.interpreter   = llmtools::loadField(cnf, "interpreter",   settings.interpreter);
  settings.scriptName    = llmtools::loadField(cnf, "scriptName",    settings.scriptName);
  settings.mountPoint    = llmtools::loadField(cnf, "mountPoint",    settings.mountPoint);
  settings.memoryLimit   = llmtools::loadField(cnf, "memoryLimit",   settings.memoryLimit);
  settings.cpuShares     = llmtools::loadField(cnf, "cpuShares",     settings.cpuShares);
  settings.network       = llmtools::loadField(cnf, "network",       settings.network);
  settings.timeout       = llmtools::loadField(cnf, "timeout",       settings.timeout);
  settings.commandBudget = llmtools::loadField(cnf, "commandBudget", settings.commandBudget);

  return settings;
}


//
// ContainerBackend

ContainerBackend::ContainerBackend(IsolationSettings settings)
: config(std::move(settings))
{
  checkBudgets(config);
}

CommandResult
ContainerBackend::manage(const std::vector<std::string>& args) const
{
  log(config.containerExec, " ", boost::join(args, " "));

  return invokeCommand(config.containerExec, args, std::chrono::seconds(config.commandBudget));
}

void
ContainerBackend::verify()
{
  try
  {
    CommandResult version = manage({ "version", "--format", "{{.Server.Version}}" });

    if (!version.success())
      throw IsolationUnavailable{commandFailure("container runtime not reachable", version)};

    CommandResult image = manage({ "image", "inspect", "--format", "{{.Id}}", config.image });

    if (!image.success())
      throw IsolationUnavailable{commandFailure("image " + config.image + " not available", image)};
  }
  catch (const std::system_error& err)
  {
    throw IsolationUnavailable{config.containerExec + " cannot be launched: " + err.what()};
  }
}

std::vector<std::string>
ContainerBackend::createArgs(const std::string& name, const std::filesystem::path& hostDir) const
{
  return { "create",
           "--name",         name,
           "--memory",       config.memoryLimit,
           "--memory-swap",  config.memoryLimit,
           "--cpu-shares",   std::to_string(config.cpuShares),
           "--network",      config.network,
           "--pids-limit",   "64",
           "--read-only",
           "--tmpfs",        "/tmp",
           "--cap-drop",     "ALL",
           "--security-opt", "no-new-privileges",
           "-v",             hostDir.string() + ":" + config.mountPoint + ":ro",
           "-w",             config.mountPoint,
           config.image,
           config.interpreter,
           config.scriptName
         };
}

std::string
ContainerBackend::create(const std::filesystem::path& hostDir)
{
  const std::string name = uniqueName("synthgpt");
  CommandResult     res  = manage(createArgs(name, hostDir));

  if (!res.success())
  {
    // a create command that timed out may still have created the container
    remove(name);
    throw IsolationError{commandFailure("cannot create container", res)};
  }

  return name;
}

void
ContainerBackend::start(const std::string& unit)
{
  CommandResult res = manage({ "start", unit });

  if (!res.success())
    throw IsolationError{commandFailure("cannot start container " + unit, res)};
}

std::optional<int>
ContainerBackend::wait(const std::string& unit, std::chrono::seconds budget)
{
  const std::vector<std::string> args = { "wait", unit };

  log(config.containerExec, " ", boost::join(args, " "));
  CommandResult res = invokeCommand(config.containerExec, args, budget);

  if (res.timedOut())
    return std::nullopt;

  if (!res.success())
    throw IsolationError{commandFailure("waiting for container " + unit + " failed", res)};

  try
  {
    return boost::lexical_cast<int>(boost::trim_copy(res.output()));
  }
  catch (const boost::bad_lexical_cast&)
  {
    throw IsolationError{"unexpected exit status from container " + unit + ": " + res.output()};
  }
}

UnitOutput
ContainerBackend::logs(const std::string& unit)
{
  CommandResult res = manage({ "logs", unit });

  if (!res.success())
    throw IsolationError{commandFailure("cannot read output of container " + unit, res)};

  return { res.output(), res.errors() };
}

bool
ContainerBackend::kill(const std::string& unit)
{
  try
  {
    return manage({ "kill", unit }).success();
  }
  catch (const std::exception& ex)
  {
    log("kill ", unit, " failed: ", ex.what());
  }

  return false;
}

bool
ContainerBackend::remove(const std::string& unit)
{
  try
  {
    return manage({ "rm", "--force", "--volumes", unit }).success();
  }
  catch (const std::exception& ex)
  {
    log("rm ", unit, " failed: ", ex.what());
  }

  return false;
}

bool
ContainerBackend::running(const std::string& unit)
{
  CommandResult res = manage({ "inspect", "--format", "{{.State.Running}}", unit });

  // a container that cannot be inspected does not exist
  return res.success() && boost::iequals(boost::trim_copy(res.output()), "true");
}

bool
ContainerBackend::exists(const std::string& unit)
{
  return manage({ "inspect", "--format", "{{.Id}}", unit }).success();
}


//
// IsolationUnit

IsolationUnit::IsolationUnit(IsolationBackend& backend, const std::filesystem::path& hostDir)
: be(backend), unit(backend.create(hostDir))
{
  log("created isolation unit ", unit);
}

IsolationUnit::~IsolationUnit()
{
  if (!be.remove(unit))
    trace(std::cerr, "unable to remove isolation unit ", unit, '\n');
  else
    log("removed isolation unit ", unit);
}


//
// ScratchDirectory

ScratchDirectory::ScratchDirectory()
: dir()
{
  const std::filesystem::path tmp = std::filesystem::temp_directory_path();

  do
  {
    dir = tmp / uniqueName("synthgpt-scratch");
  } while (!std::filesystem::create_directory(dir));

  std::filesystem::permissions( dir,
                                std::filesystem::perms::owner_all
                                  | std::filesystem::perms::group_read  | std::filesystem::perms::group_exec
                                  | std::filesystem::perms::others_read | std::filesystem::perms::others_exec
                              );
}

ScratchDirectory::~ScratchDirectory()
{
  std::error_code ec;

  std::filesystem::remove_all(dir, ec);

  if (ec)
    trace(std::cerr, "unable to remove ", dir.string(), ": ", ec.message(), '\n');
}

void
ScratchDirectory::write(const std::string& name, const std::string& content) const
{
  const std::filesystem::path file = dir / name;
  std::ofstream               out{file.string()};

  out << content;
  out.close();

  if (!out)
    throw std::runtime_error{"unable to write " + file.string()};
}


//
// IsolatedExecutor

IsolatedExecutor::IsolatedExecutor(std::unique_ptr<IsolationBackend> backend, IsolationSettings settings)
: be(std::move(backend)), config(std::move(settings)), last()
{
  if (!be)
    throw IsolationUnavailable{"no isolation backend"};

  checkBudgets(config);

  be->verify();
}

std::string
IsolatedExecutor::combine(const std::string& code, const std::string& tests)
{
  return code + "\n\n# Test cases\n" + tests;
}

ExecutionResult
IsolatedExecutor::run(const std::string& script)
{
  ScratchDirectory scratch;

  scratch.write(config.scriptName, script);

  IsolationUnit    unit{*be, scratch.path()};

  last = unit.id();
  be->start(unit.id());

  const std::chrono::seconds budget = config.executionBudget();
  std::optional<int>         status = be->wait(unit.id(), budget);

  if (!status)
  {
    log("unit ", unit.id(), " exceeded ", budget.count(), "s");

    if (!be->kill(unit.id()))
      trace(std::cerr, "unable to kill isolation unit ", unit.id(), '\n');

    return ExecutionResult::timeout(budget);
  }

  UnitOutput out = be->logs(unit.id());

  return ExecutionResult::fromExit( *status,
                                    boost::trim_copy(out.output()),
                                    boost::trim_copy(out.errors())
                                  );
}

ExecutionResult
IsolatedExecutor::execute(const std::string& code, const std::string& tests)
{
  last.clear();

  try
  {
    return run(combine(code, tests));
  }
  catch (const std::exception& ex)
  {
    log("execution failed: ", ex.what());
    return ExecutionResult::failure(std::string{"Execution failed: "} + ex.what());
  }
}

}

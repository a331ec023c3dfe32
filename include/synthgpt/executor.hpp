// SynthGPT isolated execution
//   runs candidate code together with its tests inside an ephemeral,
//   resource-bounded container.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_EXECUTOR_HPP
#define SYNTHGPT_EXECUTOR_HPP 1

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "synthgpt/llmtools.hpp"
#include "synthgpt/process.hpp"
#include "synthgpt/session.hpp"

namespace synthgpt
{

/// encapsulates all settings of the isolation environment
struct IsolationSettings
{
  std::string  containerExec = "docker";
  std::string  image         = "python_sandbox";
  std::string  interpreter   = "python";
  std::string  scriptName    = "script.py";
  std::string  mountPoint    = "/app";
  std::string  memoryLimit   = "256m";
  std::int64_t cpuShares     = 512;
  std::string  network       = "none";
  std::int64_t timeout       = 15;    ///< wall-clock seconds per execution
  std::int64_t commandBudget = 60;    ///< seconds for each container management command

  std::chrono::seconds executionBudget() const { return std::chrono::seconds(timeout); }
};

/// checks that \p settings bound every command.
/// \throws std::invalid_argument if timeout or commandBudget is less than 1s
void
checkBudgets(const IsolationSettings& settings);

/// loads isolation settings from a JSON object \p cnf. Keys that are
///   not present keep the values of \p settings.
IsolationSettings
isolationSettings(const llmtools::JsonValue& cnf, IsolationSettings settings);


using UnitOutputBase = std::tuple<std::string, std::string>;

/// captured output streams of an isolation unit
struct UnitOutput : UnitOutputBase
{
  using base = UnitOutputBase;
  using base::base;

  const std::string& output() const { return std::get<0>(*this); }
  const std::string& errors() const { return std::get<1>(*this); }
};


/// abstract interface of a provider of isolation units.
/// \details
///   Operations that manage a unit throw IsolationError when the
///   backend cannot carry them out. kill and remove report failure
///   through their return value, so they can be used on cleanup paths.
class IsolationBackend
{
  public:
    virtual ~IsolationBackend() = default;

    /// checks that units can be provisioned.
    /// \throws IsolationUnavailable if not.
    virtual void verify() = 0;

    /// creates a unit that runs the script in \p hostDir, which is exposed
    ///   read-only. Returns the unit's identifier.
    virtual std::string create(const std::filesystem::path& hostDir) = 0;

    /// starts the unit.
    virtual void start(const std::string& unit) = 0;

    /// waits at most \p budget for the unit to terminate.
    /// \return the exit status, or nothing if the budget was exceeded.
    virtual std::optional<int> wait(const std::string& unit, std::chrono::seconds budget) = 0;

    /// returns the unit's stdout and stderr
    virtual UnitOutput logs(const std::string& unit) = 0;

    /// forcibly stops the unit.
    virtual bool kill(const std::string& unit) = 0;

    /// removes the unit and all its resources, stopping it if needed.
    virtual bool remove(const std::string& unit) = 0;

    /// true if the unit is executing
    virtual bool running(const std::string& unit) = 0;

    /// true if the unit (running or not) still exists
    virtual bool exists(const std::string& unit) = 0;
};


/// isolation units implemented as containers managed through a
///   docker compatible command line (docker, podman).
class ContainerBackend : public IsolationBackend
{
  public:
    /// \throws std::invalid_argument if a time budget in \p settings is less than 1s
    explicit
    ContainerBackend(IsolationSettings settings);

    void verify() override;
    std::string create(const std::filesystem::path& hostDir) override;
    void start(const std::string& unit) override;
    std::optional<int> wait(const std::string& unit, std::chrono::seconds budget) override;
    UnitOutput logs(const std::string& unit) override;
    bool kill(const std::string& unit) override;
    bool remove(const std::string& unit) override;
    bool running(const std::string& unit) override;
    bool exists(const std::string& unit) override;

    /// returns the arguments of the create command
    std::vector<std::string>
    createArgs(const std::string& name, const std::filesystem::path& hostDir) const;

  private:
    CommandResult
    manage(const std::vector<std::string>& args) const;

    IsolationSettings config;
};


/// scoped ownership of one isolation unit; the unit is removed on
///   every exit path.
class IsolationUnit
{
  public:
    IsolationUnit(IsolationBackend& backend, const std::filesystem::path& hostDir);
    ~IsolationUnit();

    IsolationUnit(const IsolationUnit&)            = delete;
    IsolationUnit& operator=(const IsolationUnit&) = delete;

    const std::string& id() const { return unit; }

  private:
    IsolationBackend& be;
    std::string       unit;
};


/// scoped temporary directory holding the script of one execution.
class ScratchDirectory
{
  public:
    ScratchDirectory();
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&)            = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return dir; }

    /// writes \p content to file \p name inside the directory
    void write(const std::string& name, const std::string& content) const;

  private:
    std::filesystem::path dir;
};


/// runs code+tests bundles, one isolation unit per call.
class IsolatedExecutor
{
  public:
    /// \throws IsolationUnavailable if \p backend cannot provision units.
    /// \throws std::invalid_argument if a time budget in \p settings is less than 1s
    IsolatedExecutor(std::unique_ptr<IsolationBackend> backend, IsolationSettings settings);

    /// combines \p code and \p tests into one script and runs it in a
    ///   fresh isolation unit.
    /// \details
    ///   Failures of the candidate, timeouts, and failures of the backend
    ///   while the unit is in use are all reported as failed results.
    ExecutionResult
    execute(const std::string& code, const std::string& tests);

    /// the identifier of the unit used by the most recent execute call
    const std::string& lastUnit() const { return last; }

    IsolationBackend& backend() { return *be; }

    const IsolationSettings& settings() const { return config; }

    /// returns the program text that combines \p code and \p tests
    static
    std::string combine(const std::string& code, const std::string& tests);

  private:
    ExecutionResult
    run(const std::string& script);

    std::unique_ptr<IsolationBackend> be;
    IsolationSettings                 config;
    std::string                       last;
};

}

#endif /* SYNTHGPT_EXECUTOR_HPP */

// SynthGPT configuration
//   all settings that can be set through a JSON config file.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_CONFIG_HPP
#define SYNTHGPT_CONFIG_HPP 1

#include <cstdint>
#include <ostream>
#include <string>

#include "synthgpt/correction_loop.hpp"
#include "synthgpt/executor.hpp"
#include "synthgpt/llmtools.hpp"
#include "synthgpt/oracle.hpp"

namespace synthgpt
{

/// encapsulates all settings that can be configured through a JSON file.
struct Settings
{
  llmtools::Settings llmSettings;
  OracleSettings     prompts;
  IsolationSettings  isolation;
  LoopSettings       loop;
  std::string        sessionDir         = "outputs/sessions";
  std::string        illustrator        = "";
  std::string        imageDir           = "outputs/images";
  std::int64_t       illustratorTimeout = 300;   ///< seconds for one illustration
};

/// returns the default number of attempts; MAX_CORRECTION_ATTEMPTS
///   overrides the built-in default of 5 when it holds a positive number.
std::int64_t
defaultMaxAttempts();

/// returns settings with all default values
Settings
defaultSettings();

/// loads settings from a JSON object \p cnf. Keys that are not
///   present keep the values of \p settings.
Settings
loadSettings(const llmtools::JsonValue& cnf, Settings settings);

/// loads settings from the JSON file \p configFileName.
/// \details
///   falls back to default values if the file cannot be read.
Settings
readSettings(const std::string& configFileName);

/// pretty prints settings to JSON format.
/// \param withDoc if true, each key is preceded by a <key>-doc field.
void
writeSettings(std::ostream& os, const Settings& settings, bool withDoc = false);

/// prints the documentation of all configuration keys
void
printConfigHelp(std::ostream& os);

}

#endif /* SYNTHGPT_CONFIG_HPP */

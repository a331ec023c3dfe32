// SynthGPT (synthgpt)
//   Iterative code synthesis: asks an AI model for a solution to a
//   problem, runs the solution and its tests in a container, and feeds
//   failures back to the model until the tests pass.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <boost/program_options.hpp>

#include "synthgpt/config.hpp"
#include "synthgpt/console.hpp"
#include "synthgpt/correction_loop.hpp"
#include "synthgpt/errors.hpp"
#include "synthgpt/events.hpp"
#include "synthgpt/executor.hpp"
#include "synthgpt/illustrator.hpp"
#include "synthgpt/llmtools.hpp"
#include "synthgpt/oracle.hpp"
#include "synthgpt/session_store.hpp"
#include "synthgpt/trace.hpp"

#include "synthgpt/tool_version.hpp"

namespace po = boost::program_options;

namespace
{

const char* synopsis = "synthgpt: iterative code synthesis through LLMs"
                       "\n  description: synthgpt asks an AI model for code that solves a problem,"
                       "\n               runs the code together with the problem's tests in an"
                       "\n               isolated container, and feeds failures back to the model."
                       "\n               The loop stops when the tests pass or when the maximum"
                       "\n               number of attempts is reached."
                       "\n"
                       "\n  exit status: 0 (solution found), 2 (no solution), 1 (usage or setup error)"
                       ;

constexpr int EXIT_SOLVED   = 0;
constexpr int EXIT_SETUP    = 1;
constexpr int EXIT_UNSOLVED = 2;

/// encapsulates all command line switches and their settings
struct CmdLineArgs
{
  bool                     help           = false;
  bool                     helpConfig     = false;
  bool                     showVersion    = false;
  bool                     configCreate   = false;
  bool                     withDocFields  = false;
  std::string              configAI       = "";
  std::string              configModel    = "";
  std::string              configFileName = "synthgpt.json";
  std::string              problem        = "";
  std::string              problemFile    = "";
  std::string              tests          = "";
  std::string              testsFile      = "";
  std::int64_t             maxAttempts    = 0;
  std::string              logFile        = "";
  std::string              csvsummary     = "";
  std::vector<std::string> configFiles    = {};
};


po::options_description
commandLineOptions(CmdLineArgs& args)
{
  po::options_description desc("switches");

  desc.add_options()
    ("help,h",            po::bool_switch(&args.help),
                          "displays this help message and exits.")
    ("version",           po::bool_switch(&args.showVersion),
                          "displays version information and exits.")
    ("help-config",       po::bool_switch(&args.helpConfig),
                          "prints config file documentation and exits.")
    ("config",            po::value<std::string>(&args.configFileName),
                          "config file in json format (default: synthgpt.json).")
    ("create-config",     po::bool_switch(&args.configCreate),
                          "creates config file and exits.")
    ("create-doc-config", po::bool_switch(&args.withDocFields),
                          "creates config file with documentation fields and exits.")
    ("config:ai",         po::value<std::string>(&args.configAI),
                          "creates config file for a specified AI provider (default: openai).")
    ("config:model",      po::value<std::string>(&args.configModel),
                          "specifies a model for the AI provider (e.g., gpt-4o).")
    ("model-file",        po::value<std::vector<std::string>>(&args.configFiles),
                          "a JSON file with additional provider definitions.")
    ("problem",           po::value<std::string>(&args.problem),
                          "the problem statement.")
    ("problem-file",      po::value<std::string>(&args.problemFile),
                          "a file containing the problem statement.")
    ("tests",             po::value<std::string>(&args.tests),
                          "test assertions that a solution must pass.")
    ("tests-file",        po::value<std::string>(&args.testsFile),
                          "a file containing the test assertions.")
    ("max-attempts",      po::value<std::int64_t>(&args.maxAttempts),
                          "overrides maxAttempts from the config file.")
    ("log",               po::value<std::string>(&args.logFile),
                          "enables logging to a file, stdout, or stderr.")
    ("csvsummary",        po::value<std::string>(&args.csvsummary),
                          "appends a summary of all attempts to a CSV file.")
    ;

  return desc;
}

/// reads the entire file \p filename.
/// \throws std::runtime_error if the file cannot be read.
std::string
readTextFile(const std::string& filename)
{
  std::ifstream is{filename};

  if (!is.good())
    throw std::runtime_error{"unable to read " + filename};

  std::stringstream txt;

  txt << is.rdbuf();
  return txt.str();
}

/// returns the text from either \p inlineText or \p filename.
std::string
textInput(const std::string& inlineText, const std::string& filename)
{
  if (!filename.empty())
    return readTextFile(filename);

  return inlineText;
}

/// creates JSON file with default values
int
createConfigFile(const synthgpt::llmtools::Configurations& toolConfigs, CmdLineArgs args)
{
  if (std::filesystem::exists(args.configFileName))
  {
    std::cerr << "config file " << args.configFileName << " exists."
              << "\n  not creating a new file! (delete file or choose different file name)"
              << std::endl;
    return EXIT_SETUP;
  }

  if (args.configAI.empty())
  {
    std::cerr << "Unspecified AI component."
              << "\n** Using default provider: openai **"
              << std::endl;

    args.configAI = "openai";
  }

  synthgpt::Settings settings = synthgpt::defaultSettings();

  settings.llmSettings = synthgpt::llmtools::configure( toolConfigs,
                                                        synthgpt::llmtools::provider(toolConfigs, args.configAI),
                                                        args.configModel
                                                      );

  std::ofstream ofs(args.configFileName);

  synthgpt::writeSettings(ofs, settings, args.withDocFields);
  return EXIT_SOLVED;
}

std::unique_ptr<std::ofstream>
setupLogging(const std::string& logFilePath)
{
  if (logFilePath.empty())
    return nullptr;

  if (logFilePath == "stdout")
  {
    synthgpt::setLogStream(&std::cout);
    return nullptr;
  }

  if (logFilePath == "stderr")
  {
    synthgpt::setLogStream(&std::cerr);
    return nullptr;
  }

  auto logFile = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);

  if (!logFile->is_open())
    throw std::runtime_error{"Could not open log file: " + logFilePath};

  synthgpt::setLogStream(logFile.get());
  return logFile;
}

/// prints the reason for an unsuccessful session
void
reportTermination(std::ostream& os, const synthgpt::EventLog& events)
{
  if (events.events().empty())
    return;

  if (const auto* err = std::get_if<synthgpt::ErrorEvent>(&events.events().back()))
    os << "Reason: " << err->message << std::endl;
}

int
runSession(const CmdLineArgs& cmdlnargs, const synthgpt::Settings& settings)
{
  const synthgpt::Problem problem{ textInput(cmdlnargs.problem, cmdlnargs.problemFile),
                                   textInput(cmdlnargs.tests,   cmdlnargs.testsFile)
                                 };

  if (problem.statement().empty() || problem.tests().empty())
  {
    std::cerr << "both a problem statement and tests are required."
              << "\n  try --help for more information"
              << std::endl;
    return EXIT_SETUP;
  }

  std::unique_ptr<synthgpt::IsolatedExecutor> executor;

  try
  {
    executor = std::make_unique<synthgpt::IsolatedExecutor>( std::make_unique<synthgpt::ContainerBackend>(settings.isolation),
                                                             settings.isolation
                                                           );
  }
  catch (const synthgpt::IsolationUnavailable& ex)
  {
    std::cerr << "isolated execution is unavailable: " << ex.what()
              << "\n  (is " << settings.isolation.containerExec << " running, and has image "
              << settings.isolation.image << " been built?)"
              << std::endl;
    return EXIT_SETUP;
  }

  synthgpt::LlmOracle                           oracle{settings.llmSettings, settings.prompts};
  synthgpt::JsonSessionStore                    store{settings.sessionDir};
  synthgpt::ConsoleSink                         console{std::cout};
  synthgpt::EventLog                            events;
  synthgpt::EventFanout                         sink;
  std::unique_ptr<synthgpt::ScriptIllustrator>  illustrator;

  sink.add(console).add(events);

  if (!settings.illustrator.empty())
    illustrator = std::make_unique<synthgpt::ScriptIllustrator>( settings.illustrator,
                                                                 settings.imageDir,
                                                                 std::chrono::seconds(settings.illustratorTimeout)
                                                               );

  synthgpt::CorrectionLoop loop{ oracle, *executor, sink, settings.loop, &store, illustrator.get() };
  const std::int64_t       sessionId = store.nextSessionId();
  synthgpt::Session        session   = loop.run(problem, sessionId);

  //
  // prepare final report

  std::cout << "\nSession " << session.id() << ": " << session.status() << std::endl;
  synthgpt::reportResults<synthgpt::ResultPrinter>(std::cout, session);
  reportTermination(std::cout, events);

  if (cmdlnargs.csvsummary.size())
  {
    std::ofstream of{cmdlnargs.csvsummary, std::ios_base::app};

    synthgpt::reportCsvSummary(of, session, loop.statistics());
  }

  std::cerr << "Timing: " << synthgpt::StatisticsPrinter{loop.statistics()}
            << std::endl;

  return (session.status() == synthgpt::SessionStatus::completed) ? EXIT_SOLVED : EXIT_UNSOLVED;
}

}


/// main driver file
int main(int argc, char** argv)
{
  CmdLineArgs             cmdlnargs;
  po::options_description desc = commandLineOptions(cmdlnargs);

  try
  {
    po::variables_map vm;
    const int         style = po::command_line_style::default_style & ~po::command_line_style::allow_guessing;

    po::store(po::parse_command_line(argc, argv, desc, style), vm);
    po::notify(vm);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "Error: " << ex.what()
              << "\n  try --help for more information"
              << std::endl;
    return EXIT_SETUP;
  }

  if (cmdlnargs.showVersion)
  {
    std::cout << TOOL_VERSION << std::endl;
    return EXIT_SOLVED;
  }

  if (cmdlnargs.help)
  {
    std::cout << synopsis << std::endl
              << "\nusage: synthgpt switches\n"
              << desc << std::endl;
    return EXIT_SOLVED;
  }

  if (cmdlnargs.helpConfig)
  {
    synthgpt::printConfigHelp(std::cout);
    return EXIT_SOLVED;
  }

  try
  {
    std::unique_ptr<std::ofstream> logFile = setupLogging(cmdlnargs.logFile);

    synthgpt::log("synthgpt ", TOOL_VERSION, " started");

    // build tools configuration
    synthgpt::llmtools::Configurations toolsConfig = synthgpt::llmtools::initializeWithDefault();

    for (const std::string& configFileName: cmdlnargs.configFiles)
      toolsConfig = synthgpt::llmtools::initializeWithConfigFile(configFileName, std::move(toolsConfig));

    int res = EXIT_SETUP;

    if (cmdlnargs.configCreate || cmdlnargs.withDocFields)
    {
      res = createConfigFile(toolsConfig, cmdlnargs);
    }
    else
    {
      synthgpt::Settings settings = synthgpt::readSettings(cmdlnargs.configFileName);

      if (cmdlnargs.maxAttempts != 0)
        settings.loop.maxAttempts = cmdlnargs.maxAttempts;

      res = runSession(cmdlnargs, settings);
    }

    synthgpt::log("synthgpt finished with exit status ", res);
    synthgpt::setLogStream(nullptr);
    return res;
  }
  catch (const std::exception& ex)
  {
    synthgpt::setLogStream(nullptr);
    std::cerr << "ERROR:\n" << ex.what() << "\nterminating"
              << std::endl;
  }

  return EXIT_SETUP;
}

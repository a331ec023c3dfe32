// SynthGPT configuration
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/config.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace json = boost::json;

namespace synthgpt
{

namespace
{

const char* const MAX_ATTEMPTS_ENV = "MAX_CORRECTION_ATTEMPTS";

// llmtools Settings doc
const char* execDoc             = "a string pointing to an executable (script) that calls the external AI (e.g., curl)";
const char* execFlagsDoc        = "arguments to the executable. The following variables are expanded:"
                                  "\n  ${LLMTOOLS:MODEL}, ${LLMTOOLS:API_KEY}, ${LLMTOOLS:PROMPT_FILE},"
                                  "\n  ${LLMTOOLS:HISTORY}, ${LLMTOOLS:RESPONSE_FILE}, ${LLMTOOLS:SYSTEM_TEXT_FILE}."
                                  "\n  A last argument starting with > names a file receiving the command's stdout.";
const char* historyFileDoc      = "a JSON file storing the conversation history of the latest query.";
const char* responseFileDoc     = "a file [.txt or .json] where the AI stores the query response";
const char* responseFieldDoc    = "a JSON path in the form of [field ['[' literal ']'] {'.' field ['[' literal ']']} ]"
                                  "\n  identifying the response in a JSON output file."
                                  "\n  (ignored when responseFile is a text file)";
const char* roleOfAIDoc         = "The name of the AI role in the conversation history. Typically assistant.";
const char* systemTextFileDoc   = "If set SynthGPT writes the system text into the file instead of"
                                  "\n  passing it as first message in the conversation history.";
const char* apiKeyNameDoc       = "The name of the API key defined in the environment";
const char* modelNameDoc        = "The name of the model to use";
const char* queryTimeoutDoc     = "time limit in seconds for one AI query; 0 means unlimited.";
const char* promptFileDoc       = "The name of the temporary prompt file, or an object {filename, format}"
                                  "\n  where format is a JSON template for the request body.";

// prompting
const char* systemTextDoc       = "A string setting the context/role in the AI communication.";
const char* firstPromptDoc      = "The prompt of the first attempt. Variables: ${problem}, ${tests}, ${lang}.";
const char* correctionPromptDoc = "The prompt of every later attempt. Variables: ${problem}, ${code},"
                                  "\n  ${stdout}, ${stderr}, ${lang}. ${code}, ${stdout} and ${stderr}"
                                  "\n  refer to the immediately preceding attempt.";
const char* codeLangDoc         = "the language marker of code blocks in AI responses (e.g., python).";

// isolation
const char* containerExecDoc    = "a docker compatible command line tool (docker, podman).";
const char* imageDoc            = "the container image that runs candidate code.";
const char* interpreterDoc      = "the program inside the image that runs the script.";
const char* scriptNameDoc       = "the file name of the script; its extension is also used for solution files.";
const char* mountPointDoc       = "the directory in the container where the script is mounted read-only.";
const char* memoryLimitDoc      = "memory limit of a container (e.g., 256m).";
const char* cpuSharesDoc        = "relative CPU share of a container.";
const char* networkDoc          = "container network; none disables networking.";
const char* timeoutDoc          = "wall-clock limit in seconds for executing one candidate.";
const char* commandBudgetDoc    = "time limit in seconds for each container management command.";

// loop
const char* maxAttemptsDoc      = "Integer number specifying the maximum number of attempts."
                                  "\n  (the default can be set with the environment variable MAX_CORRECTION_ATTEMPTS)";
const char* solutionDirDoc      = "directory where the solution of a completed session is stored.";
const char* sessionDirDoc       = "directory where session records are stored.";

// illustration
const char* illustratorDoc      = "an optional command line generating an image from a rationale."
                                  "\n  ${prompt} and ${output} are replaced by the image prompt and the output file."
                                  "\n  An empty string disables illustrations.";
const char* imageDirDoc         = "directory where illustrations are stored.";
const char* illustratorTimeoutDoc = "time limit in seconds for generating one illustration."
                                  "\n  The correction loop waits for the illustration before it continues.";


std::string
align(std::string doc, const std::string& spaces)
{
  boost::replace_all(doc, "\n  ", spaces);
  return doc;
}

std::string
fieldDoc(bool gen, const char* field, const char* docString)
{
  if (!gen) return {};

  std::string res;
  std::string doc = align(docString, " ");

  res += "\n  \"";
  res += field;
  res += "\":";
  res += json::serialize(json::string(doc));
  res += ",";

  return res;
}

std::string
extension(const std::string& scriptName)
{
  const std::size_t pos = scriptName.find_last_of('.');

  if (pos == std::string::npos)
    return {};

  return scriptName.substr(pos + 1);
}

}


std::int64_t
defaultMaxAttempts()
{
  constexpr std::int64_t builtin = 5;
  const char*            env     = std::getenv(MAX_ATTEMPTS_ENV);

  if (env == nullptr)
    return builtin;

  try
  {
    const std::int64_t val = boost::lexical_cast<std::int64_t>(env);

    if (val > 0)
      return val;
  }
  catch (const boost::bad_lexical_cast&) {}

  std::cerr << "ignoring " << MAX_ATTEMPTS_ENV << "=" << env << " (not a positive number)"
            << std::endl;
  return builtin;
}

Settings
defaultSettings()
{
  Settings res;

  res.loop.maxAttempts = defaultMaxAttempts();
  res.loop.solutionExt = extension(res.isolation.scriptName);
  return res;
}

Settings
loadSettings(const llmtools::JsonValue& cnf, Settings config)
{
  config.llmSettings      = llmtools::settings(cnf, config.llmSettings);
  config.prompts          = oracleSettings(cnf, std::move(config.prompts));
  config.isolation        = isolationSettings(cnf, std::move(config.isolation));

  config.loop.maxAttempts = llmtools::loadField(cnf, "maxAttempts", config.loop.maxAttempts);
  config.loop.solutionDir = llmtools::loadField(cnf, "solutionDir", config.loop.solutionDir);
  config.loop.solutionExt = extension(config.isolation.scriptName);
  config.sessionDir       = llmtools::loadField(cnf, "sessionDir",  config.sessionDir);
  config.illustrator      = llmtools::loadField(cnf, "illustrator", config.illustrator);
  config.imageDir         = llmtools::loadField(cnf, "imageDir",    config.imageDir);
  config.illustratorTimeout = llmtools::loadField(cnf, "illustratorTimeout", config.illustratorTimeout);

  return config;
}

Settings
readSettings(const std::string& configFileName)
{
  Settings res = defaultSettings();

  try
  {
    res = loadSettings(llmtools::readJsonFile(configFileName), res);
  }
  catch (const std::exception& ex)
  {
    std::cerr << ex.what()
              << "\n  => Using default values."
              << std::endl;
  }

  return res;
}

void
writeSettings(std::ostream& os, const Settings& settings, bool genDoc)
{
  const llmtools::Settings& llm = settings.llmSettings;
  const IsolationSettings&  iso = settings.isolation;

  // print pretty json by hand, to keep the order of the fields.
  os << "{"
     << fieldDoc(genDoc, "exec-doc", execDoc)
     << "\n  \"exec\":"             << json::serialize(json::string(llm.exec())) << ","
     << fieldDoc(genDoc, "execFlags-doc", execFlagsDoc)
     << "\n  \"execFlags\":"        << json::serialize(json::string(llm.execFlags())) << ","
     << fieldDoc(genDoc, "historyFile-doc", historyFileDoc)
     << "\n  \"historyFile\":"      << json::serialize(json::string(llm.historyFile())) << ","
     << fieldDoc(genDoc, "responseFile-doc", responseFileDoc)
     << "\n  \"responseFile\":"     << json::serialize(json::string(llm.responseFile())) << ","
     << fieldDoc(genDoc, "responseField-doc", responseFieldDoc)
     << "\n  \"responseField\":"    << json::serialize(json::string(llm.responseField())) << ","
     << fieldDoc(genDoc, "systemTextFile-doc", systemTextFileDoc)
     << "\n  \"systemTextFile\":"   << json::serialize(json::string(llm.systemTextFile())) << ","
     << fieldDoc(genDoc, "roleOfAI-doc", roleOfAIDoc)
     << "\n  \"roleOfAI\":"         << json::serialize(json::string(llm.roleOfAI())) << ","
     << fieldDoc(genDoc, "apiKeyName-doc", apiKeyNameDoc)
     << "\n  \"apiKeyName\":"       << json::serialize(json::string(llm.apiKeyName())) << ","
     << fieldDoc(genDoc, "modelName-doc", modelNameDoc)
     << "\n  \"modelName\":"        << json::serialize(json::string(llm.modelName())) << ","
     << fieldDoc(genDoc, "promptFile-doc", promptFileDoc)
     << "\n  \"promptFile\":"       << json::serialize(llm.promptFile()) << ","
     << fieldDoc(genDoc, "queryTimeout-doc", queryTimeoutDoc)
     << "\n  \"queryTimeout\":"     << llm.queryTimeout() << ","

     // prompting
     << fieldDoc(genDoc, "systemText-doc", systemTextDoc)
     << "\n  \"systemText\":"       << json::serialize(json::string(settings.prompts.systemText)) << ","
     << fieldDoc(genDoc, "firstPrompt-doc", firstPromptDoc)
     << "\n  \"firstPrompt\":"      << json::serialize(json::string(settings.prompts.firstPrompt)) << ","
     << fieldDoc(genDoc, "correctionPrompt-doc", correctionPromptDoc)
     << "\n  \"correctionPrompt\":" << json::serialize(json::string(settings.prompts.correctionPrompt)) << ","
     << fieldDoc(genDoc, "codeLang-doc", codeLangDoc)
     << "\n  \"codeLang\":"         << json::serialize(json::string(settings.prompts.codeLang)) << ","

     // isolation
     << fieldDoc(genDoc, "containerExec-doc", containerExecDoc)
     << "\n  \"containerExec\":"    << json::serialize(json::string(iso.containerExec)) << ","
     << fieldDoc(genDoc, "image-doc", imageDoc)
     << "\n  \"image\":"            << json::serialize(json::string(iso.image)) << ","
     << fieldDoc(genDoc, "interpreter-doc", interpreterDoc)
     << "\n  \"interpreter\":"      << json::serialize(json::string(iso.interpreter)) << ","
     << fieldDoc(genDoc, "scriptName-doc", scriptNameDoc)
     << "\n  \"scriptName\":"       << json::serialize(json::string(iso.scriptName)) << ","
     << fieldDoc(genDoc, "mountPoint-doc", mountPointDoc)
     << "\n  \"mountPoint\":"       << json::serialize(json::string(iso.mountPoint)) << ","
     << fieldDoc(genDoc, "memoryLimit-doc", memoryLimitDoc)
     << "\n  \"memoryLimit\":"      << json::serialize(json::string(iso.memoryLimit)) << ","
     << fieldDoc(genDoc, "cpuShares-doc", cpuSharesDoc)
     << "\n  \"cpuShares\":"        << iso.cpuShares << ","
     << fieldDoc(genDoc, "network-doc", networkDoc)
     << "\n  \"network\":"          << json::serialize(json::string(iso.network)) << ","
     << fieldDoc(genDoc, "timeout-doc", timeoutDoc)
     << "\n  \"timeout\":"          << iso.timeout << ","
     << fieldDoc(genDoc, "commandBudget-doc", commandBudgetDoc)
     << "\n  \"commandBudget\":"    << iso.commandBudget << ","

     // loop and output
     << fieldDoc(genDoc, "solutionDir-doc", solutionDirDoc)
     << "\n  \"solutionDir\":"      << json::serialize(json::string(settings.loop.solutionDir)) << ","
     << fieldDoc(genDoc, "sessionDir-doc", sessionDirDoc)
     << "\n  \"sessionDir\":"       << json::serialize(json::string(settings.sessionDir)) << ","
     << fieldDoc(genDoc, "illustrator-doc", illustratorDoc)
     << "\n  \"illustrator\":"      << json::serialize(json::string(settings.illustrator)) << ","
     << fieldDoc(genDoc, "imageDir-doc", imageDirDoc)
     << "\n  \"imageDir\":"         << json::serialize(json::string(settings.imageDir)) << ","
     << fieldDoc(genDoc, "illustratorTimeout-doc", illustratorTimeoutDoc)
     << "\n  \"illustratorTimeout\":" << settings.illustratorTimeout << ","
     << fieldDoc(genDoc, "maxAttempts-doc", maxAttemptsDoc)
     << "\n  \"maxAttempts\":"      << settings.loop.maxAttempts
     << "\n}" << std::endl;
}

void
printConfigHelp(std::ostream& os)
{
  static std::string indent = "\n" + std::string(19, ' ');

  os << "The following configuration parameters can be set in the config file."
     << "\n"
     << "\nInteraction with AI:"
     << "\n  exec             " << align(execDoc, indent)
     << "\n  execFlags        " << align(execFlagsDoc, indent)
     << "\n  historyFile      " << align(historyFileDoc, indent)
     << "\n  responseFile     " << align(responseFileDoc, indent)
     << "\n  responseField    " << align(responseFieldDoc, indent)
     << "\n  apiKeyName       " << align(apiKeyNameDoc, indent)
     << "\n  modelName        " << align(modelNameDoc, indent)
     << "\n  promptFile       " << align(promptFileDoc, indent)
     << "\n  queryTimeout     " << align(queryTimeoutDoc, indent)
     << "\n"
     << "\nPrompting:"
     << "\n  systemText       " << align(systemTextDoc, indent)
     << "\n  systemTextFile   " << align(systemTextFileDoc, indent)
     << "\n  roleOfAI         " << align(roleOfAIDoc, indent)
     << "\n  firstPrompt      " << align(firstPromptDoc, indent)
     << "\n  correctionPrompt " << align(correctionPromptDoc, indent)
     << "\n  codeLang         " << align(codeLangDoc, indent)
     << "\n"
     << "\nIsolated execution:"
     << "\n  containerExec    " << align(containerExecDoc, indent)
     << "\n  image            " << align(imageDoc, indent)
     << "\n  interpreter      " << align(interpreterDoc, indent)
     << "\n  scriptName       " << align(scriptNameDoc, indent)
     << "\n  mountPoint       " << align(mountPointDoc, indent)
     << "\n  memoryLimit      " << align(memoryLimitDoc, indent)
     << "\n  cpuShares        " << align(cpuSharesDoc, indent)
     << "\n  network          " << align(networkDoc, indent)
     << "\n  timeout          " << align(timeoutDoc, indent)
     << "\n  commandBudget    " << align(commandBudgetDoc, indent)
     << "\n"
     << "\nIteration control and output:"
     << "\n  maxAttempts      " << align(maxAttemptsDoc, indent)
     << "\n  solutionDir      " << align(solutionDirDoc, indent)
     << "\n  sessionDir       " << align(sessionDirDoc, indent)
     << "\n  illustrator      " << align(illustratorDoc, indent)
     << "\n  imageDir         " << align(imageDirDoc, indent)
     << "\n  illustratorTimeout " << align(illustratorTimeoutDoc, indent)
     << std::endl;
}

}

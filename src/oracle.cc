// SynthGPT code generation
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/oracle.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>

#include "synthgpt/errors.hpp"
#include "synthgpt/trace.hpp"

namespace synthgpt
{

namespace
{
const std::string THINKING_BEGIN = "<thinking>";
const std::string THINKING_LIMIT = "</thinking>";
}

OracleSettings
oracleSettings(const llmtools::JsonValue& cnf, OracleSettings settings)
{
  settings.systemText       = llmtools::loadField(cnf, "systemText",       settings.systemText);
  settings.firstPrompt      = llmtools::loadField(cnf, "firstPrompt",      settings.firstPrompt);
  settings.correctionPrompt = llmtools::loadField(cnf, "correctionPrompt", settings.correctionPrompt);
  settings.codeLang         = llmtools::loadField(cnf, "codeLang",         settings.codeLang);

  return settings;
}


LlmOracle::LlmOracle(llmtools::Settings llm, OracleSettings prompts)
: llmSettings(std::move(llm)), config(std::move(prompts))
{}

std::string
LlmOracle::prompt(const GenerationRequest& request) const
{
  llmtools::VariableMap vars = { { "problem", request.problem.statement() },
                                 { "tests",   request.problem.tests() },
                                 { "lang",    config.codeLang }
                               };

  if (!request.feedback)
    return llmtools::expandText(config.firstPrompt, vars);

  vars["code"]   = request.feedback->code;
  vars["stdout"] = request.feedback->output;
  vars["stderr"] = request.feedback->errors;

  return llmtools::expandText(config.correctionPrompt, vars);
}

Generation
LlmOracle::generate(const GenerationRequest& request)
{
  try
  {
    llmtools::ConversationHistory query{llmSettings, config.systemText};

    query.appendPrompt(prompt(request));

    log("query AI for attempt ", request.attempt);
    query = llmtools::queryResponse(llmSettings, std::move(query));

    return parseResponse(query.lastEntry(), config.codeLang);
  }
  catch (const OracleFault&)
  {
    throw;
  }
  catch (const std::exception& ex)
  {
    throw OracleFault{std::string{"AI query failed: "} + ex.what()};
  }
}

Generation
LlmOracle::parseResponse(const std::string& response, const std::string& lang)
{
  using CodeSections = std::vector<llmtools::CodeSection>;

  std::string  rationale = boost::trim_copy(llmtools::extractTaggedText(response, THINKING_BEGIN, THINKING_LIMIT));
  CodeSections sections  = llmtools::extractCodeSections(response);
  auto         marked    = std::find_if( sections.begin(), sections.end(),
                                         [&lang](const llmtools::CodeSection& sec) -> bool
                                         {
                                           return boost::iequals(sec.languageMarker(), lang);
                                         }
                                       );

  if (marked != sections.end())
    return { std::move(rationale), boost::trim_copy(marked->code()) };

  if (!sections.empty())
    return { std::move(rationale), boost::trim_copy(sections.front().code()) };

  // no code block: the code is whatever follows the reasoning
  const std::size_t pos  = response.rfind(THINKING_LIMIT);
  std::string       code = (pos == std::string::npos) ? response
                                                      : response.substr(pos + THINKING_LIMIT.size());

  return { std::move(rationale), boost::trim_copy(code) };
}

}

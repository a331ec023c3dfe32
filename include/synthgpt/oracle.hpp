// SynthGPT code generation
//   the oracle interface used by the correction loop and its
//   implementation on top of the llmtools layer.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_ORACLE_HPP
#define SYNTHGPT_ORACLE_HPP 1

#include <optional>
#include <string>
#include <tuple>

#include "synthgpt/llmtools.hpp"
#include "synthgpt/session.hpp"

namespace synthgpt
{

/// the failed attempt that the next generation should correct
struct Feedback
{
  std::string code;
  std::string output;
  std::string errors;
};

/// input to a generation.
/// \details
///   the first attempt carries only the problem; later attempts also
///   carry the code and output of the immediately preceding attempt.
struct GenerationRequest
{
  Problem                 problem;
  std::size_t             attempt = 1;
  std::optional<Feedback> feedback;
};


using GenerationBase = std::tuple<std::string, std::string>;

/// a rationale and the candidate code produced by an oracle
struct Generation : GenerationBase
{
  using base = GenerationBase;
  using base::base;

  const std::string& rationale() const { return std::get<0>(*this); }
  const std::string& code()      const { return std::get<1>(*this); }
};


/// abstract interface of a code generator.
class GenerationOracle
{
  public:
    virtual ~GenerationOracle() = default;

    /// produces a candidate for \p request.
    /// \throws OracleFault if the generation backend fails.
    /// \note an empty code in the returned Generation means that the
    ///       backend produced nothing usable.
    virtual Generation generate(const GenerationRequest& request) = 0;
};


/// prompt texts and the language of generated code
struct OracleSettings
{
  std::string systemText       = "You are an expert Python programming agent. Your goal is to write a correct, working Python function to solve a given problem.\n"
                                 "First, think step-by-step about the problem or the error. If you are fixing a bug, explain the root cause. Enclose your entire thought process in <thinking> tags.\n"
                                 "Then write the full code required to solve the problem in a single ```python ... ``` block. Do not write any text after the code block.";
  std::string firstPrompt      = "Problem statement:\n${problem}\n\nTest cases:\n```${lang}\n${tests}\n```\n"
                                 "Please write a ${lang} function that solves this problem and passes all the provided test cases.";
  std::string correctionPrompt = "The code you previously wrote failed. Do not apologize. Analyze the error and fix the code.\n\n"
                                 "Original problem statement:\n${problem}\n\nYour previous code:\n```${lang}\n${code}\n```\n\n"
                                 "Execution result:\nSTDOUT:\n${stdout}\n\nSTDERR:\n${stderr}\n\n"
                                 "First, reason about why the code failed in the <thinking> tag. Then, provide the complete, corrected code in a ```${lang} ... ``` block.";
  std::string codeLang         = "python";
};

/// loads oracle settings from a JSON object \p cnf.
OracleSettings
oracleSettings(const llmtools::JsonValue& cnf, OracleSettings settings);


/// a GenerationOracle querying an LLM through the llmtools layer.
/// \details
///   every request starts a fresh conversation consisting of the system
///   text and one prompt.
class LlmOracle : public GenerationOracle
{
  public:
    LlmOracle(llmtools::Settings llm, OracleSettings prompts);

    Generation generate(const GenerationRequest& request) override;

    /// returns the prompt text for \p request
    std::string prompt(const GenerationRequest& request) const;

    /// splits an AI response into rationale and code.
    /// \details
    ///   the rationale is the text within <thinking> tags. The code is the
    ///   first code block marked with \p lang, or the first code block,
    ///   or the text following </thinking>.
    static
    Generation parseResponse(const std::string& response, const std::string& lang);

  private:
    llmtools::Settings llmSettings;
    OracleSettings     config;
};

}

#endif /* SYNTHGPT_ORACLE_HPP */

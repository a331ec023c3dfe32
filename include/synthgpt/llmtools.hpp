// SynthGPT llmtools layer
//   - runs command line AI clients (curl, ollama, scripts) on a conversation
//   - provider presets and their lookup
//   - prompt text helpers: variable expansion, code block and tag extraction
//   - small JSON helpers used by configuration and session files
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_LLMTOOLS_HPP
#define SYNTHGPT_LLMTOOLS_HPP 1

#include <cstdint>
#include <iosfwd>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <boost/json.hpp>

namespace synthgpt::llmtools
{
  using JsonValue   = boost::json::value;

  /// canonical key of a provider entry in the configurations
  using LLMProvider = std::string;

  /// how an AI client is invoked and where it leaves its answer
  using SettingsBase = std::tuple< std::string, std::string, std::string, std::string
                                 , std::string, std::string, std::string, std::string
                                 , std::string, JsonValue, std::int64_t
                                 >;
  struct Settings : SettingsBase
  {
    using base = SettingsBase;
    using base::base;

    Settings( std::string pexec           = "curl",
              std::string pexecFlags      = "${LLMTOOLS:MODEL}",
              std::string presponseFile   = "response.txt",
              std::string presponseField  = {},
              std::string proleOfAI       = "assistant",
              std::string psystemTextFile = {},
              std::string phistoryFile    = "query.json",
              std::string papiKeyName     = {},
              std::string pmodelName      = {},
              JsonValue promptFile        = nullptr,
              std::int64_t pqueryTimeout  = 0
            )
    : base( std::move(pexec), std::move(pexecFlags), std::move(presponseFile),
            std::move(presponseField), std::move(proleOfAI), std::move(psystemTextFile),
            std::move(phistoryFile), std::move(papiKeyName), std::move(pmodelName),
            std::move(promptFile), pqueryTimeout
          )
    {}

    std::string const& exec()       const     { return std::get<0>(*this); }
    std::string&       exec()                 { return std::get<0>(*this); }
    std::string const& execFlags() const      { return std::get<1>(*this); }
    std::string&       execFlags()            { return std::get<1>(*this); }
    std::string const& responseFile() const   { return std::get<2>(*this); }
    std::string&       responseFile()         { return std::get<2>(*this); }
    std::string const& responseField() const  { return std::get<3>(*this); }
    std::string&       responseField()        { return std::get<3>(*this); }
    std::string const& roleOfAI() const       { return std::get<4>(*this); }
    std::string&       roleOfAI()             { return std::get<4>(*this); }
    std::string const& systemTextFile() const { return std::get<5>(*this); }
    std::string&       systemTextFile()       { return std::get<5>(*this); }
    std::string const& historyFile() const    { return std::get<6>(*this); }
    std::string&       historyFile()          { return std::get<6>(*this); }
    std::string const& apiKeyName() const     { return std::get<7>(*this); }
    std::string&       apiKeyName()           { return std::get<7>(*this); }
    std::string const& modelName() const      { return std::get<8>(*this); }
    std::string&       modelName()            { return std::get<8>(*this); }
    JsonValue const&   promptFile() const     { return std::get<9>(*this); }
    JsonValue&         promptFile()           { return std::get<9>(*this); }

    /// seconds an AI query may take; 0 means unlimited
    std::int64_t       queryTimeout() const   { return std::get<10>(*this); }
    std::int64_t&      queryTimeout()         { return std::get<10>(*this); }
  };

  /// provider presets, a JSON object mapping a provider key to its settings
  struct Configurations
  {
      Configurations();

      /// \throws std::runtime_error if \p js is not a JSON object
      explicit
      Configurations(JsonValue js);

      const JsonValue& json() const { return val; }

    private:
      JsonValue val;
  };

  /// returns \p oldSettings updated with the fields present in \p config.
  Settings
  settings(const JsonValue& config, const Settings& oldSettings);

  /// adds the presets installed with synthgpt (etc/synthgpt/llmtools-default.json)
  ///   to \p cnf. Entries already in \p cnf take precedence.
  Configurations
  initializeWithDefault(Configurations cnf = {});

  /// adds the providers defined in \p configFileName to \p cnf.
  ///   A provider in the file replaces an entry with the same key in \p cnf.
  Configurations
  initializeWithConfigFile(const std::string& configFileName, Configurations cnf = {});

  /// looks up \p providerName by key, or case-insensitively in the
  ///   alternativeNames of each entry, and returns the entry's key.
  /// \throws std::runtime_error if no entry matches
  /// \throws std::runtime_error if the entry names an API key that is not set in the environment
  LLMProvider
  provider(const Configurations& cnf, const std::string& providerName);

  JsonValue
  readJsonStream(std::istream& is);

  /// \throws std::runtime_error if the file cannot be read or parsed
  JsonValue
  readJsonFile(const std::string& fileName);

  /// returns the settings of \p provider, using \p llmmodel instead of the
  ///   provider's default model when it is not empty.
  /// \throws std::runtime_error if the provider or its client executable cannot be found
  Settings
  configure(const Configurations& configs, const std::string& provider = "openai", const std::string& llmmodel = {});

  //
  // conversation history

  /// the messages of a conversation in the chat-completion format
  ///   [ {"role": ..., "content": ...}, ... ]
  struct ConversationHistory
  {
      /// starts a conversation with \p systemText. When settings name a
      ///   systemTextFile, the text goes to that file instead of the history.
      ConversationHistory(const Settings& settings, const std::string& systemText);

      explicit
      ConversationHistory(JsonValue jv);

      /// appends a user message
      ConversationHistory&
      appendPrompt(const std::string& prompt);

      ConversationHistory&
      append(JsonValue entry);

      /// returns the content of the last message
      std::string
      lastEntry() const;

      std::size_t
      size() const;

      const JsonValue&
      json() const;

    private:
      JsonValue val;
  };

  /// runs the AI client on \p hist and returns the history extended by the answer.
  /// \throws std::runtime_error if the client fails, exceeds the query timeout,
  ///         or leaves no readable response.
  /// \note the files named in \p settings are shared by all queries;
  ///       concurrent queries need distinct settings.
  ConversationHistory
  queryResponse(const Settings& settings, ConversationHistory hist);

  //
  // prompt text

  /// a map from variable-names to text
  using VariableMap = std::unordered_map<std::string, std::string>;

  /// replaces each ${name} in \p txt with vars[name].
  ///   Unknown names stay as they are; substituted text is not expanded again.
  std::string
  expandText(const std::string& txt, const VariableMap& vars);

  /// appends the whitespace separated words of \p s to \p args.
  ///   Text within " quotes is one word.
  /// \throws std::runtime_error if a quote is not closed
  void
  splitArgs(const std::string& s, std::vector<std::string>& args);


  using CodeSectionBase = std::tuple<std::string, std::string>;
  struct CodeSection : CodeSectionBase
  {
    using base = CodeSectionBase;
    using base::base;

    /// the marker after the opening ```; empty if absent
    const std::string& languageMarker() const { return std::get<0>(*this); }
    const std::string& code()           const { return std::get<1>(*this); }
  };

  /// returns the complete ``` fenced blocks of \p markdownText in order of appearance.
  std::vector<CodeSection>
  extractCodeSections(const std::string& markdownText);

  /// returns the text between the first \p openTag and the following \p closeTag,
  ///   or an empty string if either is missing.
  std::string
  extractTaggedText(const std::string& text, const std::string& openTag, const std::string& closeTag);

  //
  // JSON

  /// writes \p jv with one element per line, indented by two blanks per level.
  void
  prettyPrint(std::ostream& os, const JsonValue& jv, std::size_t indent = 0);

  /// returns the element at \p path in \p obj, or \p alt when the path does not
  ///   exist or holds a value of a different type.
  ///   Paths combine keys and array indices, e.g., choices[0].message.content
  /// \{
  std::string
  loadField(const JsonValue& obj, const std::string& path, const std::string& alt);

  bool
  loadField(const JsonValue& obj, const std::string& path, bool alt);

  std::int64_t
  loadField(const JsonValue& obj, const std::string& path, std::int64_t alt);

  JsonValue
  loadField(const JsonValue& obj, const std::string& path, JsonValue alt);
  /// \}
}

#endif /* SYNTHGPT_LLMTOOLS_HPP */

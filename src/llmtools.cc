// SynthGPT llmtools layer
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#include "synthgpt/llmtools.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "synthgpt/process.hpp"
#include "synthgpt/trace.hpp"

namespace json = boost::json;

namespace
{

const std::string VAR_PREFIX   = "${";
const std::string VAR_SUFFIX   = "}";
const std::string CODE_FENCE   = "```";
const std::string HOME_VAR     = "${SYNTHGPT:HOME}";
const std::string HISTORY_VAR  = "${LLMTOOLS:HISTORY}";
const std::string DEFAULT_CNF  = "/etc/synthgpt/llmtools-default.json";

const char* const JK_EXEC             = "exec";
const char* const JK_EXEC_FLAGS       = "execFlags";
const char* const JK_RESPONSE_FILE    = "responseFile";
const char* const JK_RESPONSE_FIELD   = "responseField";
const char* const JK_SYSTEM_TEXT_FILE = "systemTextFile";
const char* const JK_ROLE_OF_AI       = "roleOfAI";
const char* const JK_HISTORY_FILE     = "historyFile";
const char* const JK_API_KEY_NAME     = "apiKeyName";
const char* const JK_PROMPT_FILE      = "promptFile";
const char* const JK_MODEL_NAME       = "modelName";
const char* const JK_QUERY_TIMEOUT    = "queryTimeout";
const char* const JK_ALT_NAMES        = "alternativeNames";

const char* const JK_PF_FILENAME      = "filename";
const char* const JK_PF_FORMAT        = "format";
const char* const JK_HIST_ROLE_KEY    = "role";
const char* const JK_HIST_CONTENT_KEY = "content";

/// returns the installation prefix (the parent of the directory holding the binary)
std::string
synthgptBasePath()
{
  Dl_info info;

  if (!dladdr(reinterpret_cast<void*>(&synthgptBasePath), &info))
    throw std::runtime_error{"Could not determine synthgpt installation path"};

  const std::string binary = info.dli_fname;
  const std::size_t pos    = binary.find_last_of('/');

  if (pos == std::string::npos)
    return "..";

  return binary.substr(0, pos) + "/..";
}

bool
isJsonFile(const std::string& filename)
{
  return boost::ends_with(filename, ".json");
}

/// resolves the AI client \p exec to a full path.
///   A leading ${SYNTHGPT:HOME} refers to the installation prefix.
std::string
resolveExecutable(const std::string& exec)
{
  std::string execFile = exec;

  if (boost::starts_with(execFile, HOME_VAR))
    execFile = synthgptBasePath() + execFile.substr(HOME_VAR.size());

  if (execFile.find('/') == std::string::npos)
  {
    std::string fullPath = synthgpt::searchPath(execFile);

    if (!fullPath.empty())
      return fullPath;
  }
  else if (std::ifstream{execFile}.good())
    return execFile;

  throw std::runtime_error{"AI client '" + exec + "' not found (looking for '" + execFile + "')"};
}

std::string
readTxtFile(const std::string& filename)
{
  std::ifstream is{filename};

  if (!is.good())
    throw std::runtime_error{"File " + filename + " is not accessible"};

  return std::string{std::istreambuf_iterator<char>{is}, std::istreambuf_iterator<char>{}};
}

/// returns the element at \p path in \p val, or nullptr if it does not exist.
const json::value*
findElement(const json::value& val, const std::string& path)
{
  const json::value* curr = &val;
  std::size_t        pos  = 0;

  while (curr && pos < path.size())
  {
    if (path[pos] == '.')
    {
      ++pos;
    }
    else if (path[pos] == '[')
    {
      const std::size_t lim = path.find(']', pos);
      const json::array* arr = curr->if_array();

      if ((lim == std::string::npos) || (arr == nullptr))
        return nullptr;

      std::size_t idx = 0;

      try
      {
        idx = boost::lexical_cast<std::size_t>(path.substr(pos + 1, lim - pos - 1));
      }
      catch (const boost::bad_lexical_cast&)
      {
        return nullptr;
      }

      curr = (idx < arr->size()) ? &(*arr)[idx] : nullptr;
      pos  = lim + 1;
    }
    else
    {
      const std::size_t   lim = std::min(path.find_first_of(".[", pos), path.size());
      const json::object* obj = curr->if_object();

      curr = obj ? obj->if_contains(path.substr(pos, lim - pos)) : nullptr;
      pos  = lim;
    }
  }

  return curr;
}

json::object
responseEntry(const synthgpt::llmtools::Settings& settings, std::string text)
{
  return json::object{ { JK_HIST_ROLE_KEY,    settings.roleOfAI() },
                       { JK_HIST_CONTENT_KEY, std::move(text) }
                     };
}

/// reads the answer the AI client left in the response file.
///   For JSON files responseField locates the text.
json::object
loadAIResponse(const synthgpt::llmtools::Settings& settings)
{
  if (!isJsonFile(settings.responseFile()))
    return responseEntry(settings, readTxtFile(settings.responseFile()));

  json::value        output = synthgpt::llmtools::readJsonFile(settings.responseFile());
  const json::value* text   = findElement(output, settings.responseField());

  if ((text == nullptr) || !text->is_string())
    throw std::runtime_error{ "Response field '" + settings.responseField() + "' not found in "
                            + settings.responseFile() + "\n" + json::serialize(output)
                            };

  return responseEntry(settings, std::string(text->get_string()));
}

std::string
environmentVariable(const std::string& varname)
{
  if (varname.size())
    if (const char* var = std::getenv(varname.c_str()))
      return var;

  return {};
}

/// the name of the request body file; promptFile is either a file name or
///   an object {filename, format}.
std::string
promptFileName(const json::value& promptFile)
{
  if (const json::string* str = promptFile.if_string())
    return std::string(*str);

  return synthgpt::llmtools::loadField(promptFile, JK_PF_FILENAME, std::string{});
}

/// writes the request body described by the format template of promptFile.
///   ${LLMTOOLS:HISTORY} turns into the message array, other strings are expanded.
void
writeRequestBody( const std::string& fileName,
                  const json::value& promptFile,
                  const synthgpt::llmtools::VariableMap& vars,
                  const synthgpt::llmtools::ConversationHistory& hist
                )
{
  if (!isJsonFile(fileName))
    return;

  json::value format = synthgpt::llmtools::loadField(promptFile, JK_PF_FORMAT, json::value{});

  if (json::object* fmtobj = format.if_object())
  {
    for (auto& [key, value] : *fmtobj)
    {
      json::string* str = value.if_string();

      if (str == nullptr)
        continue;

      if (*str == HISTORY_VAR)
        value = hist.json();
      else
        *str = synthgpt::llmtools::expandText(std::string(*str), vars);
    }
  }

  std::ofstream body{fileName};

  body << format << std::endl;
}

void
storeQuery(const std::string& historyfile, const synthgpt::llmtools::ConversationHistory& hist)
{
  if (!isJsonFile(historyfile))
    throw std::runtime_error{"Unknown history file format (file extension not .json)."};

  std::ofstream out{historyfile};

  out << hist.json() << std::endl;
}

/// runs the AI client and returns the answer as history entry
json::object
invokeAI(const synthgpt::llmtools::Settings& settings, const synthgpt::llmtools::ConversationHistory& hist)
{
  storeQuery(settings.historyFile(), hist);

  const std::string               bodyFile = promptFileName(settings.promptFile());
  synthgpt::llmtools::VariableMap vars =
      { {"LLMTOOLS:MODEL",            settings.modelName() },
        {"LLMTOOLS:API_KEY",          environmentVariable(settings.apiKeyName()) },
        {"LLMTOOLS:PROMPT_FILE",      bodyFile },
        {"LLMTOOLS:HISTORY",          settings.historyFile() },
        {"LLMTOOLS:RESPONSE_FILE",    settings.responseFile() },
        {"LLMTOOLS:SYSTEM_TEXT_FILE", settings.systemTextFile() }
      };

  writeRequestBody(bodyFile, settings.promptFile(), vars, hist);

  std::vector<std::string> args;

  synthgpt::llmtools::splitArgs(synthgpt::llmtools::expandText(settings.execFlags(), vars), args);

  // a last argument >file receives the client's stdout
  std::string stdoutFile;

  if (args.size() && boost::starts_with(args.back(), ">"))
  {
    stdoutFile = args.back().substr(1);
    args.pop_back();
  }

  const std::chrono::seconds    budget{settings.queryTimeout()};
  const synthgpt::CommandResult res = synthgpt::invokeCommand(settings.exec(), args, budget);

  if (res.timedOut())
    throw std::runtime_error{"AI query timed out after " + std::to_string(settings.queryTimeout()) + "s"};

  if (res.exitCode() != 0)
    throw std::runtime_error{"AI invocation error " + std::to_string(res.exitCode()) + " " + res.errors()};

  if (stdoutFile.size())
  {
    std::ofstream out{stdoutFile};

    out << res.output() << std::endl;
  }

  return loadAIResponse(settings);
}

/// copies the providers in \p additions into \p base.
///   With \p replace set, additions override entries of base with the same key,
///   otherwise the entries in base are kept.
json::value
mergeProviders(json::value base, const json::value& additions, bool replace)
{
  const json::object* addobj = additions.if_object();

  if (addobj == nullptr)
    throw std::runtime_error{"Provider definitions must be a JSON object"};

  json::object& baseobj = base.as_object();

  for (const auto& [key, value] : *addobj)
  {
    if (!replace && baseobj.if_contains(key))
    {
      synthgpt::log("llmtools: keeping user definition of provider ", std::string(key));
      continue;
    }

    baseobj[key] = value;
  }

  return base;
}

bool
namesProvider(const json::value& altNames, const std::string& name)
{
  if (const json::string* str = altNames.if_string())
    return boost::iequals(*str, name);

  if (const json::array* arr = altNames.if_array())
    for (const json::value& alt : *arr)
      if (namesProvider(alt, name))
        return true;

  return false;
}

using ProviderEntry = std::pair<std::string, const json::value*>;

/// finds the entry of \p name, either by key or by one of its alternativeNames.
/// \throws std::runtime_error if no entry matches
ProviderEntry
findProvider(const synthgpt::llmtools::Configurations& configs, const std::string& name)
{
  const json::object& cnf = configs.json().as_object();

  if (const json::value* entry = cnf.if_contains(name))
    return { name, entry };

  for (const auto& [key, value] : cnf)
  {
    const json::object* obj = value.if_object();

    if (obj == nullptr)
      continue;

    if (const json::value* alts = obj->if_contains(JK_ALT_NAMES))
      if (namesProvider(*alts, name))
        return { std::string(key), &value };
  }

  throw std::runtime_error("No matching provider found: " + name);
}

} // anonymous namespace

namespace synthgpt::llmtools
{

ConversationHistory::ConversationHistory(const Settings& settings, const std::string& systemText)
: val(json::array())
{
  if (!settings.systemTextFile().empty())
  {
    std::ofstream ofs{settings.systemTextFile()};

    ofs << systemText;
    return;
  }

  append(json::object{ { JK_HIST_ROLE_KEY, "system" }, { JK_HIST_CONTENT_KEY, systemText } });
}

ConversationHistory::ConversationHistory(JsonValue jv)
: val(std::move(jv))
{}

ConversationHistory&
ConversationHistory::append(JsonValue entry)
{
  val.as_array().emplace_back(std::move(entry));
  return *this;
}

ConversationHistory&
ConversationHistory::appendPrompt(const std::string& prompt)
{
  return append(json::object{ { JK_HIST_ROLE_KEY, "user" }, { JK_HIST_CONTENT_KEY, prompt } });
}

std::string
ConversationHistory::lastEntry() const
{
  return std::string(val.as_array().back().as_object().at(JK_HIST_CONTENT_KEY).as_string());
}

std::size_t
ConversationHistory::size() const
{
  return val.as_array().size();
}

const JsonValue&
ConversationHistory::json() const
{
  return val;
}

ConversationHistory
queryResponse(const Settings& settings, ConversationHistory query)
{
  query.append(invokeAI(settings, query));
  return query;
}

//
// Configurations

Configurations::Configurations() : val(json::object{}) {}

Configurations::Configurations(JsonValue js) : val(std::move(js))
{
  if (!val.is_object())
    throw std::runtime_error("Provider configurations must be a JSON object.");
}

json::value
readJsonStream(std::istream& is)
{
  boost::system::error_code ec;
  json::stream_parser       p;
  std::string               line;
  std::size_t               lineno = 0;

  // parse line by line to report the location of syntax errors
  while (std::getline(is, line))
  {
    ++lineno;
    line += '\n';
    p.write(line, ec);

    if (ec)
      throw std::runtime_error("JSON error on line " + std::to_string(lineno) + ": " + ec.message()
                               + "\n    line: " + line);
  }

  p.finish(ec);

  if (ec)
    throw std::runtime_error("incomplete JSON input: " + ec.message());

  return p.release();
}

json::value
readJsonFile(const std::string& fileName)
{
  if (fileName.empty())
    throw std::runtime_error{"invalid empty filename"};

  std::ifstream ifs(fileName);

  if (!ifs.good())
    throw std::runtime_error{"File " + fileName + " is not accessible"};

  try
  {
    return readJsonStream(ifs);
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error(std::string(e.what()) + "\n    file: " + fileName);
  }
}

Settings
settings(const json::value& cnf, const Settings& oldSettings)
{
  Settings res;

  res.exec()           = loadField(cnf, JK_EXEC,             oldSettings.exec());
  res.execFlags()      = loadField(cnf, JK_EXEC_FLAGS,       oldSettings.execFlags());
  res.responseFile()   = loadField(cnf, JK_RESPONSE_FILE,    oldSettings.responseFile());
  res.responseField()  = loadField(cnf, JK_RESPONSE_FIELD,   oldSettings.responseField());
  res.systemTextFile() = loadField(cnf, JK_SYSTEM_TEXT_FILE, oldSettings.systemTextFile());
  res.roleOfAI()       = loadField(cnf, JK_ROLE_OF_AI,       oldSettings.roleOfAI());
  res.historyFile()    = loadField(cnf, JK_HISTORY_FILE,     oldSettings.historyFile());
  res.apiKeyName()     = loadField(cnf, JK_API_KEY_NAME,     oldSettings.apiKeyName());
  res.modelName()      = loadField(cnf, JK_MODEL_NAME,       oldSettings.modelName());
  res.promptFile()     = loadField(cnf, JK_PROMPT_FILE,      oldSettings.promptFile());
  res.queryTimeout()   = loadField(cnf, JK_QUERY_TIMEOUT,    oldSettings.queryTimeout());

  return res;
}

Configurations
initializeWithDefault(Configurations current)
{
  const json::value presets = readJsonFile(synthgptBasePath() + DEFAULT_CNF);

  return Configurations{mergeProviders(current.json(), presets, false)};
}

Configurations
initializeWithConfigFile(const std::string& configFileName, Configurations current)
{
  return Configurations{mergeProviders(current.json(), readJsonFile(configFileName), true)};
}

Settings
configure(const Configurations& configs, const std::string& provider, const std::string& llmmodel)
{
  Settings res = settings(*findProvider(configs, provider).second, Settings{});

  res.exec() = resolveExecutable(res.exec());

  if (!llmmodel.empty())
    res.modelName() = llmmodel;

  return res;
}

LLMProvider
provider(const Configurations& configs, const std::string& providerName)
{
  ProviderEntry     entry   = findProvider(configs, providerName);
  const std::string keyName = loadField(*entry.second, JK_API_KEY_NAME, std::string{});

  if (keyName.size() && (std::getenv(keyName.c_str()) == nullptr))
    throw std::runtime_error{"API KEY '" + keyName + "' is undefined in environment."};

  return entry.first;
}

std::string
expandText(const std::string& txt, const VariableMap& vars)
{
  std::string res;
  std::size_t done = 0;
  std::size_t pos  = txt.find(VAR_PREFIX);

  while (pos != std::string::npos)
  {
    const std::size_t nameBeg = pos + VAR_PREFIX.size();
    const std::size_t nameLim = txt.find(VAR_SUFFIX, nameBeg);

    if (nameLim == std::string::npos)
      break;

    auto const var = vars.find(txt.substr(nameBeg, nameLim - nameBeg));

    if (var != vars.end())
    {
      res.append(txt, done, pos - done).append(var->second);
      done = nameLim + VAR_SUFFIX.size();
    }

    pos = txt.find(VAR_PREFIX, (var != vars.end()) ? done : nameBeg);
  }

  return res.append(txt, done, std::string::npos);
}

void
splitArgs(const std::string& s, std::vector<std::string>& args)
{
  std::string current;
  bool        inQuotes = false;
  bool        escaped  = false;

  auto flush = [&current, &args]() -> void
               {
                 if (current.empty()) return;

                 args.push_back(std::move(current));
                 current.clear();
               };

  for (char c : s)
  {
    if (escaped)
    {
      // escape sequences are passed on unchanged
      current.push_back('\\');
      current.push_back(c);
      escaped = false;
    }
    else if (c == '\\')
      escaped = true;
    else if (c == '"')
      inQuotes = !inQuotes;
    else if (!inQuotes && std::isspace(static_cast<unsigned char>(c)))
      flush();
    else
      current.push_back(c);
  }

  if (inQuotes)
    throw std::runtime_error("Unclosed quotes in input string '" + s + "'");

  if (escaped)
    throw std::runtime_error("Unprocessed escaped character at end of input string '" + s + "'");

  flush();
}

std::vector<CodeSection>
extractCodeSections(const std::string& markdownText)
{
  std::vector<CodeSection> res;
  std::size_t              pos = markdownText.find(CODE_FENCE);

  while (pos != std::string::npos)
  {
    const std::size_t markerBeg = pos + CODE_FENCE.size();
    const std::size_t codeBeg   = markdownText.find('\n', markerBeg);

    if (codeBeg == std::string::npos)
      break;

    const std::size_t codeLim = markdownText.find(CODE_FENCE, codeBeg + 1);

    if (codeLim == std::string::npos)
      break;

    res.emplace_back( boost::trim_copy(markdownText.substr(markerBeg, codeBeg - markerBeg)),
                      markdownText.substr(codeBeg + 1, codeLim - codeBeg - 1)
                    );

    pos = markdownText.find(CODE_FENCE, codeLim + CODE_FENCE.size());
  }

  return res;
}

std::string
extractTaggedText(const std::string& text, const std::string& openTag, const std::string& closeTag)
{
  const std::size_t beg = text.find(openTag);

  if (beg == std::string::npos)
    return {};

  const std::size_t postTag = beg + openTag.size();
  const std::size_t lim     = text.find(closeTag, postTag);

  if (lim == std::string::npos)
    return {};

  return text.substr(postTag, lim - postTag);
}


void
prettyPrint(std::ostream& os, const json::value& jv, std::size_t indent)
{
  const std::string inner(indent + 2, ' ');
  const std::string outer(indent, ' ');

  switch (jv.kind())
  {
    case json::kind::object:
    {
      const json::object& obj = jv.get_object();

      if (obj.empty()) { os << "{}"; break; }

      const char* sep = "{\n";

      for (const auto& elem : obj)
      {
        os << sep << inner << json::serialize(elem.key()) << ": ";
        prettyPrint(os, elem.value(), indent + 2);
        sep = ",\n";
      }

      os << "\n" << outer << "}";
      break;
    }

    case json::kind::array:
    {
      const json::array& arr = jv.get_array();

      if (arr.empty()) { os << "[]"; break; }

      const char* sep = "[\n";

      for (const json::value& elem : arr)
      {
        os << sep << inner;
        prettyPrint(os, elem, indent + 2);
        sep = ",\n";
      }

      os << "\n" << outer << "]";
      break;
    }

    default:
      os << json::serialize(jv);
  }

  if (indent == 0)
    os << "\n";
}


std::string
loadField(const json::value& obj, const std::string& path, const std::string& alt)
{
  const json::value* val = findElement(obj, path);

  if (const json::string* str = val ? val->if_string() : nullptr)
    return std::string(*str);

  return alt;
}

bool
loadField(const json::value& obj, const std::string& path, bool alt)
{
  const json::value* val = findElement(obj, path);

  if (val == nullptr)
    return alt;

  if (const bool* bp = val->if_bool())
    return *bp;

  if (const std::int64_t* ip = val->if_int64())
    return *ip != 0;

  return alt;
}

std::int64_t
loadField(const json::value& obj, const std::string& path, std::int64_t alt)
{
  const json::value* val = findElement(obj, path);

  if (val == nullptr)
    return alt;

  if (const std::int64_t* ip = val->if_int64())
    return *ip;

  const std::uint64_t* up = val->if_uint64();

  if (up && (*up <= std::uint64_t(std::numeric_limits<std::int64_t>::max())))
    return static_cast<std::int64_t>(*up);

  return alt;
}

json::value
loadField(const json::value& obj, const std::string& path, json::value alt)
{
  if (const json::value* val = findElement(obj, path))
    return *val;

  return alt;
}

}

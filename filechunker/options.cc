/**
 * This file is part of filechunker.
 */

#include "options.h"

#include <cstdio>
#include <string>
#include <vector>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

extern char **environ;

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

/**
 * Returns the parameter name of an assignment line and stores the unquoted
 * value.  Returns the empty string for comments, empty lines, and lines that
 * are not assignments.
 */
string SimpleOptionsParser::SanitizeParameterAssignment(const string &line,
                                                        string *value) const
{
  const string trimmed = Trim(line, true);
  if (trimmed.empty() || (trimmed[0] == '#'))
    return "";
  vector<string> tokens = SplitString(trimmed, '=');
  if (tokens.size() < 2)
    return "";

  string parameter = Trim(tokens[0]);
  if (parameter.find("export ") == 0)
    parameter = Trim(parameter.substr(7));
  if (parameter.empty() || (parameter.find_first_of(" \t") != string::npos))
    return "";

  // Strip quotes from value
  tokens.erase(tokens.begin());
  *value = Trim(JoinStrings(tokens, "="));
  const unsigned value_length = value->length();
  if (value_length >= 2) {
    if ( (((*value)[0] == '"') && ((*value)[value_length - 1] == '"')) ||
         (((*value)[0] == '\'') && ((*value)[value_length - 1] == '\'')) )
    {
      *value = value->substr(1, value_length - 2);
    }
  }
  return parameter;
}


bool SimpleOptionsParser::TryParsePath(const string &config_file) {
  LogChunker(kLogOptions, kLogDebug, "Fast-parsing config file %s",
             config_file.c_str());
  FILE *fconfig = fopen(config_file.c_str(), "r");
  if (fconfig == NULL) {
    LogChunker(kLogOptions, kLogDebug, "cannot open config file %s",
               config_file.c_str());
    return false;
  }

  // Read line by line and extract parameters
  string line;
  while (GetLineFile(fconfig, &line)) {
    ConfigValue config_value;
    const string parameter =
      SanitizeParameterAssignment(line, &config_value.value);
    if (parameter.empty())
      continue;

    config_value.source = config_file;
    PopulateParameter(parameter, config_value);
  }
  fclose(fconfig);
  return true;
}


void SimpleOptionsParser::ParseEnvironment(const string &prefix) {
  for (char **env = environ; (env != NULL) && (*env != NULL); ++env) {
    const string assignment(*env);
    if (!HasPrefix(assignment, prefix, false))
      continue;
    const size_t equal_idx = assignment.find('=');
    if (equal_idx == string::npos)
      continue;

    ConfigValue config_value;
    config_value.value = assignment.substr(equal_idx + 1);
    config_value.source = "environment";
    PopulateParameter(assignment.substr(0, equal_idx), config_value);
  }
}


void SimpleOptionsParser::PopulateParameter(const string &param,
                                            const ConfigValue &val)
{
  LogChunker(kLogOptions, kLogDebug, "%s=%s (from %s)",
             param.c_str(), val.value.c_str(), val.source.c_str());
  config_[param] = val;
}


bool SimpleOptionsParser::GetValue(const string &key, string *value) const {
  map<string, ConfigValue>::const_iterator iter = config_.find(key);
  if (iter != config_.end()) {
    *value = iter->second.value;
    return true;
  }
  *value = "";
  return false;
}


bool SimpleOptionsParser::IsOn(const std::string &param_value) const {
  const string uppercase = ToUpper(param_value);
  return ((uppercase == "YES") || (uppercase == "ON") || (uppercase == "1") ||
          (uppercase == "TRUE"));
}


string SimpleOptionsParser::Dump() const {
  string result;
  for (map<string, ConfigValue>::const_iterator i = config_.begin(),
       iEnd = config_.end(); i != iEnd; ++i)
  {
    result += i->first + "=" + i->second.value +
              "    # from " + i->second.source + "\n";
  }
  return result;
}


void SimpleOptionsParser::SetValue(const string &key, const string &value) {
  ConfigValue config_value;
  config_value.source = "@INTERNAL@";
  config_value.value = value;
  PopulateParameter(key, config_value);
}

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

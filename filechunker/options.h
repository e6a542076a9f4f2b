/**
 * This file is part of filechunker.
 */

#ifndef FILECHUNKER_OPTIONS_H_
#define FILECHUNKER_OPTIONS_H_

#include <map>
#include <string>

#include "util/export.h"

#ifdef FILECHUNKER_NAMESPACE_GUARD
namespace FILECHUNKER_NAMESPACE_GUARD {
#endif

/**
 * Parses and stores the parameters of configuration files and of the
 * process environment.  For every parameter, the value and the last source
 * that set it are kept.  Later sources overwrite earlier ones.
 *
 * Configuration files consist of lines in the format
 *
 *  KEY=VALUE
 *
 * Leading "export", whitespace around keys and values, and one pair of
 * quotes around the value are stripped.  Lines starting with # are comments.
 */
class FILECHUNKER_EXPORT SimpleOptionsParser {
 public:
  SimpleOptionsParser() { }

  /**
   * Opens the config_file and extracts all contained variables and their
   * corresponding values.
   *
   * @param config_file  path to the configuration file
   * @return false if the file cannot be opened
   */
  bool TryParsePath(const std::string &config_file);

  /**
   * Takes over all environment variables whose name starts with prefix.
   */
  void ParseEnvironment(const std::string &prefix);

  /**
   * Gets the stored value for a concrete variable
   *
   * @param  key variable to be accessed in the map
   * @param  value container of the received value, if it exists
   * @return true if there was a value stored in the map for key
   */
  bool GetValue(const std::string &key, std::string *value) const;

  /**
   * @return  true if param_value is "YES", "ON", "TRUE" or "1" (any case)
   */
  bool IsOn(const std::string &param_value) const;

  /**
   * Gets all stored key-values in the format
   *
   * "KEY=VALUE    # from SOURCE"
   */
  std::string Dump() const;

  /**
   * Artificially inject values, e.g. from command line parameters.
   */
  void SetValue(const std::string &key, const std::string &value);

 private:
  /**
   * The ConfigValue structure contains a concrete value of a variable, as well
   * as the source (complete path) of the config file where it was obtained
   */
  struct ConfigValue {
    std::string value;
    std::string source;
  };

  std::string SanitizeParameterAssignment(const std::string &line,
                                          std::string *value) const;
  void PopulateParameter(const std::string &param, const ConfigValue &val);

  std::map<std::string, ConfigValue> config_;
};  // class SimpleOptionsParser

#ifdef FILECHUNKER_NAMESPACE_GUARD
}  // namespace FILECHUNKER_NAMESPACE_GUARD
#endif

#endif  // FILECHUNKER_OPTIONS_H_

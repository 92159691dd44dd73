#pragma once

#include "../stringio.hpp"

#include <boost/program_options.hpp>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "LociStore"
#ifndef LOCISTORE_VERSION
#define LOCISTORE_VERSION "unknown"
#endif

namespace config {

/**
 * Run-time parameters, merged from the command line and an optional YAML
 * config file (command line wins). Nested keys are addressed as "a:b".
 *
 * Known parameters and defaults:
 *   store-dir        loci_store
 *   strand-specific  false
 *   verbosity        1
 *   window           0
 *   flank-limit      2
 */
class ConfigStore
{
public:
  /** first positional argument (e.g. "query") */
  std::string command;
  /** remaining positional arguments */
  std::vector<std::string> command_args;

  ConfigStore();
  /** Parse command line arguments.
   *  @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  /** true if the parameter is set. */
  bool hasValue(const std::string& key) const;
  template<typename T>
    T parse(const YAML::Node& node) const;
  template<typename T>
    T getValue(const char* key) const;
  template<typename T>
    T getValue(const std::string key) const;

private:
  YAML::Node _config;

  /** Node for "a:b" style key (invalid node if not set). */
  YAML::Node lookup(const std::string& key) const;
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::parse(const YAML::Node& node) const {
  T val = node.as<T>();
  return val;
}
/** This specialization can parse numbers in scientific format. */
template<> inline
double ConfigStore::parse<double>(const YAML::Node& node) const {
  std::string s = node.as<std::string>();
  double val = stringio::strToDub(s);
  return val;
}

template<typename T>
T ConfigStore::getValue(const char* key) const {
  YAML::Node node = lookup(key);
  if (!node) {
    fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key);
    throw std::invalid_argument(stringio::format("Unknown parameter '%s'.", key));
  }
  return parse<T>(node);
}

template<typename T>
T
ConfigStore::getValue(const std::string key) const {
  return getValue<T>(key.c_str());
}

} /* namespace config */

#include "ConfigStore.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <iostream>
#include <sstream>
#include <sys/stat.h>

using namespace std;
namespace fs = boost::filesystem;

namespace config {

// default constructor
ConfigStore::ConfigStore()
{
  _config = YAML::Node(YAML::NodeType::Map);
}

YAML::Node ConfigStore::lookup(const string& key) const {
  vector<string> keys = stringio::split(key, ':');
  YAML::Node node;
  node.reset(_config);
  for (const string& k : keys) {
    // const access does not create missing entries
    const YAML::Node& parent = node;
    if (!parent.IsMap()) {
      return YAML::Node(YAML::NodeType::Undefined);
    }
    YAML::Node child = parent[k];
    if (!child) {
      return YAML::Node(YAML::NodeType::Undefined);
    }
    node.reset(child);
  }
  return node;
}

bool ConfigStore::hasValue(const string& key) const {
  return lookup(key).IsDefined();
}

bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  string dir_store = "loci_store";
  string fn_config = "";
  bool strand_specific = false;
  int verb = 1;
  long window = 0;
  int flank_limit = 2;

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << LOCISTORE_VERSION << endl << endl;
  ss << "Usage: locistore [options] <command> [args]" << endl << endl;
  ss << "Commands:" << endl;
  ss << "  list                               list frozen collections" << endl;
  ss << "  info <name>                        summarize collection" << endl;
  ss << "  drop <name>                        delete collection" << endl;
  ss << "  query <name> <chr:start-end>       loci overlapping region" << endl;
  ss << "  window <name> <chr:pos>            loci within window around position" << endl;
  ss << "  nearest <name> <chr:pos> <up|down> closest locus up-/downstream" << endl;
  ss << "  candidates <name> <chr:start-end>  loci in window plus flanking loci" << endl;
  ss << "  term-list                          list frozen terms" << endl;
  ss << "  term-info <name>                   summarize term" << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version,V", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(), "config file")
    ("store-dir,d", po::value<string>(&dir_store), "directory containing frozen collections")
    ("strand-specific,s", po::value<bool>(&strand_specific)->implicit_value(true)->zero_tokens(), "opposite-strand loci never overlap")
    ("window,w", po::value<long>(&window), "window size (bp) around positions")
    ("flank-limit,f", po::value<int>(&flank_limit), "number of flanking loci per side")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output")
  ;
  po::options_description hidden;
  hidden.add_options()
    ("command", po::value<string>(&command), "command to run")
    ("args", po::value<vector<string>>(&command_args), "command arguments")
  ;
  po::options_description all_opts;
  all_opts.add(desc).add(hidden);
  po::positional_options_description pos_opts;
  pos_opts.add("command", 1).add("args", -1);

  po::variables_map var_map;

  try {
    po::store(po::command_line_parser(ac, av).options(all_opts).positional(pos_opts).run(), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << LOCISTORE_VERSION << endl;
      return false;
    }

    if (var_map.count("help") || ac == 1) {
      std::cerr << desc << std::endl;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (const po::error &e) {
    std::cerr << std::endl << "ArgumentError: " << e.what() << std::endl;
    std::cerr << desc << std::endl;
    return false;
  }

  // check: config file exists
  if (var_map.count("config")) {
    fn_config = var_map["config"].as<string>();
    if (!fileExists(fn_config)) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      return false;
    }
    try {
      // initialize global configuration from config file
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Cannot parse config file '%s': %s\n", fn_config.c_str(), e.what());
      return false;
    }
    if (_config.IsNull()) {
      _config = YAML::Node(YAML::NodeType::Map);
    } else if (!_config.IsMap()) {
      fprintf(stderr, "\nArgumentError: Config file '%s' must contain a mapping of parameters.\n", fn_config.c_str());
      return false;
    }
  }

  // overwrite/set config params
  // (making sure parameters are set)

  // location of the blob store
  if (var_map.count("store-dir") || !_config["store-dir"]) {
    _config["store-dir"] = dir_store;
  } else if (fn_config.length() > 0) {
    // paths in config file are relative to the config file's directory
    fs::path path_store(_config["store-dir"].as<string>());
    if (path_store.is_relative()) {
      fs::path path_conf = fs::absolute(fs::path(fn_config)).parent_path();
      _config["store-dir"] = (path_conf / path_store).string();
    }
  }
  if (var_map.count("strand-specific") || !_config["strand-specific"]) {
    _config["strand-specific"] = strand_specific;
  }
  if (var_map.count("window") || !_config["window"]) {
    _config["window"] = window;
  }
  if (var_map.count("flank-limit") || !_config["flank-limit"]) {
    _config["flank-limit"] = flank_limit;
  }
  // how chatty should status messages be?
  if (var_map.count("verbosity") || !_config["verbosity"]) {
    _config["verbosity"] = verb;
  }

  // check parameter values
  try {
    dir_store = getValue<string>("store-dir");
    strand_specific = getValue<bool>("strand-specific");
    window = getValue<long>("window");
    flank_limit = getValue<int>("flank-limit");
    verb = getValue<int>("verbosity");
  } catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid parameter value in config: %s\n", e.what());
    return false;
  }
  if (dir_store.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'store-dir' must not be empty.\n");
    return false;
  }
  if (window < 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'window' must not be negative (got %ld).\n", window);
    return false;
  }
  if (flank_limit < 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'flank-limit' must not be negative (got %d).\n", flank_limit);
    return false;
  }
  if (verb < 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'verbosity' must not be negative (got %d).\n", verb);
    return false;
  }
  if (command.length() == 0) {
    fprintf(stderr, "\nArgumentError: No command given.\n");
    std::cerr << desc << std::endl;
    return false;
  }

  if (verb > 1) {
    fprintf(stderr, "################################################################################\n");
    fprintf(stderr, "%s %s\n", PROGRAM_NAME, LOCISTORE_VERSION);
    fprintf(stderr, "================================================================================\n");
    fprintf(stderr, "Running with the following options:\n");
    fprintf(stderr, "================================================================================\n");
    if (fn_config.length() > 0) {
      fprintf(stderr, "  config file:\t\t%s\n", fn_config.c_str());
    }
    fprintf(stderr, "  store directory:\t%s\n", dir_store.c_str());
    fprintf(stderr, "  strand-specific:\t%s\n", strand_specific ? "yes" : "no");
    fprintf(stderr, "  window:\t\t%ld\n", window);
    fprintf(stderr, "  flank limit:\t\t%d\n", flank_limit);
    fprintf(stderr, "  command:\t\t%s\n", command.c_str());
    fprintf(stderr, "################################################################################\n");
  }

  return true;
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */

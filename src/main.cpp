/**
 * Inspect and query frozen collections of reference loci.
 */
#include "core/config/ConfigStore.hpp"
#include "core/locio.hpp"
#include "core/refloci.hpp"
#include "core/storage.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
using locio::Locus;
using locio::TCoord;
using refloci::RefLoci;
using refloci::Term;
using storage::BlobStore;
using storage::DirBlobStore;

namespace {

/** Check number of command arguments; prints an error if it does not match. */
bool checkArgs(const ConfigStore& config, size_t n_expected) {
  if (config.command_args.size() != n_expected) {
    fprintf(stderr, "[ERROR] Command '%s' expects %lu argument(s), got %lu (see --help).\n",
            config.command.c_str(), n_expected, config.command_args.size());
    return false;
  }
  return true;
}

void printLoci(const vector<Locus>& loci) {
  for (const Locus& l : loci) {
    cout << l << endl;
  }
}

} // namespace

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return EXIT_FAILURE; }

  // params specified by user (in config file or command line)
  string dir_store = config.getValue<string>("store-dir");
  bool strand_specific = config.getValue<bool>("strand-specific");
  TCoord window = config.getValue<long>("window");
  int flank_limit = config.getValue<int>("flank-limit");
  int verbosity = config.getValue<int>("verbosity");
  const string& cmd = config.command;
  const vector<string>& args = config.command_args;

  try {
    shared_ptr<BlobStore> store = make_shared<DirBlobStore>(dir_store);

    if (cmd == "list") {
      if (!checkArgs(config, 0)) return EXIT_FAILURE;
      for (const string& name : RefLoci::listNames(*store)) {
        cout << name << endl;
      }
    }
    else if (cmd == "info") {
      if (!checkArgs(config, 1)) return EXIT_FAILURE;
      RefLoci ref = RefLoci::load(store, args[0], verbosity);
      cout << "name\t" << ref.name() << endl;
      cout << "loci\t" << ref.size() << endl;
      cout << "chromosomes\t" << stringio::join(ref.chromosomes(), ",") << endl;
      for (const auto& kv : ref.summarizeFeatureKinds()) {
        cout << locio::featureKindToString(kv.first) << "\t" << kv.second << endl;
      }
    }
    else if (cmd == "drop") {
      if (!checkArgs(config, 1)) return EXIT_FAILURE;
      RefLoci::drop(*store, args[0]);
      if (verbosity > 0) {
        fprintf(stderr, "[INFO] Dropped '%s'.\n", args[0].c_str());
      }
    }
    else if (cmd == "query") {
      if (!checkArgs(config, 2)) return EXIT_FAILURE;
      RefLoci ref = RefLoci::load(store, args[0], verbosity);
      Locus region = locio::parseRegion(args[1]);
      printLoci(ref.queryOverlap(region, locio::AlgebraOpts(strand_specific)));
    }
    else if (cmd == "window") {
      if (!checkArgs(config, 2)) return EXIT_FAILURE;
      RefLoci ref = RefLoci::load(store, args[0], verbosity);
      pair<string, TCoord> pos = locio::parsePosition(args[1]);
      printLoci(ref.queryWindow(pos.first, pos.second, window));
    }
    else if (cmd == "nearest") {
      if (!checkArgs(config, 3)) return EXIT_FAILURE;
      locio::Direction dir;
      if (args[2] == "up") {
        dir = locio::UPSTREAM;
      } else if (args[2] == "down") {
        dir = locio::DOWNSTREAM;
      } else {
        fprintf(stderr, "[ERROR] Direction must be 'up' or 'down' (got '%s').\n", args[2].c_str());
        return EXIT_FAILURE;
      }
      RefLoci ref = RefLoci::load(store, args[0], verbosity);
      pair<string, TCoord> pos = locio::parsePosition(args[1]);
      boost::optional<Locus> hit = ref.nearest(pos.first, pos.second, dir);
      if (hit) {
        cout << *hit << endl;
      } else if (verbosity > 0) {
        fprintf(stderr, "[INFO] No locus %s of %s.\n", args[2] == "up" ? "upstream" : "downstream", args[1].c_str());
      }
    }
    else if (cmd == "candidates") {
      if (!checkArgs(config, 2)) return EXIT_FAILURE;
      RefLoci ref = RefLoci::load(store, args[0], verbosity);
      Locus region = locio::parseRegion(args[1]);
      refloci::CandidateOpts opts;
      opts.window = window;
      opts.flank_limit = flank_limit;
      opts.annotate = true;
      for (const Locus& cand : ref.candidateLoci(region, opts)) {
        cout << cand << "\t" << locio::attrValueToString(cand.getAttr("locus_distance")) << endl;
      }
    }
    else if (cmd == "term-list") {
      if (!checkArgs(config, 0)) return EXIT_FAILURE;
      for (const string& name : Term::listNames(*store)) {
        cout << name << endl;
      }
    }
    else if (cmd == "term-info") {
      if (!checkArgs(config, 1)) return EXIT_FAILURE;
      Term term = Term::load(*store, args[0]);
      cout << "name\t" << term.name << endl;
      cout << "desc\t" << term.desc << endl;
      cout << "loci\t" << term.size() << endl;
      for (const auto& kv : term.attrs) {
        cout << kv.first << "\t" << locio::attrValueToString(kv.second) << endl;
      }
      printLoci(term.loci);
    }
    else {
      fprintf(stderr, "[ERROR] Unknown command '%s' (see --help).\n", cmd.c_str());
      return EXIT_FAILURE;
    }
  } catch (const locio::LocusError& e) {
    fprintf(stderr, "[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

#include "Term.hpp"
#include "Snapshot.hpp"
#include <algorithm>
#include <boost/format.hpp>

using namespace std;
using boost::format;
using locio::Locus;
using locio::TCoord;

namespace refloci {

Term::Term(const string& term_name, const string& term_desc)
: name(term_name), desc(term_desc)
{}

bool Term::addLocus(const Locus& locus) {
  if (find(loci.begin(), loci.end(), locus) != loci.end()) {
    return false;
  }
  loci.push_back(locus);
  return true;
}

vector<Locus> Term::nearbyLoci(const Locus& locus, TCoord max_distance) const {
  vector<Locus> res;
  for (const Locus& l : loci) {
    TCoord dist = locus.distance(l);
    if (!locio::isInfinite(dist) && dist <= max_distance) {
      res.push_back(l);
    }
  }
  return res;
}

vector<Locus> Term::effectiveLoci(TCoord max_distance) const {
  vector<Locus> collapsed;
  if (loci.empty()) {
    return collapsed;
  }
  vector<Locus> sorted_loci(loci);
  stable_sort(sorted_loci.begin(), sorted_loci.end());

  collapsed.push_back(sorted_loci[0]);
  for (size_t i=1; i<sorted_loci.size(); ++i) {
    Locus& tail = collapsed.back();
    const Locus& l = sorted_loci[i];
    TCoord dist = tail.distance(l);
    if (!locio::isInfinite(dist) && dist <= max_distance) {
      tail = tail.merge(l);
    } else {
      collapsed.push_back(l);
    }
  }
  return collapsed;
}

void Term::freeze(storage::BlobStore& store, bool overwrite) const {
  storage::checkBlobName(name);
  string key = PFX_TERM + name;
  if (!overwrite && store.exists(key)) {
    throw locio::StateError(str(format("Cannot freeze Term '%s': a term with that name exists.") % name));
  }
  store.put(key, toBlob(*this));
}

Term Term::load(const storage::BlobStore& store, const string& name) {
  storage::checkBlobName(name);
  string key = PFX_TERM + name;
  if (!store.exists(key)) {
    throw locio::NotFoundError(str(format("No Term named '%s'.") % name));
  }
  Term term;
  fromBlob(store.get(key), key, term);
  return term;
}

vector<string> Term::listNames(const storage::BlobStore& store) {
  vector<string> names;
  for (const string& blob_name : store.list()) {
    if (blob_name.compare(0, PFX_TERM.size(), PFX_TERM) == 0) {
      names.push_back(blob_name.substr(PFX_TERM.size()));
    }
  }
  return names;
}

void Term::drop(storage::BlobStore& store, const string& name) {
  storage::checkBlobName(name);
  if (!store.remove(PFX_TERM + name)) {
    throw locio::NotFoundError(str(format("No Term named '%s'.") % name));
  }
}

} // namespace refloci

#include "RefLoci.hpp"
#include "Snapshot.hpp"
#include <algorithm>
#include <boost/format.hpp>
#include <cstdio>
#include <set>

using namespace std;
using boost::format;
using locio::Interval;
using locio::NotFoundError;
using locio::StateError;
using locio::StorageError;
using locio::ValidationError;

namespace refloci {

namespace {

/** Redraws of a bootstrap block before giving up. */
const int MAX_BOOTSTRAP_DRAWS = 1000;

/** A stored locus needs a chromosome; so do its components. */
void checkLocus(const Locus& locus) {
  if (locus.chromosome.empty()) {
    throw ValidationError(str(format("Cannot insert locus %s: chromosome must not be empty.") % locus.toString()));
  }
  for (const Locus& sub : locus.sub_loci) {
    checkLocus(sub);
  }
}

bool sharesLocus(const set<TLocusId>& seen, const vector<Locus>& loci) {
  for (const Locus& l : loci) {
    if (l.id && seen.count(*l.id) > 0) {
      return true;
    }
  }
  return false;
}

/** Union of per-locus results by id (first occurrence wins), sorted by position. */
vector<Locus> chainLoci(const vector<vector<Locus>>& groups) {
  set<TLocusId> seen;
  vector<Locus> res;
  for (const vector<Locus>& group : groups) {
    for (const Locus& l : group) {
      if (!l.id || seen.insert(*l.id).second) {
        res.push_back(l);
      }
    }
  }
  stable_sort(res.begin(), res.end());
  return res;
}

} // namespace

string stateToString(LociState state) {
  switch (state) {
    case STATE_BUILDING: return "building";
    case STATE_FROZEN:   return "frozen";
    case STATE_LOADED:   return "loaded";
  }
  return "unknown";
}

RefLoci::RefLoci(shared_ptr<storage::BlobStore> store, const string& name)
: m_store(store),
  m_name(name),
  m_state(STATE_BUILDING),
  m_next_id(0),
  m_verbosity(0),
  m_owns_snapshot(false),
  m_is_stale(false)
{
  if (!m_store) {
    throw ValidationError("RefLoci requires a storage backend.");
  }
}

void RefLoci::requireBuilding(const char* op) const {
  if (m_state != STATE_BUILDING) {
    throw StateError(str(format("Cannot %s: RefLoci '%s' is %s (thaw it or create a working copy first).")
                         % op % m_name % stateToString(m_state)));
  }
}

void RefLoci::markStale() {
  m_is_stale = true;
}

void RefLoci::ensureIndex() const {
  if (!m_is_stale) {
    return;
  }
  m_index.clear();
  m_name_index.clear();
  for (const auto& kv : m_loci) {
    const Locus& l = kv.second;
    m_index.add(l.chromosome, l.interval, kv.first);
    if (l.name) {
      m_name_index.emplace(*l.name, kv.first);
    }
  }
  for (const auto& kv : m_aliases) {
    m_name_index.emplace(kv.first, kv.second);
  }
  m_index.build();
  m_is_stale = false;
}

TLocusId RefLoci::insert(const Locus& locus) {
  requireBuilding("insert");
  checkLocus(locus);
  TLocusId id = m_next_id++;
  Locus& stored = m_loci[id];
  stored = locus;
  stored.id = id;
  markStale();
  return id;
}

vector<TLocusId> RefLoci::insert(const vector<Locus>& loci) {
  requireBuilding("insert");
  // all or nothing
  for (const Locus& l : loci) {
    checkLocus(l);
  }
  vector<TLocusId> ids;
  ids.reserve(loci.size());
  for (const Locus& l : loci) {
    ids.push_back(insert(l));
  }
  return ids;
}

void RefLoci::remove(TLocusId id) {
  requireBuilding("remove");
  if (m_loci.erase(id) == 0) {
    throw NotFoundError(str(format("RefLoci '%s' has no locus with id %lu.") % m_name % id));
  }
  for (auto it = m_aliases.begin(); it != m_aliases.end(); ) {
    if (it->second == id) {
      it = m_aliases.erase(it);
    } else {
      ++it;
    }
  }
  markStale();
}

void RefLoci::addAlias(TLocusId id, const string& alias) {
  requireBuilding("add alias");
  if (!contains(id)) {
    throw NotFoundError(str(format("RefLoci '%s' has no locus with id %lu.") % m_name % id));
  }
  if (alias.empty()) {
    throw ValidationError("Alias must not be empty.");
  }
  auto it = m_aliases.find(alias);
  if (it != m_aliases.end()) {
    if (it->second == id) {
      return;
    }
    throw ValidationError(str(format("Alias '%s' already refers to locus %lu.") % alias % it->second));
  }
  m_aliases[alias] = id;
  markStale();
}

void RefLoci::freeze(const string& name, bool overwrite) {
  requireBuilding("freeze");
  if (m_loci.empty()) {
    throw StateError(str(format("Cannot freeze '%s': collection is empty.") % name));
  }
  storage::checkBlobName(name);
  string key = PFX_REFLOCI + name;
  bool is_own = (m_owns_snapshot && name == m_name);
  if (!overwrite && !is_own && m_store->exists(key)) {
    throw StateError(str(format("Cannot freeze '%s': a snapshot with that name exists.") % name));
  }

  LociSnapshot snap;
  snap.name = name;
  snap.next_id = m_next_id;
  snap.loci = m_loci;
  snap.aliases = m_aliases;
  m_store->put(key, toBlob(snap));

  m_name = name;
  m_owns_snapshot = true;
  ensureIndex();
  m_state = STATE_FROZEN;
  if (m_verbosity > 0) {
    fprintf(stderr, "[INFO] RefLoci '%s': froze %lu loci on %lu chromosomes.\n",
            m_name.c_str(), m_loci.size(), m_index.chromosomes().size());
  }
}

void RefLoci::thaw() {
  thaw(m_name);
}

void RefLoci::thaw(const string& name) {
  if (m_state == STATE_BUILDING) {
    throw StateError(str(format("Cannot thaw: RefLoci '%s' is not frozen.") % m_name));
  }
  if (name != m_name) {
    m_owns_snapshot = false;
  }
  m_name = name;
  m_state = STATE_BUILDING;
}

RefLoci RefLoci::workingCopy(const string& name) const {
  RefLoci copy(*this);
  copy.m_name = name;
  copy.m_state = STATE_BUILDING;
  copy.m_owns_snapshot = false;
  return copy;
}

RefLoci RefLoci::load(shared_ptr<storage::BlobStore> store, const string& name, int verbosity) {
  if (!store) {
    throw ValidationError("RefLoci requires a storage backend.");
  }
  storage::checkBlobName(name);
  string key = PFX_REFLOCI + name;
  if (!store->exists(key)) {
    throw NotFoundError(str(format("No RefLoci named '%s'.") % name));
  }

  LociSnapshot snap;
  fromBlob(store->get(key), key, snap);
  for (const auto& kv : snap.loci) {
    const Locus& l = kv.second;
    if (!l.id || *l.id != kv.first || kv.first >= snap.next_id || l.chromosome.empty()) {
      throw StorageError(str(format("Corrupt blob '%s': inconsistent entry for id %lu.") % key % kv.first));
    }
  }
  for (const auto& kv : snap.aliases) {
    if (kv.first.empty() || snap.loci.count(kv.second) == 0) {
      throw StorageError(str(format("Corrupt blob '%s': alias '%s' refers to unknown id %lu.") % key % kv.first % kv.second));
    }
  }

  RefLoci res(store, name);
  res.m_verbosity = verbosity;
  res.m_next_id = snap.next_id;
  res.m_loci.swap(snap.loci);
  res.m_aliases.swap(snap.aliases);
  res.m_owns_snapshot = true;
  res.markStale();
  res.ensureIndex();
  res.m_state = STATE_LOADED;
  if (verbosity > 0) {
    fprintf(stderr, "[INFO] RefLoci '%s': loaded %lu loci on %lu chromosomes.\n",
            name.c_str(), res.m_loci.size(), res.m_index.chromosomes().size());
  }
  return res;
}

vector<string> RefLoci::listNames(const storage::BlobStore& store) {
  vector<string> names;
  for (const string& blob_name : store.list()) {
    if (blob_name.compare(0, PFX_REFLOCI.size(), PFX_REFLOCI) == 0) {
      names.push_back(blob_name.substr(PFX_REFLOCI.size()));
    }
  }
  return names;
}

bool RefLoci::exists(const storage::BlobStore& store, const string& name) {
  storage::checkBlobName(name);
  return store.exists(PFX_REFLOCI + name);
}

void RefLoci::drop(storage::BlobStore& store, const string& name) {
  storage::checkBlobName(name);
  if (!store.remove(PFX_REFLOCI + name)) {
    throw NotFoundError(str(format("No RefLoci named '%s'.") % name));
  }
}

const Locus& RefLoci::getLocus(TLocusId id) const {
  auto it = m_loci.find(id);
  if (it == m_loci.end()) {
    throw NotFoundError(str(format("RefLoci '%s' has no locus with id %lu.") % m_name % id));
  }
  return it->second;
}

bool RefLoci::contains(TLocusId id) const {
  return m_loci.count(id) > 0;
}

vector<Locus> RefLoci::resolve(const vector<TLocusId>& ids) const {
  vector<Locus> res;
  res.reserve(ids.size());
  for (TLocusId id : ids) {
    res.push_back(getLocus(id));
  }
  return res;
}

vector<TLocusId> RefLoci::neighborhood(const Locus& locus) const {
  ensureIndex();
  // widen by 1 bp so that empty loci on the edges are found
  return m_index.queryOverlap(locus.chromosome, Interval(locus.start()-1, locus.end()+1));
}

bool RefLoci::containsLocus(const Locus& locus) const {
  for (TLocusId id : neighborhood(locus)) {
    if (getLocus(id).equals(locus)) {
      return true;
    }
  }
  return false;
}

vector<Locus> RefLoci::findByName(const string& name) const {
  ensureIndex();
  vector<TLocusId> ids;
  auto range = m_name_index.equal_range(name);
  for (auto it = range.first; it != range.second; ++it) {
    ids.push_back(it->second);
  }
  sort(ids.begin(), ids.end());
  ids.erase(unique(ids.begin(), ids.end()), ids.end());
  return resolve(ids);
}

vector<Locus> RefLoci::byFeature(locio::FeatureKind kind) const {
  vector<Locus> res;
  for (const auto& kv : m_loci) {
    if (kv.second.kind == kind) {
      res.push_back(kv.second);
    }
  }
  return res;
}

vector<string> RefLoci::featureNames(locio::FeatureKind kind) const {
  vector<string> names;
  for (const auto& kv : m_loci) {
    if (kv.second.kind == kind && kv.second.name) {
      names.push_back(*kv.second.name);
    }
  }
  return names;
}

vector<Locus> RefLoci::intersection(const vector<Locus>& loci) const {
  set<TLocusId> ids;
  for (const Locus& l : loci) {
    for (TLocusId id : neighborhood(l)) {
      if (getLocus(id).equals(l)) {
        ids.insert(id);
      }
    }
  }
  return resolve(vector<TLocusId>(ids.begin(), ids.end()));
}

vector<string> RefLoci::chromosomes() const {
  ensureIndex();
  return m_index.chromosomes();
}

map<locio::FeatureKind, size_t> RefLoci::summarizeFeatureKinds() const {
  map<locio::FeatureKind, size_t> counts;
  for (const auto& kv : m_loci) {
    counts[kv.second.kind]++;
  }
  return counts;
}

vector<Locus> RefLoci::queryOverlap(const string& chromosome, const Interval& interval) const {
  ensureIndex();
  return resolve(m_index.queryOverlap(chromosome, interval));
}

vector<Locus> RefLoci::queryOverlap(const Locus& locus, const locio::AlgebraOpts& opts) const {
  ensureIndex();
  vector<Locus> res;
  for (TLocusId id : m_index.queryOverlap(locus.chromosome, locus.interval)) {
    const Locus& l = getLocus(id);
    if (locus.overlaps(l, opts)) {
      res.push_back(l);
    }
  }
  return res;
}

vector<Locus> RefLoci::queryWindow(const string& chromosome, TCoord pos, TCoord window) const {
  ensureIndex();
  return resolve(m_index.queryWindow(chromosome, pos, window));
}

boost::optional<Locus> RefLoci::nearest(const string& chromosome, TCoord pos, locio::Direction dir) const {
  ensureIndex();
  boost::optional<TLocusId> id = m_index.nearest(chromosome, pos, dir);
  if (!id) {
    return boost::none;
  }
  return getLocus(*id);
}

vector<Locus> RefLoci::within(
  const Locus& locus,
  bool partial,
  bool same_strand,
  const boost::optional<locio::FeatureKind>& kind
) const
{
  vector<Locus> res;
  for (TLocusId id : neighborhood(locus)) {
    const Locus& l = getLocus(id);
    bool is_hit = locus.contains(l) || (partial && locus.overlaps(l));
    if (kind && l.kind != *kind) {
      continue;
    }
    if (is_hit && (!same_strand || l.strand == locus.strand)) {
      res.push_back(l);
    }
  }
  stable_sort(res.begin(), res.end());
  if (locus.strand == locio::STRAND_MINUS) {
    reverse(res.begin(), res.end());
  }
  return res;
}

vector<Locus> RefLoci::encompassing(const Locus& locus) const {
  vector<Locus> res;
  for (TLocusId id : neighborhood(locus)) {
    const Locus& l = getLocus(id);
    if (l.contains(locus)) {
      res.push_back(l);
    }
  }
  return res;
}

vector<Locus> RefLoci::flank(const Locus& locus, bool is_upstream, const FlankOpts& opts) const {
  ensureIndex();
  // on the minus strand 5' points towards higher coordinates
  bool is_minus = (locus.strand == locio::STRAND_MINUS);
  bool toward_lower = (is_upstream != is_minus);
  TCoord anchor = toward_lower ? locus.start() : locus.end();

  locio::TIdFilter accept = [this, &locus, &opts] (TLocusId id) {
    if (locus.id && *locus.id == id) {
      return false;
    }
    const Locus& l = getLocus(id);
    if (opts.kind && l.kind != *opts.kind) {
      return false;
    }
    return !opts.same_strand || l.strand == locus.strand;
  };

  vector<TLocusId> ids;
  if (opts.partial) {
    // loci with start < anchor < end
    for (TLocusId id : m_index.queryOverlap(locus.chromosome, Interval(anchor, anchor))) {
      if (ids.size() < opts.limit && accept(id)) {
        ids.push_back(id);
      }
    }
  }
  if (ids.size() < opts.limit) {
    size_t remaining = opts.limit - ids.size();
    vector<TLocusId> walk = toward_lower
      ? m_index.upstreamOf(locus.chromosome, anchor, opts.max_distance, remaining, accept)
      : m_index.downstreamOf(locus.chromosome, anchor, opts.max_distance, remaining, accept);
    ids.insert(ids.end(), walk.begin(), walk.end());
  }
  return resolve(ids);
}

vector<Locus> RefLoci::upstreamLoci(const Locus& locus, const FlankOpts& opts) const {
  return flank(locus, true, opts);
}

vector<Locus> RefLoci::downstreamLoci(const Locus& locus, const FlankOpts& opts) const {
  return flank(locus, false, opts);
}

pair<vector<Locus>, vector<Locus>> RefLoci::flankingLoci(const Locus& locus, const FlankOpts& opts) const {
  return make_pair(upstreamLoci(locus, opts), downstreamLoci(locus, opts));
}

vector<Locus> RefLoci::candidateLoci(const Locus& locus, const CandidateOpts& opts) const {
  if (opts.window < 0) {
    throw ValidationError(str(format("Window size must not be negative (got %ld).") % opts.window));
  }
  ensureIndex();
  Interval win(locus.start() - opts.window, locus.end() + opts.window);

  set<TLocusId> ids;
  vector<TLocusId> hits = m_index.queryOverlap(locus.chromosome, win);
  ids.insert(hits.begin(), hits.end());
  if (opts.flank_limit > 0) {
    hits = m_index.upstreamOf(locus.chromosome, win.start(), locio::DIST_INF, opts.flank_limit);
    ids.insert(hits.begin(), hits.end());
    hits = m_index.downstreamOf(locus.chromosome, win.end(), locio::DIST_INF, opts.flank_limit);
    ids.insert(hits.begin(), hits.end());
  }

  vector<Locus> candidates = resolve(vector<TLocusId>(ids.begin(), ids.end()));
  stable_sort(candidates.begin(), candidates.end());
  if (opts.annotate) {
    annotateCandidates(locus, candidates);
  }
  return candidates;
}

void RefLoci::annotateCandidates(const Locus& locus, vector<Locus>& candidates) const {
  string parent = locus.name ? *locus.name : locus.toString();
  size_t n = candidates.size();

  // order by distance to the query locus
  vector<size_t> order(n);
  for (size_t i=0; i<n; ++i) {
    order[i] = i;
  }
  stable_sort(order.begin(), order.end(), [&candidates, &locus] (size_t a, size_t b) {
    return candidates[a].centerDistance(locus) < candidates[b].centerDistance(locus);
  });

  // ties share the average of their ranks
  vector<double> ranks(n);
  for (size_t i=0; i<n; ) {
    size_t j = i;
    TCoord dist = candidates[order[i]].centerDistance(locus);
    while (j < n && candidates[order[j]].centerDistance(locus) == dist) {
      ++j;
    }
    double rank = (i + 1 + j) / 2.0;
    for (size_t k=i; k<j; ++k) {
      ranks[order[k]] = rank;
    }
    i = j;
  }

  long num_down = 0;
  long num_up = 0;
  for (size_t i : order) {
    Locus& cand = candidates[i];
    long num_intervening = -1;
    if (!cand.contains(locus)) {
      num_intervening = (cand.center() >= locus.center()) ? num_down++ : num_up++;
    }
    cand.setAttr("parent_locus", parent);
    cand.setAttr("num_siblings", static_cast<long>(n));
    cand.setAttr("locus_distance", cand.centerDistance(locus));
    cand.setAttr("intervening_rank", ranks[i]);
    cand.setAttr("num_intervening", num_intervening);
  }
}

vector<vector<Locus>> RefLoci::candidateLociByLocus(const vector<Locus>& loci, const CandidateOpts& opts) const {
  vector<Locus> queries(loci);
  stable_sort(queries.begin(), queries.end());
  vector<vector<Locus>> res;
  res.reserve(queries.size());
  for (const Locus& l : queries) {
    res.push_back(candidateLoci(l, opts));
  }
  return res;
}

vector<Locus> RefLoci::candidateLoci(const vector<Locus>& loci, const CandidateOpts& opts) const {
  return chainLoci(candidateLociByLocus(loci, opts));
}

vector<Locus> RefLoci::drawCandidateBlock(size_t n, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const {
  if (n > m_loci.size()) {
    throw ValidationError(str(format("Cannot draw %lu loci from RefLoci '%s' with %lu loci.")
                              % n % m_name % m_loci.size()));
  }
  ensureIndex();
  for (int i=0; i<MAX_BOOTSTRAP_DRAWS; ++i) {
    Locus anchor = randomLoci(1, rng).front();
    // the anchor locus and the n-1 loci ending before it
    vector<TLocusId> ids = m_index.upstreamOf(anchor.chromosome, anchor.end(), locio::DIST_INF, n);
    if (ids.size() < n) {
      continue;
    }
    vector<Locus> block = resolve(ids);
    stable_sort(block.begin(), block.end());
    if (opts.annotate) {
      string parent = anchor.name ? *anchor.name : anchor.toString();
      for (Locus& l : block) {
        l.setAttr("parent_locus", parent);
      }
    }
    return block;
  }
  throw StateError(str(format("RefLoci '%s': no block of %lu adjacent loci found in %d draws.")
                       % m_name % n % MAX_BOOTSTRAP_DRAWS));
}

vector<Locus> RefLoci::bootstrapCandidateLoci(const Locus& locus, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const {
  CandidateOpts plain(opts);
  plain.annotate = false;
  size_t num = candidateLoci(locus, plain).size();
  if (num == 0) {
    return vector<Locus>();
  }
  return drawCandidateBlock(num, opts, rng);
}

vector<Locus> RefLoci::bootstrapCandidateLoci(const vector<Locus>& loci, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const {
  vector<Locus> queries(loci);
  stable_sort(queries.begin(), queries.end());
  set<TLocusId> seen;
  vector<vector<Locus>> blocks;
  for (const Locus& l : queries) {
    vector<Locus> block = bootstrapCandidateLoci(l, opts, rng);
    int num_draws = 1;
    while (sharesLocus(seen, block)) {
      if (num_draws++ >= MAX_BOOTSTRAP_DRAWS) {
        throw StateError(str(format("RefLoci '%s': no disjoint bootstrap block for %s in %d draws.")
                             % m_name % l.toString() % MAX_BOOTSTRAP_DRAWS));
      }
      block = bootstrapCandidateLoci(l, opts, rng);
    }
    for (const Locus& b : block) {
      seen.insert(*b.id);
    }
    blocks.push_back(block);
  }
  return chainLoci(blocks);
}

vector<Locus> RefLoci::randomLoci(size_t n, RandomNumberGenerator<>& rng) const {
  if (n > m_loci.size()) {
    throw ValidationError(str(format("Cannot draw %lu loci from RefLoci '%s' with %lu loci.")
                              % n % m_name % m_loci.size()));
  }
  vector<TLocusId> all_ids;
  all_ids.reserve(m_loci.size());
  for (const auto& kv : m_loci) {
    all_ids.push_back(kv.first);
  }
  vector<TLocusId> ids;
  for (size_t i : rng.sampleIndices(all_ids.size(), n)) {
    ids.push_back(all_ids[i]);
  }
  return resolve(ids);
}

} // namespace refloci

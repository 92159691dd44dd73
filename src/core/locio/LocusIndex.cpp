#include "LocusIndex.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <boost/format.hpp>

using namespace std;
using boost::format;

namespace locio {

namespace {

/** Subtrees up to this level are scanned linearly. */
const int LEVEL_SCAN = 3;

bool lessByStart(const IndexEntry& a, const IndexEntry& b) {
  if (a.start != b.start) return a.start < b.start;
  if (a.end != b.end) return a.end < b.end;
  return a.id < b.id;
}

/** Orders positions into an entry vector by (end, start, id). */
struct LessByEnd
{
  const vector<IndexEntry>& e;

  explicit LessByEnd(const vector<IndexEntry>& entries) : e(entries) {}
  bool operator() (size_t i, size_t j) const {
    if (e[i].end != e[j].end) return e[i].end < e[j].end;
    if (e[i].start != e[j].start) return e[i].start < e[j].start;
    return e[i].id < e[j].id;
  }
};

/** Compute subtree maxima bottom-up. \returns level of the root node. */
int augment(vector<IndexEntry>& a) {
  const size_t n = a.size();
  // leaves sit at even positions
  size_t last_i = 0;
  TCoord last = 0; // max_end of the rightmost node on the current level
  for (size_t i = 0; i < n; i += 2) {
    last_i = i;
    last = a[i].max_end = a[i].end;
  }
  int k = 1;
  for (; (size_t(1) << k) <= n; ++k) {
    const size_t x = size_t(1) << (k - 1);
    const size_t i0 = (x << 1) - 1;
    const size_t step = x << 2;
    for (size_t i = i0; i < n; i += step) {
      TCoord el = a[i - x].max_end;
      // right child may be missing when n is not a power of 2
      TCoord er = (i + x < n) ? a[i + x].max_end : last;
      a[i].max_end = max(a[i].end, max(el, er));
    }
    // step up to the parent of the rightmost node
    last_i = ((last_i >> k) & 1) ? last_i - x : last_i + x;
    if (last_i < n && a[last_i].max_end > last) {
      last = a[last_i].max_end;
    }
  }
  return k - 1;
}

struct StackCell
{
  size_t x; // node position
  int k;    // node level
  bool w;   // left subtree already visited
};

} // namespace

void ChromosomeIndex::build() {
  sort(entries.begin(), entries.end(), lessByStart);
  max_level = entries.empty() ? -1 : augment(entries);

  by_end.resize(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    by_end[i] = i;
  }
  sort(by_end.begin(), by_end.end(), LessByEnd(entries));
}

void ChromosomeIndex::insert(const IndexEntry& entry) {
  vector<IndexEntry>::iterator it = upper_bound(entries.begin(), entries.end(), entry, lessByStart);
  size_t pos = it - entries.begin();
  entries.insert(it, entry);
  max_level = augment(entries);

  // entries behind the new one moved up by one
  for (size_t& i : by_end) {
    if (i >= pos) {
      ++i;
    }
  }
  by_end.insert(upper_bound(by_end.begin(), by_end.end(), pos, LessByEnd(entries)), pos);
}

void ChromosomeIndex::overlap(TCoord st, TCoord en, vector<TLocusId>& out_ids) const {
  if (entries.empty()) {
    return;
  }
  const size_t n = entries.size();
  vector<StackCell> stack;
  stack.reserve(64);
  StackCell root = { (size_t(1) << max_level) - 1, max_level, false };
  stack.push_back(root);

  while (!stack.empty()) {
    StackCell z = stack.back();
    stack.pop_back();
    if (z.k <= LEVEL_SCAN) {
      // small subtree: scan its positions in order
      size_t i0 = z.x >> z.k << z.k;
      size_t i1 = i0 + (size_t(1) << (z.k + 1)) - 1;
      if (i1 > n) i1 = n;
      for (size_t i = i0; i < i1 && entries[i].start < en; ++i) {
        if (st < entries[i].end) {
          out_ids.push_back(entries[i].id);
        }
      }
    } else if (!z.w) {
      // revisit this node after its left subtree
      StackCell again = { z.x, z.k, true };
      stack.push_back(again);
      size_t y = z.x - (size_t(1) << (z.k - 1));
      // positions beyond n are virtual nodes and may still have real descendants
      if (y >= n || entries[y].max_end > st) {
        StackCell left = { y, z.k - 1, false };
        stack.push_back(left);
      }
    } else if (z.x < n && entries[z.x].start < en) {
      if (st < entries[z.x].end) {
        out_ids.push_back(entries[z.x].id);
      }
      StackCell right = { z.x + (size_t(1) << (z.k - 1)), z.k - 1, false };
      stack.push_back(right);
    }
  }
}

LocusIndex::LocusIndex() : m_is_built(true) {}

void LocusIndex::add(const string& chromosome, const Interval& interval, TLocusId id) {
  m_chromosomes[chromosome].entries.push_back(IndexEntry(interval.start(), interval.end(), id));
  m_is_built = false;
}

void LocusIndex::build() {
  for (auto& kv : m_chromosomes) {
    kv.second.build();
  }
  m_is_built = true;
}

void LocusIndex::insert(const string& chromosome, const Interval& interval, TLocusId id) {
  requireBuilt();
  m_chromosomes[chromosome].insert(IndexEntry(interval.start(), interval.end(), id));
}

void LocusIndex::clear() {
  m_chromosomes.clear();
  m_is_built = true;
}

size_t LocusIndex::size() const {
  size_t n = 0;
  for (const auto& kv : m_chromosomes) {
    n += kv.second.entries.size();
  }
  return n;
}

vector<string> LocusIndex::chromosomes() const {
  vector<string> chrs;
  for (const auto& kv : m_chromosomes) {
    if (!kv.second.entries.empty()) {
      chrs.push_back(kv.first);
    }
  }
  return chrs;
}

const ChromosomeIndex* LocusIndex::getChromosome(const string& chromosome) const {
  requireBuilt();
  auto it = m_chromosomes.find(chromosome);
  if (it == m_chromosomes.end()) {
    return nullptr;
  }
  return &it->second;
}

void LocusIndex::requireBuilt() const {
  if (!m_is_built) {
    throw StateError("LocusIndex has staged entries; call build() before querying.");
  }
}

vector<TLocusId> LocusIndex::queryOverlap(const string& chromosome, const Interval& interval) const {
  vector<TLocusId> ids;
  const ChromosomeIndex* chr_idx = getChromosome(chromosome);
  if (chr_idx != nullptr) {
    chr_idx->overlap(interval.start(), interval.end(), ids);
  }
  return ids;
}

vector<TLocusId> LocusIndex::queryWindow(const string& chromosome, TCoord pos, TCoord window) const {
  if (window < 0) {
    throw ValidationError(str(format("Window size must not be negative (got %ld).") % window));
  }
  return queryOverlap(chromosome, Interval(pos - window, pos + window));
}

boost::optional<TLocusId> LocusIndex::nearest(const string& chromosome, TCoord pos, Direction dir) const {
  vector<TLocusId> ids;
  if (dir == UPSTREAM) {
    ids = upstreamOf(chromosome, pos, DIST_INF, 1);
  } else {
    ids = downstreamOf(chromosome, pos, DIST_INF, 1);
  }
  if (ids.empty()) {
    return boost::none;
  }
  return ids[0];
}

vector<TLocusId> LocusIndex::upstreamOf (
  const string& chromosome,
  TCoord pos,
  TCoord max_gap,
  size_t limit,
  const TIdFilter& accept
) const
{
  vector<TLocusId> ids;
  const ChromosomeIndex* chr_idx = getChromosome(chromosome);
  if (chr_idx == nullptr || limit == 0) {
    return ids;
  }
  const vector<IndexEntry>& e = chr_idx->entries;
  // first position (in end order) with end > pos
  auto it = upper_bound(chr_idx->by_end.begin(), chr_idx->by_end.end(), pos,
                        [&e] (TCoord p, size_t i) { return p < e[i].end; });
  while (it != chr_idx->by_end.begin() && ids.size() < limit) {
    --it;
    const IndexEntry& entry = e[*it];
    if (pos - entry.end > max_gap) {
      break;
    }
    if (!accept || accept(entry.id)) {
      ids.push_back(entry.id);
    }
  }
  return ids;
}

vector<TLocusId> LocusIndex::downstreamOf (
  const string& chromosome,
  TCoord pos,
  TCoord max_gap,
  size_t limit,
  const TIdFilter& accept
) const
{
  vector<TLocusId> ids;
  const ChromosomeIndex* chr_idx = getChromosome(chromosome);
  if (chr_idx == nullptr || limit == 0) {
    return ids;
  }
  const vector<IndexEntry>& e = chr_idx->entries;
  auto it = lower_bound(e.begin(), e.end(), pos,
                        [] (const IndexEntry& entry, TCoord p) { return entry.start < p; });
  for (; it != e.end() && ids.size() < limit; ++it) {
    if (it->start - pos > max_gap) {
      break;
    }
    if (!accept || accept(it->id)) {
      ids.push_back(it->id);
    }
  }
  return ids;
}

} // namespace locio

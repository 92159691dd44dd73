#ifndef LOCUSINDEX_H
#define LOCUSINDEX_H

#include "Interval.hpp"
#include "types.hpp"
#include <boost/optional.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace locio {

/** Predicate deciding whether an indexed id qualifies for a walk. */
typedef std::function<bool(TLocusId)> TIdFilter;

/** Entry of a per-chromosome index. */
struct IndexEntry
{
  TCoord start;   /** interval start (inclusive) */
  TCoord end;     /** interval end (exclusive) */
  TCoord max_end; /** largest end within the implicit subtree rooted here */
  TLocusId id;    /** id of the indexed locus */

  IndexEntry() : start(0), end(0), max_end(0), id(0) {}
  IndexEntry(TCoord s, TCoord e, TLocusId i) : start(s), end(e), max_end(e), id(i) {}
};

/**
 * Range index over the loci of one chromosome.
 *
 * Entries are kept in an array sorted by (start, end, id). The array doubles
 * as an implicit binary search tree: the node at index i sits on level k where
 * k is the number of trailing 1-bits of i, and every node stores the largest
 * end of its subtree. Overlap queries descend only into subtrees that can
 * still reach the query start, giving O(log n + hits).
 */
struct ChromosomeIndex
{
  /** Entries sorted by (start, end, id). */
  std::vector<IndexEntry> entries;
  /** Positions into `entries`, sorted by (end, start, id). */
  std::vector<size_t> by_end;
  /** Level of the implicit tree root (-1 if empty). */
  int max_level;

  ChromosomeIndex() : max_level(-1) {}

  /** Sort entries and compute subtree maxima. */
  void build();
  /** Add one entry to a built index, keeping both orders; O(n) without re-sorting. */
  void insert(const IndexEntry& entry);
  /** Collect ids of entries overlapping [start, end). */
  void overlap(TCoord start, TCoord end, std::vector<TLocusId>& out_ids) const;
};

/**
 * Per-chromosome index of loci supporting overlap, window and proximity
 * queries.
 *
 * Typical use is bulk construction: add() all loci, then call build().
 * insert() keeps an already built index valid in linear time for the
 * affected chromosome; prefer add() + build() for batches.
 * Queries on chromosomes without entries return empty results.
 */
class LocusIndex
{
public:
  LocusIndex();

  /** Stage an entry; the index must be (re)built before querying. */
  void add(const std::string& chromosome, const Interval& interval, TLocusId id);
  /** Sort and augment all chromosomes in O(n log n). */
  void build();
  /** Add a single entry and rebuild its chromosome. */
  void insert(const std::string& chromosome, const Interval& interval, TLocusId id);
  /** Drop all entries. */
  void clear();

  /** true if all staged entries have been indexed. */
  bool isBuilt() const { return m_is_built; }
  /** Total number of entries. */
  size_t size() const;
  /** Chromosomes with at least one entry (sorted). */
  std::vector<std::string> chromosomes() const;

  /** Ids of entries overlapping the interval, in (start, end) order. */
  std::vector<TLocusId> queryOverlap(const std::string& chromosome, const Interval& interval) const;
  /** Ids of entries overlapping [pos-window, pos+window); throws ValidationError for window < 0. */
  std::vector<TLocusId> queryWindow(const std::string& chromosome, TCoord pos, TCoord window) const;

  /** Closest entry ending at or before (UPSTREAM) / starting at or after (DOWNSTREAM) pos. */
  boost::optional<TLocusId> nearest(const std::string& chromosome, TCoord pos, Direction dir) const;

  /** Entries ending at or before pos, nearest first.
   *  \param max_gap  Only entries with pos - end <= max_gap.
   *  \param limit    Maximum number of ids returned.
   *  \param accept   Optional filter; rejected ids do not count towards limit.
   */
  std::vector<TLocusId> upstreamOf (
    const std::string& chromosome,
    TCoord pos,
    TCoord max_gap,
    size_t limit,
    const TIdFilter& accept = TIdFilter()
  ) const;

  /** Entries starting at or after pos, nearest first.
   *  \param max_gap  Only entries with start - pos <= max_gap.
   *  \param limit    Maximum number of ids returned.
   *  \param accept   Optional filter; rejected ids do not count towards limit.
   */
  std::vector<TLocusId> downstreamOf (
    const std::string& chromosome,
    TCoord pos,
    TCoord max_gap,
    size_t limit,
    const TIdFilter& accept = TIdFilter()
  ) const;

private:
  std::map<std::string, ChromosomeIndex> m_chromosomes;
  bool m_is_built;

  const ChromosomeIndex* getChromosome(const std::string& chromosome) const;
  void requireBuilt() const;
};

} // namespace locio

#endif // LOCUSINDEX_H

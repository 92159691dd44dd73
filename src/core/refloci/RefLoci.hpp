#ifndef REFLOCI_H
#define REFLOCI_H

#include "../locio.hpp"
#include "../random.hpp"
#include "../storage/BlobStore.hpp"
#include <boost/optional.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace refloci {

using locio::Locus;
using locio::TCoord;
using locio::TLocusId;

/** Lifecycle state of a RefLoci. */
enum LociState {
  STATE_BUILDING, // mutable, in memory only
  STATE_FROZEN,   // snapshot persisted, read-only
  STATE_LOADED    // rehydrated from a snapshot, read-only
};

std::string stateToString(LociState state);

/** Options for strand-aware flanking queries. */
struct FlankOpts
{
  /** max. number of loci per side */
  size_t limit;
  /** max. gap (bp) between query locus and flanking locus */
  TCoord max_distance;
  /** also report loci straddling the edge of the query locus */
  bool partial;
  /** only report loci on the query strand */
  bool same_strand;
  /** only report loci of this feature kind */
  boost::optional<locio::FeatureKind> kind;

  FlankOpts() : limit(1), max_distance(locio::DIST_INF), partial(false), same_strand(false) {}
};

/** Options for candidateLoci(). */
struct CandidateOpts
{
  /** number of flanking loci included on each side of the window */
  size_t flank_limit;
  /** window (bp) added to both sides of the query locus */
  TCoord window;
  /**
   * set attributes on candidates:
   *   parent_locus      name (or position) of the query locus
   *   num_siblings      number of candidates of the query locus
   *   locus_distance    center distance to the query locus
   *   intervening_rank  rank by center distance (1: closest, ties averaged)
   *   num_intervening   candidates between this one and the query locus
   *                     on the same side (-1 if it contains the query locus)
   */
  bool annotate;

  CandidateOpts() : flank_limit(2), window(0), annotate(false) {}
};

typedef
std::map<TLocusId, Locus>
TLocusMap;

typedef
std::map<std::string, TLocusId>
TAliasMap;

/**
 * A named, persistent collection of reference loci.
 *
 * RefLoci owns the canonical copy of each inserted Locus and assigns it a
 * collection-scoped id (ids increase monotonically, so id order is insertion
 * order). Range and proximity queries are answered from a LocusIndex, which
 * is rebuilt lazily after mutations and eagerly on freeze() and load().
 *
 * Lifecycle: BUILDING --freeze()--> FROZEN --thaw()--> BUILDING;
 * load() yields a LOADED collection, which can also be thawed.
 * Frozen and loaded collections are read-only and safe for concurrent
 * readers; mutation is single-writer by contract.
 */
class RefLoci
{
public:
  /** Create an empty collection in BUILDING state. */
  RefLoci(std::shared_ptr<storage::BlobStore> store, const std::string& name);

  const std::string& name() const { return m_name; }
  LociState state() const { return m_state; }
  bool isFrozen() const { return m_state != STATE_BUILDING; }
  size_t size() const { return m_loci.size(); }
  bool empty() const { return m_loci.empty(); }
  /** Detail level of console output (0: silent). */
  void setVerbosity(int level) { m_verbosity = level; }

  /*-----------------------*
   * building              *
   *-----------------------*/

  /** Add a copy of locus; throws StateError unless BUILDING. \returns assigned id */
  TLocusId insert(const Locus& locus);
  /** Add copies of loci in order. \returns assigned ids */
  std::vector<TLocusId> insert(const std::vector<Locus>& loci);
  /** Remove locus and its aliases; throws StateError unless BUILDING, NotFoundError for unknown ids. */
  void remove(TLocusId id);
  /**
   * Register an alternative name for a locus. Throws StateError unless
   * BUILDING, NotFoundError for unknown ids and ValidationError for an empty
   * alias or one already pointing to another locus.
   */
  void addAlias(TLocusId id, const std::string& alias);
  /** Number of registered aliases. */
  size_t numAliases() const { return m_aliases.size(); }
  const TAliasMap& aliases() const { return m_aliases; }

  /**
   * Persist the collection under name and make it read-only.
   * Fails with StateError if not BUILDING, if empty or if a snapshot with that
   * name exists and overwrite is false; ValidationError for an invalid name.
   * A thawed collection may always replace the snapshot it was frozen to or
   * loaded from. Nothing is modified if validation or storage fails.
   */
  void freeze(const std::string& name, bool overwrite = false);
  /**
   * Reopen for mutation under the current name. The snapshot keeps its
   * previous content until the collection is frozen again.
   */
  void thaw();
  /** Reopen for mutation under a new name. */
  void thaw(const std::string& name);
  /** true if freeze(name()) replaces the snapshot this collection came from. */
  bool ownsSnapshot() const { return m_owns_snapshot; }
  /** Mutable copy (same loci and ids) in BUILDING state. */
  RefLoci workingCopy(const std::string& name) const;

  /** Load snapshot; NotFoundError if absent, StorageError if unreadable. */
  static RefLoci load(std::shared_ptr<storage::BlobStore> store, const std::string& name, int verbosity = 0);
  /** Names of all snapshots in store (sorted). */
  static std::vector<std::string> listNames(const storage::BlobStore& store);
  /** true if a snapshot with that name exists. */
  static bool exists(const storage::BlobStore& store, const std::string& name);
  /** Delete snapshot; NotFoundError if absent. Loaded copies stay valid. */
  static void drop(storage::BlobStore& store, const std::string& name);

  /*-----------------------*
   * access                *
   *-----------------------*/

  /** Canonical copy of a locus; throws NotFoundError for unknown ids. */
  const Locus& getLocus(TLocusId id) const;
  bool contains(TLocusId id) const;
  /** true if a locus equal (chromosome, interval, strand) to locus is part of the collection. */
  bool containsLocus(const Locus& locus) const;
  /** All loci in id order. */
  const TLocusMap& loci() const { return m_loci; }
  /** Loci with the given name or alias, in id order. */
  std::vector<Locus> findByName(const std::string& name) const;
  /** Loci of the given feature kind, in id order. */
  std::vector<Locus> byFeature(locio::FeatureKind kind) const;
  /** Names of the loci of the given feature kind (unnamed loci are skipped). */
  std::vector<std::string> featureNames(locio::FeatureKind kind) const;
  /** Loci of the collection equal to any of the given loci (id order, no duplicates). */
  std::vector<Locus> intersection(const std::vector<Locus>& loci) const;
  /** Chromosomes with at least one locus (sorted). */
  std::vector<std::string> chromosomes() const;
  /** Number of loci per feature kind. */
  std::map<locio::FeatureKind, size_t> summarizeFeatureKinds() const;

  /*-----------------------*
   * range queries         *
   *-----------------------*/

  std::vector<Locus> queryOverlap(const std::string& chromosome, const locio::Interval& interval) const;
  /** Loci overlapping locus (strand-aware if requested), in (start, end) order. */
  std::vector<Locus> queryOverlap(const Locus& locus, const locio::AlgebraOpts& opts = locio::AlgebraOpts()) const;
  /** Loci overlapping [pos-window, pos+window); ValidationError for window < 0. */
  std::vector<Locus> queryWindow(const std::string& chromosome, TCoord pos, TCoord window) const;
  /** Closest locus ending at or before / starting at or after pos; none if no locus qualifies. */
  boost::optional<Locus> nearest(const std::string& chromosome, TCoord pos, locio::Direction dir) const;

  /** Loci contained in locus (overlapping if partial), ordered 5' to 3' relative to its strand. */
  std::vector<Locus> within(
    const Locus& locus,
    bool partial = false,
    bool same_strand = false,
    const boost::optional<locio::FeatureKind>& kind = boost::none
  ) const;
  /** Loci containing locus. */
  std::vector<Locus> encompassing(const Locus& locus) const;

  /** Loci 5' of locus (strand-aware, unknown strand counts as '+'), nearest first. */
  std::vector<Locus> upstreamLoci(const Locus& locus, const FlankOpts& opts = FlankOpts()) const;
  /** Loci 3' of locus (strand-aware, unknown strand counts as '+'), nearest first. */
  std::vector<Locus> downstreamLoci(const Locus& locus, const FlankOpts& opts = FlankOpts()) const;
  /** Upstream and downstream loci. */
  std::pair<std::vector<Locus>, std::vector<Locus>> flankingLoci(const Locus& locus, const FlankOpts& opts = FlankOpts()) const;

  /**
   * Candidate loci for a query locus (e.g. genes near a SNP): loci overlapping
   * the locus extended by opts.window on both sides, plus up to
   * opts.flank_limit loci on each side outside that window.
   * Candidates are sorted by position.
   */
  std::vector<Locus> candidateLoci(const Locus& locus, const CandidateOpts& opts = CandidateOpts()) const;
  /** Candidates of each query locus (queries sorted by position). */
  std::vector<std::vector<Locus>> candidateLociByLocus(const std::vector<Locus>& loci, const CandidateOpts& opts = CandidateOpts()) const;
  /**
   * Candidates of all query loci, without duplicates, sorted by position.
   * A candidate shared by several query loci keeps the annotation of the
   * first (leftmost) query locus.
   */
  std::vector<Locus> candidateLoci(const std::vector<Locus>& loci, const CandidateOpts& opts = CandidateOpts()) const;

  /**
   * Random stand-in for the candidates of locus: a block of loci of the same
   * size as candidateLoci(locus, opts), ending at a randomly drawn locus.
   * Empty if locus has no candidates. With opts.annotate, candidates carry the
   * drawn locus as "parent_locus". Throws StateError if no block of that size
   * could be drawn.
   */
  std::vector<Locus> bootstrapCandidateLoci(const Locus& locus, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const;
  /**
   * Random stand-ins for the candidates of several loci. Blocks drawn for
   * different query loci do not share loci; the result is sorted by position.
   */
  std::vector<Locus> bootstrapCandidateLoci(const std::vector<Locus>& loci, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const;

  /** n distinct loci drawn uniformly without replacement; ValidationError if n > size(). */
  std::vector<Locus> randomLoci(size_t n, RandomNumberGenerator<>& rng) const;

private:
  std::shared_ptr<storage::BlobStore> m_store;
  std::string m_name;
  LociState m_state;
  TLocusId m_next_id;
  TLocusMap m_loci;
  TAliasMap m_aliases;
  int m_verbosity;
  bool m_owns_snapshot;

  // derived lookup structures, rebuilt lazily while BUILDING
  mutable locio::LocusIndex m_index;
  mutable std::multimap<std::string, TLocusId> m_name_index;
  mutable bool m_is_stale;

  void requireBuilding(const char* op) const;
  void markStale();
  void ensureIndex() const;
  std::vector<Locus> resolve(const std::vector<TLocusId>& ids) const;
  /** Ids of loci that may relate to locus by overlap or containment (incl. empty loci at its edges). */
  std::vector<TLocusId> neighborhood(const Locus& locus) const;
  std::vector<Locus> flank(const Locus& locus, bool is_upstream, const FlankOpts& opts) const;
  void annotateCandidates(const Locus& locus, std::vector<Locus>& candidates) const;
  std::vector<Locus> drawCandidateBlock(size_t n, const CandidateOpts& opts, RandomNumberGenerator<>& rng) const;
};

} // namespace refloci

#endif // REFLOCI_H

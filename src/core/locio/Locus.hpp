#ifndef LOCUS_H
#define LOCUS_H

#include "Interval.hpp"
#include "types.hpp"
#include <boost/optional.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/optional.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/variant.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/version.hpp>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace locio {

/** Options controlling the relational operators on loci. */
struct AlgebraOpts
{
  /** If set, loci on opposite strands never overlap or contain each other. */
  bool strand_specific;

  AlgebraOpts() : strand_specific(false) {}
  explicit AlgebraOpts(bool is_strand_specific) : strand_specific(is_strand_specific) {}
};

/**
 * Represents a genomic location: a chromosome, a half-open interval and
 * optional strand, name, feature kind and attributes.
 *
 * A Locus may be composite; its sub_loci are values owned by the parent.
 * Equality and ordering only consider chromosome, interval and strand,
 * so the same feature loaded twice compares equal regardless of id,
 * name or attributes.
 */
struct Locus
{
  /** Collection-scoped id; unset for detached loci. */
  boost::optional<TLocusId> id;
  /** Reference sequence identifier (non-empty). */
  std::string chromosome;
  /** Coordinates (0-based, half-open). */
  Interval interval;
  Strand strand;
  /** Feature name (e.g. gene symbol, rsID). */
  boost::optional<std::string> name;
  /** Feature classification. */
  FeatureKind kind;
  /** Origin of the annotation. */
  std::string source;
  /** Reading frame (CDS features only). */
  boost::optional<int> frame;
  /** Feature-specific payload. */
  TAttrMap attrs;
  /** Component loci of a composite locus. */
  std::vector<Locus> sub_loci;

  /** default c'tor (used by containers and deserialization) */
  Locus();
  /** Create detached locus; throws ValidationError for an empty chromosome or start > end. */
  Locus(const std::string& chromosome, TCoord start, TCoord end, Strand strand = STRAND_UNKNOWN);
  /** Create detached locus from an existing interval. */
  Locus(const std::string& chromosome, const Interval& interval, Strand strand = STRAND_UNKNOWN);

  TCoord start() const { return interval.start(); }
  TCoord end() const { return interval.end(); }
  TCoord length() const { return interval.length(); }
  /** Midpoint of the locus (may be a half position). */
  double center() const;

  /** true if the locus is not part of any RefLoci. */
  bool isDetached() const { return !id; }
  /** true if the locus has component loci. */
  bool isComposite() const { return !sub_loci.empty(); }

  /** Overlap test; false across chromosomes. */
  bool overlaps(const Locus& other, const AlgebraOpts& opts = AlgebraOpts()) const;
  /** Containment test (other within this); false across chromosomes. */
  bool contains(const Locus& other, const AlgebraOpts& opts = AlgebraOpts()) const;
  /** Gap in bp between the loci; DIST_INF across chromosomes. */
  TCoord distance(const Locus& other) const;
  /** Distance between the loci centers (rounded down); DIST_INF across chromosomes. */
  TCoord centerDistance(const Locus& other) const;

  /** Total order: chromosome, start, end, strand. \returns -1, 0 or 1 */
  int compareTo(const Locus& other) const;
  /** Value equality on chromosome, interval and strand. */
  bool equals(const Locus& other) const;

  /** Combine with another locus into a composite locus (see locio::merge). */
  Locus merge(const Locus& other) const;

  /** 5' end, taking strand into account (unknown strand counts as '+'). */
  TCoord strandedStart() const;
  /** 3' end, taking strand into account (unknown strand counts as '+'). */
  TCoord strandedEnd() const;
  /** Position `dist` bp upstream (5') of the locus. */
  TCoord upstream(TCoord dist) const;
  /** Position `dist` bp downstream (3') of the locus. */
  TCoord downstream(TCoord dist) const;

  bool hasAttr(const std::string& key) const;
  /** Attribute value; throws NotFoundError for unknown keys. */
  const TAttrValue& getAttr(const std::string& key) const;
  /** Attribute value or a default. */
  TAttrValue getAttrOr(const std::string& key, const TAttrValue& dflt) const;
  void setAttr(const std::string& key, const TAttrValue& value);
  void setAttr(const std::string& key, const std::string& value);
  void setAttr(const std::string& key, const char* value);
  void setAttr(const std::string& key, int value);
  void setAttr(const std::string& key, long value);
  void setAttr(const std::string& key, double value);
  void setAttr(const std::string& key, bool value);

  /** Append a component locus. */
  void addSublocus(const Locus& locus);
  /** Find a (nested) sublocus by name; nullptr if there is none. */
  const Locus* findSublocus(const std::string& name) const;

  /** Compact representation, e.g. "chr8:100-150(+)". */
  std::string toString() const;

  bool operator== (const Locus& rhs) const { return equals(rhs); }
  bool operator!= (const Locus& rhs) const { return !equals(rhs); }
  bool operator< (const Locus& rhs) const { return compareTo(rhs) < 0; }

  template<class Archive>
  void serialize(Archive& ar, const unsigned int /* version */) {
    ar & id;
    ar & chromosome;
    ar & interval;
    ar & strand;
    ar & name;
    ar & kind;
    ar & source;
    ar & frame;
    ar & attrs;
    ar & sub_loci;
  }
};

/**
 * Merge loci into a composite locus.
 *
 * The result spans the bounding interval of all inputs and carries the
 * inputs as sub_loci; composite inputs contribute their own sub_loci
 * (flattened one level). The strand is the common strand of all inputs,
 * unknown otherwise.
 * Throws ValidationError for fewer than two inputs or mismatched chromosomes.
 */
Locus merge(const std::vector<Locus>& loci);

/** true if two strands may relate under the given options. */
bool strandsCompatible(Strand a, Strand b, const AlgebraOpts& opts);

/** Parse a region string "chr:start-end" (commas allowed in numbers). */
Locus parseRegion(const std::string& region);

/** Parse a position string "chr:pos". */
std::pair<std::string, TCoord> parsePosition(const std::string& position);

/** Print locus as tab-separated record (chromosome, start, end, strand, kind, name). */
std::ostream& operator<<(std::ostream& os, const Locus& locus);

} // namespace locio

BOOST_CLASS_VERSION(locio::Locus, 1)

#endif // LOCUS_H

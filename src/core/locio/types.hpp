#ifndef LOCIO_TYPES_H
#define LOCIO_TYPES_H

#include <boost/variant.hpp>
#include <limits>
#include <map>
#include <string>

namespace locio {

/** Represents genomic coordinates (0-based, signed to allow window arithmetic). */
typedef
long
TCoord;

/** Collection-scoped identifier assigned to a Locus by RefLoci. */
typedef
unsigned long
TLocusId;

/** Sentinel distance between loci that have no meaningful distance
 *  (e.g. loci on different chromosomes).
 */
const TCoord DIST_INF = std::numeric_limits<TCoord>::max();

/** Returns true if a distance is the DIST_INF sentinel. */
inline bool isInfinite (TCoord dist) {
  return dist == DIST_INF;
}

/** Strand of a genomic feature. */
enum Strand {
  STRAND_PLUS,
  STRAND_MINUS,
  STRAND_UNKNOWN
};

/** Kind of genomic feature a Locus represents. */
enum FeatureKind {
  FEAT_LOCUS,
  FEAT_GENE,
  FEAT_TRANSCRIPT,
  FEAT_EXON,
  FEAT_CDS,
  FEAT_SNP,
  FEAT_REGION,
  FEAT_OTHER
};

/** Direction of a positional proximity query. */
enum Direction {
  UPSTREAM,   // towards lower coordinates
  DOWNSTREAM  // towards higher coordinates
};

/** Value of a Locus attribute (bool, integer, real or string). */
typedef
boost::variant<
  bool,
  long,
  double,
  std::string
>
TAttrValue;

/** Locus attributes, ordered by key. */
typedef
std::map<
  std::string,
  TAttrValue
>
TAttrMap;

/** Strand symbol ('+', '-', '.'). */
char strandToChar (Strand strand);
/** Parse strand symbol; anything but '+' and '-' is unknown. */
Strand charToStrand (char c);

/** Canonical name of a feature kind (e.g. "gene", "SNP"). */
std::string featureKindToString (FeatureKind kind);
/** Parse feature kind name (case-insensitive); unknown names map to FEAT_OTHER. */
FeatureKind stringToFeatureKind (const std::string& name);

/** Render an attribute value as text. */
std::string attrValueToString (const TAttrValue& value);

} // namespace locio

#endif // LOCIO_TYPES_H

#include "Locus.hpp"
#include "exceptions.hpp"
#include "../stringio.hpp"
#include <algorithm>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <ostream>
#include <sstream>

using namespace std;
using boost::format;

namespace locio {

Locus::Locus()
: strand(STRAND_UNKNOWN),
  kind(FEAT_LOCUS),
  source("locistore")
{}

Locus::Locus(const string& chr, TCoord start, TCoord end, Strand s)
: chromosome(chr),
  interval(start, end),
  strand(s),
  kind(FEAT_LOCUS),
  source("locistore")
{
  if (chromosome.empty()) {
    throw ValidationError("Locus requires a non-empty chromosome.");
  }
}

Locus::Locus(const string& chr, const Interval& iv, Strand s)
: chromosome(chr),
  interval(iv),
  strand(s),
  kind(FEAT_LOCUS),
  source("locistore")
{
  if (chromosome.empty()) {
    throw ValidationError("Locus requires a non-empty chromosome.");
  }
}

double Locus::center() const {
  return start() + length() / 2.0;
}

bool strandsCompatible(Strand a, Strand b, const AlgebraOpts& opts) {
  if (!opts.strand_specific) {
    return true;
  }
  if (a == STRAND_UNKNOWN || b == STRAND_UNKNOWN) {
    return true;
  }
  return a == b;
}

bool Locus::overlaps(const Locus& other, const AlgebraOpts& opts) const {
  if (chromosome != other.chromosome) {
    return false;
  }
  if (!strandsCompatible(strand, other.strand, opts)) {
    return false;
  }
  return interval.overlaps(other.interval);
}

bool Locus::contains(const Locus& other, const AlgebraOpts& opts) const {
  if (chromosome != other.chromosome) {
    return false;
  }
  if (!strandsCompatible(strand, other.strand, opts)) {
    return false;
  }
  return interval.contains(other.interval);
}

TCoord Locus::distance(const Locus& other) const {
  if (chromosome != other.chromosome) {
    return DIST_INF;
  }
  return interval.distance(other.interval);
}

TCoord Locus::centerDistance(const Locus& other) const {
  if (chromosome != other.chromosome) {
    return DIST_INF;
  }
  return static_cast<TCoord>(floor(fabs(center() - other.center())));
}

int Locus::compareTo(const Locus& other) const {
  int cmp_chr = chromosome.compare(other.chromosome);
  if (cmp_chr != 0) {
    return cmp_chr < 0 ? -1 : 1;
  }
  int cmp_iv = interval.compare(other.interval);
  if (cmp_iv != 0) {
    return cmp_iv;
  }
  if (strand != other.strand) {
    return strand < other.strand ? -1 : 1;
  }
  return 0;
}

bool Locus::equals(const Locus& other) const {
  return compareTo(other) == 0;
}

Locus Locus::merge(const Locus& other) const {
  vector<Locus> pair_loci;
  pair_loci.push_back(*this);
  pair_loci.push_back(other);
  return locio::merge(pair_loci);
}

TCoord Locus::strandedStart() const {
  return strand == STRAND_MINUS ? end() : start();
}

TCoord Locus::strandedEnd() const {
  return strand == STRAND_MINUS ? start() : end();
}

TCoord Locus::upstream(TCoord dist) const {
  if (strand == STRAND_MINUS) {
    return end() + dist;
  }
  return max(TCoord(0), start() - dist);
}

TCoord Locus::downstream(TCoord dist) const {
  if (strand == STRAND_MINUS) {
    return max(TCoord(0), start() - dist);
  }
  return end() + dist;
}

bool Locus::hasAttr(const string& key) const {
  return attrs.find(key) != attrs.end();
}

const TAttrValue& Locus::getAttr(const string& key) const {
  TAttrMap::const_iterator it = attrs.find(key);
  if (it == attrs.end()) {
    throw NotFoundError(str(format("Attribute '%s' not set for locus %s.") % key % toString()));
  }
  return it->second;
}

TAttrValue Locus::getAttrOr(const string& key, const TAttrValue& dflt) const {
  TAttrMap::const_iterator it = attrs.find(key);
  return it == attrs.end() ? dflt : it->second;
}

void Locus::setAttr(const string& key, const TAttrValue& value) {
  attrs[key] = value;
}
void Locus::setAttr(const string& key, const string& value) {
  attrs[key] = TAttrValue(value);
}
void Locus::setAttr(const string& key, const char* value) {
  attrs[key] = TAttrValue(string(value));
}
void Locus::setAttr(const string& key, int value) {
  attrs[key] = TAttrValue(static_cast<long>(value));
}
void Locus::setAttr(const string& key, long value) {
  attrs[key] = TAttrValue(value);
}
void Locus::setAttr(const string& key, double value) {
  attrs[key] = TAttrValue(value);
}
void Locus::setAttr(const string& key, bool value) {
  attrs[key] = TAttrValue(value);
}

void Locus::addSublocus(const Locus& locus) {
  sub_loci.push_back(locus);
}

const Locus* Locus::findSublocus(const string& sub_name) const {
  for (const Locus& sub : sub_loci) {
    if (sub.name && *sub.name == sub_name) {
      return &sub;
    }
    const Locus* nested = sub.findSublocus(sub_name);
    if (nested != nullptr) {
      return nested;
    }
  }
  return nullptr;
}

string Locus::toString() const {
  string s = str(format("%s:%ld-%ld(%c)") % chromosome % start() % end() % strandToChar(strand));
  if (name) {
    s += " " + *name;
  }
  return s;
}

Locus merge(const vector<Locus>& loci) {
  if (loci.size() < 2) {
    throw ValidationError(str(format("Merging requires at least two loci (got %d).") % loci.size()));
  }
  const Locus& first = loci[0];
  Interval span = first.interval;
  Strand strand = first.strand;
  for (const Locus& l : loci) {
    if (l.chromosome != first.chromosome) {
      throw ValidationError(str(format("Cannot merge loci on different chromosomes ('%s' vs. '%s').")
                                % first.chromosome % l.chromosome));
    }
    span = span.hull(l.interval);
    if (l.strand != strand) {
      strand = STRAND_UNKNOWN;
    }
  }

  Locus merged(first.chromosome, span, strand);
  for (const Locus& l : loci) {
    if (l.isComposite()) {
      merged.sub_loci.insert(merged.sub_loci.end(), l.sub_loci.begin(), l.sub_loci.end());
    } else {
      merged.sub_loci.push_back(l);
    }
  }
  return merged;
}

namespace {

TCoord parseCoord(const string& field, const string& input) {
  string digits(field);
  digits.erase(remove(digits.begin(), digits.end(), ','), digits.end());
  try {
    return boost::lexical_cast<TCoord>(digits);
  } catch (const boost::bad_lexical_cast&) {
    throw ValidationError(str(format("Invalid coordinate '%s' in '%s'.") % field % input));
  }
}

} // namespace

Locus parseRegion(const string& region) {
  size_t pos_colon = region.rfind(':');
  if (pos_colon == string::npos || pos_colon == 0) {
    throw ValidationError(str(format("Malformed region '%s' (expected chr:start-end).") % region));
  }
  string chr = region.substr(0, pos_colon);
  vector<string> coords = stringio::split(region.substr(pos_colon+1), '-');
  if (coords.size() != 2) {
    throw ValidationError(str(format("Malformed region '%s' (expected chr:start-end).") % region));
  }
  return Locus(chr, parseCoord(coords[0], region), parseCoord(coords[1], region));
}

pair<string, TCoord> parsePosition(const string& position) {
  size_t pos_colon = position.rfind(':');
  if (pos_colon == string::npos || pos_colon == 0) {
    throw ValidationError(str(format("Malformed position '%s' (expected chr:pos).") % position));
  }
  return make_pair(position.substr(0, pos_colon), parseCoord(position.substr(pos_colon+1), position));
}

ostream& operator<<(ostream& os, const Locus& locus) {
  os << locus.chromosome << "\t" << locus.start() << "\t" << locus.end()
     << "\t" << strandToChar(locus.strand)
     << "\t" << featureKindToString(locus.kind)
     << "\t" << (locus.name ? *locus.name : ".");
  return os;
}

} // namespace locio

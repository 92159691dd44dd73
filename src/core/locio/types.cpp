#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

using namespace std;

namespace locio {

char strandToChar (Strand strand) {
  switch (strand) {
    case STRAND_PLUS:  return '+';
    case STRAND_MINUS: return '-';
    default:           return '.';
  }
}

Strand charToStrand (char c) {
  switch (c) {
    case '+': return STRAND_PLUS;
    case '-': return STRAND_MINUS;
  }
  return STRAND_UNKNOWN;
}

string featureKindToString (FeatureKind kind) {
  switch (kind) {
    case FEAT_LOCUS:      return "locus";
    case FEAT_GENE:       return "gene";
    case FEAT_TRANSCRIPT: return "transcript";
    case FEAT_EXON:       return "exon";
    case FEAT_CDS:        return "CDS";
    case FEAT_SNP:        return "SNP";
    case FEAT_REGION:     return "region";
    default:              return "other";
  }
}

FeatureKind stringToFeatureKind (const string& name) {
  string s(name);
  transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "locus") return FEAT_LOCUS;
  if (s == "gene") return FEAT_GENE;
  if (s == "transcript" || s == "mrna") return FEAT_TRANSCRIPT;
  if (s == "exon") return FEAT_EXON;
  if (s == "cds") return FEAT_CDS;
  if (s == "snp" || s == "snv") return FEAT_SNP;
  if (s == "region") return FEAT_REGION;
  return FEAT_OTHER;
}

namespace {

/** Formats attribute values; bools print as true/false. */
struct AttrPrinter : public boost::static_visitor<string>
{
  string operator()(bool b) const { return b ? "true" : "false"; }
  string operator()(long i) const { return to_string(i); }
  string operator()(double d) const {
    ostringstream ss;
    ss << d;
    return ss.str();
  }
  string operator()(const string& s) const { return s; }
};

} // namespace

string attrValueToString (const TAttrValue& value) {
  return boost::apply_visitor(AttrPrinter(), value);
}

} // namespace locio

#ifndef TERM_H
#define TERM_H

#include "../locio.hpp"
#include "../storage/BlobStore.hpp"
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/version.hpp>
#include <string>
#include <vector>

namespace refloci {

/**
 * A named set of loci that are related outside the context of the whole
 * genome (e.g. genes sharing a biological function).
 *
 * Unlike RefLoci, a Term holds plain values without ids and no index;
 * it is expected to be small. Loci are kept unique by value equality.
 */
struct Term
{
  std::string name;
  std::string desc;
  std::vector<locio::Locus> loci;
  locio::TAttrMap attrs;

  Term() {}
  explicit Term(const std::string& name, const std::string& desc = "");

  size_t size() const { return loci.size(); }
  /** Add locus unless an equal one is present. \returns true if added */
  bool addLocus(const locio::Locus& locus);

  /** Term loci at most max_distance bp away from locus. */
  std::vector<locio::Locus> nearbyLoci(const locio::Locus& locus, locio::TCoord max_distance) const;

  /**
   * Collapse loci that are at most max_distance bp apart into 'effective'
   * loci. Loci are processed in sorted order; each group of two or more
   * becomes a composite locus (see locio::merge) whose sub_loci are the
   * members of the group:
   *
   *        Locus1         Locus2
   * -------========-------=========--------
   *       50     100     150     200       (max_distance=100)
   *
   *        Locus3
   * -------========================--------
   *        ========       =========  sub_loci
   */
  std::vector<locio::Locus> effectiveLoci(locio::TCoord max_distance) const;

  /** Persist term; StateError if it exists and overwrite is false. */
  void freeze(storage::BlobStore& store, bool overwrite = false) const;
  /** NotFoundError if absent, StorageError if unreadable. */
  static Term load(const storage::BlobStore& store, const std::string& name);
  static std::vector<std::string> listNames(const storage::BlobStore& store);
  /** NotFoundError if absent. */
  static void drop(storage::BlobStore& store, const std::string& name);

  template<class Archive>
  void serialize(Archive& ar, const unsigned int /* version */) {
    ar & name;
    ar & desc;
    ar & loci;
    ar & attrs;
  }
};

} // namespace refloci

BOOST_CLASS_VERSION(refloci::Term, 1)

#endif // TERM_H

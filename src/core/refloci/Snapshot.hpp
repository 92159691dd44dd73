#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include "../locio/Locus.hpp"
#include "../locio/exceptions.hpp"
#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/format.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/version.hpp>
#include <map>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

namespace refloci {

/** Blob name prefix of frozen RefLoci. */
const std::string PFX_REFLOCI = "refloci.";
/** Blob name prefix of frozen Terms. */
const std::string PFX_TERM = "term.";

/** Persisted state of a frozen RefLoci. */
struct LociSnapshot
{
  std::string name;
  /** next id to be assigned (greater than all ids in loci) */
  locio::TLocusId next_id;
  std::map<locio::TLocusId, locio::Locus> loci;
  /** alternative locus names (since version 2) */
  std::map<std::string, locio::TLocusId> aliases;

  LociSnapshot() : next_id(0) {}

  template<class Archive>
  void serialize(Archive& ar, const unsigned int version) {
    ar & name;
    ar & next_id;
    ar & loci;
    if (version >= 2) {
      ar & aliases;
    }
  }
};

/** Serialize object into a binary blob. */
template<typename T>
std::string toBlob(const T& obj) {
  std::ostringstream oss(std::ios::out | std::ios::binary);
  {
    boost::archive::binary_oarchive oa(oss);
    oa << obj;
  }
  return oss.str();
}

/**
 * Restore object from a binary blob.
 * Undecodable blobs raise locio::StorageError naming the blob.
 */
template<typename T>
void fromBlob(const std::string& blob, const std::string& blob_name, T& obj) {
  std::istringstream iss(blob, std::ios::in | std::ios::binary);
  try {
    boost::archive::binary_iarchive ia(iss);
    ia >> obj;
  } catch (const boost::archive::archive_exception& e) {
    throw locio::StorageError(boost::str(boost::format("Corrupt blob '%s': %s") % blob_name % e.what()));
  } catch (const locio::ValidationError& e) {
    throw locio::StorageError(boost::str(boost::format("Corrupt blob '%s': %s") % blob_name % e.what()));
  } catch (const std::length_error& e) {
    throw locio::StorageError(boost::str(boost::format("Corrupt blob '%s': %s") % blob_name % e.what()));
  } catch (const std::bad_alloc& e) {
    throw locio::StorageError(boost::str(boost::format("Corrupt blob '%s': %s") % blob_name % e.what()));
  }
}

} // namespace refloci

BOOST_CLASS_VERSION(refloci::LociSnapshot, 2)

#endif // SNAPSHOT_H

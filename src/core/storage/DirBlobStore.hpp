#ifndef DIRBLOBSTORE_H
#define DIRBLOBSTORE_H

#include "BlobStore.hpp"
#include <boost/filesystem/path.hpp>

namespace storage {

/**
 * Stores each blob as file "<dir>/<name>.blob".
 *
 * put() writes a uniquely named temporary file in the same directory and
 * renames it over the target, so concurrent readers never observe a
 * partially written blob. Filesystem errors surface as locio::StorageError.
 */
class DirBlobStore : public BlobStore
{
public:
  /** Open store in directory, creating it if necessary. */
  explicit DirBlobStore(const boost::filesystem::path& dir);

  void put(const std::string& name, const std::string& data) override;
  std::string get(const std::string& name) const override;
  bool exists(const std::string& name) const override;
  std::vector<std::string> list() const override;
  bool remove(const std::string& name) override;

  const boost::filesystem::path& dir() const { return m_dir; }

private:
  boost::filesystem::path m_dir;

  boost::filesystem::path blobPath(const std::string& name) const;
  /** Existence check; access errors other than 'not found' raise StorageError. */
  bool isBlobFile(const boost::filesystem::path& fn_blob) const;
};

} // namespace storage

#endif // DIRBLOBSTORE_H

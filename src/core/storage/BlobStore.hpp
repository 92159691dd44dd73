#ifndef BLOBSTORE_H
#define BLOBSTORE_H

#include <string>
#include <vector>

namespace storage {

/**
 * Durable storage of named opaque blobs.
 *
 * Implementations must make put() atomic: a reader sees either the previous
 * blob or the complete new one. Names are plain identifiers (no path
 * separators, no leading '.'); invalid names raise locio::ValidationError.
 */
class BlobStore
{
public:
  virtual ~BlobStore() {}

  /** Store blob under name, replacing any existing blob. */
  virtual void put(const std::string& name, const std::string& data) = 0;
  /** Retrieve blob; throws locio::NotFoundError if absent. */
  virtual std::string get(const std::string& name) const = 0;
  virtual bool exists(const std::string& name) const = 0;
  /** Names of all stored blobs (sorted). */
  virtual std::vector<std::string> list() const = 0;
  /** Delete blob. \returns false if there was none. */
  virtual bool remove(const std::string& name) = 0;
};

/** Throws locio::ValidationError unless name is usable as a blob name. */
void checkBlobName(const std::string& name);

} // namespace storage

#endif // BLOBSTORE_H

#ifndef MEMBLOBSTORE_H
#define MEMBLOBSTORE_H

#include "BlobStore.hpp"
#include <map>

namespace storage {

/** Keeps blobs in memory. Not synchronized; one writer at a time. */
class MemBlobStore : public BlobStore
{
public:
  void put(const std::string& name, const std::string& data) override;
  std::string get(const std::string& name) const override;
  bool exists(const std::string& name) const override;
  std::vector<std::string> list() const override;
  bool remove(const std::string& name) override;

private:
  std::map<std::string, std::string> m_blobs;
};

} // namespace storage

#endif // MEMBLOBSTORE_H

#include "MemBlobStore.hpp"
#include "../locio/exceptions.hpp"
#include <boost/format.hpp>

using namespace std;
using boost::format;

namespace storage {

void MemBlobStore::put(const string& name, const string& data) {
  checkBlobName(name);
  m_blobs[name] = data;
}

string MemBlobStore::get(const string& name) const {
  checkBlobName(name);
  auto it = m_blobs.find(name);
  if (it == m_blobs.end()) {
    throw locio::NotFoundError(str(format("No blob named '%s'.") % name));
  }
  return it->second;
}

bool MemBlobStore::exists(const string& name) const {
  checkBlobName(name);
  return m_blobs.count(name) > 0;
}

vector<string> MemBlobStore::list() const {
  vector<string> names;
  for (const auto& kv : m_blobs) {
    names.push_back(kv.first);
  }
  return names;
}

bool MemBlobStore::remove(const string& name) {
  checkBlobName(name);
  return m_blobs.erase(name) > 0;
}

} // namespace storage

#include "BlobStore.hpp"
#include "../locio/exceptions.hpp"
#include <boost/format.hpp>

using namespace std;
using boost::format;

namespace storage {

void checkBlobName(const string& name) {
  if (name.empty()) {
    throw locio::ValidationError("Blob name must not be empty.");
  }
  if (name[0] == '.') {
    throw locio::ValidationError(str(format("Invalid blob name '%s' (must not start with '.').") % name));
  }
  if (name.find_first_of("/\\") != string::npos) {
    throw locio::ValidationError(str(format("Invalid blob name '%s' (must not contain path separators).") % name));
  }
}

} // namespace storage

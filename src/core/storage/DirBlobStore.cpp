#include "DirBlobStore.hpp"
#include "../locio/exceptions.hpp"
#include <algorithm>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <sstream>
#include <unistd.h>

using namespace std;
using boost::format;
namespace fs = boost::filesystem;

namespace storage {

namespace {

const string BLOB_EXT = ".blob";

/** Flush file (or directory) contents to disk. \returns 0 on success, errno otherwise */
int syncPath(const fs::path& p) {
  int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) {
    return errno;
  }
  int err = 0;
  if (::fsync(fd) != 0) {
    err = errno;
  }
  ::close(fd);
  return err;
}

}

DirBlobStore::DirBlobStore(const fs::path& dir)
: m_dir(dir)
{
  try {
    if (!fs::exists(m_dir)) {
      fs::create_directories(m_dir);
    } else if (!fs::is_directory(m_dir)) {
      throw locio::StorageError(str(format("'%s' exists but is not a directory.") % m_dir.string()));
    }
  } catch (const fs::filesystem_error& e) {
    throw locio::StorageError(str(format("Cannot open store '%s': %s") % m_dir.string() % e.what()));
  }
}

fs::path DirBlobStore::blobPath(const string& name) const {
  checkBlobName(name);
  return m_dir / (name + BLOB_EXT);
}

void DirBlobStore::put(const string& name, const string& data) {
  fs::path fn_blob = blobPath(name);
  // temp files start with '.' and are never listed
  boost::uuids::uuid tmp_id = boost::uuids::random_generator()();
  fs::path fn_tmp = m_dir / ("." + name + "." + boost::uuids::to_string(tmp_id) + ".tmp");

  fs::ofstream ofs(fn_tmp, ios::out | ios::binary | ios::trunc);
  if (!ofs) {
    throw locio::StorageError(str(format("Cannot write file '%s'.") % fn_tmp.string()));
  }
  ofs.write(data.data(), data.size());
  ofs.close();
  if (ofs.fail()) {
    boost::system::error_code ec;
    fs::remove(fn_tmp, ec);
    throw locio::StorageError(str(format("Writing blob '%s' failed.") % name));
  }
  // contents must be on disk before the rename makes them visible
  int err = syncPath(fn_tmp);
  if (err != 0) {
    boost::system::error_code ec;
    fs::remove(fn_tmp, ec);
    throw locio::StorageError(str(format("Cannot sync blob '%s': %s") % name % strerror(err)));
  }

  try {
    fs::rename(fn_tmp, fn_blob);
  } catch (const fs::filesystem_error& e) {
    boost::system::error_code ec;
    fs::remove(fn_tmp, ec);
    throw locio::StorageError(str(format("Cannot commit blob '%s': %s") % name % e.what()));
  }
  // persist the directory entry; the blob is committed either way
  err = syncPath(m_dir);
  if (err != 0) {
    fprintf(stderr, "[WARN] DirBlobStore: cannot sync '%s' after committing '%s': %s\n",
            m_dir.c_str(), name.c_str(), strerror(err));
  }
}

bool DirBlobStore::isBlobFile(const fs::path& fn_blob) const {
  boost::system::error_code ec;
  bool is_found = fs::exists(fn_blob, ec);
  if (ec) {
    throw locio::StorageError(str(format("Cannot access '%s': %s") % fn_blob.string() % ec.message()));
  }
  return is_found;
}

string DirBlobStore::get(const string& name) const {
  fs::path fn_blob = blobPath(name);
  if (!isBlobFile(fn_blob)) {
    throw locio::NotFoundError(str(format("No blob named '%s' in '%s'.") % name % m_dir.string()));
  }
  fs::ifstream ifs(fn_blob, ios::in | ios::binary);
  if (!ifs) {
    throw locio::StorageError(str(format("Cannot read file '%s'.") % fn_blob.string()));
  }
  ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    throw locio::StorageError(str(format("Reading blob '%s' failed.") % name));
  }
  return ss.str();
}

bool DirBlobStore::exists(const string& name) const {
  return isBlobFile(blobPath(name));
}

vector<string> DirBlobStore::list() const {
  vector<string> names;
  try {
    for (fs::directory_iterator it(m_dir), end; it != end; ++it) {
      const fs::path& p = it->path();
      string fn = p.filename().string();
      if (fn[0] == '.' || p.extension() != BLOB_EXT || !fs::is_regular_file(p)) {
        continue;
      }
      names.push_back(p.stem().string());
    }
  } catch (const fs::filesystem_error& e) {
    throw locio::StorageError(str(format("Cannot list store '%s': %s") % m_dir.string() % e.what()));
  }
  sort(names.begin(), names.end());
  return names;
}

bool DirBlobStore::remove(const string& name) {
  fs::path fn_blob = blobPath(name);
  try {
    return fs::remove(fn_blob);
  } catch (const fs::filesystem_error& e) {
    throw locio::StorageError(str(format("Cannot remove blob '%s': %s") % name % e.what()));
  }
}

} // namespace storage

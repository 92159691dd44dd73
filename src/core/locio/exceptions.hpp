#ifndef LOCIO_EXCEPTIONS_H
#define LOCIO_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace locio {

/** Base class of all errors raised by the locus library. */
class LocusError : public std::runtime_error
{
public:
  explicit LocusError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Malformed input: bad interval bounds, empty chromosome, chromosome mismatch in merge. */
class ValidationError : public LocusError
{
public:
  explicit ValidationError(const std::string& msg) : LocusError(msg) {}
};

/** Operation not allowed in the current state of a collection. */
class StateError : public LocusError
{
public:
  explicit StateError(const std::string& msg) : LocusError(msg) {}
};

/** Requested snapshot, locus or attribute does not exist. */
class NotFoundError : public LocusError
{
public:
  explicit NotFoundError(const std::string& msg) : LocusError(msg) {}
};

/** Failure reported by the durable storage layer (I/O fault, corrupt blob). */
class StorageError : public LocusError
{
public:
  explicit StorageError(const std::string& msg) : LocusError(msg) {}
};

} // namespace locio

#endif // LOCIO_EXCEPTIONS_H

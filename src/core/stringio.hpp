#ifndef STRINGIO_H
#define STRINGIO_H

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace stringio {

/** String formatting. */
template<typename ... Args>
std::string format(const std::string& format, Args ... args);
/** Splits a string by a delimiter into an existing vector */
std::vector<std::string> &split(const std::string&, char, std::vector<std::string>&);
/** Splits a string by a delimiter into a new vector */
std::vector<std::string> split(const std::string&, char);
/** Concatenates strings, separated by a delimiter */
std::string join(const std::vector<std::string>&, const std::string& sep);
/** Parses a real number (also in scientific format, e.g. "1e-3"). Throws std::invalid_argument. */
double strToDub(const std::string&);

/* Templated function definitions. */

template<typename ... Args>
std::string format( const std::string& format, Args ... args )
{
  size_t size = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
  std::unique_ptr<char[]> buf( new char[ size ] );
  std::snprintf( buf.get(), size, format.c_str(), args ... );
  return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

} /* namespace stringio */

#endif /*STRINGIO_H */

#ifndef INTERVAL_H
#define INTERVAL_H

#include "types.hpp"
#include <boost/optional.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/split_member.hpp>
#include <iosfwd>

namespace locio {

/**
 * Half-open coordinate range [start, end) on a single axis.
 *
 * Invariant: start <= end. Intervals sharing only a boundary point do not
 * overlap, and length is end - start. An Interval with start == end is
 * empty but well-formed.
 */
class Interval
{
public:
  /** default c'tor: empty interval [0,0) */
  Interval();
  /** Create interval [start, end); throws ValidationError if start > end. */
  Interval(TCoord start, TCoord end);

  TCoord start() const { return m_start; }
  TCoord end() const { return m_end; }
  TCoord length() const { return m_end - m_start; }
  bool isEmpty() const { return m_start == m_end; }

  /** true iff both intervals share at least one position. */
  bool overlaps(const Interval& other) const;
  /** true iff other lies completely within this interval. */
  bool contains(const Interval& other) const;
  /** Gap between the nearer edges; 0 for overlapping (or adjacent) intervals. */
  TCoord distance(const Interval& other) const;
  /** Order by start, then end. \returns -1, 0 or 1 */
  int compare(const Interval& other) const;

  /** Smallest interval covering both intervals. */
  Interval hull(const Interval& other) const;
  /** Shared part of both intervals, if they overlap. */
  boost::optional<Interval> intersect(const Interval& other) const;

  bool operator== (const Interval& rhs) const { return compare(rhs) == 0; }
  bool operator!= (const Interval& rhs) const { return compare(rhs) != 0; }
  bool operator< (const Interval& rhs) const { return compare(rhs) < 0; }

private:
  TCoord m_start;
  TCoord m_end;

  friend class boost::serialization::access;

  template<class Archive>
  void save(Archive& ar, const unsigned int /* version */) const {
    ar & m_start & m_end;
  }
  /** Bounds read from an archive are validated like constructor arguments. */
  template<class Archive>
  void load(Archive& ar, const unsigned int /* version */) {
    TCoord start, end;
    ar & start & end;
    *this = Interval(start, end);
  }
  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

/** Print interval as "[start,end)". */
std::ostream& operator<<(std::ostream& os, const Interval& iv);

} // namespace locio

#endif // INTERVAL_H

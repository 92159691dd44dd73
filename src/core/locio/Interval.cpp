#include "Interval.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <boost/format.hpp>
#include <ostream>

using namespace std;
using boost::format;

namespace locio {

Interval::Interval() : m_start(0), m_end(0) {}

Interval::Interval(TCoord start, TCoord end)
: m_start(start), m_end(end)
{
  if (start > end) {
    throw ValidationError(str(format("Malformed interval: start (%ld) > end (%ld).") % start % end));
  }
}

bool Interval::overlaps(const Interval& other) const {
  return m_start < other.m_end && other.m_start < m_end;
}

bool Interval::contains(const Interval& other) const {
  return m_start <= other.m_start && other.m_end <= m_end;
}

TCoord Interval::distance(const Interval& other) const {
  if (overlaps(other)) {
    return 0;
  }
  return max(m_start, other.m_start) - min(m_end, other.m_end);
}

int Interval::compare(const Interval& other) const {
  if (m_start != other.m_start) {
    return m_start < other.m_start ? -1 : 1;
  }
  if (m_end != other.m_end) {
    return m_end < other.m_end ? -1 : 1;
  }
  return 0;
}

Interval Interval::hull(const Interval& other) const {
  return Interval(min(m_start, other.m_start), max(m_end, other.m_end));
}

boost::optional<Interval> Interval::intersect(const Interval& other) const {
  if (!overlaps(other)) {
    return boost::none;
  }
  return Interval(max(m_start, other.m_start), min(m_end, other.m_end));
}

ostream& operator<<(ostream& os, const Interval& iv) {
  os << "[" << iv.start() << "," << iv.end() << ")";
  return os;
}

} // namespace locio

#include "stringio.hpp"
#include <sstream>
#include <stdexcept>

using namespace std;

namespace stringio {

vector<string> &split(const string &s, char delim, vector<string> &elems) {
  stringstream ss(s);
  string item;
  while (std::getline(ss, item, delim)) {
    elems.push_back(item);
  }
  return elems;
}

vector<string> split(const string &s, char delim) {
  vector<string> elems;
  split(s, delim, elems);
  return elems;
}

string join(const vector<string>& parts, const string& sep) {
  string res;
  for (size_t i=0; i<parts.size(); ++i) {
    if (i > 0) {
      res += sep;
    }
    res += parts[i];
  }
  return res;
}

double strToDub(const string& s) {
  size_t pos = 0;
  double val = stod(s, &pos);
  if (pos != s.size()) {
    throw invalid_argument("Trailing characters in number: '" + s + "'");
  }
  return val;
}

} /* namespace stringio */

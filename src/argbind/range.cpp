#include "./range.hpp"
#include "./exceptions.hpp"
#include "./util.hpp"

#include <algorithm>
#include <ostream>

#include <boost/lexical_cast.hpp>

namespace argbind {

constexpr int Range::unbounded;

Range::Range(int min, int max, bool variable, bool unspecified, string original)
  : min_(min), max_(max), variable_(variable), unspecified_(unspecified), original_(std::move(original))
{
  if (min < 0 || max < 0)
    throw InitializationException("Invalid negative range (min=" + std::to_string(min) + ", max=" +
                                  std::to_string(max) + ")");
  if (min > max)
    throw InitializationException("Invalid range (min=" + std::to_string(min) + ", max=" +
                                  std::to_string(max) + ")");
}

namespace {

int parse_bound(string const &s, int default_value, string_view original) {
  auto trimmed = trim_whitespace(s);
  if (trimmed.empty() || trimmed == "*")
    return default_value;
  try {
    return boost::lexical_cast<int>(trimmed);
  }
  catch (boost::bad_lexical_cast &) {
    throw InitializationException("Invalid range " + repr(original) + ": " + repr(trimmed) +
                                  " is not an integer");
  }
}

} // anon namespace

Range Range::value_of(string_view range_str) {
  string range = trim_whitespace(range_str);
  bool unspecified = range.empty() || starts_with(range, "..");
  int min = -1, max = -1;
  bool variable = false;
  auto dots = range.find("..");
  if (dots != string::npos) {
    min = parse_bound(range.substr(0, dots), 0, range_str);
    max = parse_bound(range.substr(dots + 2), unbounded, range_str);
    variable = max == unbounded;
  } else {
    max = parse_bound(range, unbounded, range_str);
    variable = max == unbounded;
    min = variable ? 0 : max;
  }
  return Range(min, max, variable, unspecified, range);
}

Range Range::parameter_capacity(Range const &arity, Range const &index) {
  if (arity.max() == 0)
    return arity;
  if (index.size() == 1)
    return arity;
  if (index.is_variable())
    return Range::value_of(std::to_string(arity.min()) + "..*");
  if (arity.size() == 1)
    return Range::value_of(std::to_string(arity.min() * index.size()));
  if (arity.is_variable())
    return Range::value_of(std::to_string(arity.min() * index.size()) + "..*");
  return Range::value_of(std::to_string(arity.min() * index.size()) + ".." +
                         std::to_string(arity.max() * index.size()));
}

int Range::size() const {
  if (variable_)
    return unbounded;
  return max_ - min_ + 1;
}

Range Range::with_min(int new_min) const {
  return Range(new_min, std::max(new_min, max_), variable_, unspecified_, original_);
}

Range Range::with_max(int new_max) const {
  return Range(std::min(min_, new_max), new_max, new_max == unbounded, unspecified_, original_);
}

Range Range::with_unspecified(bool unspecified) const {
  return Range(min_, max_, variable_, unspecified, original_);
}

string Range::to_string() const {
  if (min_ == max_)
    return std::to_string(min_);
  return std::to_string(min_) + ".." + (variable_ ? string("*") : std::to_string(max_));
}

std::ostream &operator<<(std::ostream &os, Range const &range) {
  return os << range.to_string();
}

} // namespace argbind

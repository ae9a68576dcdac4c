#ifndef HEADER_GUARD_cb92db54222c204c2f4deba020f21cf0
#define HEADER_GUARD_cb92db54222c204c2f4deba020f21cf0

#include "./fwd.hpp"

#include <cstring>
#include <regex>
#include <sstream>
#include <utility>

namespace argbind {

/**
 * Generic utilities shared by the implementation files
 **/
inline namespace util {

template <class Assoc, class Key>
auto find_ptr(Assoc const &assoc, Key const &key) {
  auto it = assoc.find(key);
  if (it != assoc.end())
    return &it->second;
  return decltype(&it->second)(nullptr);
}

inline bool starts_with(string_view s, string_view prefix) {
  return s.size() >= prefix.size() && std::memcmp(s.data(), prefix.data(), prefix.size()) == 0;
}

inline bool ends_with(string_view s, string_view suffix) {
  return s.size() >= suffix.size() &&
         std::memcmp(s.data() + (s.size() - suffix.size()), suffix.data(), suffix.size()) == 0;
}

struct always_true_pred {
  template <class... T>
  bool operator()(T &&...) {
    return true;
  }
};

struct identity {
  template <class T>
  T &&operator()(T &&x) { return std::forward<T>(x); }
};

template <class Range, class Transform = identity, class Predicate = always_true_pred>
void join(std::ostream &os, string_view sep, Range const &args, Transform &&t = {}, Predicate &&p = {}) {
  bool first = true;
  for (auto const &x : args) {
    if (!p(x))
      continue;
    if (!first)
      os << sep;
    first = false;
    os << t(x);
  }
}

template <class Range, class Transform = identity, class Predicate = always_true_pred>
string join(string_view sep, Range const &args, Transform &&t = {}, Predicate &&p = {}) {
  std::ostringstream ostr;
  join(ostr, sep, args, std::forward<Transform>(t), std::forward<Predicate>(p));
  return ostr.str();
}

/**
 * Formats a list of strings as "[a, b, c]".
 **/
string list_string(vector<string> const &values);

// ASCII only; non-ASCII bytes are passed through unchanged.
string ascii_to_lower(string_view s);

bool equals_ignore_case(string_view a, string_view b);

/**
 * Removes leading and trailing whitespace.
 **/
string trim_whitespace(string_view s);

/**
 * \brief Splits \p value around matches of \p re.
 *
 * A positive \p limit caps the number of pieces, the last one holding the unsplit remainder.  With a
 * limit of zero trailing empty pieces are removed.  A zero-width match at the start of a non-empty
 * input never produces a leading empty piece.
 **/
vector<string> split_regex(string const &value, std::regex const &re, int limit);

} // namespace argbind::util

} // namespace argbind

#endif /* HEADER GUARD */

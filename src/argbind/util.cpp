#include "./util.hpp"
#include <cctype>

namespace argbind {

string repr(string_view s) {
  string x;
  x += '\'';
  x += string(s);
  x += '\'';
  return x;
}

inline namespace util {

string list_string(vector<string> const &values) {
  return "[" + join(", ", values) + "]";
}

string ascii_to_lower(string_view s) {
  string result;
  result.reserve(s.size());
  for (auto x : s)
    result.push_back((char)std::tolower((unsigned char)x));
  return result;
}

bool equals_ignore_case(string_view a, string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
      return false;
  }
  return true;
}

string trim_whitespace(string_view s) {
  size_t begin = 0, end = s.size();
  while (begin < end && std::isspace((unsigned char)s[begin]))
    ++begin;
  while (end > begin && std::isspace((unsigned char)s[end - 1]))
    --end;
  return string(s.substr(begin, end - begin));
}

vector<string> split_regex(string const &value, std::regex const &re, int limit) {
  vector<string> result;
  if (value.empty()) {
    result.emplace_back();
    return result;
  }

  size_t start = 0;
  auto begin = std::sregex_iterator(value.begin(), value.end(), re);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    if (limit > 0 && (int)result.size() == limit - 1)
      break;
    auto const &m = *it;
    size_t match_pos = (size_t)m.position(0);
    size_t match_len = (size_t)m.length(0);
    if (match_len == 0 && match_pos == 0)
      continue;
    if (match_len == 0 && match_pos >= value.size())
      break;
    result.push_back(value.substr(start, match_pos - start));
    start = match_pos + match_len;
  }
  result.push_back(value.substr(start));

  if (limit == 0) {
    while (!result.empty() && result.back().empty())
      result.pop_back();
  }
  return result;
}

} // namespace argbind::util

} // namespace argbind

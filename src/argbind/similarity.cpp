#include "./similarity.hpp"
#include "./util.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace argbind {

namespace {

using BigramCounts = std::map<string, int>;

BigramCounts bigrams(string_view s) {
  BigramCounts result;
  for (size_t i = 0; i + 1 < s.size(); ++i)
    ++result[string(s.substr(i, 2))];
  return result;
}

double dot(BigramCounts const &a, BigramCounts const &b) {
  double result = 0;
  for (auto const &p : a) {
    if (auto count = find_ptr(b, p.first))
      result += double(p.second) * double(*count);
  }
  return result;
}

} // anon namespace

double bigram_similarity(string_view a, string_view b) {
  auto a_counts = bigrams(ascii_to_lower(a));
  auto b_counts = bigrams(ascii_to_lower(b));
  double norm = std::sqrt(dot(a_counts, a_counts) * dot(b_counts, b_counts));
  if (norm == 0)
    return 0;
  return dot(a_counts, b_counts) / norm;
}

vector<string> most_similar(string_view pattern, vector<string> const &candidates, double threshold) {
  vector<std::pair<double, string const *>> ranked;
  for (auto const &candidate : candidates) {
    double score = bigram_similarity(pattern, candidate);
    if (score > threshold)
      ranked.emplace_back(score, &candidate);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](auto const &a, auto const &b) { return a.first > b.first; });
  vector<string> result;
  for (auto const &p : ranked)
    result.push_back(*p.second);
  return result;
}

} // namespace argbind

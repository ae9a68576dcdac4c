#ifndef HEADER_GUARD_b1abcf6e26671fac454b0828e8497268
#define HEADER_GUARD_b1abcf6e26671fac454b0828e8497268

#include "./fwd.hpp"

namespace argbind {

/**
 * \brief Cosine similarity of the character bigram frequency vectors of \p a and \p b.
 *
 * The comparison is case-insensitive.  Returns 0 if either string has no bigrams.
 **/
double bigram_similarity(string_view a, string_view b);

/**
 * \brief Ranks \p candidates by similarity to \p pattern.
 *
 * Only candidates with a similarity strictly greater than \p threshold are returned, most similar first.
 * Candidates with equal similarity keep their relative order in \p candidates.
 **/
vector<string> most_similar(string_view pattern, vector<string> const &candidates, double threshold = 0);

} // namespace argbind

#endif /* HEADER GUARD */

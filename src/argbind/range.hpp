#ifndef HEADER_GUARD_5a03a6de55390d2f497d2d1a3108c83d
#define HEADER_GUARD_5a03a6de55390d2f497d2d1a3108c83d

#include "./fwd.hpp"

#include <iosfwd>
#include <limits>

namespace argbind {

/**
 * \brief Closed or unbounded integer interval.
 *
 * Used both for the arity of an argument (how many command line tokens it consumes) and for the index
 * of a positional parameter (which argument positions it claims).  An unbounded range has
 * \c max() equal to \ref unbounded and is marked \e variable.
 *
 * A range is immutable; \ref with_min and \ref with_max return modified copies.
 **/
class Range {
public:
  static constexpr int unbounded = std::numeric_limits<int>::max();

  /**
   * \throws InitializationException if \p min or \p max is negative or \p min exceeds \p max.
   **/
  Range(int min, int max, bool variable = false, bool unspecified = false, string original = {});

  /**
   * \brief Parses \c "N", \c "N..M", \c "N..*", \c "..M" or \c "*".
   *
   * Whitespace around the value is ignored.  An empty string yields an \e unspecified \c 0..* range.
   * \throws InitializationException if the string is not a valid range.
   **/
  static Range value_of(string_view range);

  /**
   * \brief Returns the total number of tokens a positional parameter with the given \p arity and
   * \p index may consume.
   **/
  static Range parameter_capacity(Range const &arity, Range const &index);

  int min() const { return min_; }
  int max() const { return max_; }
  bool is_variable() const { return variable_; }

  /**
   * \brief True if this range was not explicitly specified but derived from a default.
   **/
  bool is_unspecified() const { return unspecified_; }

  /**
   * \brief The string this range was parsed from, if any.
   **/
  string const &original_value() const { return original_; }

  /**
   * \brief Number of values in the range.
   **/
  int size() const;

  Range with_min(int new_min) const;
  Range with_max(int new_max) const;
  Range with_unspecified(bool unspecified) const;

  bool contains(int value) const { return min_ <= value && value <= max_; }

  string to_string() const;

  friend bool operator==(Range const &a, Range const &b) {
    return a.min_ == b.min_ && a.max_ == b.max_ && a.variable_ == b.variable_;
  }
  friend bool operator!=(Range const &a, Range const &b) { return !(a == b); }

  /**
   * Orders by minimum, then maximum.
   **/
  friend bool operator<(Range const &a, Range const &b) {
    return a.min_ != b.min_ ? a.min_ < b.min_ : a.max_ < b.max_;
  }

private:
  int min_;
  int max_;
  bool variable_;
  bool unspecified_;
  string original_;
};

std::ostream &operator<<(std::ostream &os, Range const &range);

} // namespace argbind

#endif /* HEADER GUARD */

#ifndef HEADER_GUARD_aa8bb283110269705e65904ef33c61b8
#define HEADER_GUARD_aa8bb283110269705e65904ef33c61b8

#include "./fwd.hpp"

#include <iosfwd>

namespace argbind {

/**
 * \brief Parser settings of a single command.
 *
 * Each \ref CommandSpec owns one.  Use \ref CommandSpec::configure_parser to apply a change to a command
 * and all of its subcommands; a subcommand attached later keeps its own settings.
 *
 * Setters return \c *this so they can be chained.
 **/
class ParserConfig {
public:
  static constexpr char const *default_separator = "=";

  /**
   * \brief String separating an option name from an attached value, \c "=" by default.
   **/
  string separator() const { return separator_ ? *separator_ : string(default_separator); }
  ParserConfig &separator(string value);

  /**
   * \brief True if the separator was set explicitly.
   **/
  bool has_explicit_separator() const { return bool(separator_); }

  /**
   * \brief Argument after which all arguments are positional, \c "--" by default.
   **/
  string const &end_of_options_delimiter() const { return end_of_options_delimiter_; }
  ParserConfig &end_of_options_delimiter(string value);

  /**
   * \brief Whether short options may be clustered, as in \c -xvfFILE.  On by default.
   **/
  bool posix_clustered_short_options_allowed() const { return posix_clustered_short_options_allowed_; }
  ParserConfig &posix_clustered_short_options_allowed(bool value);

  bool overwritten_options_allowed() const { return overwritten_options_allowed_; }
  ParserConfig &overwritten_options_allowed(bool value);

  bool unmatched_arguments_allowed() const { return unmatched_arguments_allowed_; }
  ParserConfig &unmatched_arguments_allowed(bool value);

  /**
   * \brief Stop interpreting arguments at the first unmatched one.
   *
   * Enabling this also enables \ref unmatched_arguments_allowed.
   **/
  bool stop_at_unmatched() const { return stop_at_unmatched_; }
  ParserConfig &stop_at_unmatched(bool value);

  /**
   * \brief Treat all arguments after the first positional parameter as positional.
   **/
  bool stop_at_positional() const { return stop_at_positional_; }
  ParserConfig &stop_at_positional(bool value);

  bool unmatched_options_are_positional() const { return unmatched_options_are_positional_; }
  ParserConfig &unmatched_options_are_positional(bool value);

  /**
   * \brief Whether a boolean flag specified again flips its current value.  On by default; when off,
   * a flag is always set to true.
   **/
  bool toggle_boolean_flags() const { return toggle_boolean_flags_; }
  ParserConfig &toggle_boolean_flags(bool value);

  bool case_insensitive_enum_values_allowed() const { return case_insensitive_enum_values_allowed_; }
  ParserConfig &case_insensitive_enum_values_allowed(bool value);

  /**
   * \brief Limit the number of values a split regex may produce to the remaining arity.
   **/
  bool limit_split() const { return limit_split_; }
  ParserConfig &limit_split(bool value);

  /**
   * \brief An option with a value attached (\c -oVALUE, \c -o=VALUE) consumes no further arguments.
   **/
  bool arity_satisfied_by_attached_option_param() const { return arity_satisfied_by_attached_option_param_; }
  ParserConfig &arity_satisfied_by_attached_option_param(bool value);

  /**
   * \brief Collect parameter errors and report them together after the scan.
   **/
  bool collect_errors() const { return collect_errors_; }
  ParserConfig &collect_errors(bool value);

  /**
   * \brief Remove surrounding double quotes from values.
   **/
  bool trim_quotes() const { return trim_quotes_; }
  ParserConfig &trim_quotes(bool value);

  /**
   * \brief Apply split regexes inside quoted sections too.
   **/
  bool split_quoted_strings() const { return split_quoted_strings_; }
  ParserConfig &split_quoted_strings(bool value);

  /**
   * \brief Replace \c @file arguments by the contents of the file.  On by default.
   **/
  bool expand_at_files() const { return expand_at_files_; }
  ParserConfig &expand_at_files(bool value);

  /**
   * \brief Character starting a comment in argument files, \c '#' by default.  nullopt disables comments.
   **/
  optional<char> at_file_comment_char() const { return at_file_comment_char_; }
  ParserConfig &at_file_comment_char(optional<char> value);

  /**
   * \brief Arguments that look like negative numbers are positional, unless the command declares an
   * option whose name looks like a negative number.  On by default.
   **/
  bool negative_numbers_are_positional() const { return negative_numbers_are_positional_; }
  ParserConfig &negative_numbers_are_positional(bool value);

  /**
   * \brief Copies the settings of \p other that this configuration has not set explicitly.
   *
   * Only the separator has a notion of being set; used when merging mixins.
   **/
  void initialize_from(ParserConfig const &other);

  string to_string() const;

private:
  optional<string> separator_;
  string end_of_options_delimiter_ = "--";
  bool posix_clustered_short_options_allowed_ = true;
  bool overwritten_options_allowed_ = false;
  bool unmatched_arguments_allowed_ = false;
  bool stop_at_unmatched_ = false;
  bool stop_at_positional_ = false;
  bool unmatched_options_are_positional_ = false;
  bool toggle_boolean_flags_ = true;
  bool case_insensitive_enum_values_allowed_ = false;
  bool limit_split_ = false;
  bool arity_satisfied_by_attached_option_param_ = false;
  bool collect_errors_ = false;
  bool trim_quotes_ = false;
  bool split_quoted_strings_ = false;
  bool expand_at_files_ = true;
  optional<char> at_file_comment_char_ = '#';
  bool negative_numbers_are_positional_ = true;
};

std::ostream &operator<<(std::ostream &os, ParserConfig const &config);

} // namespace argbind

#endif /* HEADER GUARD */

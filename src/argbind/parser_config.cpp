#include "./parser_config.hpp"
#include "./exceptions.hpp"

#include <ostream>
#include <sstream>

namespace argbind {

constexpr char const *ParserConfig::default_separator;

ParserConfig &ParserConfig::separator(string value) {
  if (value.empty())
    throw InitializationException("separator must be non-empty");
  separator_ = std::move(value);
  return *this;
}

ParserConfig &ParserConfig::end_of_options_delimiter(string value) {
  if (value.empty())
    throw InitializationException("end-of-options delimiter must be non-empty");
  end_of_options_delimiter_ = std::move(value);
  return *this;
}

ParserConfig &ParserConfig::posix_clustered_short_options_allowed(bool value) {
  posix_clustered_short_options_allowed_ = value;
  return *this;
}

ParserConfig &ParserConfig::overwritten_options_allowed(bool value) {
  overwritten_options_allowed_ = value;
  return *this;
}

ParserConfig &ParserConfig::unmatched_arguments_allowed(bool value) {
  unmatched_arguments_allowed_ = value;
  return *this;
}

ParserConfig &ParserConfig::stop_at_unmatched(bool value) {
  stop_at_unmatched_ = value;
  if (value)
    unmatched_arguments_allowed_ = true;
  return *this;
}

ParserConfig &ParserConfig::stop_at_positional(bool value) {
  stop_at_positional_ = value;
  return *this;
}

ParserConfig &ParserConfig::unmatched_options_are_positional(bool value) {
  unmatched_options_are_positional_ = value;
  return *this;
}

ParserConfig &ParserConfig::toggle_boolean_flags(bool value) {
  toggle_boolean_flags_ = value;
  return *this;
}

ParserConfig &ParserConfig::case_insensitive_enum_values_allowed(bool value) {
  case_insensitive_enum_values_allowed_ = value;
  return *this;
}

ParserConfig &ParserConfig::limit_split(bool value) {
  limit_split_ = value;
  return *this;
}

ParserConfig &ParserConfig::arity_satisfied_by_attached_option_param(bool value) {
  arity_satisfied_by_attached_option_param_ = value;
  return *this;
}

ParserConfig &ParserConfig::collect_errors(bool value) {
  collect_errors_ = value;
  return *this;
}

ParserConfig &ParserConfig::trim_quotes(bool value) {
  trim_quotes_ = value;
  return *this;
}

ParserConfig &ParserConfig::split_quoted_strings(bool value) {
  split_quoted_strings_ = value;
  return *this;
}

ParserConfig &ParserConfig::expand_at_files(bool value) {
  expand_at_files_ = value;
  return *this;
}

ParserConfig &ParserConfig::at_file_comment_char(optional<char> value) {
  at_file_comment_char_ = value;
  return *this;
}

ParserConfig &ParserConfig::negative_numbers_are_positional(bool value) {
  negative_numbers_are_positional_ = value;
  return *this;
}

void ParserConfig::initialize_from(ParserConfig const &other) {
  if (!separator_ && other.separator_)
    separator_ = other.separator_;
}

string ParserConfig::to_string() const {
  std::ostringstream os;
  os << *this;
  return os.str();
}

std::ostream &operator<<(std::ostream &os, ParserConfig const &c) {
  os << "posix_clustered_short_options_allowed=" << c.posix_clustered_short_options_allowed()
     << ", stop_at_positional=" << c.stop_at_positional()
     << ", stop_at_unmatched=" << c.stop_at_unmatched()
     << ", separator=" << c.separator()
     << ", overwritten_options_allowed=" << c.overwritten_options_allowed()
     << ", unmatched_arguments_allowed=" << c.unmatched_arguments_allowed()
     << ", expand_at_files=" << c.expand_at_files()
     << ", at_file_comment_char=" << (c.at_file_comment_char() ? string(1, *c.at_file_comment_char()) : string("null"))
     << ", end_of_options_delimiter=" << c.end_of_options_delimiter()
     << ", limit_split=" << c.limit_split()
     << ", arity_satisfied_by_attached_option_param=" << c.arity_satisfied_by_attached_option_param()
     << ", toggle_boolean_flags=" << c.toggle_boolean_flags()
     << ", unmatched_options_are_positional=" << c.unmatched_options_are_positional()
     << ", collect_errors=" << c.collect_errors()
     << ", case_insensitive_enum_values_allowed=" << c.case_insensitive_enum_values_allowed()
     << ", trim_quotes=" << c.trim_quotes()
     << ", split_quoted_strings=" << c.split_quoted_strings()
     << ", negative_numbers_are_positional=" << c.negative_numbers_are_positional();
  return os;
}

} // namespace argbind

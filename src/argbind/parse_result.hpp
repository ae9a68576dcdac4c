#ifndef HEADER_GUARD_9cf3e3f98538a45fe0ae6745988bca0b
#define HEADER_GUARD_9cf3e3f98538a45fe0ae6745988bca0b

#include "./fwd.hpp"
#include "./arg_spec.hpp"

#include <exception>
#include <map>

namespace argbind {

namespace detail {
struct ParserState;
} // namespace detail

/**
 * \brief What was matched at one command level during a parse.
 *
 * The result of the command that was parsed holds the result of the subcommand that was invoked, if
 * any, and so on, forming a chain.  Arguments that were only given a default value are not reported as
 * matched.
 **/
class ParseResult {
public:
  explicit ParseResult(shared_ptr<CommandSpec> command) : command_(std::move(command)) {}

  shared_ptr<CommandSpec> const &command() const { return command_; }

  /**
   * \brief Options matched on the command line, in the order they were first matched.
   **/
  vector<shared_ptr<OptionSpec>> const &matched_options() const { return matched_options_; }

  /**
   * \brief Positional parameters matched on the command line, in the order they were first matched.
   **/
  vector<shared_ptr<PositionalParamSpec>> const &matched_positionals() const { return matched_positionals_; }

  /**
   * \brief Positional parameters that received a value at argument position \p position.
   **/
  vector<shared_ptr<PositionalParamSpec>> matched_positionals(int position) const;

  /**
   * \brief Options and positional parameters matched on the command line.
   **/
  vector<shared_ptr<ArgSpec>> const &matched_args() const { return matched_args_; }

  /**
   * \brief Returns the matched option with the name \p name, or nullptr.
   *
   * \p name may be given with or without its prefix: \c "--verbose", \c "verbose".
   **/
  shared_ptr<OptionSpec> matched_option(string const &name) const;

  /**
   * \brief Returns the matched option with the short name \c -name, or nullptr.
   **/
  shared_ptr<OptionSpec> matched_option(char name) const;

  bool has_matched_option(string const &name) const { return bool(matched_option(name)); }
  bool has_matched_option(char name) const { return bool(matched_option(name)); }
  bool has_matched_positional(int position) const { return !matched_positionals(position).empty(); }

  /**
   * \brief The value of the matched option \p name, or \p fallback if it was not matched.
   **/
  template <class T>
  T matched_option_value(string const &name, T fallback) const {
    auto option = matched_option(name);
    return option ? option->template value<T>() : fallback;
  }

  template <class T>
  T matched_option_value(char name, T fallback) const {
    auto option = matched_option(name);
    return option ? option->template value<T>() : fallback;
  }

  /**
   * \brief The value of the first positional parameter matched at \p position, or \p fallback.
   **/
  template <class T>
  T matched_positional_value(int position, T fallback) const {
    auto positionals = matched_positionals(position);
    return positionals.empty() ? fallback : positionals.front()->template value<T>();
  }

  /**
   * \brief Arguments that matched no option, positional parameter or subcommand.
   **/
  vector<string> const &unmatched() const { return unmatched_; }

  /**
   * \brief The command line arguments after \c @file expansion.
   **/
  vector<string> const &original_args() const { return original_args_; }

  /**
   * \brief Errors recorded at this level while collecting errors.
   **/
  vector<std::exception_ptr> const &errors() const { return errors_; }

  bool has_subcommand() const { return bool(subcommand_); }
  shared_ptr<ParseResult> const &subcommand() const { return subcommand_; }

  bool is_usage_help_requested() const { return usage_help_requested_; }
  bool is_version_help_requested() const { return version_help_requested_; }

  /**
   * \brief This result followed by the results of the invoked subcommands.
   **/
  vector<ParseResult const *> command_chain() const;

private:
  friend struct detail::ParserState;

  void add(shared_ptr<ArgSpec> const &arg, int position);

  shared_ptr<CommandSpec> command_;
  vector<shared_ptr<OptionSpec>> matched_options_;
  vector<shared_ptr<PositionalParamSpec>> matched_positionals_;
  vector<shared_ptr<ArgSpec>> matched_args_;
  std::map<int, vector<shared_ptr<PositionalParamSpec>>> positionals_by_position_;
  vector<string> unmatched_;
  vector<string> original_args_;
  vector<std::exception_ptr> errors_;
  shared_ptr<ParseResult> subcommand_;
  bool usage_help_requested_ = false;
  bool version_help_requested_ = false;
};

} // namespace argbind

#endif /* HEADER GUARD */

#ifndef HEADER_GUARD_c1708721786b0153682c19188d69329b
#define HEADER_GUARD_c1708721786b0153682c19188d69329b

#include "./fwd.hpp"

#include <exception>
#include <stdexcept>

namespace argbind {

/**
 * \defgroup Errors Error reporting
 * \brief Exceptions raised while building a command specification or parsing arguments.
 * \details Every exception derives from \c std::logic_error.  Problems with the specification itself
 * are reported as \ref InitializationException and are never recoverable during a parse.  Problems with
 * the user input are reported as \ref ParameterException, which records the command level at which the
 * failure occurred.
 * @{
 **/

/**
 * \brief The command specification is invalid.
 **/
class InitializationException : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/**
 * \brief Two options of one command share a name.
 **/
class DuplicateOptionException : public InitializationException {
public:
  using InitializationException::InitializationException;

  static DuplicateOptionException create(string const &name, ArgSpec const &a, ArgSpec const &b);
};

/**
 * \brief The positional parameters of a command leave an index uncovered.
 **/
class ParameterIndexGapException : public InitializationException {
public:
  using InitializationException::InitializationException;
};

/**
 * \brief Thrown by type converters when a string cannot be converted.
 *
 * The parser wraps it into a \ref ParameterException that describes the argument being processed.
 **/
class TypeConversionException : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * \brief The command line arguments do not satisfy the command grammar.
 **/
class ParameterException : public std::invalid_argument {
  shared_ptr<CommandSpec const> command_;
  shared_ptr<ArgSpec const> arg_;
  optional<string> value_;
  std::exception_ptr cause_;
public:
  ParameterException(shared_ptr<CommandSpec const> command, string const &message,
                     shared_ptr<ArgSpec const> arg = {}, optional<string> value = nullopt,
                     std::exception_ptr cause = {})
    : std::invalid_argument(message), command_(std::move(command)), arg_(std::move(arg)),
      value_(std::move(value)), cause_(std::move(cause))
  {}

  /**
   * \return The command level at which the failure occurred.
   **/
  shared_ptr<CommandSpec const> const &command() const { return command_; }

  /**
   * \return The option or positional parameter being processed, if any.
   **/
  shared_ptr<ArgSpec const> const &arg_spec() const { return arg_; }

  /**
   * \return The offending command line value, if any.
   **/
  optional<string> const &value() const { return value_; }

  /**
   * \return The exception that caused this one, or a null pointer.
   **/
  std::exception_ptr const &cause() const { return cause_; }

  /**
   * \brief Print an error message and exit
   * This prints the qualified name of the failing command followed by the error message, and then exits
   * the program with code 2.
   **/
  [[noreturn]] void handle() const;

  /**
   * \brief Wraps an unexpected exception raised while processing the argument at \p index.
   **/
  static ParameterException create(shared_ptr<CommandSpec const> command, std::exception_ptr cause,
                                   string const &arg, int index, vector<string> const &args);
};

/**
 * \brief A required option or positional parameter was not specified.
 **/
class MissingParameterException : public ParameterException {
  vector<shared_ptr<ArgSpec const>> missing_;
public:
  MissingParameterException(shared_ptr<CommandSpec const> command, string const &message,
                            vector<shared_ptr<ArgSpec const>> missing)
    : ParameterException(std::move(command), message, missing.size() == 1 ? missing.front() : nullptr),
      missing_(std::move(missing))
  {}

  vector<shared_ptr<ArgSpec const>> const &missing() const { return missing_; }

  /**
   * \brief Builds the "Missing required option(s)" message for the options in \p missing.
   **/
  static MissingParameterException create(shared_ptr<CommandSpec const> command,
                                          vector<shared_ptr<ArgSpec const>> missing,
                                          string const &separator);
};

/**
 * \brief More values were specified than the arity of an argument allows.
 **/
class MaxValuesExceededException : public ParameterException {
public:
  using ParameterException::ParameterException;
};

/**
 * \brief A single-valued option was specified more than once.
 **/
class OverwrittenOptionException : public ParameterException {
public:
  using ParameterException::ParameterException;
};

/**
 * \brief No converter is known for the type of an argument.
 **/
class MissingTypeConverterException : public ParameterException {
public:
  using ParameterException::ParameterException;
};

/**
 * \brief One or more arguments matched no option, positional parameter or subcommand.
 **/
class UnmatchedArgumentException : public ParameterException {
  vector<string> unmatched_;
public:
  UnmatchedArgumentException(shared_ptr<CommandSpec const> command, vector<string> unmatched);

  vector<string> const &unmatched() const { return unmatched_; }

  /**
   * \brief Returns true if the first unmatched argument looks like an option.
   **/
  bool is_unknown_option() const;

  /**
   * \brief Returns corrections for the first unmatched argument.
   *
   * Unknown options are matched against option names sharing their first two characters; other
   * arguments against the three most similar subcommand names.
   **/
  vector<string> suggestions() const;
};

/**
 * \brief Errors collected while parsing with \ref ParserConfig::collect_errors enabled.
 **/
class ParameterErrors : public ParameterException {
  vector<std::exception_ptr> errors_;
  shared_ptr<ParseResult const> result_;
public:
  ParameterErrors(shared_ptr<CommandSpec const> command, vector<std::exception_ptr> errors,
                  shared_ptr<ParseResult const> result);

  vector<std::exception_ptr> const &errors() const { return errors_; }

  /**
   * \brief The messages of \ref errors, in order of occurrence.
   **/
  vector<string> messages() const;

  /**
   * \return The partial parse result.
   **/
  shared_ptr<ParseResult const> const &parse_result() const { return result_; }
};

/**
 * \brief Returns the \c what() message of the exception held by \p error.
 **/
string error_message(std::exception_ptr const &error);

/** @} */

} // namespace argbind

#endif /* HEADER GUARD */

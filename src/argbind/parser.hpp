#ifndef HEADER_GUARD_cfc715bed4455390a15d0f7e979ccb3c
#define HEADER_GUARD_cfc715bed4455390a15d0f7e979ccb3c

#include "./fwd.hpp"
#include "./command_spec.hpp"
#include "./parse_result.hpp"

#include <exception>

namespace argbind {

/**
 * \brief Supplies the value of an interactive option or positional parameter, for instance by prompting
 * on a terminal.
 *
 * \param prompt Suggested prompt text, such as <tt>"Enter value for --password: "</tt>.
 **/
using InteractiveReader = std::function<string (ArgSpec const &arg, string const &prompt)>;

/**
 * \brief Decides what happens when the command line violates the grammar.
 **/
class ErrorStrategy {
public:
  virtual ~ErrorStrategy() = default;

  /**
   * \brief Called with every violation.
   *
   * Throwing aborts the parse.  Returning normally records \p error and parsing continues with the next
   * argument; the recorded errors are reported together as \ref ParameterErrors when the parse ends.
   **/
  virtual void on_error(std::exception_ptr const &error) = 0;
};

/**
 * \brief Rethrows the first violation.
 **/
class AbortOnError : public ErrorStrategy {
public:
  [[noreturn]] void on_error(std::exception_ptr const &error) override;
};

/**
 * \brief Records every violation and continues.
 **/
class ContinueOnError : public ErrorStrategy {
public:
  void on_error(std::exception_ptr const &error) override;
};

/**
 * \brief Matches command line arguments against a \ref CommandSpec and stores the values through the
 * bindings of its arguments.
 *
 * A parser may be used for any number of parses; every parse starts by restoring the initial values of
 * all arguments.  Parses of the same command tree must not run concurrently.
 **/
class Parser {
public:
  /**
   * \param strategy Error strategy used at every command level.  By default each level aborts on the
   * first error, or continues if its \ref ParserConfig::collect_errors is set.
   * \throws InitializationException if the command tree is invalid
   **/
  explicit Parser(shared_ptr<CommandSpec> command, shared_ptr<ErrorStrategy> strategy = nullptr);

  shared_ptr<CommandSpec> const &command() const { return command_; }

  Parser &interactive_reader(InteractiveReader reader);

  /**
   * \brief Parses a list of arguments.
   *
   * \throws ParameterException on failure
   * \throws ParameterErrors if errors were collected
   **/
  ParseResult parse(vector<string> const &args) const;

  /**
   * \brief Parses the arguments following \p argv[0].
   *
   * \throws ParameterException on failure
   **/
  ParseResult parse(int argc, char const *const *argv) const;

  /**
   * \brief Parses the arguments following \p argv[0].
   * \note If there is an error parsing, prints the error message to standard error and exits with status 2.
   **/
  ParseResult parse_or_exit(int argc, char const *const *argv) const;

private:
  shared_ptr<CommandSpec> command_;
  shared_ptr<ErrorStrategy> strategy_;
  InteractiveReader interactive_reader_;
};

} // namespace argbind

#endif /* HEADER GUARD */

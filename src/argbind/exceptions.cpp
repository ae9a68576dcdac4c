#include "./exceptions.hpp"
#include "./arg_spec.hpp"
#include "./command_spec.hpp"
#include "./similarity.hpp"
#include "./util.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include <boost/core/demangle.hpp>

namespace argbind {

namespace {

string describe_missing(ArgSpec const &arg, string const &separator) {
  if (arg.is_option())
    return static_cast<OptionSpec const &>(arg).longest_name() + separator + arg.param_label();
  return "params[" + static_cast<PositionalParamSpec const &>(arg).index().to_string() + "]" + separator +
         arg.param_label();
}

bool unmatched_resembles_option(CommandSpec const *command, vector<string> const &unmatched) {
  return command && !unmatched.empty() && command->resembles_option(unmatched.front());
}

string unmatched_message(CommandSpec const *command, vector<string> const &unmatched) {
  string message = unmatched_resembles_option(command, unmatched) ? "Unknown option" : "Unmatched argument";
  if (unmatched.size() > 1)
    message += "s";
  return message + ": " + join(", ", unmatched);
}

string collected_message(vector<std::exception_ptr> const &errors) {
  if (errors.size() == 1)
    return error_message(errors.front());
  return std::to_string(errors.size()) + " errors: " +
         join("; ", errors, [](std::exception_ptr const &e) { return error_message(e); });
}

} // anon namespace

DuplicateOptionException DuplicateOptionException::create(string const &name, ArgSpec const &a, ArgSpec const &b) {
  return DuplicateOptionException("Option name " + repr(name) + " is used by both " + a.to_string() + " and " +
                                  b.to_string());
}

void ParameterException::handle() const {
  string name = command_ ? command_->qualified_name() : string();
  if (!name.empty())
    std::cerr << name << ": ";
  std::cerr << "error: " << what() << std::endl;
  std::exit(2);
}

ParameterException ParameterException::create(shared_ptr<CommandSpec const> command, std::exception_ptr cause,
                                              string const &arg, int index, vector<string> const &args) {
  string description;
  try {
    std::rethrow_exception(cause);
  }
  catch (std::exception &e) {
    description = boost::core::demangle(typeid(e).name()) + ": " + e.what();
  }
  string message = description + " while processing argument at or before arg[" + std::to_string(index) + "] '" +
                   arg + "' in " + list_string(args);
  return ParameterException(std::move(command), message, nullptr, arg, cause);
}

MissingParameterException MissingParameterException::create(shared_ptr<CommandSpec const> command,
                                                            vector<shared_ptr<ArgSpec const>> missing,
                                                            string const &separator) {
  if (missing.size() == 1) {
    string message = "Missing required option '" + describe_missing(*missing.front(), separator) + "'";
    return MissingParameterException(std::move(command), message, std::move(missing));
  }
  vector<string> names;
  for (auto const &arg : missing)
    names.push_back(describe_missing(*arg, separator));
  return MissingParameterException(std::move(command), "Missing required options " + list_string(names),
                                   std::move(missing));
}

UnmatchedArgumentException::UnmatchedArgumentException(shared_ptr<CommandSpec const> command,
                                                       vector<string> unmatched)
  : ParameterException(command, unmatched_message(command.get(), unmatched), nullptr,
                       unmatched.empty() ? optional<string>() : optional<string>(unmatched.front())),
    unmatched_(std::move(unmatched))
{}

bool UnmatchedArgumentException::is_unknown_option() const {
  return unmatched_resembles_option(command().get(), unmatched_);
}

vector<string> UnmatchedArgumentException::suggestions() const {
  if (unmatched_.empty() || !command())
    return {};
  if (is_unknown_option()) {
    string stripped = CommandSpec::strip_prefix(unmatched_.front());
    return command()->find_option_names_with_prefix(stripped.substr(0, std::min<size_t>(2, stripped.size())));
  }
  if (command()->subcommands().empty())
    return {};
  auto result = most_similar(unmatched_.front(), command()->subcommand_names());
  if (result.size() > 3)
    result.resize(3);
  return result;
}

ParameterErrors::ParameterErrors(shared_ptr<CommandSpec const> command, vector<std::exception_ptr> errors,
                                 shared_ptr<ParseResult const> result)
  : ParameterException(std::move(command), collected_message(errors)),
    errors_(std::move(errors)), result_(std::move(result))
{}

vector<string> ParameterErrors::messages() const {
  vector<string> result;
  for (auto const &e : errors_)
    result.push_back(error_message(e));
  return result;
}

string error_message(std::exception_ptr const &error) {
  if (!error)
    return {};
  try {
    std::rethrow_exception(error);
  }
  catch (std::exception &e) {
    return e.what();
  }
}

} // namespace argbind

#include "./parse_result.hpp"
#include "./command_spec.hpp"
#include "./util.hpp"

#include <algorithm>

namespace argbind {

vector<shared_ptr<PositionalParamSpec>> ParseResult::matched_positionals(int position) const {
  if (auto p = find_ptr(positionals_by_position_, position))
    return *p;
  return {};
}

shared_ptr<OptionSpec> ParseResult::matched_option(string const &name) const {
  auto stripped = CommandSpec::strip_prefix(name);
  for (auto const &option : matched_options_) {
    for (auto const &option_name : option->names()) {
      if (option_name == name || CommandSpec::strip_prefix(option_name) == stripped)
        return option;
    }
  }
  return nullptr;
}

shared_ptr<OptionSpec> ParseResult::matched_option(char name) const {
  return matched_option(string("-") + name);
}

vector<ParseResult const *> ParseResult::command_chain() const {
  vector<ParseResult const *> result;
  for (ParseResult const *r = this; r; r = r->subcommand_.get())
    result.push_back(r);
  return result;
}

void ParseResult::add(shared_ptr<ArgSpec> const &arg, int position) {
  if (std::find(matched_args_.begin(), matched_args_.end(), arg) == matched_args_.end())
    matched_args_.push_back(arg);
  if (arg->is_option()) {
    auto option = std::static_pointer_cast<OptionSpec>(arg);
    if (std::find(matched_options_.begin(), matched_options_.end(), option) == matched_options_.end())
      matched_options_.push_back(option);
    return;
  }
  auto positional = std::static_pointer_cast<PositionalParamSpec>(arg);
  if (std::find(matched_positionals_.begin(), matched_positionals_.end(), positional) == matched_positionals_.end())
    matched_positionals_.push_back(positional);
  auto &at_position = positionals_by_position_[position];
  if (std::find(at_position.begin(), at_position.end(), positional) == at_position.end())
    at_position.push_back(positional);
}

} // namespace argbind

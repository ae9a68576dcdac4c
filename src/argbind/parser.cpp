#include "./parser.hpp"
#include "./at_file.hpp"
#include "./exceptions.hpp"
#include "./trace.hpp"
#include "./util.hpp"

#include <algorithm>
#include <set>

#include <boost/core/demangle.hpp>

namespace argbind {

void AbortOnError::on_error(std::exception_ptr const &error) {
  std::rethrow_exception(error);
}

void ContinueOnError::on_error(std::exception_ptr const &) {}

namespace detail {

/**
 * How a value relates to the option name it belongs to: a separate argument (\c -f \c FILE), attached
 * (\c -fFILE) or attached with the separator (\c -f=FILE).
 **/
enum class LookBehind {
  separate,
  attached,
  attached_with_separator,
};

inline bool is_attached(LookBehind x) { return x != LookBehind::separate; }

/**
 * Remaining arguments; the next argument is at the back.
 **/
using ArgStack = vector<string>;

namespace {

string pop(ArgStack &args) {
  string x = std::move(args.back());
  args.pop_back();
  return x;
}

string remainder_string(ArgStack const &args) {
  return list_string(vector<string>(args.rbegin(), args.rend()));
}

bool is_blank(string const &s) {
  return trim_whitespace(s).empty();
}

} // anon namespace

/**
 * State shared by all command levels of one parse.
 **/
struct ParseContext {
  vector<string> original_args;
  shared_ptr<ErrorStrategy> strategy;
  InteractiveReader const *interactive_reader = nullptr;

  // set by help options and help commands anywhere in the chain
  bool help_requested = false;

  vector<std::exception_ptr> errors;
};

/**
 * Matches arguments against one command level.  Subcommands are handled by a nested ParserState.
 **/
struct ParserState {
  ParserState(ParseContext &context, shared_ptr<CommandSpec> command, ParseResult &result)
    : context(context), command(std::move(command)), config(this->command->parser()), result(result) {
    if (context.strategy)
      strategy = context.strategy;
    else if (config.collect_errors())
      strategy = std::make_shared<ContinueOnError>();
    else
      strategy = std::make_shared<AbortOnError>();
  }

  ParseContext &context;
  shared_ptr<CommandSpec> command;
  ParserConfig const &config;
  ParseResult &result;
  shared_ptr<ErrorStrategy> strategy;

  int position = 0;
  bool end_of_options = false;
  bool initializing_defaults = false;
  // set when a positional stopped consuming to leave arguments for later positionals
  optional<int> reserved_position;
  vector<shared_ptr<ArgSpec>> required;
  std::set<ArgSpec const *> initialized;

  void parse(ArgStack &args);

private:
  void clear();
  void report(std::exception_ptr const &error);

  template <class E>
  bool fail(E const &e) {
    report(std::make_exception_ptr(e));
    return false;
  }

  template <class F>
  void guarded(ArgStack const &args, F &&f);

  void apply_default_values();
  void apply_default(shared_ptr<ArgSpec> const &arg);
  void process_arguments(ArgStack &args);
  void handle_unmatched_argument(ArgStack &args);
  void process_remainder_as_positional_parameters(ArgStack &args);
  void process_positional_parameter(ArgStack &args);
  void process_standalone_option(string const &name, ArgStack &args, bool param_attached);
  void process_clustered_short_options(string const &arg, ArgStack &args);

  int apply_option(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity, ArgStack &args,
                   string const &description);
  int apply_value_to_single_valued_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind,
                                         Range const &derived_arity, ArgStack &args, string const &description);
  int apply_values_to_collection_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                                       ArgStack &args, string const &description);
  int apply_values_to_map_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                                ArgStack &args, string const &description);

  vector<any> consume_arguments(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                                ArgStack &args, std::type_index type, string const &description);
  void consume_one_argument(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity, int consumed,
                            string const &token, std::type_index type, vector<any> &result, int index,
                            string const &description);
  bool can_consume_one_argument(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                string const &token, std::type_index type, string const &description);

  void consume_map_arguments(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                             ArgStack &args, any &map, string const &description);
  void consume_one_map_argument(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                                int consumed, string const &token, any &map, int index,
                                string const &description);
  bool can_consume_one_map_argument(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                    string const &token, string const &description);
  std::pair<string, string> split_key_value(shared_ptr<ArgSpec> const &arg, string const &value);

  int consumed_count(int i, int initial_size, ArgSpec const &arg) const;
  int consumed_count_map(int i, int initial_size, ArgSpec const &arg) const;

  bool assert_no_missing_parameters(shared_ptr<ArgSpec> const &arg, Range const &arity, ArgStack const &args);
  void assert_no_missing_mandatory_parameter(shared_ptr<ArgSpec> const &arg, ArgStack const &args, int i,
                                             Range const &arity);
  void assert_max_values_not_exceeded(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                      ArgStack const &args);

  int reserved_capacity(ArgSpec const &arg) const;
  int first_reserved_index(ArgSpec const &arg) const;
  int consumable_count(ArgSpec const &arg, ArgStack const &args) const;
  bool vararg_can_consume_next_value(ArgSpec const &arg, string const &next) const;
  bool is_option(string const &arg) const;
  bool positional_slot_available() const;

  TypeConverter type_converter(std::type_index type, shared_ptr<ArgSpec> const &arg, int index) const;
  any try_convert(shared_ptr<ArgSpec> const &arg, int index, TypeConverter const &converter, string const &value,
                  std::type_index type) const;
  string option_description(ArgSpec const &arg, int index) const;
  string unquote(string const &value) const;
  string read_interactive_value(ArgSpec const &arg, string const &description);

  void update_help_requested(ArgSpec const &arg);
  void remove_required(shared_ptr<ArgSpec> const &arg);

  void add_string_value(ArgSpec &arg, string const &value);
  void add_original_string_value(ArgSpec &arg, string const &value);
  void add_typed_value(ArgSpec &arg, any const &value);
  void record_position(ArgSpec &arg, int at);
  void record_match(shared_ptr<ArgSpec> const &arg);
};

template <class F>
void ParserState::guarded(ArgStack const &args, F &&f) {
  try {
    f();
  }
  catch (ParameterException &) {
    report(std::current_exception());
  }
  catch (std::exception &) {
    int index = int(context.original_args.size()) - int(args.size()) - 1;
    string arg = index >= 0 && index < int(context.original_args.size()) ? context.original_args[index] : "?";
    fail(ParameterException::create(command, std::current_exception(), arg, index, context.original_args));
  }
}

void ParserState::parse(ArgStack &args) {
  clear();
  auto const &logger = trace::logger();
  logger->debug("Initializing command {}: {} options, {} positional parameters, {} required, {} subcommands",
                repr(command->qualified_name()), command->options().size(), command->positionals().size(),
                command->required_args().size(), command->subcommands().size());
  result.original_args_ = context.original_args;
  required = command->required_args();
  std::stable_sort(required.begin(), required.end(), [](shared_ptr<ArgSpec> const &a, shared_ptr<ArgSpec> const &b) {
    return a->is_option() && !b->is_option();
  });
  initialized.clear();

  guarded(args, [&] { apply_default_values(); });
  initializing_defaults = false;
  initialized.clear();

  do {
    size_t stack_size = args.size();
    guarded(args, [&] { process_arguments(args); });
    if (stack_size == args.size() && stack_size > 0)
      result.unmatched_.push_back(pop(args));
  } while (!args.empty());

  if (!context.help_requested && !required.empty()) {
    vector<shared_ptr<ArgSpec const>> missing_options;
    for (auto const &arg : required) {
      if (arg->is_option())
        missing_options.push_back(arg);
    }
    if (!missing_options.empty())
      fail(MissingParameterException::create(command, missing_options, config.separator()));
    for (auto const &arg : required) {
      if (arg->is_positional())
        assert_no_missing_parameters(arg, arg->arity(), args);
    }
  }

  if (!result.unmatched_.empty()) {
    for (auto const &binding : command->unmatched_args_bindings())
      binding(result.unmatched_);
    if (!config.unmatched_arguments_allowed())
      fail(UnmatchedArgumentException(command, result.unmatched_));
    logger->info("Unmatched arguments: {}", list_string(result.unmatched_));
  }
}

void ParserState::clear() {
  position = 0;
  end_of_options = false;
  for (auto const &arg : command->args())
    arg->reset_values();
}

void ParserState::report(std::exception_ptr const &error) {
  strategy->on_error(error);
  trace::logger()->debug("Recorded error: {}", error_message(error));
  result.errors_.push_back(error);
  context.errors.push_back(error);
}

void ParserState::apply_default_values() {
  initializing_defaults = true;
  for (auto const &arg : command->args())
    apply_default(arg);
  initializing_defaults = false;
}

void ParserState::apply_default(shared_ptr<ArgSpec> const &arg) {
  optional<string> value;
  if (auto const &provider = command->default_value_provider())
    value = provider->default_value(*arg);
  if (!value)
    value = arg->default_value();
  if (!value)
    return;
  trace::logger()->debug("Applying default value {} to {}", repr(*value), arg->to_string());
  Range arity = arg->arity().with_min(std::max(1, arg->arity().min()));
  ArgStack stack{ *value };
  apply_option(arg, LookBehind::separate, arity, stack, arg->to_string());
  remove_required(arg);
}

void ParserState::process_arguments(ArgStack &args) {
  auto const &logger = trace::logger();
  string const separator = config.separator();
  while (!args.empty()) {
    if (end_of_options) {
      process_remainder_as_positional_parameters(args);
      return;
    }
    string arg = pop(args);
    logger->debug("Processing argument {}. Remainder={}", repr(arg), remainder_string(args));

    if (arg == config.end_of_options_delimiter()) {
      logger->info("Found end-of-options delimiter {}. Treating remainder as positional parameters.", repr(arg));
      end_of_options = true;
      process_remainder_as_positional_parameters(args);
      return;
    }

    if (auto subcommand = command->find_subcommand(arg)) {
      if (subcommand->help_command()) {
        logger->info("{} is a help command: not validating required arguments", repr(arg));
        context.help_requested = true;
      }
      logger->debug("Found subcommand {}", repr(arg));
      auto sub_result = std::make_shared<ParseResult>(subcommand);
      result.subcommand_ = sub_result;
      ParserState sub_state(context, subcommand, *sub_result);
      sub_state.parse(args);
      return;
    }

    bool param_attached = false;
    auto separator_index = arg.find(separator);
    if (separator_index != string::npos && separator_index > 0) {
      string key = arg.substr(0, separator_index);
      // the whole argument wins if it is an option name itself
      if (command->find_option(key) && !command->find_option(arg)) {
        param_attached = true;
        string param = arg.substr(separator_index + separator.size());
        args.push_back(param);
        arg = key;
        logger->debug("Separated {} option from {} option parameter", repr(key), repr(param));
      } else {
        logger->debug("{} contains separator {} but {} is not a known option", repr(arg), repr(separator),
                      repr(key));
      }
    } else {
      logger->debug("{} cannot be separated into <option>{}<option-parameter>", repr(arg), separator);
    }

    if (command->find_option(arg)) {
      process_standalone_option(arg, args, param_attached);
    } else if (config.posix_clustered_short_options_allowed() && arg.size() > 2 && arg[0] == '-') {
      logger->debug("Trying to process {} as clustered short options", repr(arg));
      process_clustered_short_options(arg, args);
    } else {
      args.push_back(arg);
      logger->debug("Could not find option {}, deciding whether to treat as unmatched option or positional parameter",
                    repr(arg));
      if (command->resembles_option(arg)) {
        handle_unmatched_argument(args);
        continue;
      }
      logger->debug("No option named {} found. Processing as positional parameter", repr(arg));
      process_positional_parameter(args);
    }
  }
}

void ParserState::handle_unmatched_argument(ArgStack &args) {
  if (!args.empty())
    result.unmatched_.push_back(pop(args));
  if (config.stop_at_unmatched()) {
    while (!args.empty())
      result.unmatched_.push_back(pop(args));
  }
}

void ParserState::process_remainder_as_positional_parameters(ArgStack &args) {
  while (!args.empty())
    process_positional_parameter(args);
}

void ParserState::process_positional_parameter(ArgStack &args) {
  auto const &logger = trace::logger();
  logger->debug("Processing next argument as a positional parameter at index={}. Remainder={}", position,
                remainder_string(args));
  if (config.stop_at_positional()) {
    if (!end_of_options)
      logger->debug("Parser is configured to stop at positional: treating remaining arguments as positional parameters");
    end_of_options = true;
  }
  int args_consumed = 0;
  int interactive_consumed = 0;
  reserved_position = nullopt;
  for (auto const &positional : command->positionals()) {
    auto const &index = positional->index();
    if (!index.contains(position) || positional->has_value_at_position(position))
      continue;
    ArgStack args_copy = args;
    Range const &arity = positional->arity();
    logger->debug("Position {} is in index range {}. Trying to assign arguments to {}, arity={}", position,
                  index.to_string(), positional->to_string(), arity.to_string());
    if (!assert_no_missing_parameters(positional, arity, args_copy))
      break;
    int original_size = int(args_copy.size());
    int actually_consumed = apply_option(positional, LookBehind::separate, arity, args_copy,
                                         "args[" + index.to_string() + "] at position " + std::to_string(position));
    int count = original_size - int(args_copy.size());
    if (count > 0 || actually_consumed > 0) {
      remove_required(positional);
      if (positional->interactive())
        ++interactive_consumed;
    }
    args_consumed = std::max(args_consumed, count);
  }
  for (int i = 0; i < args_consumed; ++i)
    args.pop_back();
  if (reserved_position)
    position = *reserved_position;
  else
    position += args_consumed + interactive_consumed;
  logger->debug("Consumed {} arguments and {} interactive values, moving position to index {}", args_consumed,
                interactive_consumed, position);
  if (args_consumed == 0 && interactive_consumed == 0 && !args.empty())
    handle_unmatched_argument(args);
}

void ParserState::process_standalone_option(string const &name, ArgStack &args, bool param_attached) {
  shared_ptr<ArgSpec> option = command->find_option(name);
  remove_required(option);
  Range arity = option->arity();
  if (param_attached)
    arity = arity.with_min(std::max(1, arity.min()));
  trace::logger()->debug("Found option named {}: {}, arity={}", repr(name), option->to_string(), arity.to_string());
  apply_option(option, param_attached ? LookBehind::attached_with_separator : LookBehind::separate, arity, args,
               "option " + name);
}

void ParserState::process_clustered_short_options(string const &arg, ArgStack &args) {
  auto const &logger = trace::logger();
  string const separator = config.separator();
  string prefix = arg.substr(0, 1);
  string cluster = arg.substr(1);
  bool param_attached = true;
  while (true) {
    shared_ptr<ArgSpec> option;
    if (!cluster.empty())
      option = command->find_option(cluster[0]);
    if (option) {
      Range arity = option->arity();
      string description = "option " + prefix + cluster[0];
      logger->debug("Found option '{}{}' in {}: {}, arity={}", prefix, cluster[0], repr(arg), option->to_string(),
                    arity.to_string());
      remove_required(option);
      cluster = cluster.substr(1);
      param_attached = !cluster.empty();
      LookBehind look_behind = param_attached ? LookBehind::attached : LookBehind::separate;
      if (starts_with(cluster, separator)) {
        look_behind = LookBehind::attached_with_separator;
        cluster = cluster.substr(separator.size());
        arity = arity.with_min(std::max(1, arity.min()));
      }
      // the remainder may be the option parameter
      if (!is_blank(cluster))
        args.push_back(cluster);
      size_t arg_count = args.size();
      apply_option(option, look_behind, arity, args, description);
      if (is_blank(cluster) || args.empty() || args.size() < arg_count)
        return;
      cluster = pop(args);
    } else {
      if (cluster.empty())
        return;
      if (ends_with(arg, cluster)) {
        args.push_back(param_attached ? prefix + cluster : cluster);
        if (args.back() == arg) {
          logger->debug("Could not match any short options in {}, deciding whether to treat as unmatched option or "
                        "positional parameter",
                        repr(arg));
          if (command->resembles_option(arg)) {
            handle_unmatched_argument(args);
            return;
          }
          process_positional_parameter(args);
          return;
        }
        logger->debug("No option found for {} in {}", repr(cluster), repr(arg));
        handle_unmatched_argument(args);
      } else {
        args.push_back(cluster);
        logger->debug("{} is not an option parameter for {}", repr(cluster), repr(arg));
        process_positional_parameter(args);
      }
      return;
    }
  }
}

int ParserState::apply_option(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                              ArgStack &args, string const &description) {
  update_help_requested(*arg);
  bool consume_only_one = config.arity_satisfied_by_attached_option_param() && is_attached(look_behind);
  ArgStack single;
  ArgStack *working = &args;
  if (consume_only_one) {
    if (!args.empty()) {
      single.push_back(pop(args));
      working = &single;
    }
  } else if (!assert_no_missing_parameters(arg, arity, args)) {
    return 0;
  }

  if (arg->interactive())
    working->push_back(read_interactive_value(*arg, description));

  int result;
  switch (arg->value_type().shape) {
  case Shape::sequence:
    result = apply_values_to_collection_field(arg, look_behind, arity, *working, description);
    break;
  case Shape::mapping:
    result = apply_values_to_map_field(arg, look_behind, arity, *working, description);
    break;
  default:
    result = apply_value_to_single_valued_field(arg, look_behind, arity, *working, description);
    break;
  }

  if (working != &args && !working->empty()) {
    args.push_back(pop(*working));
    if (!working->empty())
      throw std::logic_error("Working stack should be empty but was " + remainder_string(*working));
  }
  return result;
}

int ParserState::apply_value_to_single_valued_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind,
                                                    Range const &derived_arity, ArgStack &args,
                                                    string const &description) {
  bool no_more_values = args.empty();
  optional<string> value;
  if (!args.empty())
    value = unquote(pop(args));
  Range arity = arg->arity().is_unspecified() ? derived_arity : arg->arity();
  if (arity.max() == 0 && !arity.is_unspecified() && look_behind == LookBehind::attached_with_separator) {
    throw MaxValuesExceededException(command,
                                     option_description(*arg, 0) + " should be specified without " +
                                         repr(value ? *value : string()) + " parameter",
                                     arg, value);
  }
  int result = arity.min();

  std::type_index type = arg->auxiliary_types()[0];
  if (arity.min() <= 0) {
    if (type == typeid(bool)) {
      // a boolean with an optional value only consumes "true" or "false"
      if (arity.max() > 0 && value && (equals_ignore_case(*value, "true") || equals_ignore_case(*value, "false"))) {
        result = 1;
      } else if (look_behind != LookBehind::attached_with_separator) {
        if (value)
          args.push_back(*value);
        if (config.toggle_boolean_flags()) {
          any current = arg->value_any();
          bool const *current_value = any_cast<bool>(&current);
          value = (current_value && *current_value) ? "false" : "true";
        } else {
          value = string("true");
        }
      }
    } else {
      if (value && is_option(*value)) {
        args.push_back(*value);
        value = string();
      } else if (!value) {
        value = string();
      }
    }
  }
  if (no_more_values && !value)
    return 0;

  auto converter = type_converter(type, arg, 0);
  any new_value = try_convert(arg, -1, converter, *value, type);
  char const *action = "Setting";
  if (initialized.count(arg.get())) {
    if (!config.overwritten_options_allowed()) {
      throw OverwrittenOptionException(command, option_description(*arg, 0) + " should be specified only once", arg,
                                       value);
    }
    action = "Overwriting";
  }
  initialized.insert(arg.get());
  if (!initializing_defaults)
    trace::logger()->info("{} {} to {} for {}", action, arg->to_string(), repr(*value), description);
  arg->set_value(new_value);
  add_original_string_value(*arg, *value);
  add_string_value(*arg, *value);
  add_typed_value(*arg, new_value);
  record_position(*arg, position);
  record_match(arg);
  return result;
}

int ParserState::apply_values_to_collection_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind,
                                                  Range const &arity, ArgStack &args, string const &description) {
  auto const &value_type = arg->value_type();
  auto converted = consume_arguments(arg, look_behind, arity, args, value_type.auxiliary_types[0], description);
  any collection = arg->value_any();
  // the first match of a parse replaces the initial contents
  if (collection.empty() || !initialized.count(arg.get()))
    collection = value_type.make_default();
  initialized.insert(arg.get());
  for (auto const &element : converted)
    value_type.append(collection, element);
  record_match(arg);
  arg->set_value(collection);
  return int(converted.size());
}

int ParserState::apply_values_to_map_field(shared_ptr<ArgSpec> const &arg, LookBehind look_behind,
                                           Range const &arity, ArgStack &args, string const &description) {
  auto const &value_type = arg->value_type();
  if (value_type.auxiliary_types.size() < 2) {
    throw ParameterException(command,
                             arg->to_string() +
                                 " needs two types (one for the map key, one for the value) but only has " +
                                 std::to_string(value_type.auxiliary_types.size()) + " types configured.",
                             arg);
  }
  any map = arg->value_any();
  if (map.empty() || !initialized.count(arg.get()))
    map = value_type.make_default();
  initialized.insert(arg.get());
  size_t original_size = value_type.size(map);
  consume_map_arguments(arg, look_behind, arity, args, map, description);
  record_match(arg);
  arg->set_value(map);
  return int(value_type.size(map) - original_size);
}

vector<any> ParserState::consume_arguments(shared_ptr<ArgSpec> const &arg, LookBehind look_behind,
                                           Range const &arity, ArgStack &args, std::type_index type,
                                           string const &description) {
  vector<any> result;
  int current_position = position;

  int initial_size = int(arg->string_values().size());
  int consumed = consumed_count(0, initial_size, *arg);
  for (int i = 0; consumed < arity.min() && !args.empty(); ++i) {
    record_position(*arg, current_position++);
    assert_no_missing_mandatory_parameter(arg, args, i, arity);
    consume_one_argument(arg, look_behind, arity, consumed, pop(args), type, result, i, description);
    consumed = consumed_count(i + 1, initial_size, *arg);
    look_behind = LookBehind::separate;
  }
  int reserved = reserved_capacity(*arg);
  int available = reserved > 0 ? consumable_count(*arg, args) : 0;
  for (int i = consumed; consumed < arity.max() && !args.empty(); ++i) {
    if (!vararg_can_consume_next_value(*arg, args.back()))
      break;
    if (reserved > 0 && available <= reserved) {
      reserved_position = first_reserved_index(*arg);
      trace::logger()->debug("Leaving {} arguments for positional parameters from index {} after {}", available,
                             *reserved_position, arg->to_string());
      break;
    }
    --available;
    // a position that was tried is not tried again, even if nothing could be consumed
    record_position(*arg, current_position++);
    if (!can_consume_one_argument(arg, arity, consumed, args.back(), type, description))
      break;
    consume_one_argument(arg, look_behind, arity, consumed, pop(args), type, result, i, description);
    consumed = consumed_count(i + 1, initial_size, *arg);
    look_behind = LookBehind::separate;
  }
  assert_max_values_not_exceeded(arg, arity, consumed, args);
  if (result.empty() && arity.min() == 0 && arity.max() <= 1 && type == typeid(bool))
    result.push_back(any(true));
  return result;
}

void ParserState::consume_one_argument(shared_ptr<ArgSpec> const &arg, LookBehind, Range const &arity,
                                       int consumed, string const &token, std::type_index type,
                                       vector<any> &result, int index, string const &description) {
  string raw = unquote(token);
  auto values = arg->split_value(raw, config, arity, consumed);
  auto converter = type_converter(type, arg, 0);
  for (auto const &value : values) {
    any converted = try_convert(arg, index, converter, value, type);
    result.push_back(converted);
    if (!initializing_defaults)
      trace::logger()->info("Adding [{}] to {} for {}", value, arg->to_string(), description);
    add_string_value(*arg, value);
    add_typed_value(*arg, converted);
  }
  add_original_string_value(*arg, raw);
}

bool ParserState::can_consume_one_argument(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                           string const &token, std::type_index type, string const &description) {
  auto converter = type_converter(type, arg, 0);
  try {
    for (auto const &value : arg->split_value(unquote(token), config, arity, consumed))
      try_convert(arg, -1, converter, value, type);
    return true;
  }
  catch (ParameterException &e) {
    trace::logger()->debug("{} cannot be assigned to {}: type conversion fails: {}", repr(token), description,
                           e.what());
    return false;
  }
}

void ParserState::consume_map_arguments(shared_ptr<ArgSpec> const &arg, LookBehind look_behind, Range const &arity,
                                        ArgStack &args, any &map, string const &description) {
  int current_position = position;

  int initial_size = int(arg->string_values().size());
  int consumed = consumed_count_map(0, initial_size, *arg);
  for (int i = 0; consumed < arity.min() && !args.empty(); ++i) {
    record_position(*arg, current_position++);
    assert_no_missing_mandatory_parameter(arg, args, i, arity);
    consume_one_map_argument(arg, look_behind, arity, consumed, pop(args), map, i, description);
    consumed = consumed_count_map(i + 1, initial_size, *arg);
    look_behind = LookBehind::separate;
  }
  for (int i = consumed; consumed < arity.max() && !args.empty(); ++i) {
    if (!vararg_can_consume_next_value(*arg, args.back()))
      break;
    record_position(*arg, current_position++);
    if (!can_consume_one_map_argument(arg, arity, consumed, args.back(), description))
      break;
    consume_one_map_argument(arg, look_behind, arity, consumed, pop(args), map, i, description);
    consumed = consumed_count_map(i + 1, initial_size, *arg);
    look_behind = LookBehind::separate;
  }
  assert_max_values_not_exceeded(arg, arity, consumed, args);
}

void ParserState::consume_one_map_argument(shared_ptr<ArgSpec> const &arg, LookBehind, Range const &arity,
                                           int consumed, string const &token, any &map, int index,
                                           string const &description) {
  auto const &value_type = arg->value_type();
  auto key_converter = type_converter(value_type.auxiliary_types[0], arg, 0);
  auto value_converter = type_converter(value_type.auxiliary_types[1], arg, 1);
  string raw = unquote(token);
  for (auto const &value : arg->split_value(raw, config, arity, consumed)) {
    auto key_value = split_key_value(arg, value);
    any key = try_convert(arg, index, key_converter, key_value.first, value_type.auxiliary_types[0]);
    any mapped = try_convert(arg, index, value_converter, key_value.second, value_type.auxiliary_types[1]);
    value_type.put(map, key, mapped);
    if (!initializing_defaults) {
      trace::logger()->info("Putting [{} : {}] in {} for {}", key_value.first, key_value.second, arg->to_string(),
                            description);
    }
    add_string_value(*arg, key_value.first);
    add_string_value(*arg, key_value.second);
    add_typed_value(*arg, mapped);
  }
  add_original_string_value(*arg, raw);
}

bool ParserState::can_consume_one_map_argument(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                               string const &token, string const &description) {
  auto const &types = arg->auxiliary_types();
  auto key_converter = type_converter(types[0], arg, 0);
  auto value_converter = type_converter(types[1], arg, 1);
  try {
    for (auto const &value : arg->split_value(unquote(token), config, arity, consumed)) {
      auto key_value = split_key_value(arg, value);
      try_convert(arg, -1, key_converter, key_value.first, types[0]);
      try_convert(arg, -1, value_converter, key_value.second, types[1]);
    }
    return true;
  }
  catch (ParameterException &e) {
    trace::logger()->debug("{} cannot be assigned to {}: type conversion fails: {}", repr(token), description,
                           e.what());
    return false;
  }
}

std::pair<string, string> ParserState::split_key_value(shared_ptr<ArgSpec> const &arg, string const &value) {
  string key;
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == '=') {
      key.push_back('=');
      ++i;
    } else if (value[i] == '=') {
      return { key, value.substr(i + 1) };
    } else {
      key.push_back(value[i]);
    }
  }
  string format = arg->split_regex().empty() ? string("KEY=VALUE")
                                              : "KEY=VALUE[" + arg->split_regex() + "KEY=VALUE]...";
  throw ParameterException(command,
                           "Value for " + option_description(*arg, 0) + " should be in " + format +
                               " format but was " + value,
                           arg, value);
}

int ParserState::consumed_count(int i, int initial_size, ArgSpec const &arg) const {
  return config.limit_split() ? int(arg.string_values().size()) - initial_size : i;
}

int ParserState::consumed_count_map(int i, int initial_size, ArgSpec const &arg) const {
  return config.limit_split() ? (int(arg.string_values().size()) - initial_size) / 2 : i;
}

bool ParserState::assert_no_missing_parameters(shared_ptr<ArgSpec> const &arg, Range const &arity,
                                               ArgStack const &args) {
  if (arg->interactive())
    return true;
  int available = int(args.size());
  if (available > 0 && config.limit_split() && !arg->split_regex().empty())
    available += int(arg->split_value(args.back(), config, arity, 0).size()) - 1;
  if (arity.min() <= 0 || available >= arity.min())
    return true;

  vector<shared_ptr<ArgSpec const>> missing{ arg };
  if (arity.min() == 1) {
    if (arg->is_option())
      return fail(MissingParameterException(command, "Missing required parameter for " + option_description(*arg, 0),
                                            missing));
    auto const &index = static_cast<PositionalParamSpec const &>(*arg).index();
    vector<string> labels;
    for (auto const &positional : command->positionals()) {
      if (positional->index().min() >= index.min() && positional->arity().min() > 0)
        labels.push_back(positional->param_label());
    }
    string message = "Missing required parameter";
    if (labels.size() > 1 || arity.min() - available > 1)
      message += "s";
    return fail(MissingParameterException(command, message + ": " + join(", ", labels), missing));
  }
  if (args.empty()) {
    return fail(MissingParameterException(command,
                                          option_description(*arg, 0) + " requires at least " +
                                              std::to_string(arity.min()) + " values, but none were specified.",
                                          missing));
  }
  return fail(MissingParameterException(command,
                                        option_description(*arg, 0) + " requires at least " +
                                            std::to_string(arity.min()) + " values, but only " +
                                            std::to_string(available) + " were specified: " +
                                            remainder_string(args),
                                        missing));
}

void ParserState::assert_no_missing_mandatory_parameter(shared_ptr<ArgSpec> const &arg, ArgStack const &args, int i,
                                                        Range const &arity) {
  if (vararg_can_consume_next_value(*arg, args.back()))
    return;
  string which = arity.min() > 1 ? std::to_string(i + 1) + " (of " + std::to_string(arity.min()) +
                                       " mandatory parameters) "
                                 : string();
  throw MissingParameterException(command,
                                  "Expected parameter " + which + "for " + option_description(*arg, -1) +
                                      " but found '" + args.back() + "'",
                                  { arg });
}

void ParserState::assert_max_values_not_exceeded(shared_ptr<ArgSpec> const &arg, Range const &arity, int consumed,
                                                 ArgStack const &args) {
  if (initializing_defaults || !arg->is_option() || arity.is_variable() || arity.max() <= 1 ||
      consumed < arity.max() || args.empty() || config.unmatched_arguments_allowed())
    return;
  string const &next = args.back();
  if (!vararg_can_consume_next_value(*arg, next) || positional_slot_available())
    return;
  throw MaxValuesExceededException(command,
                                   option_description(*arg, -1) + " should be specified with at most " +
                                       std::to_string(arity.max()) + " values but found '" + next + "'",
                                   arg, next);
}

/**
 * Minimum number of arguments needed by the positional parameters whose index range lies entirely after
 * that of \p arg, if \p arg takes more than one value.
 **/
int ParserState::reserved_capacity(ArgSpec const &arg) const {
  if (!arg.is_positional() || arg.arity().max() <= 1)
    return 0;
  auto const &index = static_cast<PositionalParamSpec const &>(arg).index();
  int reserved = 0;
  for (auto const &positional : command->positionals()) {
    if (positional->index().min() > index.max())
      reserved += positional->capacity().min();
  }
  return reserved;
}

int ParserState::first_reserved_index(ArgSpec const &arg) const {
  auto const &index = static_cast<PositionalParamSpec const &>(arg).index();
  int result = Range::unbounded;
  for (auto const &positional : command->positionals()) {
    if (positional->index().min() > index.max())
      result = std::min(result, positional->index().min());
  }
  return result;
}

int ParserState::consumable_count(ArgSpec const &arg, ArgStack const &args) const {
  int count = 0;
  for (auto it = args.rbegin(); it != args.rend() && vararg_can_consume_next_value(arg, *it); ++it)
    ++count;
  return count;
}

bool ParserState::vararg_can_consume_next_value(ArgSpec const &arg, string const &next) const {
  if (end_of_options && arg.is_positional())
    return true;
  return !command->find_subcommand(next) && !is_option(next);
}

bool ParserState::is_option(string const &arg) const {
  if (arg == config.end_of_options_delimiter())
    return true;
  if (command->find_option(arg))
    return true;
  auto separator_index = arg.find(config.separator());
  if (separator_index != string::npos && separator_index > 0 && command->find_option(arg.substr(0, separator_index)))
    return true;
  return arg.size() > 2 && arg[0] == '-' && command->find_option(arg[1]);
}

bool ParserState::positional_slot_available() const {
  for (auto const &positional : command->positionals()) {
    if (positional->index().max() >= position)
      return true;
  }
  return false;
}

TypeConverter ParserState::type_converter(std::type_index type, shared_ptr<ArgSpec> const &arg, int index) const {
  auto const &converters = arg->converters();
  if (int(converters.size()) > index && converters[index])
    return converters[index];
  auto converter = command->converters().lookup(type, config.case_insensitive_enum_values_allowed());
  if (!converter) {
    throw MissingTypeConverterException(command,
                                        "No TypeConverter registered for " + type_name(type) + " of " +
                                            arg->to_string(),
                                        arg);
  }
  return converter;
}

any ParserState::try_convert(shared_ptr<ArgSpec> const &arg, int index, TypeConverter const &converter,
                             string const &value, std::type_index type) const {
  try {
    return converter(value);
  }
  catch (TypeConversionException &e) {
    throw ParameterException(command, "Invalid value for " + option_description(*arg, index) + ": " + e.what(), arg,
                             value);
  }
  catch (std::exception &e) {
    throw ParameterException(command,
                             "Invalid value for " + option_description(*arg, index) + ": cannot convert '" + value +
                                 "' to " + type_name(type) + " (" + boost::core::demangle(typeid(e).name()) +
                                 ": " + e.what() + ")",
                             arg, value, std::current_exception());
  }
}

string ParserState::option_description(ArgSpec const &arg, int index) const {
  if (arg.is_option()) {
    string description = "option '" + static_cast<OptionSpec const &>(arg).longest_name() + "'";
    if (index >= 0) {
      if (arg.arity().max() > 1)
        description += " at index " + std::to_string(index);
      description += " (" + arg.param_label() + ")";
    }
    return description;
  }
  return "positional parameter at index " + static_cast<PositionalParamSpec const &>(arg).index().to_string() +
         " (" + arg.param_label() + ")";
}

string ParserState::unquote(string const &value) const {
  if (config.trim_quotes() && value.size() > 1 && value.front() == '"' && value.back() == '"')
    return value.substr(1, value.size() - 2);
  return value;
}

string ParserState::read_interactive_value(ArgSpec const &arg, string const &description) {
  string name = arg.is_option() ? static_cast<OptionSpec const &>(arg).longest_name()
                                : "position " + std::to_string(position);
  if (!context.interactive_reader || !*context.interactive_reader) {
    throw ParameterException(command, "No interactive reader is configured to read a value for " +
                                          option_description(arg, -1));
  }
  trace::logger()->debug("Reading value for {} interactively", name);
  return (*context.interactive_reader)(arg, "Enter value for " + name + ": ");
}

void ParserState::update_help_requested(ArgSpec const &arg) {
  if (initializing_defaults || !arg.is_option())
    return;
  auto const &option = static_cast<OptionSpec const &>(arg);
  auto const &logger = trace::logger();
  if (option.help()) {
    logger->info("{} is a help option: not validating required arguments", option.to_string());
    context.help_requested = true;
  }
  if (option.version_help()) {
    logger->info("{} is a version help option: not validating required arguments", option.to_string());
    result.version_help_requested_ = true;
    context.help_requested = true;
  }
  if (option.usage_help()) {
    logger->info("{} is a usage help option: not validating required arguments", option.to_string());
    result.usage_help_requested_ = true;
    context.help_requested = true;
  }
}

void ParserState::remove_required(shared_ptr<ArgSpec> const &arg) {
  required.erase(std::remove(required.begin(), required.end(), arg), required.end());
}

void ParserState::add_string_value(ArgSpec &arg, string const &value) {
  if (!initializing_defaults)
    arg.string_values_.push_back(value);
}

void ParserState::add_original_string_value(ArgSpec &arg, string const &value) {
  if (!initializing_defaults)
    arg.original_string_values_.push_back(value);
}

void ParserState::add_typed_value(ArgSpec &arg, any const &value) {
  if (!initializing_defaults)
    arg.typed_values_.push_back(value);
}

void ParserState::record_position(ArgSpec &arg, int at) {
  if (!initializing_defaults)
    arg.positions_.insert(at);
}

void ParserState::record_match(shared_ptr<ArgSpec> const &arg) {
  if (!initializing_defaults)
    result.add(arg, position);
}

} // namespace detail

Parser::Parser(shared_ptr<CommandSpec> command, shared_ptr<ErrorStrategy> strategy)
  : command_(std::move(command)), strategy_(std::move(strategy))
{
  if (!command_)
    throw InitializationException("Parser requires a command");
  command_->validate_tree();
}

Parser &Parser::interactive_reader(InteractiveReader reader) {
  interactive_reader_ = std::move(reader);
  return *this;
}

ParseResult Parser::parse(vector<string> const &args) const {
  auto const &logger = trace::logger();
  logger->info("Parsing {} command line args {}", args.size(), list_string(args));
  logger->debug("Parser configuration: {}", command_->parser().to_string());

  auto const &config = command_->parser();
  detail::ParseContext context;
  context.original_args = config.expand_at_files() ? expand_at_files(args, config.at_file_comment_char()) : args;
  context.strategy = strategy_;
  context.interactive_reader = &interactive_reader_;

  detail::ArgStack stack(context.original_args.rbegin(), context.original_args.rend());
  ParseResult result(command_);
  detail::ParserState state(context, command_, result);
  state.parse(stack);
  if (!context.errors.empty())
    throw ParameterErrors(command_, context.errors, std::make_shared<ParseResult const>(result));
  return result;
}

ParseResult Parser::parse(int argc, char const *const *argv) const {
  vector<string> args;
  for (int i = 1; i < argc; ++i)
    args.emplace_back(argv[i]);
  return parse(args);
}

ParseResult Parser::parse_or_exit(int argc, char const *const *argv) const {
  try {
    return parse(argc, argv);
  }
  catch (ParameterException &e) {
    e.handle();
  }
}

} // namespace argbind

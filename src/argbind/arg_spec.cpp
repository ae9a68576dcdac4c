#include "./arg_spec.hpp"
#include "./exceptions.hpp"
#include "./parser_config.hpp"
#include "./trace.hpp"
#include "./util.hpp"

#include <algorithm>
#include <deque>

namespace argbind {

namespace {

bool is_zero_arity_type(ValueType const &type) {
  return type.is_boolean();
}

Range resolve_arity(detail::ArgSpecData const &data, bool is_option) {
  if (data.arity)
    return *data.arity;
  if (is_option) {
    // options without a declared type are flags
    if (!data.value_type || is_zero_arity_type(*data.value_type))
      return Range::value_of("0").with_unspecified(true);
    return Range::value_of("1").with_unspecified(true);
  }
  if (data.value_type && data.value_type->is_multi_value())
    return Range::value_of("0..1").with_unspecified(true);
  return Range::value_of("1").with_unspecified(true);
}

ValueType resolve_value_type(detail::ArgSpecData const &data, Range const &arity, bool is_option) {
  if (data.value_type)
    return *data.value_type;
  if (arity.is_variable() || arity.max() > 1)
    return value_type_of<vector<string>>();
  if (arity.max() == 1)
    return value_type_of<string>();
  return is_option ? value_type_of<bool>() : value_type_of<string>();
}

std::regex compile_split_regex(string const &split_regex) {
  if (split_regex.empty())
    return std::regex();
  try {
    return std::regex(split_regex);
  }
  catch (std::regex_error &e) {
    throw InitializationException("Invalid split regex " + repr(split_regex) + ": " + e.what());
  }
}

/**
 * Replaces quoted sections by empty quotes so that they cannot be split, remembering their contents.
 **/
bool mask_quoted_sections(string const &value, string &splittable, std::deque<string> &quoted) {
  string temp;
  bool escaping = false, in_quote = false;
  for (char ch : value) {
    if (ch == '\\') {
      escaping = !escaping;
    } else if (ch == '"') {
      if (!escaping) {
        in_quote = !in_quote;
        if (in_quote) {
          splittable.push_back(ch);
          continue;
        }
        quoted.push_back(temp);
        temp.clear();
        splittable.push_back(ch);
        continue;
      }
      escaping = false;
    } else {
      escaping = false;
    }
    (in_quote ? temp : splittable).push_back(ch);
  }
  if (in_quote) {
    quoted.push_back(temp);
    return false;
  }
  return true;
}

string restore_quoted_sections(string const &part, std::deque<string> &quoted, bool trim_quotes) {
  string result;
  bool escaping = false, in_quote = false;
  for (char ch : part) {
    if (ch == '\\') {
      escaping = !escaping;
    } else if (ch == '"' && !escaping) {
      in_quote = !in_quote;
      if (!trim_quotes)
        result.push_back(ch);
      if (!in_quote && !quoted.empty()) {
        // the closing quote follows the restored text
        if (!trim_quotes)
          result.pop_back();
        result += quoted.front();
        quoted.pop_front();
        if (!trim_quotes)
          result.push_back(ch);
      }
      continue;
    } else {
      escaping = false;
    }
    result.push_back(ch);
  }
  return result;
}

} // anon namespace

ArgSpec::ArgSpec(detail::ArgSpecData data, bool is_option)
  : value_type_(resolve_value_type(data, resolve_arity(data, is_option), is_option)),
    arity_(resolve_arity(data, is_option)),
    required_(false),
    default_value_(std::move(data.default_value)),
    initial_value_(std::move(data.initial_value)),
    has_initial_value_(data.has_initial_value),
    split_regex_(data.split_regex),
    split_pattern_(compile_split_regex(data.split_regex)),
    hidden_(data.hidden),
    interactive_(data.interactive),
    param_label_(data.param_label.empty() ? string("PARAM") : data.param_label),
    completion_candidates_(std::move(data.completion_candidates)),
    converters_(std::move(data.converters)),
    binding_(std::move(data.binding))
{
  bool required = data.required ? *data.required : (!is_option && arity_.min() > 0);
  required_ = required && !default_value_;

  if (interactive_ && (arity_.min() != 1 || arity_.max() != 1))
    throw InitializationException(
        "Interactive options and positional parameters are only supported for arity=1, not for arity=" +
        arity_.to_string());

  if (!binding_) {
    if (!has_initial_value_) {
      initial_value_ = value_type_.make_default();
      has_initial_value_ = true;
    }
    binding_ = std::make_shared<ObjectBinding>(initial_value_);
  }
}

ArgSpec::ArgSpec(ArgSpec const &other)
  : value_type_(other.value_type_),
    arity_(other.arity_),
    required_(other.required_),
    default_value_(other.default_value_),
    initial_value_(other.initial_value_),
    has_initial_value_(other.has_initial_value_),
    split_regex_(other.split_regex_),
    split_pattern_(other.split_pattern_),
    hidden_(other.hidden_),
    interactive_(other.interactive_),
    param_label_(other.param_label_),
    completion_candidates_(other.completion_candidates_),
    converters_(other.converters_),
    binding_(other.binding_)
{}

ArgSpec::~ArgSpec() = default;

void ArgSpec::reset_values() {
  string_values_.clear();
  original_string_values_.clear();
  typed_values_.clear();
  positions_.clear();
  if (has_initial_value_) {
    binding_->set(initial_value_);
    trace::logger()->debug("Set initial value for {} of type {}", to_string(), type_name(value_type_.type));
  }
}

vector<string> ArgSpec::split_value(string const &value, ParserConfig const &config, Range const &arity,
                                    int consumed) const {
  if (split_regex_.empty())
    return { value };
  int limit = config.limit_split() ? std::max(arity.max() - consumed, 0) : 0;
  if (config.split_quoted_strings())
    return util::split_regex(value, split_pattern_, limit);

  string splittable;
  std::deque<string> quoted;
  if (!mask_quoted_sections(value, splittable, quoted)) {
    trace::logger()->warn("Unbalanced quotes in [{}] for {} (value={})", quoted.back(), to_string(), value);
    return util::split_regex(value, split_pattern_, limit);
  }
  auto result = util::split_regex(splittable, split_pattern_, limit);
  for (auto &part : result)
    part = restore_quoted_sections(part, quoted, config.trim_quotes());
  if (!quoted.empty()) {
    trace::logger()->warn("Unable to respect quotes while splitting value {} for {}", value, to_string());
    return util::split_regex(value, split_pattern_, limit);
  }
  return result;
}

OptionSpec::OptionSpec(Builder const &builder)
  : ArgSpec(builder.data(), true),
    names_(builder.names_),
    usage_help_(builder.usage_help_),
    version_help_(builder.version_help_),
    help_(builder.help_)
{
  if (names_.empty())
    throw InitializationException("Option names cannot be empty. Specify at least one option name.");
  for (auto const &name : names_) {
    if (trim_whitespace(name).empty())
      throw InitializationException("Invalid names: " + list_string(names_));
  }
}

shared_ptr<OptionSpec> OptionSpec::Builder::build() const {
  return std::make_shared<OptionSpec>(*this);
}

string OptionSpec::longest_name() const {
  return *std::max_element(names_.begin(), names_.end(),
                           [](string const &a, string const &b) { return a.size() < b.size(); });
}

string OptionSpec::shortest_name() const {
  return *std::min_element(names_.begin(), names_.end(),
                           [](string const &a, string const &b) { return a.size() < b.size(); });
}

string OptionSpec::to_string() const {
  return "option '" + longest_name() + "'";
}

shared_ptr<ArgSpec> OptionSpec::clone() const {
  return shared_ptr<OptionSpec>(new OptionSpec(*this));
}

PositionalParamSpec::PositionalParamSpec(Builder const &builder)
  : ArgSpec(builder.data(), false),
    index_(builder.index_ ? *builder.index_ : Range::value_of("*")),
    capacity_(Range::parameter_capacity(arity(), index_))
{}

shared_ptr<PositionalParamSpec> PositionalParamSpec::Builder::build() const {
  return std::make_shared<PositionalParamSpec>(*this);
}

string PositionalParamSpec::to_string() const {
  return "positional parameter[" + index_.to_string() + "]";
}

shared_ptr<ArgSpec> PositionalParamSpec::clone() const {
  return shared_ptr<PositionalParamSpec>(new PositionalParamSpec(*this));
}

bool positional_order(ArgSpec const &a, ArgSpec const &b) {
  auto const &pa = static_cast<PositionalParamSpec const &>(a);
  auto const &pb = static_cast<PositionalParamSpec const &>(b);
  if (pa.index() != pb.index())
    return pa.index() < pb.index();
  return pa.arity() < pb.arity();
}

} // namespace argbind

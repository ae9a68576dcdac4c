#ifndef HEADER_GUARD_94510d40a7b41e2df11d75fa414884fc
#define HEADER_GUARD_94510d40a7b41e2df11d75fa414884fc

#include "./fwd.hpp"
#include "./binding.hpp"
#include "./convert.hpp"
#include "./range.hpp"

#include <regex>
#include <set>

namespace argbind {

namespace detail {
struct ParserState;

/**
 * \brief Attributes collected by an argument builder.  Unset attributes receive defaults when the
 * argument is built.
 **/
struct ArgSpecData {
  optional<ValueType> value_type;
  optional<Range> arity;
  optional<bool> required;
  optional<string> default_value;
  any initial_value;
  bool has_initial_value = false;
  string split_regex;
  bool hidden = false;
  bool interactive = false;
  string param_label;
  vector<string> completion_candidates;
  vector<TypeConverter> converters;
  shared_ptr<Binding> binding;
};
} // namespace detail

/**
 * \brief Specifies a list of option names.
 *
 * This can be implicitly constructed from either a single string or a list of strings.
 **/
class OptionNames : public vector<string> {
public:
  OptionNames() = default;
  OptionNames(const char *x) : vector<string>{ std::string(x) } {}
  OptionNames(std::string x) : vector<string>{ std::move(x) } {}
  OptionNames(std::initializer_list<std::string> x) : vector<string>(x) {}
  OptionNames(std::vector<std::string> x) : vector<string>(std::move(x)) {}
};

/**
 * \brief Attributes shared by the option and positional parameter builders.
 * \tparam Self The concrete builder type returned by the setters.
 **/
template <class Self>
class ArgSpecBuilder {
public:
  /**
   * \brief Declares the type of the value.
   *
   * Sequence containers make the argument multi-valued, \c std::map and \c std::unordered_map make it
   * accept \c KEY=VALUE pairs.  If no type is declared, one is derived from the arity.
   **/
  template <class T>
  Self &type() {
    data_.value_type = value_type_of<T>();
    return self();
  }

  /**
   * \brief Stores the value in \p target and declares its type.
   *
   * The current value of \p target becomes the initial value restored before every parse.
   **/
  template <class T>
  Self &bind(T &target) {
    data_.value_type = value_type_of<T>();
    data_.binding = std::make_shared<ReferenceBinding<T>>(target);
    data_.initial_value = any(target);
    data_.has_initial_value = true;
    return self();
  }

  Self &binding(shared_ptr<Binding> value) {
    data_.binding = std::move(value);
    return self();
  }

  Self &getter_setter(std::function<any ()> getter, std::function<void (any)> setter) {
    data_.binding = std::make_shared<FunctionBinding>(std::move(getter), std::move(setter));
    return self();
  }

  /**
   * \brief Value restored before every parse.  Must hold the declared type.
   **/
  Self &initial_value(any value) {
    data_.initial_value = std::move(value);
    data_.has_initial_value = true;
    return self();
  }

  Self &arity(string_view range) {
    data_.arity = Range::value_of(range);
    return self();
  }

  Self &arity(Range range) {
    data_.arity = std::move(range);
    return self();
  }

  Self &required(bool value) {
    data_.required = value;
    return self();
  }

  /**
   * \brief Value applied when the argument is not specified.  An argument with a default value is
   * never required.
   **/
  Self &default_value(string value) {
    data_.default_value = std::move(value);
    return self();
  }

  /**
   * \brief Regular expression splitting each command line value into several values.
   **/
  Self &split_regex(string value) {
    data_.split_regex = std::move(value);
    return self();
  }

  Self &hidden(bool value) {
    data_.hidden = value;
    return self();
  }

  /**
   * \brief The value is read through the parser's \ref InteractiveReader instead of the command line.
   **/
  Self &interactive(bool value) {
    data_.interactive = value;
    return self();
  }

  Self &param_label(string value) {
    data_.param_label = std::move(value);
    return self();
  }

  Self &completion_candidates(vector<string> value) {
    data_.completion_candidates = std::move(value);
    return self();
  }

  /**
   * \brief Converters used instead of the registry, one per auxiliary type.
   **/
  Self &converters(vector<TypeConverter> value) {
    data_.converters = std::move(value);
    return self();
  }

  detail::ArgSpecData const &data() const { return data_; }

protected:
  Self &self() { return static_cast<Self &>(*this); }

  detail::ArgSpecData data_;
};

/**
 * \brief Description of one option or positional parameter.
 *
 * The definition is fixed when the argument is built.  During a parse the parser records the matched
 * values on the argument and writes the converted value through its \ref Binding; these records are
 * reset at the start of every parse.
 **/
class ArgSpec {
public:
  virtual ~ArgSpec();

  virtual bool is_option() const = 0;
  bool is_positional() const { return !is_option(); }

  ValueType const &value_type() const { return value_type_; }
  std::type_index type() const { return value_type_.type; }
  vector<std::type_index> const &auxiliary_types() const { return value_type_.auxiliary_types; }
  bool is_multi_value() const { return value_type_.is_multi_value(); }

  Range const &arity() const { return arity_; }
  bool required() const { return required_; }
  optional<string> const &default_value() const { return default_value_; }
  bool has_initial_value() const { return has_initial_value_; }
  any const &initial_value() const { return initial_value_; }
  string const &split_regex() const { return split_regex_; }
  bool hidden() const { return hidden_; }
  bool interactive() const { return interactive_; }
  string const &param_label() const { return param_label_; }
  vector<string> const &completion_candidates() const { return completion_candidates_; }
  vector<TypeConverter> const &converters() const { return converters_; }
  shared_ptr<Binding> const &binding() const { return binding_; }

  /**
   * \brief The command this argument was added to, or nullptr.
   **/
  CommandSpec *command() const { return command_; }

  any value_any() const { return binding_->get(); }

  template <class T>
  T value() const {
    any v = value_any();
    return any_cast<T>(v);
  }

  void set_value(any value) { binding_->set(std::move(value)); }

  /**
   * \brief Values matched during the last parse, after splitting.
   **/
  vector<string> const &string_values() const { return string_values_; }

  /**
   * \brief Command line arguments matched during the last parse, before splitting.
   **/
  vector<string> const &original_string_values() const { return original_string_values_; }

  /**
   * \brief Converted values of the last parse, in the order they were matched.
   **/
  vector<any> const &typed_values() const { return typed_values_; }

  /**
   * \brief True if a value was recorded for argument position \p position during the last parse.
   **/
  bool has_value_at_position(int position) const { return positions_.count(position) != 0; }

  /**
   * \brief Splits \p value with the split regex.
   *
   * \param arity Arity in effect; with \ref ParserConfig::limit_split the number of pieces is limited to
   * the part of \c arity.max() not yet \p consumed.
   **/
  vector<string> split_value(string const &value, ParserConfig const &config, Range const &arity,
                             int consumed) const;

  virtual string to_string() const = 0;

  /**
   * \brief Returns a copy of the definition that shares the binding but belongs to no command.
   **/
  virtual shared_ptr<ArgSpec> clone() const = 0;

protected:
  ArgSpec(detail::ArgSpecData data, bool is_option);
  ArgSpec(ArgSpec const &other);

private:
  friend class CommandSpec;
  friend struct detail::ParserState;

  void reset_values();

  ValueType value_type_;
  Range arity_;
  bool required_;
  optional<string> default_value_;
  any initial_value_;
  bool has_initial_value_;
  string split_regex_;
  std::regex split_pattern_;
  bool hidden_;
  bool interactive_;
  string param_label_;
  vector<string> completion_candidates_;
  vector<TypeConverter> converters_;
  shared_ptr<Binding> binding_;
  CommandSpec *command_ = nullptr;

  vector<string> string_values_;
  vector<string> original_string_values_;
  vector<any> typed_values_;
  std::set<int> positions_;
};

/**
 * \brief A named option such as \c -v or \c --verbose.
 **/
class OptionSpec : public ArgSpec {
public:
  class Builder : public ArgSpecBuilder<Builder> {
  public:
    explicit Builder(OptionNames names) : names_(std::move(names)) {}

    Builder &names(OptionNames value) {
      names_ = std::move(value);
      return *this;
    }

    /**
     * \brief Matching this option requests usage help and suppresses required-argument validation.
     **/
    Builder &usage_help(bool value) {
      usage_help_ = value;
      return *this;
    }

    /**
     * \brief Matching this option requests version help and suppresses required-argument validation.
     **/
    Builder &version_help(bool value) {
      version_help_ = value;
      return *this;
    }

    /**
     * \brief Matching this option suppresses required-argument validation.
     **/
    Builder &help(bool value) {
      help_ = value;
      return *this;
    }

    shared_ptr<OptionSpec> build() const;

  private:
    friend class OptionSpec;
    OptionNames names_;
    bool usage_help_ = false;
    bool version_help_ = false;
    bool help_ = false;
  };

  static Builder builder(OptionNames names) { return Builder(std::move(names)); }

  /**
   * \throws InitializationException if there is no name or a name is empty
   **/
  explicit OptionSpec(Builder const &builder);

  bool is_option() const override { return true; }

  vector<string> const &names() const { return names_; }
  string longest_name() const;
  string shortest_name() const;

  bool usage_help() const { return usage_help_; }
  bool version_help() const { return version_help_; }
  bool help() const { return help_; }

  string to_string() const override;
  shared_ptr<ArgSpec> clone() const override;

private:
  OptionSpec(OptionSpec const &other) = default;

  vector<string> names_;
  bool usage_help_;
  bool version_help_;
  bool help_;
};

/**
 * \brief A positional parameter claiming one or more argument positions.
 **/
class PositionalParamSpec : public ArgSpec {
public:
  class Builder : public ArgSpecBuilder<Builder> {
  public:
    Builder() = default;

    /**
     * \brief Positions claimed, such as \c "0", \c "1..2" or \c "2..*".  Defaults to all positions.
     **/
    Builder &index(string_view range) {
      index_ = Range::value_of(range);
      return *this;
    }

    Builder &index(Range range) {
      index_ = std::move(range);
      return *this;
    }

    shared_ptr<PositionalParamSpec> build() const;

  private:
    friend class PositionalParamSpec;
    optional<Range> index_;
  };

  static Builder builder() { return Builder(); }

  explicit PositionalParamSpec(Builder const &builder);

  bool is_option() const override { return false; }

  Range const &index() const { return index_; }

  /**
   * \brief Total number of arguments this parameter can consume across its index range.
   **/
  Range const &capacity() const { return capacity_; }

  string to_string() const override;
  shared_ptr<ArgSpec> clone() const override;

private:
  PositionalParamSpec(PositionalParamSpec const &other) = default;

  Range index_;
  Range capacity_;
};

/**
 * \brief Orders positional parameters by index, then by arity.
 **/
bool positional_order(ArgSpec const &a, ArgSpec const &b);

} // namespace argbind

#endif /* HEADER GUARD */

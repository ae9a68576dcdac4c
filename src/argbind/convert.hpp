#ifndef HEADER_GUARD_a33689beee545d2b73f685a20b866190
#define HEADER_GUARD_a33689beee545d2b73f685a20b866190

#include "./fwd.hpp"
#include "./exceptions.hpp"

#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include <boost/lexical_cast.hpp>

namespace argbind {

/**
 * \defgroup Conversion Type conversion
 * \brief Conversion of command line strings to typed values.
 * \details A \ref TypeConverter converts a single string to a value of some type \p T, stored in an
 * \c any.  Converters are looked up first on the argument being processed (see
 * \ref ArgSpecBuilder::converters), then in the \ref ConverterRegistry of its command.
 *
 * Converters report failures by throwing \ref TypeConversionException.
 * @{
 **/

using TypeConverter = std::function<any (string const &value)>;

/**
 * \brief Returns a readable name for \p type, such as \c "int" or \c "string".
 **/
string type_name(std::type_index type);

namespace detail {

[[noreturn]] void handle_type_conversion_failure(std::type_index type, string const &s);

} // namespace detail

/**
 * \brief Converts using \c boost::lexical_cast.
 * \throws TypeConversionException on failure
 **/
template <class T>
T lexical_convert(string const &s) {
  try {
    return boost::lexical_cast<T>(s);
  }
  catch (boost::bad_lexical_cast &) {
    detail::handle_type_conversion_failure(typeid(T), s);
  }
}

/**
 * \brief A URI reference split into the components of RFC 3986.
 *
 * The authority, query and fragment are absent when the reference lacks the \c //, \c ? or \c #
 * delimiter introducing them.
 **/
struct Uri {
  string scheme;
  optional<string> authority;
  string path;
  optional<string> query;
  optional<string> fragment;

  string to_string() const;
};

bool operator==(Uri const &a, Uri const &b);
inline bool operator!=(Uri const &a, Uri const &b) { return !(a == b); }

/**
 * \brief The name of a character encoding known to Boost.Locale.
 **/
struct Charset {
  string name;
};

inline bool operator==(Charset const &a, Charset const &b) { return a.name == b.name; }
inline bool operator!=(Charset const &a, Charset const &b) { return !(a == b); }

/**
 * \brief Maps types to converters.
 *
 * Each \ref CommandSpec owns a copy of a registry.  A registry obtained from \ref with_builtins knows
 * strings, booleans, characters, all standard arithmetic types, and a set of common value types:
 * \c boost::uuids::uuid, \c std::regex, \c boost::gregorian::date, \c boost::posix_time::ptime,
 * \c boost::posix_time::time_duration, \c boost::multiprecision::cpp_int,
 * \c boost::multiprecision::cpp_dec_float_50, \c boost::filesystem::path,
 * \c boost::asio::ip::address, \ref Uri and \ref Charset.
 **/
class ConverterRegistry {
public:
  /**
   * \brief Constructs an empty registry.
   **/
  ConverterRegistry() = default;

  /**
   * \brief Constructs a registry holding the builtin converters.
   **/
  static ConverterRegistry with_builtins();

  /**
   * \brief Registers \p converter for \p type, replacing any existing converter.
   **/
  ConverterRegistry &add(std::type_index type, TypeConverter converter);

  /**
   * \brief Registers a converter for \p T from a function returning a value convertible to \p T.
   **/
  template <class T, class F>
  ConverterRegistry &add(F convert) {
    return add(typeid(T), [convert](string const &s) -> any { return any(T(convert(s))); });
  }

  /**
   * \brief Registers the named constants of the enumeration \p E.
   *
   * Values are matched against the names exactly, or ignoring case if the parser configuration allows
   * case-insensitive enum values.
   **/
  template <class E>
  ConverterRegistry &add_enum(vector<std::pair<string, E>> constants) {
    auto table = std::make_shared<EnumTable>();
    for (auto &c : constants) {
      table->names.push_back(std::move(c.first));
      table->values.push_back(any(c.second));
    }
    enums_[typeid(E)] = std::move(table);
    return *this;
  }

  bool contains(std::type_index type) const;

  /**
   * \brief Returns the converter for \p type, or an empty function if there is none.
   *
   * \param case_insensitive_enums Applies to enumerations registered with \ref add_enum.
   **/
  TypeConverter lookup(std::type_index type, bool case_insensitive_enums = false) const;

  bool is_enum(std::type_index type) const;

  /**
   * \brief Returns the constant names of an enumeration registered with \ref add_enum.
   **/
  vector<string> enum_constants(std::type_index type) const;

private:
  struct EnumTable {
    vector<string> names;
    vector<any> values;
  };

  static any convert_enum(EnumTable const &table, string const &value, bool case_insensitive);

  std::unordered_map<std::type_index, TypeConverter> converters_;
  std::unordered_map<std::type_index, shared_ptr<EnumTable const>> enums_;
};

/** @} */

} // namespace argbind

#endif /* HEADER GUARD */

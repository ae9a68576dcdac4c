#include "./convert.hpp"
#include "./util.hpp"

#include <limits>
#include <regex>

#include <boost/asio/ip/address.hpp>
#include <boost/core/demangle.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/locale/encoding.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>

namespace argbind {

namespace {

struct TypeNames : std::unordered_map<std::type_index, string> {
  TypeNames() {
    emplace(typeid(string), "string");
    emplace(typeid(bool), "boolean");
    emplace(typeid(char), "char");
    emplace(typeid(signed char), "byte");
    emplace(typeid(unsigned char), "unsigned byte");
    emplace(typeid(short), "short");
    emplace(typeid(unsigned short), "unsigned short");
    emplace(typeid(int), "int");
    emplace(typeid(unsigned int), "unsigned int");
    emplace(typeid(long), "long");
    emplace(typeid(unsigned long), "unsigned long");
    emplace(typeid(long long), "long long");
    emplace(typeid(unsigned long long), "unsigned long long");
    emplace(typeid(float), "float");
    emplace(typeid(double), "double");
    emplace(typeid(long double), "long double");
    emplace(typeid(boost::uuids::uuid), "UUID");
    emplace(typeid(std::regex), "pattern");
    emplace(typeid(boost::gregorian::date), "date");
    emplace(typeid(boost::posix_time::ptime), "timestamp");
    emplace(typeid(boost::posix_time::time_duration), "time");
    emplace(typeid(boost::multiprecision::cpp_int), "big integer");
    emplace(typeid(boost::multiprecision::cpp_dec_float_50), "big decimal");
    emplace(typeid(boost::filesystem::path), "path");
    emplace(typeid(boost::asio::ip::address), "IP address");
    emplace(typeid(Uri), "URI");
    emplace(typeid(Charset), "charset");
  }
};

TypeNames const &type_names() {
  static TypeNames names;
  return names;
}

// Integers are range checked against the target type; lexical_cast would otherwise accept "-1" for
// unsigned types and treat single-byte types as characters.
template <class T>
any convert_integer(string const &s) {
  if (std::numeric_limits<T>::is_signed) {
    long long value;
    if (!boost::conversion::try_lexical_convert(s, value) ||
        value < (long long)std::numeric_limits<T>::min() || value > (long long)std::numeric_limits<T>::max())
      detail::handle_type_conversion_failure(typeid(T), s);
    return any(T(value));
  } else {
    unsigned long long value;
    if (starts_with(trim_whitespace(s), "-") || !boost::conversion::try_lexical_convert(s, value) ||
        value > (unsigned long long)std::numeric_limits<T>::max())
      detail::handle_type_conversion_failure(typeid(T), s);
    return any(T(value));
  }
}

template <class T>
any convert_float(string const &s) {
  return any(lexical_convert<T>(s));
}

any convert_bool(string const &s) {
  if (equals_ignore_case(s, "true"))
    return any(true);
  if (equals_ignore_case(s, "false"))
    return any(false);
  throw TypeConversionException(repr(s) + " is not a boolean");
}

any convert_char(string const &s) {
  if (s.size() != 1)
    throw TypeConversionException(repr(s) + " is not a single character");
  return any(s[0]);
}

any convert_uuid(string const &s) {
  try {
    return any(boost::uuids::string_generator()(s));
  }
  catch (std::runtime_error &) {
    detail::handle_type_conversion_failure(typeid(boost::uuids::uuid), s);
  }
}

any convert_regex(string const &s) {
  try {
    return any(std::regex(s));
  }
  catch (std::regex_error &e) {
    throw TypeConversionException(repr(s) + " is not a valid pattern: " + e.what());
  }
}

any convert_date(string const &s) {
  boost::gregorian::date date;
  try {
    date = boost::gregorian::from_simple_string(s);
  }
  catch (std::exception &) {
    throw TypeConversionException(repr(s) + " is not a yyyy-mm-dd date");
  }
  if (date.is_special())
    throw TypeConversionException(repr(s) + " is not a yyyy-mm-dd date");
  return any(date);
}

any convert_timestamp(string const &s) {
  boost::posix_time::ptime time;
  try {
    time = s.find('T') != string::npos ? boost::posix_time::from_iso_extended_string(s)
                                       : boost::posix_time::time_from_string(s);
  }
  catch (std::exception &) {
    throw TypeConversionException(repr(s) + " is not a yyyy-mm-ddThh:mm:ss timestamp");
  }
  if (time.is_special())
    throw TypeConversionException(repr(s) + " is not a yyyy-mm-ddThh:mm:ss timestamp");
  return any(time);
}

any convert_time(string const &s) {
  boost::posix_time::time_duration duration;
  try {
    duration = boost::posix_time::duration_from_string(s);
  }
  catch (std::exception &) {
    throw TypeConversionException(repr(s) + " is not a hh:mm[:ss[.fff]] time");
  }
  if (duration.is_special())
    throw TypeConversionException(repr(s) + " is not a hh:mm[:ss[.fff]] time");
  return any(duration);
}

template <class Number>
any convert_big_number(string const &s) {
  try {
    return any(Number(s));
  }
  catch (std::runtime_error &) {
    detail::handle_type_conversion_failure(typeid(Number), s);
  }
}

any convert_address(string const &s) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(s, ec);
  if (ec)
    throw TypeConversionException(repr(s) + " is not an IP address: " + ec.message());
  return any(address);
}

any convert_uri(string const &s) {
  static std::regex const characters("^([-A-Za-z0-9._~:/?#\\[\\]@!$&'()*+,;=]|%[0-9A-Fa-f]{2})*$");
  static std::regex const reference("^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\\?([^#]*))?(#(.*))?$");
  static std::regex const scheme("^[A-Za-z][-A-Za-z0-9+.]*$");
  std::smatch m;
  if (!std::regex_match(s, characters) || !std::regex_match(s, m, reference) ||
      (m[2].matched && !std::regex_match(m[2].str(), scheme)))
    detail::handle_type_conversion_failure(typeid(Uri), s);
  Uri uri;
  uri.scheme = m[2].str();
  if (m[3].matched)
    uri.authority = m[4].str();
  uri.path = m[5].str();
  if (m[6].matched)
    uri.query = m[7].str();
  if (m[8].matched)
    uri.fragment = m[9].str();
  return any(uri);
}

// the conversion backends refuse to open an unknown encoding even when there is nothing to convert
any convert_charset(string const &s) {
  try {
    boost::locale::conv::to_utf<char>(string(), s);
  }
  catch (boost::locale::conv::invalid_charset_error &) {
    throw TypeConversionException(repr(s) + " is not a supported charset");
  }
  return any(Charset{ s });
}

} // anon namespace

string Uri::to_string() const {
  string result;
  if (!scheme.empty())
    result += scheme + ":";
  if (authority)
    result += "//" + *authority;
  result += path;
  if (query)
    result += "?" + *query;
  if (fragment)
    result += "#" + *fragment;
  return result;
}

bool operator==(Uri const &a, Uri const &b) {
  return a.scheme == b.scheme && a.authority == b.authority && a.path == b.path && a.query == b.query &&
         a.fragment == b.fragment;
}

namespace detail {

[[noreturn]] void handle_type_conversion_failure(std::type_index type, string const &s) {
  auto const &name = type_name(type);
  bool vowel = !name.empty() && string("aeiouAEIO").find(name[0]) != string::npos;
  throw TypeConversionException(repr(s) + (vowel ? " is not an " : " is not a ") + name);
}

} // namespace detail

string type_name(std::type_index type) {
  if (auto name = find_ptr(type_names(), type))
    return *name;
  return boost::core::demangle(type.name());
}

ConverterRegistry ConverterRegistry::with_builtins() {
  ConverterRegistry registry;
  registry.add(typeid(string), [](string const &s) { return any(s); });
  registry.add(typeid(bool), &convert_bool);
  registry.add(typeid(char), &convert_char);
  registry.add(typeid(signed char), &convert_integer<signed char>);
  registry.add(typeid(unsigned char), &convert_integer<unsigned char>);
  registry.add(typeid(short), &convert_integer<short>);
  registry.add(typeid(unsigned short), &convert_integer<unsigned short>);
  registry.add(typeid(int), &convert_integer<int>);
  registry.add(typeid(unsigned int), &convert_integer<unsigned int>);
  registry.add(typeid(long), &convert_integer<long>);
  registry.add(typeid(unsigned long), &convert_integer<unsigned long>);
  registry.add(typeid(long long), &convert_integer<long long>);
  registry.add(typeid(unsigned long long), &convert_integer<unsigned long long>);
  registry.add(typeid(float), &convert_float<float>);
  registry.add(typeid(double), &convert_float<double>);
  registry.add(typeid(long double), &convert_float<long double>);
  registry.add(typeid(boost::uuids::uuid), &convert_uuid);
  registry.add(typeid(std::regex), &convert_regex);
  registry.add(typeid(boost::gregorian::date), &convert_date);
  registry.add(typeid(boost::posix_time::ptime), &convert_timestamp);
  registry.add(typeid(boost::posix_time::time_duration), &convert_time);
  registry.add(typeid(boost::multiprecision::cpp_int), &convert_big_number<boost::multiprecision::cpp_int>);
  registry.add(typeid(boost::multiprecision::cpp_dec_float_50),
               &convert_big_number<boost::multiprecision::cpp_dec_float_50>);
  registry.add(typeid(boost::filesystem::path), [](string const &s) { return any(boost::filesystem::path(s)); });
  registry.add(typeid(boost::asio::ip::address), &convert_address);
  registry.add(typeid(Uri), &convert_uri);
  registry.add(typeid(Charset), &convert_charset);
  return registry;
}

ConverterRegistry &ConverterRegistry::add(std::type_index type, TypeConverter converter) {
  converters_[type] = std::move(converter);
  return *this;
}

bool ConverterRegistry::contains(std::type_index type) const {
  return converters_.count(type) != 0 || enums_.count(type) != 0;
}

TypeConverter ConverterRegistry::lookup(std::type_index type, bool case_insensitive_enums) const {
  if (auto converter = find_ptr(converters_, type))
    return *converter;
  if (auto table = find_ptr(enums_, type)) {
    auto t = *table;
    return [t, case_insensitive_enums](string const &value) {
      return convert_enum(*t, value, case_insensitive_enums);
    };
  }
  return {};
}

bool ConverterRegistry::is_enum(std::type_index type) const {
  return enums_.count(type) != 0;
}

vector<string> ConverterRegistry::enum_constants(std::type_index type) const {
  if (auto table = find_ptr(enums_, type))
    return (*table)->names;
  return {};
}

any ConverterRegistry::convert_enum(EnumTable const &table, string const &value, bool case_insensitive) {
  for (size_t i = 0; i < table.names.size(); ++i) {
    if (table.names[i] == value)
      return table.values[i];
  }
  if (case_insensitive) {
    for (size_t i = 0; i < table.names.size(); ++i) {
      if (equals_ignore_case(table.names[i], value))
        return table.values[i];
    }
  }
  throw TypeConversionException("expected one of " + list_string(table.names) +
                                (case_insensitive ? " (case-insensitive)" : " (case-sensitive)") +
                                " but was " + repr(value));
}

} // namespace argbind

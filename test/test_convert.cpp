#include "argbind/convert.hpp"

#include <gtest/gtest.h>
#include <boost/asio/ip/address.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace argbind {

namespace {

enum class Color { red, green, blue };

struct Opaque {};

template <class T>
T convert(ConverterRegistry const &registry, string const &value) {
  auto converter = registry.lookup(typeid(T));
  if (!converter)
    throw std::logic_error("no converter");
  return any_cast<T>(converter(value));
}

::testing::AssertionResult conversion_fails(TypeConverter const &converter, string const &value,
                                            string const &expected_message) {
  try {
    converter(value);
  }
  catch (TypeConversionException &e) {
    if (e.what() == expected_message)
      return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << "message was " << ::testing::PrintToString(string(e.what()));
  }
  return ::testing::AssertionFailure() << "conversion of " << ::testing::PrintToString(value) << " succeeded";
}

TEST(ConvertTest, Strings) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_EQ("", convert<string>(registry, ""));
  EXPECT_EQ(" a b ", convert<string>(registry, " a b "));
}

TEST(ConvertTest, Booleans) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_TRUE(convert<bool>(registry, "true"));
  EXPECT_TRUE(convert<bool>(registry, "TRUE"));
  EXPECT_FALSE(convert<bool>(registry, "False"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(bool)), "yes", "'yes' is not a boolean"));
}

TEST(ConvertTest, Integers) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_EQ(42, convert<int>(registry, "42"));
  EXPECT_EQ(-7, convert<long>(registry, "-7"));
  EXPECT_EQ(200u, convert<unsigned char>(registry, "200"));
  EXPECT_EQ(18446744073709551615ull, convert<unsigned long long>(registry, "18446744073709551615"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(signed char)), "200", "'200' is not a byte"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(int)), "abc", "'abc' is not an int"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(int)), "99999999999", "'99999999999' is not an int"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(unsigned int)), "-1", "'-1' is not an unsigned int"));
}

TEST(ConvertTest, FloatingPoint) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_DOUBLE_EQ(1.5, convert<double>(registry, "1.5"));
  EXPECT_FLOAT_EQ(-2.25f, convert<float>(registry, "-2.25"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(double)), "1.5x", "'1.5x' is not a double"));
}

TEST(ConvertTest, Characters) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_EQ('x', convert<char>(registry, "x"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(char)), "xy", "'xy' is not a single character"));
}

TEST(ConvertTest, BoostTypes) {
  auto registry = ConverterRegistry::with_builtins();
  EXPECT_EQ(boost::gregorian::date(2020, 2, 29), convert<boost::gregorian::date>(registry, "2020-02-29"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(boost::gregorian::date)), "2020-13-01",
                               "'2020-13-01' is not a yyyy-mm-dd date"));
  EXPECT_EQ(boost::posix_time::hours(1) + boost::posix_time::minutes(30),
            convert<boost::posix_time::time_duration>(registry, "01:30"));
  EXPECT_EQ(boost::posix_time::ptime(boost::gregorian::date(2021, 3, 4), boost::posix_time::hours(5)),
            convert<boost::posix_time::ptime>(registry, "2021-03-04T05:00:00"));
  EXPECT_EQ(boost::filesystem::path("/tmp/x"), convert<boost::filesystem::path>(registry, "/tmp/x"));
  EXPECT_TRUE(convert<boost::asio::ip::address>(registry, "127.0.0.1").is_v4());
  EXPECT_TRUE(convert<boost::asio::ip::address>(registry, "::1").is_v6());
  EXPECT_THROW(registry.lookup(typeid(boost::asio::ip::address))("300.1.1.1"), TypeConversionException);
  EXPECT_EQ("123456789012345678901234567890",
            convert<boost::multiprecision::cpp_int>(registry, "123456789012345678901234567890").str());
  EXPECT_EQ("12345678-1234-5678-1234-567812345678",
            boost::uuids::to_string(convert<boost::uuids::uuid>(registry, "12345678-1234-5678-1234-567812345678")));
  EXPECT_THROW(registry.lookup(typeid(boost::uuids::uuid))("nope"), TypeConversionException);

  auto uri = convert<Uri>(registry, "https://example.com:8080/a/b?x=1&y=2#top");
  EXPECT_EQ("https", uri.scheme);
  EXPECT_EQ(optional<string>("example.com:8080"), uri.authority);
  EXPECT_EQ("/a/b", uri.path);
  EXPECT_EQ(optional<string>("x=1&y=2"), uri.query);
  EXPECT_EQ(optional<string>("top"), uri.fragment);
  EXPECT_EQ("https://example.com:8080/a/b?x=1&y=2#top", uri.to_string());
  auto file = convert<Uri>(registry, "file:///tmp/x%20y");
  EXPECT_EQ(optional<string>(""), file.authority);
  EXPECT_EQ("/tmp/x%20y", file.path);
  EXPECT_FALSE(bool(file.query));
  EXPECT_EQ("file:///tmp/x%20y", file.to_string());
  auto relative = convert<Uri>(registry, "docs/index.html");
  EXPECT_EQ("", relative.scheme);
  EXPECT_FALSE(bool(relative.authority));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(Uri)), "http://exa mple.com",
                               "'http://exa mple.com' is not a URI"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(Uri)), "1http://x", "'1http://x' is not a URI"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(Uri)), "a%zz", "'a%zz' is not a URI"));

  EXPECT_TRUE(Charset{ "UTF-8" } == convert<Charset>(registry, "UTF-8"));
  EXPECT_TRUE(Charset{ "ISO-8859-1" } == convert<Charset>(registry, "ISO-8859-1"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(Charset)), "no-such-charset",
                               "'no-such-charset' is not a supported charset"));
}

TEST(ConvertTest, Enums) {
  auto registry = ConverterRegistry::with_builtins();
  registry.add_enum<Color>({ { "RED", Color::red }, { "GREEN", Color::green }, { "BLUE", Color::blue } });
  EXPECT_TRUE(registry.is_enum(typeid(Color)));
  EXPECT_TRUE(registry.contains(typeid(Color)));
  EXPECT_EQ((vector<string>{ "RED", "GREEN", "BLUE" }), registry.enum_constants(typeid(Color)));
  EXPECT_TRUE(Color::green == convert<Color>(registry, "GREEN"));
  EXPECT_TRUE(conversion_fails(registry.lookup(typeid(Color)), "green",
                               "expected one of [RED, GREEN, BLUE] (case-sensitive) but was 'green'"));
  auto insensitive = registry.lookup(typeid(Color), true);
  EXPECT_TRUE(Color::blue == any_cast<Color>(insensitive("blue")));
  EXPECT_TRUE(conversion_fails(insensitive, "purple",
                               "expected one of [RED, GREEN, BLUE] (case-insensitive) but was 'purple'"));
}

TEST(ConvertTest, CustomConverters) {
  ConverterRegistry registry;
  EXPECT_FALSE(registry.contains(typeid(int)));
  EXPECT_FALSE(bool(registry.lookup(typeid(int))));
  registry.add<int>([](string const &s) { return s.size(); });
  EXPECT_EQ(3, convert<int>(registry, "abc"));
  EXPECT_FALSE(bool(registry.lookup(typeid(Opaque))));
}

TEST(ConvertTest, TypeNames) {
  EXPECT_EQ("int", type_name(typeid(int)));
  EXPECT_EQ("string", type_name(typeid(string)));
  EXPECT_EQ("boolean", type_name(typeid(bool)));
  EXPECT_NE(string::npos, type_name(typeid(Opaque)).find("Opaque"));
}

} // anon namespace

} // namespace argbind

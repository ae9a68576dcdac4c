#ifndef HEADER_GUARD_11d7f7d3df79a74e9ae9e4c532f6edbf
#define HEADER_GUARD_11d7f7d3df79a74e9ae9e4c532f6edbf

#include <string>
#include <experimental/string_view>
#include <experimental/optional>
#include <memory>
#include <vector>
#include <functional>

#ifdef ARGBIND_USE_STD_EXPERIMENTAL_ANY
#include <experimental/any>
#else
#include <boost/any.hpp>
#endif

namespace argbind {

using std::experimental::optional;
using std::experimental::nullopt;
using std::string;
using std::experimental::string_view;
using std::vector;

#ifdef ARGBIND_USE_STD_EXPERIMENTAL_ANY
using std::experimental::any;
using std::experimental::any_cast;
#else
using boost::any;
using boost::any_cast;
#endif

using std::shared_ptr;
using std::weak_ptr;

class Range;
class ArgSpec;
class OptionSpec;
class PositionalParamSpec;
class CommandSpec;
class ParserConfig;
class ParseResult;
class Parser;
class ConverterRegistry;

/**
 * Returns a representation of a string in string literal syntax
 **/
string repr(string_view s);

} // namespace argbind

#endif /* HEADER GUARD */

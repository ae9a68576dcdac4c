#include "./at_file.hpp"
#include "./exceptions.hpp"
#include "./trace.hpp"
#include "./util.hpp"

#include <fstream>
#include <set>

#include <boost/filesystem.hpp>

namespace argbind {

namespace {

char unescape(char c) {
  switch (c) {
  case 'a': return '\a';
  case 'b': return '\b';
  case 'f': return '\f';
  case 'n': return '\n';
  case 'r': return '\r';
  case 't': return '\t';
  case 'v': return '\v';
  default: return c;
  }
}

bool is_whitespace(int c) {
  return static_cast<unsigned char>(c) <= ' ';
}

void add_or_expand(string const &arg, vector<string> &arguments, std::set<string> &visited,
                   optional<char> comment_char);

void expand_argument_file(string const &file_name, vector<string> &arguments, std::set<string> &visited,
                          optional<char> comment_char) {
  namespace fs = boost::filesystem;
  fs::path path = fs::absolute(fs::path(file_name));
  boost::system::error_code ec;
  std::ifstream in;
  if (fs::is_regular_file(path, ec))
    in.open(path.string());
  if (!in.is_open() || !in) {
    trace::logger()->info("File {} does not exist or cannot be read; treating argument literally", file_name);
    arguments.push_back("@" + file_name);
    return;
  }
  if (!visited.insert(path.lexically_normal().string()).second) {
    trace::logger()->info("Already visited file {}; ignoring", path.string());
    return;
  }
  auto tokens = detail::tokenize_argument_file(in, comment_char);
  if (in.bad())
    throw InitializationException("Could not read argument file @" + file_name);
  vector<string> result;
  for (auto const &token : tokens)
    add_or_expand(token, result, visited, comment_char);
  trace::logger()->info("Expanded file @{} to arguments {}", file_name, list_string(result));
  arguments.insert(arguments.end(), result.begin(), result.end());
}

void add_or_expand(string const &arg, vector<string> &arguments, std::set<string> &visited,
                   optional<char> comment_char) {
  if (arg.size() > 1 && arg[0] == '@') {
    string rest = arg.substr(1);
    if (rest[0] == '@') {
      trace::logger()->info("Not expanding @-escaped argument {} (trimmed leading '@' char)", rest);
      arguments.push_back(rest);
      return;
    }
    trace::logger()->info("Expanding argument file @{}", rest);
    expand_argument_file(rest, arguments, visited, comment_char);
    return;
  }
  arguments.push_back(arg);
}

} // anon namespace

vector<string> expand_at_files(vector<string> const &args, optional<char> comment_char) {
  vector<string> expanded;
  for (auto const &arg : args) {
    std::set<string> visited;
    add_or_expand(arg, expanded, visited, comment_char);
  }
  return expanded;
}

namespace detail {

vector<string> tokenize_argument_file(std::istream &in, optional<char> comment_char) {
  vector<string> result;
  auto is_comment = [&](int c) { return comment_char && c == static_cast<unsigned char>(*comment_char); };
  int c = in.get();
  while (c != std::char_traits<char>::eof()) {
    if (is_whitespace(c)) {
      c = in.get();
    } else if (is_comment(c)) {
      while (c != std::char_traits<char>::eof() && c != '\n' && c != '\r')
        c = in.get();
    } else if (c == '"' || c == '\'') {
      int quote = c;
      string token;
      c = in.get();
      while (c != std::char_traits<char>::eof() && c != quote && c != '\n' && c != '\r') {
        if (c == '\\') {
          c = in.get();
          if (c == std::char_traits<char>::eof())
            break;
          token.push_back(unescape(static_cast<char>(c)));
        } else {
          token.push_back(static_cast<char>(c));
        }
        c = in.get();
      }
      if (c == quote)
        c = in.get();
      result.push_back(std::move(token));
    } else {
      string token;
      while (c != std::char_traits<char>::eof() && !is_whitespace(c) && c != '"' && c != '\'' && !is_comment(c)) {
        token.push_back(static_cast<char>(c));
        c = in.get();
      }
      result.push_back(std::move(token));
    }
  }
  return result;
}

} // namespace detail

} // namespace argbind

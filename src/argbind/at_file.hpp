#ifndef HEADER_GUARD_a36344ddc1bbed92852d85a4ebbecd36
#define HEADER_GUARD_a36344ddc1bbed92852d85a4ebbecd36

#include "./fwd.hpp"

#include <iosfwd>

namespace argbind {

/**
 * \brief Replaces every \c @file argument by the arguments stored in \c file.
 *
 * Argument files may refer to other argument files; a file already being expanded is skipped.  The
 * argument \c "@" is kept as is, \c "@@x" becomes the literal argument \c "@x", and a file that cannot
 * be read is passed on literally.
 *
 * \param comment_char Starts a comment that extends to the end of the line, or nullopt.
 * \throws InitializationException if a readable file fails while being read
 **/
vector<string> expand_at_files(vector<string> const &args, optional<char> comment_char);

namespace detail {

/**
 * \brief Splits the contents of an argument file into arguments.
 *
 * Arguments are separated by whitespace.  Single or double quotes group characters, including
 * whitespace, into one argument; inside quotes a backslash escapes the next character and a newline
 * ends the quoted section.
 **/
vector<string> tokenize_argument_file(std::istream &in, optional<char> comment_char);

} // namespace detail

} // namespace argbind

#endif /* HEADER GUARD */

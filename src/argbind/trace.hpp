#ifndef HEADER_GUARD_6e426c6d97fd75749fd6a2f490500d2c
#define HEADER_GUARD_6e426c6d97fd75749fd6a2f490500d2c

#include "./fwd.hpp"

#include <spdlog/spdlog.h>

namespace argbind {

/**
 * \brief Diagnostic output of the parser.
 *
 * All messages go to the \c "argbind" spdlog logger, which writes to stderr.  The initial level is read
 * from the \c ARGBIND_TRACE environment variable: \c off, \c warn, \c info or \c debug (\c true is taken
 * as \c info).  Without it, only warnings are shown.
 **/
namespace trace {

shared_ptr<spdlog::logger> const &logger();

void set_level(spdlog::level::level_enum level);

/**
 * \brief Maps an \c ARGBIND_TRACE value to a level.  Unknown values map to \c warn.
 **/
spdlog::level::level_enum level_from_string(string_view value);

} // namespace trace

} // namespace argbind

#endif /* HEADER GUARD */

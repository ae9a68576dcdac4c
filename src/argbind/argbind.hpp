#ifndef HEADER_GUARD_7f9e837ccf0f3c83a8f25ad6042e3fa1
#define HEADER_GUARD_7f9e837ccf0f3c83a8f25ad6042e3fa1

#include "./fwd.hpp"
#include "./range.hpp"
#include "./exceptions.hpp"
#include "./convert.hpp"
#include "./binding.hpp"
#include "./arg_spec.hpp"
#include "./parser_config.hpp"
#include "./command_spec.hpp"
#include "./parse_result.hpp"
#include "./parser.hpp"
#include "./similarity.hpp"
#include "./at_file.hpp"
#include "./trace.hpp"

#endif /* HEADER GUARD */

#include "./trace.hpp"
#include "./util.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace argbind {
namespace trace {

namespace {

shared_ptr<spdlog::logger> make_logger() {
  auto existing = spdlog::get("argbind");
  if (existing)
    return existing;
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern("[argbind %l] %v");
  auto result = std::make_shared<spdlog::logger>("argbind", sink);
  char const *env = std::getenv("ARGBIND_TRACE");
  result->set_level(env ? level_from_string(env) : spdlog::level::warn);
  result->flush_on(spdlog::level::warn);
  spdlog::register_logger(result);
  return result;
}

} // anon namespace

shared_ptr<spdlog::logger> const &logger() {
  static shared_ptr<spdlog::logger> const instance = make_logger();
  return instance;
}

void set_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

spdlog::level::level_enum level_from_string(string_view value) {
  auto v = ascii_to_lower(trim_whitespace(value));
  if (v == "off")
    return spdlog::level::off;
  if (v == "debug")
    return spdlog::level::debug;
  if (v == "info" || v == "true")
    return spdlog::level::info;
  return spdlog::level::warn;
}

} // namespace trace
} // namespace argbind

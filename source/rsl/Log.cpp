#include "Log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/color.h>

namespace rsl {
namespace logging {

static std::atomic<Level> sLevel{Level::Warn};

static std::string_view LevelName(Level l) {
  switch (l) {
  case Level::Error:
    return "error";
  case Level::Warn:
    return "warn";
  case Level::Info:
    return "info";
  case Level::Debug:
    return "debug";
  case Level::Trace:
    return "trace";
  }
  return "?";
}

static fmt::text_style LevelStyle(Level l) {
  switch (l) {
  case Level::Error:
    return fmt::fg(fmt::color::dark_red);
  case Level::Warn:
    return fmt::fg(fmt::color::yellow);
  case Level::Info:
    return fmt::fg(fmt::color::light_green);
  default:
    return {};
  }
}

void init() {
  const char* env = std::getenv("LIBGX_LOG");
  if (env == nullptr) {
    return;
  }
  const std::string_view want(env);
  for (auto l : {Level::Error, Level::Warn, Level::Info, Level::Debug,
                 Level::Trace}) {
    if (want == LevelName(l)) {
      setLevel(l);
      return;
    }
  }
  warn("LIBGX_LOG: unknown level \"{}\"", want);
}
void setLevel(Level level) { sLevel.store(level); }
Level getLevel() { return sLevel.load(); }

void log(Level l, std::string_view s) {
  if (static_cast<int>(l) > static_cast<int>(sLevel.load())) {
    return;
  }
  // Single call so concurrent lines do not interleave
  fmt::print(stderr, "{} {}\n",
             fmt::styled(fmt::format("[{}]", LevelName(l)), LevelStyle(l)), s);
}
void debug(std::string_view s) { log(Level::Debug, s); }
void error(std::string_view s) { log(Level::Error, s); }
void info(std::string_view s) { log(Level::Info, s); }
void trace(std::string_view s) { log(Level::Trace, s); }
void warn(std::string_view s) { log(Level::Warn, s); }

} // namespace logging
} // namespace rsl

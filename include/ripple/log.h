#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace ripple {

enum class log_level {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

inline auto to_string(const log_level level) -> std::string_view {
  switch (level) {
  case log_level::trace:
    return "trace";
  case log_level::debug:
    return "debug";
  case log_level::info:
    return "info";
  case log_level::warn:
    return "warn";
  case log_level::error:
    return "error";
  case log_level::off:
    return "off";
  }
  return "unknown";
}

using log_sink_t = std::function<void(log_level, std::string_view)>;

inline void stderr_sink(const log_level level, const std::string_view message) {
  fmt::print(stderr, "[ripple] {}: {}\n", to_string(level), message);
}

class logger {
  log_level threshold;
  log_sink_t sink;

public:
  explicit logger(log_level threshold = log_level::warn,
                  log_sink_t sink = stderr_sink)
      : threshold{threshold}, sink{std::move(sink)} {}

  auto level() const { return threshold; }

  auto enabled(const log_level level) const {
    return level != log_level::off and level >= threshold and bool{sink};
  }

  template <typename... Args>
  void log(const log_level level, fmt::format_string<Args...> format,
           Args &&...args) const {
    if (not enabled(level))
      return;

    sink(level, fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void trace(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::trace, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::debug, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::info, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::warn, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::error, format, std::forward<Args>(args)...);
  }
};

} // namespace ripple

template <> struct fmt::formatter<ripple::log_level> : formatter<string_view> {
  auto format(const ripple::log_level level, format_context &ctx) const {
    return formatter<string_view>::format(ripple::to_string(level), ctx);
  }
};

#pragma once

#include <fmt/core.h>

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace retrack {

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
  default:
    return "unknown";
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
}

using log_sink_t = std::function<void(log_level, std::string_view)>;

struct runtime_config_t {
  log_level level = log_level::off;

  // Empty means stderr.
  log_sink_t sink = {};
};

class logger_t {
  runtime_config_t config_;

public:
  explicit logger_t(runtime_config_t config) : config_{std::move(config)} {}

  auto &config() const { return config_; }
  void set_level(const log_level level) { config_.level = level; }

  auto enabled(const log_level level) const {
    return level != log_level::off and level >= config_.level;
  }

  template <typename... Args>
  void log(const log_level level, fmt::format_string<Args...> format,
           Args &&...args) const {
    if (not enabled(level))
      return;

    const auto message = fmt::format(format, std::forward<Args>(args)...);
    if (config_.sink) {
      config_.sink(level, message);
      return;
    }

    fmt::print(stderr, "[retrack:{}] {}\n", to_string(level), message);
  }
};

} // namespace retrack

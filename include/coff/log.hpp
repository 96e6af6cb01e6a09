#pragma once

#include <fmt/core.h>
#include <functional>
#include <string_view>
#include <utility>

namespace coff {

enum struct log_level { debug, info, warning, error };

inline auto format_as(log_level l) noexcept {
  switch (l) {
  case log_level::debug:
    return "debug";
  case log_level::info:
    return "info";
  case log_level::warning:
    return "warning";
  case log_level::error:
    return "error";
  }
  return "???";
}

using log_sink = std::function<void(log_level, std::string_view)>;

// Forwards formatted messages to a sink. A default constructed logger drops
// everything and never formats.
class logger {
public:
  logger() = default;
  explicit logger(log_sink sink) : _sink(std::move(sink)) {}

  template <typename... Args>
  void log(log_level level, fmt::format_string<Args...> format,
           Args &&...args) const {
    if (!_sink)
      return;
    _sink(level, fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::debug, format, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args &&...args) const {
    log(log_level::error, format, std::forward<Args>(args)...);
  }

private:
  log_sink _sink;
};

} // namespace coff

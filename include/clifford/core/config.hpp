#pragma once

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace clifford::core {

/**
 * \brief Parse the diagnostic trace switch from `CLIFFORD_TRACE`.
 * \return `true` for `1`, `true`, `on` or `yes` (case-insensitive).
 */
inline bool trace_enabled_from_env() {
  const char *raw = std::getenv("CLIFFORD_TRACE");
  if (raw == nullptr) {
    return false;
  }

  std::string value(raw);
  for (char &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  return value == "1" || value == "true" || value == "on" || value == "yes";
}

/// \brief Trace switch, read from the environment once per process.
inline bool trace_enabled() {
  static const bool enabled = trace_enabled_from_env();
  return enabled;
}

/**
 * \brief Emit a `[Tag] message` diagnostic line to stderr when tracing is on.
 * \param tag Component tag printed in brackets.
 * \param format fmt format string.
 * \param args Format arguments.
 */
template <typename... Args>
void trace(std::string_view tag, fmt::format_string<Args...> format, Args &&...args) {
  if (!trace_enabled()) {
    return;
  }
  fmt::print(stderr, "[{}] ", tag);
  fmt::print(stderr, format, std::forward<Args>(args)...);
  std::fputc('\n', stderr);
}

} // namespace clifford::core

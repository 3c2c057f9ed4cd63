#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gpusched {
// Logging utilities
// -----------------
// Every write goes through one process-wide mutex so that lines coming from
// request handlers, the health sweep and the telemetry thread never
// interleave.

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

namespace detail {
inline auto
trim_copy(std::string_view value) -> std::string
{
  const auto first = value.find_first_not_of(" \t\n\r\f\v");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\n\r\f\v");
  return std::string(value.substr(first, last - first + 1));
}
}  // namespace detail

// =============================================================================
// Verbosity parsing: accepts "0".."4" or a level name (case-insensitive)
// =============================================================================

inline auto
parse_verbosity_level(const std::string& val) -> VerbosityLevel
{
  using enum VerbosityLevel;
  const std::string trimmed = detail::trim_copy(val);
  if (trimmed.empty()) {
    throw std::invalid_argument("Invalid verbosity level: " + trimmed);
  }

  if (std::ranges::all_of(
          trimmed, [](unsigned char c) { return std::isdigit(c) != 0; })) {
    if (trimmed.size() > 1) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    switch (trimmed.front()) {
      case '0':
        return Silent;
      case '1':
        return Info;
      case '2':
        return Stats;
      case '3':
        return Debug;
      case '4':
        return Trace;
      default:
        throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
  }

  std::string lower(trimmed.size(), '\0');
  std::ranges::transform(trimmed, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "silent") {
    return Silent;
  }
  if (lower == "info") {
    return Info;
  }
  if (lower == "stats") {
    return Stats;
  }
  if (lower == "debug") {
    return Debug;
  }
  if (lower == "trace") {
    return Trace;
  }
  throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

inline auto
verbosity_style(const VerbosityLevel level)
    -> std::pair<const char*, const char*>
{
  using enum VerbosityLevel;
  switch (level) {
    case Info:
      return {"\x1b[1;32m", "[INFO] "};
    case Stats:
      return {"\x1b[1;35m", "[STATS] "};
    case Debug:
      return {"\x1b[1;34m", "[DEBUG] "};
    case Trace:
      return {"\x1b[1;90m", "[TRACE] "};
    default:
      return {"", ""};
  }
}

// =============================================================================
// Verbosity-controlled logging (stdout)
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (level == VerbosityLevel::Silent ||
      std::to_underlying(current_level) < std::to_underlying(level)) {
    return;
  }
  auto [color, label] = verbosity_style(level);
  const std::scoped_lock lock(log_mutex);
  std::cout << color << label << message << "\x1b[0m\n" << std::flush;
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// =============================================================================
// Unconditional logging (stderr)
// =============================================================================

inline void
log_warning(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;33m[WARNING] " << message << "\x1b[0m\n" << std::flush;
}

// Used for conditions an operator must see: failovers, lost reservations.
inline void
log_warning_critical(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;31m[WARNING] " << message << "\x1b[0m\n" << std::flush;
}

inline void
log_error(const std::string& message)
{
  const std::scoped_lock lock(log_mutex);
  std::cerr << "\x1b[1;31m[ERROR] " << message << "\x1b[0m\n" << std::flush;
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  {
    const std::scoped_lock lock(log_mutex);
    std::cerr << "\x1b[1;41m[FATAL] " << message << "\x1b[0m\n";
  }
  std::terminate();
}
}  // namespace gpusched

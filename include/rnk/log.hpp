#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace rnk {

enum class LogLevel : int { Debug = 0, Info, Warn, Error, Off };

// Process-wide level; default Warn.
void set_log_level(LogLevel lvl);
LogLevel log_level();

// nullptr restores std::cerr.
void set_log_sink(std::ostream* os);

inline bool log_enabled(LogLevel lvl) {
  return lvl != LogLevel::Off && static_cast<int>(lvl) >= static_cast<int>(log_level());
}

// Writes "[rnk] <LEVEL> <msg>\n" to the sink.
void log_write(LogLevel lvl, std::string_view msg);

const char* log_level_name(LogLevel lvl);
std::optional<LogLevel> parse_log_level(const std::string& s);

template <class... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Debug)) log_write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <class... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Info)) log_write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <class... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Warn)) log_write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <class... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
  if (log_enabled(LogLevel::Error)) log_write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace rnk

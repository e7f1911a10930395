#include <rnk/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>

namespace rnk {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
static std::ostream* g_sink = nullptr;

void set_log_level(LogLevel lvl) {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(std::ostream* os) { g_sink = os; }

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default:              return "OFF";
  }
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (k == "debug") return LogLevel::Debug;
  if (k == "info")  return LogLevel::Info;
  if (k == "warn" || k == "warning") return LogLevel::Warn;
  if (k == "error") return LogLevel::Error;
  if (k == "off")   return LogLevel::Off;
  return std::nullopt;
}

void log_write(LogLevel lvl, std::string_view msg) {
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << fmt::format("[rnk] {} {}\n", log_level_name(lvl), msg);
}

} // namespace rnk

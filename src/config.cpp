#include <rnk/config.hpp>
#include <fstream>
#include <istream>
#include <ostream>
#include <fmt/format.h>
#include <rnk/csv.hpp>

namespace rnk {

static void apply_(SessionConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "sim_step") {
    auto v = csv::to_double(value);
    if (v && *v > 0.0) cfg.sim_step = *v;
    else log_warn("session config: sim_step '{}' must be a positive number", value);
  } else if (key == "hop_limit") {
    auto v = csv::to_int(value);
    if (v && *v >= 0) cfg.neighbors.hop_limit = *v;
    else log_warn("session config: hop_limit '{}' must be a non-negative integer", value);
  } else if (key == "fallback_distance") {
    auto v = csv::to_double(value);
    if (v && *v >= 0.0) cfg.neighbors.fallback_distance = *v;
    else log_warn("session config: fallback_distance '{}' must be >= 0", value);
  } else if (key == "log_level") {
    if (auto lvl = parse_log_level(value)) cfg.log_level = *lvl;
    else log_warn("session config: unknown log level '{}'", value);
  } else {
    log_warn("session config: unknown key '{}'", key);
  }
}

SessionConfig session_config_from_csv_stream(std::istream& in) {
  SessionConfig cfg;
  std::string line;
  bool first = true;
  while (std::getline(in, line)) {
    auto raw = csv::content_line(line);
    if (!raw) continue;
    auto cols = csv::split_line(*raw);
    if (first) {
      first = false;
      if (cols[0] == "key") continue;
    }
    if (cols.size() < 2 || cols[0].empty()) {
      log_warn("session config: skipping malformed line '{}'", *raw);
      continue;
    }
    apply_(cfg, cols[0], cols[1]);
  }
  return cfg;
}

std::optional<SessionConfig> load_session_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return session_config_from_csv_stream(f);
}

void write_session_config_csv(std::ostream& os, const SessionConfig& cfg) {
  os << "key,value\n";
  os << fmt::format("sim_step,{}\n", cfg.sim_step);
  os << fmt::format("hop_limit,{}\n", cfg.neighbors.hop_limit);
  if (cfg.neighbors.fallback_distance) os << fmt::format("fallback_distance,{}\n", *cfg.neighbors.fallback_distance);
  if (cfg.log_level) os << fmt::format("log_level,{}\n", log_level_name(*cfg.log_level));
}

} // namespace rnk

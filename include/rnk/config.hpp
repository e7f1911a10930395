#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <rnk/log.hpp>
#include <rnk/neighbors.hpp>

namespace rnk {

struct SessionConfig {
  double sim_step = 0.1;              // seconds per step
  NeighborQueryConfig neighbors{};
  std::optional<LogLevel> log_level;  // unset = leave the process level alone
};

// key,value rows: sim_step, hop_limit, fallback_distance, log_level.
// Unknown keys and out-of-range values are logged and ignored.
SessionConfig session_config_from_csv_stream(std::istream& in);
std::optional<SessionConfig> load_session_config_csv(const std::string& path);

void write_session_config_csv(std::ostream& os, const SessionConfig& cfg);

} // namespace rnk

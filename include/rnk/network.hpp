#pragma once
#include <string>
#include <vector>

namespace rnk {

// Sentinels for "edge unknown" in hot per-step queries.
inline constexpr double kUnknown      = -1001.0;
inline constexpr int    kUnknownLanes = -1001;

// Leading character of junction-internal edge ids (e.g. ":center_0").
inline constexpr char kInternalMarker = ':';

struct Edge {
  std::string id;
  double length = 0.0;     // meters, >= 0
  int lanes = 1;           // >= 1
  double speed = 30.0;     // speed limit, m/s
  bool is_internal = false;
  std::string parent;      // internal links: owning junction id; empty otherwise
};

struct LaneRef {
  std::string edge;
  int lane = 0;
  bool operator==(const LaneRef&) const = default;
};

// Directed arc (from_edge, from_lane) -> (to_edge, to_lane).
struct Connection {
  std::string from_edge;
  int from_lane = 0;
  std::string to_edge;
  int to_lane = 0;
};

enum class StartKind : int { Edge = 0, Internal, Intersection };

// Externally supplied start offset on the global axis.
struct EdgeStart {
  std::string edge;
  double offset = 0.0;
  StartKind kind = StartKind::Edge;
};

// Everything needed to build a Scenario.
struct NetworkDescription {
  std::vector<Edge> edges;
  std::vector<Connection> connections;
  std::vector<EdgeStart> starts;   // optional layout hints; empty = derived
};

} // namespace rnk

#include <rnk/presets.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace rnk {

static void connect_lanes(std::vector<Connection>& out, const std::string& from, const std::string& to, int lanes) {
  for (int l = 0; l < lanes; ++l) out.push_back(Connection{from, l, to, l});
}

NetworkDescription make_ring(const RingParams& p) {
  NetworkDescription net;
  const int n = std::max(1, p.edges);
  const int lanes = std::max(1, p.lanes);
  const double seg = p.length / n;
  const double junction = std::max(0.0, p.junction_length);

  double offset = 0.0;
  for (int i = 0; i < n; ++i) {
    const std::string id = fmt::format("ring_{}", i);
    const std::string next = fmt::format("ring_{}", (i + 1) % n);
    net.edges.push_back(Edge{.id = id, .length = seg, .lanes = lanes, .speed = p.speed});
    net.starts.push_back(EdgeStart{id, offset, StartKind::Edge});
    offset += seg;
    if (junction > 0.0) {
      const std::string link = fmt::format(":j{}_0", i);
      net.edges.push_back(Edge{.id = link, .length = junction, .lanes = lanes, .speed = p.speed,
                               .is_internal = true});
      net.starts.push_back(EdgeStart{link, offset, StartKind::Internal});
      connect_lanes(net.connections, id, link, lanes);
      connect_lanes(net.connections, link, next, lanes);
      offset += junction;
    } else {
      connect_lanes(net.connections, id, next, lanes);
    }
  }
  return net;
}

NetworkDescription make_highway(const HighwayParams& p) {
  NetworkDescription net;
  const int n = std::max(1, p.edges);
  const int lanes = std::max(1, p.lanes);
  const double seg = p.length / n;
  for (int i = 0; i < n; ++i) {
    const std::string id = fmt::format("highway_{}", i);
    net.edges.push_back(Edge{.id = id, .length = seg, .lanes = lanes, .speed = p.speed});
    net.starts.push_back(EdgeStart{id, seg * i, StartKind::Edge});
    if (i + 1 < n) connect_lanes(net.connections, id, fmt::format("highway_{}", i + 1), lanes);
  }
  return net;
}

NetworkDescription make_merge() {
  NetworkDescription net;
  net.edges = {
    Edge{.id = "inflow_highway", .length = 100.0, .lanes = 2, .speed = 30.0},
    Edge{.id = ":left_0",        .length = 5.0,   .lanes = 2, .speed = 30.0, .is_internal = true},
    Edge{.id = "left",           .length = 100.0, .lanes = 2, .speed = 30.0},
    Edge{.id = "center",         .length = 100.0, .lanes = 2, .speed = 30.0},
    Edge{.id = "inflow_merge",   .length = 100.0, .lanes = 1, .speed = 20.0},
    Edge{.id = "bottom",         .length = 50.0,  .lanes = 1, .speed = 20.0},
  };
  connect_lanes(net.connections, "inflow_highway", ":left_0", 2);
  connect_lanes(net.connections, ":left_0", "left", 2);
  connect_lanes(net.connections, "left", "center", 2);
  connect_lanes(net.connections, "inflow_merge", "bottom", 1);
  net.connections.push_back(Connection{"bottom", 0, "center", 0});

  net.starts = {
    {"inflow_highway", 0.0,   StartKind::Edge},
    {"left",           105.0, StartKind::Edge},
    {"center",         205.0, StartKind::Edge},
    {"inflow_merge",   305.0, StartKind::Edge},
    {"bottom",         405.0, StartKind::Edge},
    {":left_0",        100.0, StartKind::Internal},
  };
  return net;
}

NetworkDescription make_preset(NetworkPreset p) {
  switch (p) {
    case NetworkPreset::Ring:
      return make_ring(RingParams{.length = 230.0, .edges = 4, .lanes = 1, .junction_length = 2.0});
    case NetworkPreset::Highway:
      return make_highway(HighwayParams{.length = 600.0, .edges = 3, .lanes = 3});
    case NetworkPreset::Merge:
      return make_merge();
    default:
      return make_ring();
  }
}

const char* preset_name(NetworkPreset p) {
  switch (p) {
    case NetworkPreset::Ring:    return "Ring";
    case NetworkPreset::Highway: return "Highway";
    case NetworkPreset::Merge:   return "Merge";
    default: return "Unknown";
  }
}

std::vector<VehicleSpawn> preset_vehicles(NetworkPreset p, std::size_t n) {
  std::vector<VehicleSpawn> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    VehicleSpawn v;
    v.id = fmt::format("veh_{}", i);
    v.speed = 8.0 + 1.5 * static_cast<double>(i % 4);   // 8, 9.5, 11, 12.5 pattern
    switch (p) {
      case NetworkPreset::Ring: {
        // Even spacing around the 4 x 57.5 m ring of make_preset.
        const double seg = 230.0 / 4.0;
        const double s = 230.0 * static_cast<double>(i) / static_cast<double>(n);
        const int edge = std::min(3, static_cast<int>(std::floor(s / seg)));
        v.edge = fmt::format("ring_{}", edge);
        v.pos = s - seg * edge;
        v.lane = 0;
        break;
      }
      case NetworkPreset::Highway:
        v.edge = "highway_0";
        v.lane = static_cast<int>(i % 3);
        v.pos = std::fmod(12.0 * static_cast<double>(i / 3), 200.0);
        break;
      case NetworkPreset::Merge:
      default:
        if (i % 3 == 2) {
          v.edge = "inflow_merge";
          v.lane = 0;
          v.pos = std::fmod(15.0 * static_cast<double>(i / 3), 100.0);
        } else {
          v.edge = "inflow_highway";
          v.lane = static_cast<int>(i % 3);
          v.pos = std::fmod(15.0 * static_cast<double>(i / 3), 100.0);
        }
        break;
    }
    if (i % 5 == 4) {
      v.type = "rl";
      v.kind = VehicleKind::Autonomous;
    }
    out.push_back(std::move(v));
  }
  return out;
}

} // namespace rnk

#pragma once
#include <cstdint>
#include <memory>
#include <rnk/backend.hpp>
#include <rnk/config.hpp>
#include <rnk/neighbors.hpp>
#include <rnk/network.hpp>
#include <rnk/position_map.hpp>
#include <rnk/topology.hpp>
#include <rnk/vehicle_table.hpp>

namespace rnk {

// Immutable network facts. Safe to share read-only between sessions.
class Scenario {
public:
  // Throws TopologyError on a malformed network or inconsistent start hints.
  explicit Scenario(NetworkDescription net);

  const NetworkDescription& network() const { return net_; }
  const NetworkTopology& topology() const { return topo_; }
  const GlobalPositionMap& positions() const { return map_; }

private:
  NetworkDescription net_;
  NetworkTopology topo_;
  GlobalPositionMap map_;
};

std::shared_ptr<const Scenario> make_scenario(NetworkDescription net);

// One episode: owns its vehicle table and query engine, drives one backend.
// Per step: advance, then exactly one refresh, then any number of queries.
class Session {
public:
  Session(std::shared_ptr<const Scenario> scenario, SimulatorBackend& backend, SessionConfig cfg = {});
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  void reset();
  void step();

  const Scenario& scenario() const { return *scenario_; }
  const SessionConfig& config() const { return cfg_; }

  VehicleStateTable& vehicles() { return table_; }
  const VehicleStateTable& vehicles() const { return table_; }
  const LaneNeighborQueryEngine& neighbors() const { return engine_; }

  double time() const { return table_.time(); }
  std::uint64_t step_count() const { return steps_; }

private:
  std::shared_ptr<const Scenario> scenario_;
  SimulatorBackend& backend_;
  SessionConfig cfg_;
  VehicleStateTable table_;
  LaneNeighborQueryEngine engine_;
  std::uint64_t steps_{0};
};

} // namespace rnk

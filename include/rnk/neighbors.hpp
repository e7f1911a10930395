#pragma once
#include <optional>
#include <string>
#include <vector>
#include <rnk/network.hpp>
#include <rnk/position_map.hpp>
#include <rnk/topology.hpp>
#include <rnk/vehicle_table.hpp>

namespace rnk {

struct NeighborQueryConfig {
  int hop_limit = 1;                        // edges searched past the local one
  std::optional<double> fallback_distance;  // no-neighbor gap; unset = network length
};

// Per-lane results for one vehicle, indexed by lane of its current edge.
struct LaneNeighbors {
  std::vector<double> headways;
  std::vector<double> tailways;
  std::vector<std::string> leaders;     // "" = none
  std::vector<std::string> followers;
  bool operator==(const LaneNeighbors&) const = default;
};

// Leader/follower queries over one table snapshot. Holds no per-call state;
// topology and position map must outlive the engine.
class LaneNeighborQueryEngine {
public:
  LaneNeighborQueryEngine(const NetworkTopology& topo, const GlobalPositionMap& map,
                          NeighborQueryConfig cfg = {});

  const NeighborQueryConfig& config() const { return cfg_; }
  // Gap reported when a lane holds no neighbor within the hop limit.
  double fallback_distance() const;

  // Position of the vehicle on the global axis.
  double global_position(const VehicleStateTable& t, const std::string& id, double error = kUnknown) const;

  // Same lane.
  std::string leader(const VehicleStateTable& t, const std::string& id, const std::string& error = "") const;
  std::string follower(const VehicleStateTable& t, const std::string& id, const std::string& error = "") const;
  double headway(const VehicleStateTable& t, const std::string& id, double error = kUnknown) const;
  double tailway(const VehicleStateTable& t, const std::string& id, double error = kUnknown) const;

  // Every lane of the vehicle's edge.
  LaneNeighbors lane_neighbors(const VehicleStateTable& t, const std::string& id,
                               const LaneNeighbors& error = {}) const;
  std::vector<std::string> lane_leaders(const VehicleStateTable& t, const std::string& id,
                                        const std::vector<std::string>& error = {}) const;
  std::vector<std::string> lane_followers(const VehicleStateTable& t, const std::string& id,
                                          const std::vector<std::string>& error = {}) const;
  std::vector<double> lane_headways(const VehicleStateTable& t, const std::string& id,
                                    const std::vector<double>& error = {}) const;
  std::vector<double> lane_tailways(const VehicleStateTable& t, const std::string& id,
                                    const std::vector<double>& error = {}) const;

  // Element-wise versions.
  std::vector<double> global_position(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                      double error = kUnknown) const;
  std::vector<std::string> leader(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                  const std::string& error = "") const;
  std::vector<std::string> follower(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                    const std::string& error = "") const;
  std::vector<double> headway(const VehicleStateTable& t, const std::vector<std::string>& ids,
                              double error = kUnknown) const;
  std::vector<double> tailway(const VehicleStateTable& t, const std::vector<std::string>& ids,
                              double error = kUnknown) const;
  std::vector<LaneNeighbors> lane_neighbors(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                            const LaneNeighbors& error = {}) const;
  std::vector<std::vector<std::string>> lane_leaders(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                     const std::vector<std::string>& error = {}) const;
  std::vector<std::vector<std::string>> lane_followers(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                       const std::vector<std::string>& error = {}) const;
  std::vector<std::vector<double>> lane_headways(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                 const std::vector<double>& error = {}) const;
  std::vector<std::vector<double>> lane_tailways(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                 const std::vector<double>& error = {}) const;

private:
  struct Hit {
    std::string id;
    double gap = 0.0;
  };

  // Nearest vehicle ahead of / behind `self` in `lane`; nullopt if none
  // within the hop limit.
  std::optional<Hit> find_ahead_(const VehicleStateTable& t, const VehicleRecord& self, int lane) const;
  std::optional<Hit> find_behind_(const VehicleStateTable& t, const VehicleRecord& self, int lane) const;

  const NetworkTopology& topo_;
  const GlobalPositionMap& map_;
  NeighborQueryConfig cfg_;
};

} // namespace rnk

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <rnk/backend.hpp>
#include <rnk/topology.hpp>

namespace rnk {

struct VehicleSpawn {
  std::string id;
  std::string edge;
  int lane = 0;
  double pos = 0.0;        // meters from edge start
  double speed = 10.0;     // m/s, held constant
  double length = 5.0;
  std::string type = "human";
  VehicleKind kind = VehicleKind::Human;
};

// Synthetic backend: constant-speed vehicles that follow next() links,
// keeping their lane index where the junction allows it. A vehicle that runs
// off a sink edge arrives and leaves the network.
class KinematicBackend : public SimulatorBackend {
public:
  // Throws TopologyError if the network is malformed.
  explicit KinematicBackend(NetworkDescription net, std::vector<VehicleSpawn> initial = {});

  const NetworkDescription& network() const override { return net_; }
  void reset() override;
  void advance(double dt) override;
  StepSnapshot snapshot() const override;

  // Live insertion/removal; reported in the next snapshot after advance().
  // add_vehicle rejects duplicate ids and unknown edges/lanes.
  bool add_vehicle(const VehicleSpawn& v);
  bool remove_vehicle(const std::string& id);
  bool set_speed(const std::string& id, double speed);

  std::size_t vehicle_count() const { return vehicles_.size(); }
  double time() const { return time_; }
  const NetworkTopology& topology() const { return topo_; }

private:
  struct Vehicle {
    VehicleSpawn spawn;
    std::vector<std::string> route;   // most recent edges entered
  };

  Vehicle* find_(const std::string& id);
  bool valid_(const VehicleSpawn& v) const;
  // Length of the follow_next loop through (edge, lane); 0 if there is none.
  double lap_length_(const std::string& edge, int lane) const;
  // false once the vehicle has left the network
  bool move_(Vehicle& v, double dist) const;

  NetworkDescription net_;
  NetworkTopology topo_;
  std::vector<VehicleSpawn> initial_;
  std::size_t lane_states_{0};

  std::vector<Vehicle> vehicles_;
  double time_{0.0};
  std::vector<std::string> departed_;
  std::vector<std::string> arrived_;
  std::vector<std::string> teleported_;
  std::vector<std::string> pending_departed_;
  std::vector<std::string> pending_teleported_;
};

} // namespace rnk

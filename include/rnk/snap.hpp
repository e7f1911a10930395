#pragma once
#include <string>
#include <vector>

namespace rnk {

enum class VehicleKind : int { Human = 0, Autonomous = 1 };

// One vehicle as reported by the simulator for the current step.
struct VehicleObservation {
  std::string id;
  std::string edge;
  int lane = 0;                // 0-based, edge lane order
  double pos = 0.0;            // meters from the edge start
  double speed = 0.0;          // m/s
  double length = 5.0;         // meters
  std::string type;            // vehicle type tag, e.g. "human", "rl"
  VehicleKind kind = VehicleKind::Human;
  std::vector<std::string> route;
};

// Simulator state after one advance.
struct StepSnapshot {
  double time = 0.0;                       // simulation time (s)
  std::vector<VehicleObservation> vehicles;
  std::vector<std::string> departed;       // entered during this step
  std::vector<std::string> arrived;        // left at a sink
  std::vector<std::string> teleported;     // removed by the simulator
};

} // namespace rnk

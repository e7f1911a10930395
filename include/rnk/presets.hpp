#pragma once
#include <cstddef>
#include <vector>
#include <rnk/kinematic.hpp>
#include <rnk/network.hpp>

namespace rnk {

enum class NetworkPreset : int {
  Ring = 0,
  Highway = 1,
  Merge = 2,
  Count
};

// Closed loop of `edges` equal segments ring_0..ring_{n-1}. With a positive
// junction_length each segment ends in an internal link ":j<i>_0".
struct RingParams {
  double length = 230.0;          // sum of the ring_i lengths
  int edges = 4;
  int lanes = 1;
  double speed = 30.0;
  double junction_length = 0.0;
};

// Straight road highway_0..highway_{n-1}, lane-preserving.
struct HighwayParams {
  double length = 1000.0;
  int edges = 1;
  int lanes = 4;
  double speed = 30.0;
};

NetworkDescription make_ring(const RingParams& p = {});
NetworkDescription make_highway(const HighwayParams& p = {});
// Two-lane main line with a 5 m internal link, plus a one-lane on-ramp
// joining lane 0 of the center edge.
NetworkDescription make_merge();

NetworkDescription make_preset(NetworkPreset p);
const char* preset_name(NetworkPreset p);

// n vehicles spread over the preset's entry edges, lanes round-robin.
std::vector<VehicleSpawn> preset_vehicles(NetworkPreset p, std::size_t n);

} // namespace rnk

#include <rnk/kinematic.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <rnk/log.hpp>

namespace rnk {

static constexpr std::size_t kRouteMemory = 32;

KinematicBackend::KinematicBackend(NetworkDescription net, std::vector<VehicleSpawn> initial)
    : net_(std::move(net)), topo_(net_), initial_(std::move(initial)) {
  for (const auto* ids : {&topo_.edge_list(), &topo_.junction_list()}) {
    for (const auto& id : *ids) lane_states_ += static_cast<std::size_t>(topo_.num_lanes(id));
  }
  reset();
}

bool KinematicBackend::valid_(const VehicleSpawn& v) const {
  if (v.id.empty()) return false;
  const int lanes = topo_.num_lanes(v.edge);
  return lanes != kUnknownLanes && v.lane >= 0 && v.lane < lanes;
}

KinematicBackend::Vehicle* KinematicBackend::find_(const std::string& id) {
  auto it = std::find_if(vehicles_.begin(), vehicles_.end(),
                         [&](const Vehicle& v){ return v.spawn.id == id; });
  return it == vehicles_.end() ? nullptr : &*it;
}

void KinematicBackend::reset() {
  vehicles_.clear();
  departed_.clear();
  arrived_.clear();
  teleported_.clear();
  pending_departed_.clear();
  pending_teleported_.clear();
  time_ = 0.0;

  for (const auto& s : initial_) {
    if (!valid_(s) || find_(s.id)) {
      log_warn("kinematic: initial vehicle '{}' on '{}' lane {} rejected", s.id, s.edge, s.lane);
      continue;
    }
    vehicles_.push_back(Vehicle{s, {s.edge}});
    departed_.push_back(s.id);
  }
}

bool KinematicBackend::add_vehicle(const VehicleSpawn& v) {
  if (!valid_(v) || find_(v.id)) return false;
  vehicles_.push_back(Vehicle{v, {v.edge}});
  pending_departed_.push_back(v.id);
  return true;
}

bool KinematicBackend::remove_vehicle(const std::string& id) {
  auto it = std::find_if(vehicles_.begin(), vehicles_.end(),
                         [&](const Vehicle& v){ return v.spawn.id == id; });
  if (it == vehicles_.end()) return false;
  vehicles_.erase(it);
  pending_teleported_.push_back(id);
  return true;
}

bool KinematicBackend::set_speed(const std::string& id, double speed) {
  Vehicle* v = find_(id);
  if (!v) return false;
  v->spawn.speed = std::max(0.0, speed);
  return true;
}

double KinematicBackend::lap_length_(const std::string& edge, int lane) const {
  double lap = 0.0;
  LaneRef at{edge, lane};
  for (std::size_t i = 0; i < lane_states_; ++i) {
    lap += topo_.edge_length(at.edge);
    const LaneRef* to = topo_.follow_next(at.edge, at.lane);
    if (!to) return 0.0;
    at = *to;
    if (at.edge == edge && at.lane == lane) return lap;
  }
  return 0.0;
}

bool KinematicBackend::move_(Vehicle& v, double dist) const {
  VehicleSpawn& s = v.spawn;
  s.pos += dist;
  std::size_t hops = 0;
  double len = topo_.edge_length(s.edge);
  while (s.pos >= len) {
    const LaneRef* to = topo_.follow_next(s.edge, s.lane);
    if (!to) return false;
    // More hops than lane states means the vehicle is going round a loop:
    // drop whole laps. A zero-length loop holds it at the edge end.
    if (++hops > lane_states_) {
      const double lap = lap_length_(s.edge, s.lane);
      if (lap <= 0.0) {
        s.pos = len;
        break;
      }
      s.pos = std::fmod(s.pos, lap);
      hops = 0;
      if (s.pos < len) break;
    }
    s.pos -= len;
    s.edge = to->edge;
    s.lane = to->lane;
    v.route.push_back(s.edge);
    if (v.route.size() > kRouteMemory) v.route.erase(v.route.begin());
    len = topo_.edge_length(s.edge);
  }
  return true;
}

void KinematicBackend::advance(double dt) {
  departed_ = std::move(pending_departed_);
  teleported_ = std::move(pending_teleported_);
  pending_departed_.clear();
  pending_teleported_.clear();
  arrived_.clear();
  if (dt <= 0.0) return;

  // Fixed step, constant speed.
  for (auto it = vehicles_.begin(); it != vehicles_.end();) {
    if (move_(*it, it->spawn.speed * dt)) {
      ++it;
      continue;
    }
    arrived_.push_back(it->spawn.id);
    it = vehicles_.erase(it);
  }
  time_ += dt;
}

StepSnapshot KinematicBackend::snapshot() const {
  StepSnapshot snap;
  snap.time = time_;
  snap.vehicles.reserve(vehicles_.size());
  for (const auto& v : vehicles_) {
    VehicleObservation o;
    o.id = v.spawn.id;
    o.edge = v.spawn.edge;
    o.lane = v.spawn.lane;
    o.pos = v.spawn.pos;
    o.speed = v.spawn.speed;
    o.length = v.spawn.length;
    o.type = v.spawn.type;
    o.kind = v.spawn.kind;
    o.route = v.route;
    snap.vehicles.push_back(std::move(o));
  }
  snap.departed = departed_;
  snap.arrived = arrived_;
  snap.teleported = teleported_;
  return snap;
}

} // namespace rnk

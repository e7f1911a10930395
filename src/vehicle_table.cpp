#include <rnk/vehicle_table.hpp>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <unordered_set>
#include <rnk/log.hpp>

namespace rnk {

static const std::vector<std::string> kNoIds{};
static constexpr std::size_t kMaxHistory = 1u << 16;

template <class T, class Fn>
static std::vector<T> each_id(const std::vector<std::string>& ids, Fn&& fn) {
  std::vector<T> out;
  out.reserve(ids.size());
  for (const auto& id : ids) out.push_back(fn(id));
  return out;
}

static void erase_value(std::vector<std::string>& v, const std::string& id) {
  auto it = std::find(v.begin(), v.end(), id);
  if (it != v.end()) v.erase(it);
}

void VehicleStateTable::refresh(const StepSnapshot& snap) {
  time_ = snap.time;
  departed_.clear();
  arrived_.clear();
  teleported_.clear();

  std::unordered_set<std::string> gone;
  for (const auto& id : snap.arrived) {
    gone.insert(id);
    arrived_.push_back(id);
    remove_(id);
  }
  for (const auto& id : snap.teleported) {
    gone.insert(id);
    teleported_.push_back(id);
    remove_(id);
  }

  std::unordered_set<std::string> seen;
  seen.reserve(snap.vehicles.size());
  for (const auto& obs : snap.vehicles) {
    if (gone.count(obs.id)) continue;
    seen.insert(obs.id);

    auto it = records_.find(obs.id);
    if (it == records_.end()) {
      add_(obs);
      departed_.push_back(obs.id);
      continue;
    }
    VehicleRecord& r = it->second;
    if (r.edge != obs.edge) {
      index_erase_(r.edge, r.id);
      index_insert_(obs.edge, r.id);
      r.edge = obs.edge;
    }
    r.lane = obs.lane;
    r.pos = obs.pos;
    r.speed = obs.speed;
    r.length = obs.length;
    if (!obs.route.empty()) r.route = obs.route;
  }

  // Vehicles the simulator stopped reporting without saying why.
  std::vector<std::string> missing;
  for (const auto& id : ids_) {
    if (!seen.count(id)) missing.push_back(id);
  }
  for (const auto& id : missing) {
    log_debug("vehicle '{}' missing from snapshot at t={}; removed", id, snap.time);
    teleported_.push_back(id);
    remove_(id);
  }

  departed_history_.push_back(departed_.size());
  arrived_history_.push_back(arrived_.size());
  if (departed_history_.size() > kMaxHistory) departed_history_.pop_front();
  if (arrived_history_.size() > kMaxHistory) arrived_history_.pop_front();
}

void VehicleStateTable::clear() {
  time_ = 0.0;
  records_.clear();
  ids_.clear();
  by_edge_.clear();
  observed_.clear();
  departed_.clear();
  arrived_.clear();
  teleported_.clear();
  departed_history_.clear();
  arrived_history_.clear();
}

void VehicleStateTable::add_(const VehicleObservation& obs) {
  VehicleRecord r;
  r.id = obs.id;
  r.edge = obs.edge;
  r.lane = obs.lane;
  r.pos = obs.pos;
  r.speed = obs.speed;
  r.length = obs.length;
  r.type = obs.type;
  r.kind = obs.kind;
  r.route = obs.route;
  records_.emplace(obs.id, std::move(r));
  ids_.push_back(obs.id);
  index_insert_(obs.edge, obs.id);
}

void VehicleStateTable::remove_(const std::string& id) {
  auto it = records_.find(id);
  if (it == records_.end()) return;
  index_erase_(it->second.edge, id);
  records_.erase(it);
  erase_value(ids_, id);
  erase_value(observed_, id);
}

void VehicleStateTable::index_insert_(const std::string& edge, const std::string& id) {
  by_edge_[edge].push_back(id);
}

void VehicleStateTable::index_erase_(const std::string& edge, const std::string& id) {
  auto it = by_edge_.find(edge);
  if (it == by_edge_.end()) return;
  auto& v = it->second;
  // Order within an edge is not part of the contract: swap-and-pop.
  auto pos = std::find(v.begin(), v.end(), id);
  if (pos != v.end()) {
    *pos = std::move(v.back());
    v.pop_back();
  }
  if (v.empty()) by_edge_.erase(it);
}

const VehicleRecord* VehicleStateTable::find(const std::string& id) const {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}

std::size_t VehicleStateTable::num_rl_vehicles() const {
  return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
      [](const auto& kv){ return kv.second.kind == VehicleKind::Autonomous; }));
}

std::vector<std::string> VehicleStateTable::human_ids() const {
  std::vector<std::string> out;
  for (const auto& id : ids_) {
    if (records_.at(id).kind == VehicleKind::Human) out.push_back(id);
  }
  return out;
}

std::vector<std::string> VehicleStateTable::rl_ids() const {
  std::vector<std::string> out;
  for (const auto& id : ids_) {
    if (records_.at(id).kind == VehicleKind::Autonomous) out.push_back(id);
  }
  return out;
}

const std::vector<std::string>& VehicleStateTable::ids_on_edge(const std::string& edge) const {
  auto it = by_edge_.find(edge);
  return it == by_edge_.end() ? kNoIds : it->second;
}

std::vector<std::string> VehicleStateTable::ids_on_edges(const std::vector<std::string>& edges) const {
  std::vector<std::string> out;
  for (const auto& e : edges) {
    const auto& ids = ids_on_edge(e);
    out.insert(out.end(), ids.begin(), ids.end());
  }
  return out;
}

double VehicleStateTable::speed(const std::string& id, double error) const {
  const VehicleRecord* r = find(id);
  return r ? r->speed : error;
}

double VehicleStateTable::position(const std::string& id, double error) const {
  const VehicleRecord* r = find(id);
  return r ? r->pos : error;
}

double VehicleStateTable::length(const std::string& id, double error) const {
  const VehicleRecord* r = find(id);
  return r ? r->length : error;
}

int VehicleStateTable::lane(const std::string& id, int error) const {
  const VehicleRecord* r = find(id);
  return r ? r->lane : error;
}

std::string VehicleStateTable::edge(const std::string& id, const std::string& error) const {
  const VehicleRecord* r = find(id);
  return r ? r->edge : error;
}

std::string VehicleStateTable::type(const std::string& id, const std::string& error) const {
  const VehicleRecord* r = find(id);
  return r ? r->type : error;
}

std::vector<std::string> VehicleStateTable::route(const std::string& id,
                                                  const std::vector<std::string>& error) const {
  const VehicleRecord* r = find(id);
  return r ? r->route : error;
}

std::vector<double> VehicleStateTable::speed(const std::vector<std::string>& ids, double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return speed(id, error); });
}

std::vector<double> VehicleStateTable::position(const std::vector<std::string>& ids, double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return position(id, error); });
}

std::vector<double> VehicleStateTable::length(const std::vector<std::string>& ids, double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return length(id, error); });
}

std::vector<int> VehicleStateTable::lane(const std::vector<std::string>& ids, int error) const {
  return each_id<int>(ids, [&](const std::string& id){ return lane(id, error); });
}

std::vector<std::string> VehicleStateTable::edge(const std::vector<std::string>& ids,
                                                 const std::string& error) const {
  return each_id<std::string>(ids, [&](const std::string& id){ return edge(id, error); });
}

std::vector<std::string> VehicleStateTable::type(const std::vector<std::string>& ids,
                                                 const std::string& error) const {
  return each_id<std::string>(ids, [&](const std::string& id){ return type(id, error); });
}

std::vector<std::vector<std::string>> VehicleStateTable::route(const std::vector<std::string>& ids,
                                                               const std::vector<std::string>& error) const {
  return each_id<std::vector<std::string>>(ids, [&](const std::string& id){ return route(id, error); });
}

void VehicleStateTable::set_observed(const std::string& id) {
  auto it = records_.find(id);
  if (it == records_.end() || it->second.observed) return;
  it->second.observed = true;
  observed_.push_back(id);
}

void VehicleStateTable::remove_observed(const std::string& id) {
  auto it = records_.find(id);
  if (it != records_.end()) it->second.observed = false;
  erase_value(observed_, id);
}

double VehicleStateTable::rate_(const std::deque<std::size_t>& history, double time_span) const {
  if (history.empty() || !(time_span > 0.0) || sim_step_ <= 0.0) return 0.0;
  const double steps = std::clamp(time_span / sim_step_, 1.0, static_cast<double>(history.size()));
  const auto n = static_cast<std::size_t>(steps);
  std::size_t sum = 0;
  for (auto it = history.end() - static_cast<std::ptrdiff_t>(n); it != history.end(); ++it) sum += *it;
  return 3600.0 * static_cast<double>(sum) / (static_cast<double>(n) * sim_step_);
}

double VehicleStateTable::inflow_rate(double time_span) const {
  return rate_(departed_history_, time_span);
}

double VehicleStateTable::outflow_rate(double time_span) const {
  return rate_(arrived_history_, time_span);
}

} // namespace rnk

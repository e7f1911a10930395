#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>
#include <rnk/network.hpp>
#include <rnk/snap.hpp>

namespace rnk {

struct VehicleRecord {
  std::string id;
  std::string edge;
  int lane = 0;
  double pos = 0.0;
  double speed = 0.0;
  double length = 5.0;
  std::string type;
  VehicleKind kind = VehicleKind::Human;
  bool observed = false;
  std::vector<std::string> route;
};

// Per-episode vehicle state, refreshed once per step from a StepSnapshot.
// Accessors never throw: a gone vehicle yields the caller's error value.
class VehicleStateTable {
public:
  explicit VehicleStateTable(double sim_step = 0.1) : sim_step_(sim_step) {}

  // Updates known vehicles in place, adds new ids and drops ids that the
  // snapshot no longer reports. The edge index moves only vehicles whose
  // edge changed.
  void refresh(const StepSnapshot& snap);

  // Forget everything (episode reset).
  void clear();

  double sim_step() const { return sim_step_; }
  double time() const { return time_; }

  bool contains(const std::string& id) const { return records_.count(id) != 0; }
  const VehicleRecord* find(const std::string& id) const;

  std::size_t num_vehicles() const { return ids_.size(); }
  std::size_t num_rl_vehicles() const;
  const std::vector<std::string>& ids() const { return ids_; }   // departure order
  std::vector<std::string> human_ids() const;
  std::vector<std::string> rl_ids() const;

  // Unordered; empty if the edge holds no vehicle.
  const std::vector<std::string>& ids_on_edge(const std::string& edge) const;
  std::vector<std::string> ids_on_edges(const std::vector<std::string>& edges) const;

  // Per-vehicle accessors.
  double speed(const std::string& id, double error = kUnknown) const;
  double position(const std::string& id, double error = kUnknown) const;
  double length(const std::string& id, double error = kUnknown) const;
  int lane(const std::string& id, int error = kUnknownLanes) const;
  std::string edge(const std::string& id, const std::string& error = "") const;
  std::string type(const std::string& id, const std::string& error = "") const;
  std::vector<std::string> route(const std::string& id, const std::vector<std::string>& error = {}) const;

  // Element-wise versions.
  std::vector<double> speed(const std::vector<std::string>& ids, double error = kUnknown) const;
  std::vector<double> position(const std::vector<std::string>& ids, double error = kUnknown) const;
  std::vector<double> length(const std::vector<std::string>& ids, double error = kUnknown) const;
  std::vector<int> lane(const std::vector<std::string>& ids, int error = kUnknownLanes) const;
  std::vector<std::string> edge(const std::vector<std::string>& ids, const std::string& error = "") const;
  std::vector<std::string> type(const std::vector<std::string>& ids, const std::string& error = "") const;
  std::vector<std::vector<std::string>> route(const std::vector<std::string>& ids,
                                              const std::vector<std::string>& error = {}) const;

  // Observed vehicles (visualization); idempotent, insertion ordered.
  void set_observed(const std::string& id);
  void remove_observed(const std::string& id);
  const std::vector<std::string>& observed_ids() const { return observed_; }

  // Bookkeeping for the most recent refresh.
  const std::vector<std::string>& departed_ids() const { return departed_; }
  const std::vector<std::string>& arrived_ids() const { return arrived_; }
  const std::vector<std::string>& teleported_ids() const { return teleported_; }
  std::size_t num_departed() const { return departed_.size(); }
  std::size_t num_arrived() const { return arrived_.size(); }

  // veh/hr over the trailing time_span seconds; 0 before any step.
  double inflow_rate(double time_span) const;
  double outflow_rate(double time_span) const;

private:
  void add_(const VehicleObservation& obs);
  void remove_(const std::string& id);
  void index_insert_(const std::string& edge, const std::string& id);
  void index_erase_(const std::string& edge, const std::string& id);
  double rate_(const std::deque<std::size_t>& history, double time_span) const;

  double sim_step_;
  double time_{0.0};
  std::unordered_map<std::string, VehicleRecord> records_;
  std::vector<std::string> ids_;
  std::unordered_map<std::string, std::vector<std::string>> by_edge_;
  std::vector<std::string> observed_;

  std::vector<std::string> departed_;
  std::vector<std::string> arrived_;
  std::vector<std::string> teleported_;
  std::deque<std::size_t> departed_history_;   // one entry per refresh
  std::deque<std::size_t> arrived_history_;
};

} // namespace rnk

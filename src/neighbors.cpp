#include <rnk/neighbors.hpp>
#include <algorithm>
#include <cstddef>
#include <utility>

namespace rnk {

namespace {

// Ordering key on one edge. Ids break position ties so results never depend
// on the (unordered) edge index.
using Key = std::pair<double, const std::string*>;

bool key_less(const Key& a, const Key& b) {
  if (a.first != b.first) return a.first < b.first;
  return *a.second < *b.second;
}

template <class T, class Fn>
std::vector<T> each_id(const std::vector<std::string>& ids, Fn&& fn) {
  std::vector<T> out;
  out.reserve(ids.size());
  for (const auto& id : ids) out.push_back(fn(id));
  return out;
}

} // namespace

LaneNeighborQueryEngine::LaneNeighborQueryEngine(const NetworkTopology& topo, const GlobalPositionMap& map,
                                                 NeighborQueryConfig cfg)
    : topo_(topo), map_(map), cfg_(std::move(cfg)) {
  if (cfg_.hop_limit < 0) cfg_.hop_limit = 0;
}

double LaneNeighborQueryEngine::fallback_distance() const {
  return cfg_.fallback_distance.value_or(topo_.total_length());
}

std::optional<LaneNeighborQueryEngine::Hit>
LaneNeighborQueryEngine::find_ahead_(const VehicleStateTable& t, const VehicleRecord& self, int lane) const {
  const bool own_lane = lane == self.lane;
  const Key self_key{self.pos, &self.id};

  // Local edge: nearest strictly ahead. Other lanes exclude side-by-side.
  const VehicleRecord* best = nullptr;
  for (const auto& id : t.ids_on_edge(self.edge)) {
    if (id == self.id) continue;
    const VehicleRecord* c = t.find(id);
    if (!c || c->lane != lane) continue;
    const Key k{c->pos, &c->id};
    const bool ahead = own_lane ? key_less(self_key, k) : c->pos > self.pos;
    if (!ahead) continue;
    if (!best || key_less(k, Key{best->pos, &best->id})) best = c;
  }
  if (best) return Hit{best->id, best->pos - self.pos - best->length};

  // Walk downstream, nearest to each edge's start.
  double travelled = topo_.edge_length(self.edge) - self.pos;
  LaneRef at{self.edge, lane};
  for (int hop = 0; hop < cfg_.hop_limit; ++hop) {
    const LaneRef* step = topo_.follow_next(at.edge, at.lane);
    if (!step) break;
    at = *step;

    for (const auto& id : t.ids_on_edge(at.edge)) {
      if (id == self.id) continue;
      const VehicleRecord* c = t.find(id);
      if (!c || c->lane != at.lane) continue;
      if (!best || key_less(Key{c->pos, &c->id}, Key{best->pos, &best->id})) best = c;
    }
    if (best) return Hit{best->id, travelled + best->pos - best->length};
    travelled += topo_.edge_length(at.edge);
  }
  return std::nullopt;
}

std::optional<LaneNeighborQueryEngine::Hit>
LaneNeighborQueryEngine::find_behind_(const VehicleStateTable& t, const VehicleRecord& self, int lane) const {
  const bool own_lane = lane == self.lane;
  const Key self_key{self.pos, &self.id};

  const VehicleRecord* best = nullptr;
  for (const auto& id : t.ids_on_edge(self.edge)) {
    if (id == self.id) continue;
    const VehicleRecord* c = t.find(id);
    if (!c || c->lane != lane) continue;
    const Key k{c->pos, &c->id};
    const bool behind = own_lane ? key_less(k, self_key) : c->pos < self.pos;
    if (!behind) continue;
    if (!best || key_less(Key{best->pos, &best->id}, k)) best = c;
  }
  if (best) return Hit{best->id, self.pos - best->pos - self.length};

  // Walk upstream, nearest to each edge's end.
  double travelled = self.pos;
  LaneRef at{self.edge, lane};
  for (int hop = 0; hop < cfg_.hop_limit; ++hop) {
    const LaneRef* step = topo_.follow_prev(at.edge, at.lane);
    if (!step) break;
    at = *step;
    const double len = topo_.edge_length(at.edge);

    for (const auto& id : t.ids_on_edge(at.edge)) {
      if (id == self.id) continue;
      const VehicleRecord* c = t.find(id);
      if (!c || c->lane != at.lane) continue;
      if (!best || key_less(Key{best->pos, &best->id}, Key{c->pos, &c->id})) best = c;
    }
    if (best) return Hit{best->id, travelled + (len - best->pos) - self.length};
    travelled += len;
  }
  return std::nullopt;
}

double LaneNeighborQueryEngine::global_position(const VehicleStateTable& t, const std::string& id,
                                                double error) const {
  const VehicleRecord* r = t.find(id);
  if (!r) return error;
  const double g = map_.to_global(r->edge, r->pos);
  return g == kUnknown ? error : g;
}

std::string LaneNeighborQueryEngine::leader(const VehicleStateTable& t, const std::string& id,
                                            const std::string& error) const {
  const VehicleRecord* r = t.find(id);
  if (!r || r->lane < 0 || r->lane >= topo_.num_lanes(r->edge)) return error;
  auto hit = find_ahead_(t, *r, r->lane);
  return hit ? hit->id : std::string{};
}

std::string LaneNeighborQueryEngine::follower(const VehicleStateTable& t, const std::string& id,
                                              const std::string& error) const {
  const VehicleRecord* r = t.find(id);
  if (!r || r->lane < 0 || r->lane >= topo_.num_lanes(r->edge)) return error;
  auto hit = find_behind_(t, *r, r->lane);
  return hit ? hit->id : std::string{};
}

double LaneNeighborQueryEngine::headway(const VehicleStateTable& t, const std::string& id, double error) const {
  const VehicleRecord* r = t.find(id);
  if (!r || r->lane < 0 || r->lane >= topo_.num_lanes(r->edge)) return error;
  auto hit = find_ahead_(t, *r, r->lane);
  return hit ? hit->gap : fallback_distance();
}

double LaneNeighborQueryEngine::tailway(const VehicleStateTable& t, const std::string& id, double error) const {
  const VehicleRecord* r = t.find(id);
  if (!r || r->lane < 0 || r->lane >= topo_.num_lanes(r->edge)) return error;
  auto hit = find_behind_(t, *r, r->lane);
  return hit ? hit->gap : fallback_distance();
}

LaneNeighbors LaneNeighborQueryEngine::lane_neighbors(const VehicleStateTable& t, const std::string& id,
                                                      const LaneNeighbors& error) const {
  const VehicleRecord* r = t.find(id);
  if (!r) return error;
  const int lanes = topo_.num_lanes(r->edge);
  if (lanes == kUnknownLanes) return error;

  const double none = fallback_distance();
  LaneNeighbors out;
  const auto n = static_cast<std::size_t>(lanes);
  out.headways.assign(n, none);
  out.tailways.assign(n, none);
  out.leaders.assign(n, std::string{});
  out.followers.assign(n, std::string{});

  for (int l = 0; l < lanes; ++l) {
    const auto i = static_cast<std::size_t>(l);
    if (auto hit = find_ahead_(t, *r, l)) {
      out.leaders[i] = hit->id;
      out.headways[i] = hit->gap;
    }
    if (auto hit = find_behind_(t, *r, l)) {
      out.followers[i] = hit->id;
      out.tailways[i] = hit->gap;
    }
  }
  return out;
}

std::vector<std::string> LaneNeighborQueryEngine::lane_leaders(const VehicleStateTable& t, const std::string& id,
                                                               const std::vector<std::string>& error) const {
  if (!t.contains(id)) return error;
  LaneNeighbors n = lane_neighbors(t, id);
  if (n.leaders.empty()) return error;
  return std::move(n.leaders);
}

std::vector<std::string> LaneNeighborQueryEngine::lane_followers(const VehicleStateTable& t, const std::string& id,
                                                                 const std::vector<std::string>& error) const {
  if (!t.contains(id)) return error;
  LaneNeighbors n = lane_neighbors(t, id);
  if (n.followers.empty()) return error;
  return std::move(n.followers);
}

std::vector<double> LaneNeighborQueryEngine::lane_headways(const VehicleStateTable& t, const std::string& id,
                                                           const std::vector<double>& error) const {
  if (!t.contains(id)) return error;
  LaneNeighbors n = lane_neighbors(t, id);
  if (n.headways.empty()) return error;
  return std::move(n.headways);
}

std::vector<double> LaneNeighborQueryEngine::lane_tailways(const VehicleStateTable& t, const std::string& id,
                                                           const std::vector<double>& error) const {
  if (!t.contains(id)) return error;
  LaneNeighbors n = lane_neighbors(t, id);
  if (n.tailways.empty()) return error;
  return std::move(n.tailways);
}

std::vector<double> LaneNeighborQueryEngine::global_position(const VehicleStateTable& t,
                                                             const std::vector<std::string>& ids,
                                                             double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return global_position(t, id, error); });
}

std::vector<std::string> LaneNeighborQueryEngine::leader(const VehicleStateTable& t,
                                                         const std::vector<std::string>& ids,
                                                         const std::string& error) const {
  return each_id<std::string>(ids, [&](const std::string& id){ return leader(t, id, error); });
}

std::vector<std::string> LaneNeighborQueryEngine::follower(const VehicleStateTable& t,
                                                           const std::vector<std::string>& ids,
                                                           const std::string& error) const {
  return each_id<std::string>(ids, [&](const std::string& id){ return follower(t, id, error); });
}

std::vector<double> LaneNeighborQueryEngine::headway(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                     double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return headway(t, id, error); });
}

std::vector<double> LaneNeighborQueryEngine::tailway(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                                     double error) const {
  return each_id<double>(ids, [&](const std::string& id){ return tailway(t, id, error); });
}

std::vector<LaneNeighbors> LaneNeighborQueryEngine::lane_neighbors(const VehicleStateTable& t,
                                                                   const std::vector<std::string>& ids,
                                                                   const LaneNeighbors& error) const {
  return each_id<LaneNeighbors>(ids, [&](const std::string& id){ return lane_neighbors(t, id, error); });
}

std::vector<std::vector<std::string>>
LaneNeighborQueryEngine::lane_leaders(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                      const std::vector<std::string>& error) const {
  return each_id<std::vector<std::string>>(ids, [&](const std::string& id){ return lane_leaders(t, id, error); });
}

std::vector<std::vector<std::string>>
LaneNeighborQueryEngine::lane_followers(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                        const std::vector<std::string>& error) const {
  return each_id<std::vector<std::string>>(ids, [&](const std::string& id){ return lane_followers(t, id, error); });
}

std::vector<std::vector<double>>
LaneNeighborQueryEngine::lane_headways(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                       const std::vector<double>& error) const {
  return each_id<std::vector<double>>(ids, [&](const std::string& id){ return lane_headways(t, id, error); });
}

std::vector<std::vector<double>>
LaneNeighborQueryEngine::lane_tailways(const VehicleStateTable& t, const std::vector<std::string>& ids,
                                       const std::vector<double>& error) const {
  return each_id<std::vector<double>>(ids, [&](const std::string& id){ return lane_tailways(t, id, error); });
}

} // namespace rnk

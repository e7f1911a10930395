#include <rnk/topology.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>
#include <fmt/format.h>
#include <rnk/log.hpp>

namespace rnk {

static const std::vector<LaneRef> kNoLanes{};

[[noreturn]] static void fail(const std::string& msg) {
  log_error("topology: {}", msg);
  throw TopologyError(msg);
}

std::string NetworkTopology::derive_parent(const std::string& internal_id) {
  const auto cut = internal_id.rfind('_');
  if (cut == std::string::npos || cut == 0 || cut + 1 >= internal_id.size()) return {};
  const bool numeric = std::all_of(internal_id.begin() + static_cast<std::ptrdiff_t>(cut) + 1,
                                   internal_id.end(),
                                   [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!numeric) return {};
  return internal_id.substr(0, cut);
}

NetworkTopology::NetworkTopology(std::vector<Edge> edges, const std::vector<Connection>& connections)
    : edges_(std::move(edges)) {
  index_.reserve(edges_.size());
  for (std::size_t i = 0; i < edges_.size(); ++i) {
    Edge& e = edges_[i];
    if (e.id.empty()) fail(fmt::format("edge #{} has an empty id", i));
    if (e.length < 0.0) fail(fmt::format("edge '{}' has negative length {}", e.id, e.length));
    if (e.lanes < 1) fail(fmt::format("edge '{}' has {} lanes", e.id, e.lanes));
    if (e.speed < 0.0) fail(fmt::format("edge '{}' has negative speed limit {}", e.id, e.speed));
    if (!index_.emplace(e.id, i).second) fail(fmt::format("duplicate edge id '{}'", e.id));

    // Classification is fixed here; queries never re-parse ids.
    e.is_internal = e.is_internal || e.id.front() == kInternalMarker;
    if (e.is_internal) {
      if (e.parent.empty()) e.parent = derive_parent(e.id);
      junction_list_.push_back(e.id);
    } else {
      e.parent.clear();
      edge_list_.push_back(e.id);
      max_speed_ = std::max(max_speed_, e.speed);
      total_length_ += e.length;
    }

    next_[e.id] = LaneTable(static_cast<std::size_t>(e.lanes));
    prev_[e.id] = LaneTable(static_cast<std::size_t>(e.lanes));
  }

  for (const auto& c : connections) add_connection_(c);
}

void NetworkTopology::add_connection_(const Connection& c) {
  const Edge* from = edge(c.from_edge);
  const Edge* to   = edge(c.to_edge);
  if (!from) fail(fmt::format("connection {}:{} -> {}:{} starts on unknown edge '{}'",
                              c.from_edge, c.from_lane, c.to_edge, c.to_lane, c.from_edge));
  if (!to) fail(fmt::format("connection {}:{} -> {}:{} ends on unknown edge '{}'",
                            c.from_edge, c.from_lane, c.to_edge, c.to_lane, c.to_edge));
  if (c.from_lane < 0 || c.from_lane >= from->lanes)
    fail(fmt::format("connection leaves lane {} of '{}' which has {} lanes", c.from_lane, from->id, from->lanes));
  if (c.to_lane < 0 || c.to_lane >= to->lanes)
    fail(fmt::format("connection enters lane {} of '{}' which has {} lanes", c.to_lane, to->id, to->lanes));

  next_[c.from_edge][static_cast<std::size_t>(c.from_lane)].push_back(LaneRef{c.to_edge, c.to_lane});
  prev_[c.to_edge][static_cast<std::size_t>(c.to_lane)].push_back(LaneRef{c.from_edge, c.from_lane});
}

const Edge* NetworkTopology::edge(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &edges_[it->second];
}

bool NetworkTopology::is_internal(const std::string& id) const {
  const Edge* e = edge(id);
  return e != nullptr && e->is_internal;
}

double NetworkTopology::edge_length(const std::string& id) const {
  if (const Edge* e = edge(id)) return e->length;
  log_debug("edge_length: unknown edge '{}'", id);
  return kUnknown;
}

double NetworkTopology::speed_limit(const std::string& id) const {
  if (const Edge* e = edge(id)) return e->speed;
  log_debug("speed_limit: unknown edge '{}'", id);
  return kUnknown;
}

int NetworkTopology::num_lanes(const std::string& id) const {
  if (const Edge* e = edge(id)) return e->lanes;
  log_debug("num_lanes: unknown edge '{}'", id);
  return kUnknownLanes;
}

const std::vector<LaneRef>& NetworkTopology::lookup_(const std::unordered_map<std::string, LaneTable>& m,
                                                     const std::string& edge, int lane) const {
  auto it = m.find(edge);
  if (it == m.end() || lane < 0 || static_cast<std::size_t>(lane) >= it->second.size()) return kNoLanes;
  return it->second[static_cast<std::size_t>(lane)];
}

const std::vector<LaneRef>& NetworkTopology::next(const std::string& edge, int lane) const {
  return lookup_(next_, edge, lane);
}

const std::vector<LaneRef>& NetworkTopology::prev(const std::string& edge, int lane) const {
  return lookup_(prev_, edge, lane);
}

static const LaneRef* prefer_lane(const std::vector<LaneRef>& links, int lane) {
  if (links.empty()) return nullptr;
  for (const auto& l : links) {
    if (l.lane == lane) return &l;
  }
  return &links.front();
}

const LaneRef* NetworkTopology::follow_next(const std::string& edge, int lane) const {
  return prefer_lane(next(edge, lane), lane);
}

const LaneRef* NetworkTopology::follow_prev(const std::string& edge, int lane) const {
  return prefer_lane(prev(edge, lane), lane);
}

} // namespace rnk

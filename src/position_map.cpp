#include <rnk/position_map.hpp>
#include <algorithm>
#include <fstream>
#include <ostream>
#include <set>
#include <unordered_map>
#include <fmt/format.h>
#include <rnk/log.hpp>

namespace rnk {

[[noreturn]] static void fail(const std::string& msg) {
  log_error("position map: {}", msg);
  throw TopologyError(msg);
}

// First listed predecessor of a junction link; nullptr for a link nothing feeds.
static const LaneRef* anchor_of(const NetworkTopology& topo, const std::string& id) {
  const int lanes = topo.num_lanes(id);
  for (int l = 0; l < lanes; ++l) {
    const auto& in = topo.prev(id, l);
    if (!in.empty()) return &in.front();
  }
  return nullptr;
}

namespace {

struct Chain {
  std::string root;   // edge or hinted link the chain of anchors starts from
  double rel = 0.0;   // link start past the end of root
};

} // namespace

// Unhinted junction links resolved to their root edge. Repeats until nothing
// changes so the order links are declared in does not matter.
static std::unordered_map<std::string, Chain> link_chains(const NetworkTopology& topo,
                                                          const std::set<std::string>& hinted) {
  std::unordered_map<std::string, Chain> chains;
  std::vector<std::string> pending;
  for (const auto& id : topo.junction_list()) {
    if (!hinted.count(id)) pending.push_back(id);
  }
  bool progress = true;
  while (progress) {
    progress = false;
    for (auto it = pending.begin(); it != pending.end();) {
      const LaneRef* a = anchor_of(topo, *it);
      if (a && (!topo.is_internal(a->edge) || hinted.count(a->edge))) {
        chains.emplace(*it, Chain{a->edge, 0.0});
      } else if (auto c = a ? chains.find(a->edge) : chains.end(); c != chains.end()) {
        chains.emplace(*it, Chain{c->second.root, c->second.rel + topo.edge_length(a->edge)});
      } else {
        ++it;
        continue;
      }
      it = pending.erase(it);
      progress = true;
    }
  }
  return chains;
}

static std::set<std::string> junction_hints(const std::vector<EdgeStart>& starts) {
  std::set<std::string> hinted;
  for (const auto& s : starts) {
    if (s.kind != StartKind::Edge) hinted.insert(s.edge);
  }
  return hinted;
}

GlobalPositionMap::GlobalPositionMap(const NetworkTopology& topo, const std::vector<EdgeStart>& starts) {
  for (const auto& id : topo.junction_list()) {
    parents_.emplace(id, topo.edge(id)->parent);
  }
  place_edges_(topo, starts);
  place_junctions_(topo, starts);

  std::stable_sort(table_.begin(), table_.end(),
                   [](const OffsetEntry& a, const OffsetEntry& b){ return a.offset < b.offset; });
  total_starts_ = edge_starts_;
  for (const auto& e : table_) total_starts_.emplace(e.edge, e.offset);
}

void GlobalPositionMap::place_edges_(const NetworkTopology& topo, const std::vector<EdgeStart>& starts) {
  const bool hinted = std::any_of(starts.begin(), starts.end(),
                                  [](const EdgeStart& s){ return s.kind == StartKind::Edge; });
  if (hinted) {
    for (const auto& s : starts) {
      if (s.kind != StartKind::Edge) continue;
      const Edge* e = topo.edge(s.edge);
      if (!e) fail(fmt::format("edge start names unknown edge '{}'", s.edge));
      if (e->is_internal) fail(fmt::format("edge start names internal link '{}'; use an internal start", s.edge));
      if (!edge_starts_.emplace(s.edge, s.offset).second)
        fail(fmt::format("edge '{}' has more than one edge start", s.edge));
    }
    for (const auto& id : topo.edge_list()) {
      if (!edge_starts_.count(id)) fail(fmt::format("edge '{}' has no edge start", id));
    }
  } else {
    // Back to back in a deterministic order, each followed by room for the
    // junction links that hang off its end.
    std::unordered_map<std::string, double> room;
    for (const auto& [id, c] : link_chains(topo, junction_hints(starts))) {
      double& r = room[c.root];
      r = std::max(r, c.rel + topo.edge_length(id));
    }
    std::vector<std::string> ids = topo.edge_list();
    std::sort(ids.begin(), ids.end());
    double length = 0.0;
    for (const auto& id : ids) {
      edge_starts_.emplace(id, length);
      length += topo.edge_length(id);
      if (auto r = room.find(id); r != room.end()) length += r->second;
    }
  }

  // Reverse table: one entry per offset. Zero-length edges host no position
  // and give way to whatever else starts there.
  struct Placed { const std::string* id; double offset; double length; };
  std::vector<Placed> placed;
  placed.reserve(edge_starts_.size());
  for (const auto& id : topo.edge_list()) {
    placed.push_back(Placed{&id, edge_starts_.at(id), topo.edge_length(id)});
  }
  std::stable_sort(placed.begin(), placed.end(), [](const Placed& a, const Placed& b){
    if (a.offset != b.offset) return a.offset < b.offset;
    return a.length > b.length;
  });
  const Placed* last = nullptr;
  for (const auto& p : placed) {
    if (last && last->offset == p.offset) {
      if (p.length > 0.0)
        fail(fmt::format("edges '{}' and '{}' share global offset {}", *last->id, *p.id, p.offset));
      continue;
    }
    table_.push_back(OffsetEntry{*p.id, p.offset, false});
    last = &p;
  }
}

void GlobalPositionMap::place_junctions_(const NetworkTopology& topo, const std::vector<EdgeStart>& starts) {
  std::set<double> seen;
  for (const auto& e : table_) seen.insert(e.offset);

  auto place = [&](const std::string& name, double offset) {
    if (!seen.insert(offset).second) {
      log_info("junction link '{}' at offset {} collides with an earlier entry; dropped", name, offset);
      return false;
    }
    internal_starts_.emplace(name, offset);
    table_.push_back(OffsetEntry{name, offset, true});
    return true;
  };

  for (const auto& s : starts) {
    if (s.kind != StartKind::Internal) continue;
    if (!topo.is_internal(s.edge)) fail(fmt::format("internal start names '{}', which is not an internal link", s.edge));
    if (internal_starts_.count(s.edge)) continue;
    place(s.edge, s.offset);
  }
  for (const auto& s : starts) {
    if (s.kind != StartKind::Intersection) continue;
    if (s.edge.empty()) fail("intersection start with an empty name");
    if (internal_starts_.count(s.edge)) continue;
    place(s.edge, s.offset);
  }

  // Unhinted links start where their chain of first predecessors ends. One
  // that lands on a taken offset keeps its start for to_global only.
  const auto chains = link_chains(topo, junction_hints(starts));
  for (const auto& id : topo.junction_list()) {
    auto c = chains.find(id);
    if (c == chains.end()) continue;
    double root = kUnknown;
    if (auto it = edge_starts_.find(c->second.root); it != edge_starts_.end()) root = it->second;
    else if (auto jt = internal_starts_.find(c->second.root); jt != internal_starts_.end()) root = jt->second;
    else continue;
    const double start = root + topo.edge_length(c->second.root) + c->second.rel;
    if (!place(id, start)) derived_starts_.emplace(id, start);
  }
}

double GlobalPositionMap::to_global(const std::string& edge, double local_pos) const {
  // An empty edge means the vehicle vanished mid-step (e.g. a collision).
  if (edge.empty()) return kUnknown;

  if (auto it = internal_starts_.find(edge); it != internal_starts_.end()) return it->second + local_pos;
  if (auto p = parents_.find(edge); p != parents_.end()) {
    if (auto it = total_starts_.find(p->second); it != total_starts_.end()) return it->second + local_pos;
    if (auto it = derived_starts_.find(edge); it != derived_starts_.end()) return it->second + local_pos;
    return kUnknown;
  }
  if (auto it = edge_starts_.find(edge); it != edge_starts_.end()) return it->second + local_pos;
  return kUnknown;
}

std::optional<LocalPosition> GlobalPositionMap::to_local(double global_pos) const {
  auto it = std::upper_bound(table_.begin(), table_.end(), global_pos,
                             [](double x, const OffsetEntry& e){ return x < e.offset; });
  if (it == table_.begin()) return std::nullopt;
  --it;
  return LocalPosition{it->edge, global_pos - it->offset};
}

std::optional<double> GlobalPositionMap::edge_start(const std::string& edge) const {
  auto it = total_starts_.find(edge);
  if (it == total_starts_.end()) return std::nullopt;
  return it->second;
}

void write_offset_table_csv(std::ostream& os, const GlobalPositionMap& map) {
  os << "edge,offset,internal\n";
  for (const auto& e : map.offsets()) {
    os << fmt::format("{},{},{}\n", e.edge, e.offset, e.internal ? 1 : 0);
  }
}

bool save_offset_table_csv(const std::string& path, const GlobalPositionMap& map) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_offset_table_csv(f, map);
  return static_cast<bool>(f);
}

} // namespace rnk

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <rnk/network.hpp>

namespace rnk {

// Raised only while building a network; a malformed topology invalidates
// every later query.
class TopologyError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Static graph of edges, lanes and junction links. Immutable after construction.
class NetworkTopology {
public:
  NetworkTopology(std::vector<Edge> edges, const std::vector<Connection>& connections);
  explicit NetworkTopology(const NetworkDescription& net)
      : NetworkTopology(net.edges, net.connections) {}

  // kUnknown / kUnknownLanes for unknown ids.
  double edge_length(const std::string& id) const;
  double speed_limit(const std::string& id) const;
  int num_lanes(const std::string& id) const;

  // Over non-internal edges only.
  double max_speed() const { return max_speed_; }
  double total_length() const { return total_length_; }

  bool has_edge(const std::string& id) const { return index_.count(id) != 0; }
  bool is_internal(const std::string& id) const;
  const Edge* edge(const std::string& id) const;   // nullptr if unknown
  std::size_t edge_count() const { return edges_.size(); }
  const std::vector<Edge>& edges() const { return edges_; }

  // Non-internal ids in declaration order / internal ids in declaration order.
  const std::vector<std::string>& edge_list() const { return edge_list_; }
  const std::vector<std::string>& junction_list() const { return junction_list_; }

  // Outgoing / incoming lane pairs; empty list if none (or unknown edge/lane).
  const std::vector<LaneRef>& next(const std::string& edge, int lane) const;
  const std::vector<LaneRef>& prev(const std::string& edge, int lane) const;

  // Preferred single successor / predecessor: the link that keeps the lane
  // index, else the first listed one. nullptr at a sink / source.
  const LaneRef* follow_next(const std::string& edge, int lane) const;
  const LaneRef* follow_prev(const std::string& edge, int lane) const;

  // Junction id derived from an internal link id: ":center_0" -> ":center".
  static std::string derive_parent(const std::string& internal_id);

private:
  using LaneTable = std::vector<std::vector<LaneRef>>;   // [lane] -> targets

  void add_connection_(const Connection& c);
  const std::vector<LaneRef>& lookup_(const std::unordered_map<std::string, LaneTable>& m,
                                      const std::string& edge, int lane) const;

  std::vector<Edge> edges_;
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_map<std::string, LaneTable> next_;
  std::unordered_map<std::string, LaneTable> prev_;
  std::vector<std::string> edge_list_;
  std::vector<std::string> junction_list_;
  double max_speed_{0.0};
  double total_length_{0.0};
};

} // namespace rnk

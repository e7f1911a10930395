#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <rnk/network.hpp>
#include <rnk/topology.hpp>

namespace rnk {

struct LocalPosition {
  std::string edge;
  double pos = 0.0;
};

// One row of the combined offset table.
struct OffsetEntry {
  std::string edge;
  double offset = 0.0;
  bool internal = false;
};

// Linearizes the edge graph onto one global axis.
//
// Non-internal edges are placed first, from Edge hints when any are given,
// otherwise back to back in sorted id order with room left after each edge
// for the junction links hanging off it. Junction links follow: internal and
// intersection hints in that order, then links without a hint at the end of
// their chain of first predecessors. A junction link whose offset is already
// taken is dropped from the table (first writer wins) and resolves through
// its parent junction, or through its own derived start if it has one.
class GlobalPositionMap {
public:
  // Throws TopologyError when the hints cannot describe a consistent layout.
  GlobalPositionMap(const NetworkTopology& topo, const std::vector<EdgeStart>& starts = {});

  // kUnknown if the edge is empty or cannot be resolved.
  double to_global(const std::string& edge, double local_pos) const;

  // Inverse of to_global; nullopt below the first offset.
  std::optional<LocalPosition> to_local(double global_pos) const;

  std::optional<double> edge_start(const std::string& edge) const;

  // Sorted by ascending offset; offsets are unique.
  const std::vector<OffsetEntry>& offsets() const { return table_; }
  std::size_t size() const { return table_.size(); }

private:
  void place_edges_(const NetworkTopology& topo, const std::vector<EdgeStart>& starts);
  void place_junctions_(const NetworkTopology& topo, const std::vector<EdgeStart>& starts);

  std::unordered_map<std::string, double> edge_starts_;       // non-internal
  std::unordered_map<std::string, double> internal_starts_;   // kept junction links
  std::unordered_map<std::string, double> derived_starts_;    // dropped unhinted links
  std::unordered_map<std::string, double> total_starts_;      // everything in table_
  std::unordered_map<std::string, std::string> parents_;      // internal id -> junction
  std::vector<OffsetEntry> table_;
};

// Debug/inspection export: "edge,offset,internal" rows in axis order.
void write_offset_table_csv(std::ostream& os, const GlobalPositionMap& map);
bool save_offset_table_csv(const std::string& path, const GlobalPositionMap& map);

} // namespace rnk

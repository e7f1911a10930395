#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <rnk/network.hpp>

namespace rnk {

// Stream parsers (test-friendly, no filesystem). An optional header row,
// blank lines and '#' comments are skipped; malformed rows are logged and
// dropped. Structural checks (unknown edges, lane ranges) happen later in
// NetworkTopology.

// id,length,lanes,speed[,parent]; a non-empty parent marks an internal link.
std::vector<Edge> edges_from_csv_stream(std::istream& in);
// from,from_lane,to,to_lane
std::vector<Connection> connections_from_csv_stream(std::istream& in);
// edge,offset[,kind] with kind in edge|internal|intersection
std::vector<EdgeStart> edge_starts_from_csv_stream(std::istream& in);

NetworkDescription network_from_csv_streams(std::istream& edges, std::istream& connections,
                                            std::istream* starts = nullptr);

// Reads edges.csv, connections.csv and (if present) edge_starts.csv from dir.
// nullopt if a required file cannot be opened.
std::optional<NetworkDescription> load_network_csv(const std::string& dir);

// Inverse of the above, for saving presets.
void write_edges_csv(std::ostream& os, const std::vector<Edge>& edges);
void write_connections_csv(std::ostream& os, const std::vector<Connection>& connections);
void write_edge_starts_csv(std::ostream& os, const std::vector<EdgeStart>& starts);

std::optional<StartKind> parse_start_kind(const std::string& s);
const char* start_kind_name(StartKind k);

} // namespace rnk

#include <rnk/network_csv.hpp>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <utility>
#include <fmt/format.h>
#include <rnk/csv.hpp>
#include <rnk/log.hpp>

namespace rnk {

namespace {

// Reads rows, skipping a header whose first cell is `header_key`.
template <class T, class Parse>
std::vector<T> read_rows(std::istream& in, const char* what, const char* header_key, Parse&& parse) {
  std::vector<T> out;
  std::string line;
  bool first = true;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto raw = csv::content_line(line);
    if (!raw) continue;
    auto cols = csv::split_line(*raw);
    if (first) {
      first = false;
      if (cols[0] == header_key) continue;
    }
    if (auto row = parse(cols)) {
      out.push_back(std::move(*row));
    } else {
      log_warn("{}: skipping malformed line {}: '{}'", what, line_no, *raw);
    }
  }
  return out;
}

std::optional<Edge> parse_edge_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4 || cols[0].empty()) return std::nullopt;
  auto length = csv::to_double(cols[1]);
  auto lanes = csv::to_int(cols[2]);
  auto speed = csv::to_double(cols[3]);
  if (!length || !lanes || !speed) return std::nullopt;
  Edge e;
  e.id = cols[0];
  e.length = *length;
  e.lanes = *lanes;
  e.speed = *speed;
  if (cols.size() > 4 && !cols[4].empty()) {
    e.parent = cols[4];
    e.is_internal = true;
  }
  return e;
}

std::optional<Connection> parse_connection_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4 || cols[0].empty() || cols[2].empty()) return std::nullopt;
  auto from_lane = csv::to_int(cols[1]);
  auto to_lane = csv::to_int(cols[3]);
  if (!from_lane || !to_lane) return std::nullopt;
  return Connection{cols[0], *from_lane, cols[2], *to_lane};
}

std::optional<EdgeStart> parse_start_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2 || cols[0].empty()) return std::nullopt;
  auto offset = csv::to_double(cols[1]);
  if (!offset) return std::nullopt;
  StartKind kind = StartKind::Edge;
  if (cols.size() > 2 && !cols[2].empty()) {
    auto k = parse_start_kind(cols[2]);
    if (!k) return std::nullopt;
    kind = *k;
  }
  return EdgeStart{cols[0], *offset, kind};
}

} // namespace

std::optional<StartKind> parse_start_kind(const std::string& s) {
  if (s == "edge") return StartKind::Edge;
  if (s == "internal") return StartKind::Internal;
  if (s == "intersection") return StartKind::Intersection;
  return std::nullopt;
}

const char* start_kind_name(StartKind k) {
  switch (k) {
    case StartKind::Edge:         return "edge";
    case StartKind::Internal:     return "internal";
    case StartKind::Intersection: return "intersection";
  }
  return "edge";
}

std::vector<Edge> edges_from_csv_stream(std::istream& in) {
  return read_rows<Edge>(in, "edges.csv", "id", parse_edge_row);
}

std::vector<Connection> connections_from_csv_stream(std::istream& in) {
  return read_rows<Connection>(in, "connections.csv", "from", parse_connection_row);
}

std::vector<EdgeStart> edge_starts_from_csv_stream(std::istream& in) {
  return read_rows<EdgeStart>(in, "edge_starts.csv", "edge", parse_start_row);
}

NetworkDescription network_from_csv_streams(std::istream& edges, std::istream& connections,
                                            std::istream* starts) {
  NetworkDescription net;
  net.edges = edges_from_csv_stream(edges);
  net.connections = connections_from_csv_stream(connections);
  if (starts) net.starts = edge_starts_from_csv_stream(*starts);
  return net;
}

std::optional<NetworkDescription> load_network_csv(const std::string& dir) {
  namespace fs = std::filesystem;
  const fs::path root(dir);
  std::ifstream edges(root / "edges.csv");
  if (!edges) return std::nullopt;
  std::ifstream connections(root / "connections.csv");
  if (!connections) return std::nullopt;

  std::ifstream starts(root / "edge_starts.csv");
  NetworkDescription net = network_from_csv_streams(edges, connections, starts ? &starts : nullptr);
  log_info("loaded network from '{}': {} edges, {} connections, {} starts",
           dir, net.edges.size(), net.connections.size(), net.starts.size());
  return net;
}

void write_edges_csv(std::ostream& os, const std::vector<Edge>& edges) {
  os << "id,length,lanes,speed,parent\n";
  for (const auto& e : edges) {
    os << fmt::format("{},{},{},{},{}\n", e.id, e.length, e.lanes, e.speed, e.is_internal ? e.parent : "");
  }
}

void write_connections_csv(std::ostream& os, const std::vector<Connection>& connections) {
  os << "from,from_lane,to,to_lane\n";
  for (const auto& c : connections) {
    os << fmt::format("{},{},{},{}\n", c.from_edge, c.from_lane, c.to_edge, c.to_lane);
  }
}

void write_edge_starts_csv(std::ostream& os, const std::vector<EdgeStart>& starts) {
  os << "edge,offset,kind\n";
  for (const auto& s : starts) {
    os << fmt::format("{},{},{}\n", s.edge, s.offset, start_kind_name(s.kind));
  }
}

} // namespace rnk

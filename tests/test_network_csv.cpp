#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <rnk/network_csv.hpp>
#include <rnk/position_map.hpp>
#include <rnk/presets.hpp>
#include <rnk/topology.hpp>

using Catch::Approx;
using namespace rnk;

static std::string edges_csv = R"(id,length,lanes,speed,parent
in, 100, 2, 30
:mid_0, 5, 2, 15
out, 80, 2, 25
link, 3, 1, 10, mid
)";

static std::string connections_csv = R"(from,from_lane,to,to_lane
in,0,:mid_0,0
in,1,:mid_0,1
:mid_0,0,out,0
:mid_0,1,out,1
)";

static std::string starts_csv = R"(edge,offset,kind
in,0
out,105,edge
:mid_0,100,internal
)";

TEST_CASE("edges parse with optional parent column") {
  std::istringstream ss(edges_csv);
  auto edges = edges_from_csv_stream(ss);
  REQUIRE(edges.size() == 4);
  REQUIRE(edges[0].id == "in");
  REQUIRE(edges[0].length == Approx(100.0));
  REQUIRE(edges[0].lanes == 2);
  REQUIRE(edges[2].speed == Approx(25.0));
  REQUIRE_FALSE(edges[1].is_internal);          // decided by NetworkTopology
  REQUIRE(edges[3].is_internal);
  REQUIRE(edges[3].parent == "mid");
}

TEST_CASE("malformed rows, blanks and comments are skipped") {
  std::ostringstream log;
  set_log_sink(&log);
  std::istringstream ss(R"(
# edges for a broken file
a, 10, 1, 30
b, ten, 1, 30
c, 10
d, 10, 1.5, 30

e, 20, 1, 30
)");
  auto edges = edges_from_csv_stream(ss);
  set_log_sink(nullptr);

  REQUIRE(edges.size() == 2);
  REQUIRE(edges[0].id == "a");
  REQUIRE(edges[1].id == "e");
  REQUIRE(log.str().find("skipping malformed line") != std::string::npos);
}

TEST_CASE("edge starts parse their kind") {
  std::istringstream ss(starts_csv + "x,1,bogus\n");
  auto starts = edge_starts_from_csv_stream(ss);
  REQUIRE(starts.size() == 3);
  REQUIRE(starts[0].kind == StartKind::Edge);
  REQUIRE(starts[1].offset == Approx(105.0));
  REQUIRE(starts[2].kind == StartKind::Internal);
  REQUIRE(parse_start_kind("intersection") == StartKind::Intersection);
  REQUIRE_FALSE(parse_start_kind("junction").has_value());
}

TEST_CASE("csv streams build a consistent network") {
  std::istringstream e(edges_csv), c(connections_csv), s(starts_csv);
  auto net = network_from_csv_streams(e, c, &s);
  REQUIRE(net.connections.size() == 4);

  NetworkTopology topo(net);
  GlobalPositionMap map(topo, net.starts);
  REQUIRE(topo.edge_list() == std::vector<std::string>{"in", "out"});
  REQUIRE(topo.junction_list() == std::vector<std::string>{":mid_0", "link"});
  REQUIRE(topo.total_length() == Approx(180.0));
  REQUIRE(map.to_global(":mid_0", 2.0) == Approx(102.0));
  REQUIRE(map.to_global("out", 1.0) == Approx(106.0));
}

TEST_CASE("written network csv parses back to the same network") {
  const auto net = make_merge();
  std::stringstream e, c, s;
  write_edges_csv(e, net.edges);
  write_connections_csv(c, net.connections);
  write_edge_starts_csv(s, net.starts);

  auto back = network_from_csv_streams(e, c, &s);
  REQUIRE(back.edges.size() == net.edges.size());
  REQUIRE(back.connections.size() == net.connections.size());
  REQUIRE(back.starts.size() == net.starts.size());

  NetworkTopology topo(back);
  GlobalPositionMap map(topo, back.starts);
  REQUIRE(topo.total_length() == Approx(450.0));
  REQUIRE(map.to_global(":left_0", 0.0) == Approx(100.0));
}

TEST_CASE("load_network_csv returns nullopt on a missing directory") {
  REQUIRE_FALSE(load_network_csv("this_dir_does_not_exist").has_value());
}

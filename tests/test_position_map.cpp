#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include <rnk/position_map.hpp>
#include <rnk/presets.hpp>
#include <rnk/topology.hpp>

using Catch::Approx;
using namespace rnk;

TEST_CASE("derived layout places edges back to back in id order") {
  std::vector<Edge> edges{
    Edge{.id = "c", .length = 8.0},
    Edge{.id = "a", .length = 16.0},
    Edge{.id = "b", .length = 32.0},
  };
  NetworkTopology topo(edges, {});
  GlobalPositionMap map(topo);

  REQUIRE(map.edge_start("a") == 0.0);
  REQUIRE(map.edge_start("b") == 16.0);
  REQUIRE(map.edge_start("c") == 48.0);
  REQUIRE(map.to_global("b", 2.5) == 18.5);
  REQUIRE(map.size() == 3);
}

TEST_CASE("to_local inverts to_global exactly on non-internal edges") {
  NetworkTopology topo(make_highway(HighwayParams{.length = 384.0, .edges = 3, .lanes = 2}));
  GlobalPositionMap map(topo, make_highway(HighwayParams{.length = 384.0, .edges = 3, .lanes = 2}).starts);

  // Dyadic positions are exact in binary floating point.
  for (const auto& id : topo.edge_list()) {
    for (double p : {0.0, 0.5, 31.25, 64.0, 127.75}) {
      auto local = map.to_local(map.to_global(id, p));
      REQUIRE(local.has_value());
      REQUIRE(local->edge == id);
      REQUIRE(local->pos == p);
    }
  }
  REQUIRE_FALSE(map.to_local(-1.0).has_value());
}

TEST_CASE("offset table is strictly increasing") {
  for (auto p : {NetworkPreset::Ring, NetworkPreset::Highway, NetworkPreset::Merge}) {
    auto net = make_preset(p);
    NetworkTopology topo(net);
    GlobalPositionMap map(topo, net.starts);
    const auto& rows = map.offsets();
    REQUIRE(rows.size() >= 2);
    for (std::size_t i = 1; i < rows.size(); ++i) {
      REQUIRE(rows[i - 1].offset < rows[i].offset);
    }
  }
}

TEST_CASE("internal links resolve through their own offset or their parent") {
  auto net = make_merge();
  NetworkTopology topo(net);
  GlobalPositionMap map(topo, net.starts);

  REQUIRE(map.to_global(":left_0", 2.0) == Approx(102.0));
  REQUIRE(map.to_global("left", 10.0) == Approx(115.0));
  REQUIRE(map.to_global("", 1.0) == kUnknown);
  REQUIRE(map.to_global("nowhere", 1.0) == kUnknown);

  auto local = map.to_local(101.0);
  REQUIRE(local.has_value());
  REQUIRE(local->edge == ":left_0");
  REQUIRE(local->pos == Approx(1.0));
}

TEST_CASE("colliding junction links keep the first and fall back to the parent") {
  // Two links of junction ":j" both start where "in" ends.
  std::vector<Edge> edges{
    Edge{.id = "in", .length = 20.0, .lanes = 2},
    Edge{.id = ":j_0", .length = 3.0},
    Edge{.id = ":j_1", .length = 3.0},
    Edge{.id = "out", .length = 20.0, .lanes = 2},
  };
  std::vector<Connection> conns{
    {"in", 0, ":j_0", 0}, {"in", 1, ":j_1", 0},
    {":j_0", 0, "out", 0}, {":j_1", 0, "out", 1},
  };
  NetworkTopology topo(edges, conns);
  std::vector<EdgeStart> starts{
    {"in", 0.0, StartKind::Edge},
    {"out", 23.0, StartKind::Edge},
    {":j", 20.0, StartKind::Intersection},
  };
  GlobalPositionMap map(topo, starts);

  // Intersection name claims 20 first; both links collide and drop.
  REQUIRE(map.to_global(":j_0", 1.0) == Approx(21.0));
  REQUIRE(map.to_global(":j_1", 2.0) == Approx(22.0));
  auto local = map.to_local(21.0);
  REQUIRE(local.has_value());
  REQUIRE(local->edge == ":j");
}

TEST_CASE("unhinted junction links start where their predecessor ends") {
  std::vector<Edge> edges{
    Edge{.id = "a", .length = 40.0},
    Edge{.id = ":k_0", .length = 2.0},
    Edge{.id = "b", .length = 40.0},
  };
  std::vector<Connection> conns{{"a", 0, ":k_0", 0}, {":k_0", 0, "b", 0}};
  NetworkTopology topo(edges, conns);
  std::vector<EdgeStart> starts{{"a", 0.0, StartKind::Edge}, {"b", 42.0, StartKind::Edge}};
  GlobalPositionMap map(topo, starts);

  REQUIRE(map.edge_start(":k_0") == 40.0);
  REQUIRE(map.to_global(":k_0", 1.5) == Approx(41.5));
}

TEST_CASE("derived layout leaves room for junction links") {
  std::vector<Edge> edges{
    Edge{.id = "a", .length = 100.0},
    Edge{.id = ":j_0", .length = 5.0},
    Edge{.id = "b", .length = 100.0},
  };
  std::vector<Connection> conns{{"a", 0, ":j_0", 0}, {":j_0", 0, "b", 0}};
  NetworkTopology topo(edges, conns);
  GlobalPositionMap map(topo);

  REQUIRE(map.to_global(":j_0", 2.0) == Approx(102.0));
  REQUIRE(map.edge_start("b") == 105.0);
  REQUIRE(map.size() == 3);
  REQUIRE(map.offsets()[1].edge == ":j_0");
  REQUIRE(map.offsets()[1].internal);

  for (const std::string id : {"a", "b"}) {
    for (double p : {0.0, 4.5, 99.5}) {
      auto local = map.to_local(map.to_global(id, p));
      REQUIRE(local.has_value());
      REQUIRE(local->edge == id);
      REQUIRE(local->pos == p);
    }
  }
  auto local = map.to_local(103.0);
  REQUIRE(local.has_value());
  REQUIRE(local->edge == ":j_0");
}

TEST_CASE("junction link chains are placed whatever order they are declared in") {
  // ":k_0" follows ":k_1" but is listed first.
  std::vector<Edge> edges{
    Edge{.id = "a", .length = 40.0},
    Edge{.id = ":k_0", .length = 2.0},
    Edge{.id = ":k_1", .length = 3.0},
    Edge{.id = "b", .length = 40.0},
  };
  std::vector<Connection> conns{{"a", 0, ":k_1", 0}, {":k_1", 0, ":k_0", 0}, {":k_0", 0, "b", 0}};
  NetworkTopology topo(edges, conns);

  SECTION("hinted edges") {
    std::vector<EdgeStart> starts{{"a", 0.0, StartKind::Edge}, {"b", 45.0, StartKind::Edge}};
    GlobalPositionMap map(topo, starts);
    REQUIRE(map.edge_start(":k_1") == 40.0);
    REQUIRE(map.edge_start(":k_0") == 43.0);
    REQUIRE(map.to_global(":k_0", 1.0) == Approx(44.0));
  }
  SECTION("derived layout") {
    GlobalPositionMap map(topo);
    REQUIRE(map.edge_start(":k_1") == 40.0);
    REQUIRE(map.edge_start(":k_0") == 43.0);
    REQUIRE(map.edge_start("b") == 45.0);
  }
}

TEST_CASE("a zero-length link on a taken offset keeps its own start") {
  std::vector<Edge> edges{
    Edge{.id = "a", .length = 10.0},
    Edge{.id = ":z_0", .length = 0.0},
    Edge{.id = "b", .length = 10.0},
  };
  std::vector<Connection> conns{{"a", 0, ":z_0", 0}, {":z_0", 0, "b", 0}};
  NetworkTopology topo(edges, conns);
  GlobalPositionMap map(topo);

  REQUIRE(map.size() == 2);
  REQUIRE(map.to_global(":z_0", 0.0) == Approx(10.0));
}

TEST_CASE("inconsistent start hints fail construction") {
  std::vector<Edge> edges{Edge{.id = "a", .length = 10.0}, Edge{.id = "b", .length = 10.0}};
  NetworkTopology topo(edges, {});

  SECTION("missing edge") {
    std::vector<EdgeStart> starts{{"a", 0.0, StartKind::Edge}};
    REQUIRE_THROWS_AS(GlobalPositionMap(topo, starts), TopologyError);
  }
  SECTION("unknown edge") {
    std::vector<EdgeStart> starts{{"a", 0.0, StartKind::Edge}, {"b", 10.0, StartKind::Edge},
                                  {"zzz", 20.0, StartKind::Edge}};
    REQUIRE_THROWS_AS(GlobalPositionMap(topo, starts), TopologyError);
  }
  SECTION("shared offset") {
    std::vector<EdgeStart> starts{{"a", 0.0, StartKind::Edge}, {"b", 0.0, StartKind::Edge}};
    REQUIRE_THROWS_AS(GlobalPositionMap(topo, starts), TopologyError);
  }
}

TEST_CASE("offset table exports as csv in axis order") {
  auto net = make_merge();
  NetworkTopology topo(net);
  GlobalPositionMap map(topo, net.starts);

  std::ostringstream os;
  write_offset_table_csv(os, map);
  const std::string out = os.str();
  REQUIRE(out.rfind("edge,offset,internal\ninflow_highway,0,0\n:left_0,100,1\nleft,105,0\n", 0) == 0);
  REQUIRE_FALSE(save_offset_table_csv("/nonexistent_dir/offsets.csv", map));
}

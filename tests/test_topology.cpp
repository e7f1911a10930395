#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <rnk/presets.hpp>
#include <rnk/topology.hpp>

using Catch::Approx;
using namespace rnk;

static NetworkTopology junction_net() {
  std::vector<Edge> edges{
    Edge{.id = "a", .length = 50.0, .lanes = 2, .speed = 20.0},
    Edge{.id = ":c_0", .length = 4.0, .lanes = 2, .speed = 10.0},
    Edge{.id = "b", .length = 70.0, .lanes = 1, .speed = 35.0},
  };
  std::vector<Connection> conns{
    {"a", 0, ":c_0", 0},
    {"a", 1, ":c_0", 1},
    {":c_0", 0, "b", 0},
    {":c_0", 1, "b", 0},
  };
  return NetworkTopology(edges, conns);
}

TEST_CASE("static edge facts and aggregates skip internal links") {
  auto topo = junction_net();
  REQUIRE(topo.edge_count() == 3);
  REQUIRE(topo.edge_length("a") == Approx(50.0));
  REQUIRE(topo.num_lanes("a") == 2);
  REQUIRE(topo.speed_limit("b") == Approx(35.0));

  REQUIRE(topo.total_length() == Approx(120.0));   // 50 + 70, not the 4 m link
  REQUIRE(topo.max_speed() == Approx(35.0));

  REQUIRE(topo.edge_list() == std::vector<std::string>{"a", "b"});
  REQUIRE(topo.junction_list() == std::vector<std::string>{":c_0"});
  REQUIRE(topo.is_internal(":c_0"));
  REQUIRE_FALSE(topo.is_internal("a"));
  REQUIRE(topo.edge(":c_0")->parent == ":c");
}

TEST_CASE("unknown edges return the sentinel instead of throwing") {
  auto topo = junction_net();
  REQUIRE(topo.edge_length("nope") == kUnknown);
  REQUIRE(topo.speed_limit("nope") == kUnknown);
  REQUIRE(topo.num_lanes("nope") == kUnknownLanes);
  REQUIRE(topo.edge("nope") == nullptr);
  REQUIRE_FALSE(topo.has_edge("nope"));
  REQUIRE(topo.next("nope", 0).empty());
  REQUIRE(topo.prev("nope", 0).empty());
}

TEST_CASE("next and prev list lane pairs in both directions") {
  auto topo = junction_net();
  const auto& out = topo.next("a", 1);
  REQUIRE(out.size() == 1);
  REQUIRE(out.front() == LaneRef{":c_0", 1});

  const auto& in = topo.prev("b", 0);
  REQUIRE(in.size() == 2);
  REQUIRE(in[0] == LaneRef{":c_0", 0});
  REQUIRE(in[1] == LaneRef{":c_0", 1});

  REQUIRE(topo.next("b", 0).empty());       // sink
  REQUIRE(topo.prev("a", 0).empty());       // source
  REQUIRE(topo.next("a", 5).empty());       // lane out of range
}

TEST_CASE("follow_next prefers the link that keeps the lane index") {
  auto topo = junction_net();
  REQUIRE(*topo.follow_next("a", 1) == LaneRef{":c_0", 1});
  REQUIRE(*topo.follow_next(":c_0", 1) == LaneRef{"b", 0});   // only choice
  REQUIRE(*topo.follow_prev("b", 0) == LaneRef{":c_0", 0});   // same index wins
  REQUIRE(topo.follow_next("b", 0) == nullptr);
}

TEST_CASE("explicit is_internal and parent survive construction") {
  std::vector<Edge> edges{
    Edge{.id = "x", .length = 10.0},
    Edge{.id = "link", .length = 2.0, .is_internal = true, .parent = "J1"},
  };
  NetworkTopology topo(edges, {});
  REQUIRE(topo.is_internal("link"));
  REQUIRE(topo.edge("link")->parent == "J1");
  REQUIRE(topo.total_length() == Approx(10.0));
}

TEST_CASE("derive_parent strips a numeric suffix only") {
  REQUIRE(NetworkTopology::derive_parent(":center_0") == ":center");
  REQUIRE(NetworkTopology::derive_parent(":a_b_12") == ":a_b");
  REQUIRE(NetworkTopology::derive_parent(":center").empty());
  REQUIRE(NetworkTopology::derive_parent(":center_x").empty());
}

TEST_CASE("malformed networks fail construction") {
  SECTION("connection to an unknown edge") {
    std::vector<Edge> edges{Edge{.id = "a", .length = 10.0}};
    std::vector<Connection> conns{{"a", 0, "ghost", 0}};
    REQUIRE_THROWS_AS(NetworkTopology(edges, conns), TopologyError);
  }
  SECTION("lane index out of range") {
    std::vector<Edge> edges{Edge{.id = "a", .length = 10.0}, Edge{.id = "b", .length = 10.0}};
    std::vector<Connection> conns{{"a", 1, "b", 0}};
    REQUIRE_THROWS_AS(NetworkTopology(edges, conns), TopologyError);
  }
  SECTION("duplicate id") {
    std::vector<Edge> edges{Edge{.id = "a", .length = 10.0}, Edge{.id = "a", .length = 5.0}};
    REQUIRE_THROWS_AS(NetworkTopology(edges, {}), TopologyError);
  }
  SECTION("negative length") {
    std::vector<Edge> edges{Edge{.id = "a", .length = -1.0}};
    REQUIRE_THROWS_AS(NetworkTopology(edges, {}), TopologyError);
  }
  SECTION("zero lanes") {
    std::vector<Edge> edges{Edge{.id = "a", .length = 1.0, .lanes = 0}};
    REQUIRE_THROWS_AS(NetworkTopology(edges, {}), TopologyError);
  }
}

TEST_CASE("ring preset closes the loop") {
  NetworkTopology topo(make_ring(RingParams{.length = 300.0, .edges = 3, .lanes = 2}));
  REQUIRE(topo.total_length() == Approx(300.0));
  REQUIRE(*topo.follow_next("ring_2", 1) == LaneRef{"ring_0", 1});
  REQUIRE(*topo.follow_prev("ring_0", 0) == LaneRef{"ring_2", 0});
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstddef>
#include <string>

#include <rnk/kinematic.hpp>
#include <rnk/position_map.hpp>
#include <rnk/presets.hpp>
#include <rnk/topology.hpp>

using Catch::Approx;
using namespace rnk;

TEST_CASE("every preset builds a valid scenario and seats its vehicles") {
  for (int i = 0; i < static_cast<int>(NetworkPreset::Count); ++i) {
    const auto p = static_cast<NetworkPreset>(i);
    const auto net = make_preset(p);
    NetworkTopology topo(net);
    GlobalPositionMap map(topo, net.starts);
    REQUIRE(map.size() >= topo.edge_list().size());
    REQUIRE(std::string(preset_name(p)) != "Unknown");

    KinematicBackend sim(net, preset_vehicles(p, 12));
    REQUIRE(sim.vehicle_count() == 12);
  }
}

TEST_CASE("ring with junction links keeps its road length") {
  auto net = make_ring(RingParams{.length = 200.0, .edges = 4, .lanes = 2, .junction_length = 2.0});
  NetworkTopology topo(net);
  GlobalPositionMap map(topo, net.starts);

  REQUIRE(topo.total_length() == Approx(200.0));
  REQUIRE(topo.junction_list().size() == 4);
  REQUIRE(map.edge_start("ring_1") == 52.0);
  REQUIRE(map.edge_start(":j0_0") == 50.0);
  REQUIRE(*topo.follow_next("ring_3", 1) == LaneRef{":j3_0", 1});
  REQUIRE(*topo.follow_next(":j3_0", 1) == LaneRef{"ring_0", 1});
}

TEST_CASE("merge on-ramp joins the main line on lane 0") {
  NetworkTopology topo(make_merge());
  REQUIRE(topo.total_length() == Approx(450.0));
  REQUIRE(topo.max_speed() == Approx(30.0));
  REQUIRE(*topo.follow_next("bottom", 0) == LaneRef{"center", 0});
  REQUIRE(topo.prev("center", 0).size() == 2);
  REQUIRE(topo.prev("center", 1).size() == 1);
  REQUIRE(topo.next("center", 0).empty());
}

TEST_CASE("preset vehicles alternate kinds and ids are unique") {
  auto vs = preset_vehicles(NetworkPreset::Highway, 10);
  REQUIRE(vs.size() == 10);
  std::size_t rl = 0;
  for (std::size_t i = 0; i < vs.size(); ++i) {
    REQUIRE(vs[i].id == "veh_" + std::to_string(i));
    if (vs[i].kind == VehicleKind::Autonomous) ++rl;
  }
  REQUIRE(rl == 2);
}

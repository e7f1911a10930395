#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <string>
#include <vector>

#include <rnk/kinematic.hpp>
#include <rnk/log.hpp>
#include <rnk/presets.hpp>
#include <rnk/session.hpp>

using Catch::Approx;
using namespace rnk;

static std::vector<VehicleSpawn> ring_trio() {
  std::vector<VehicleSpawn> out;
  for (int i = 0; i < 3; ++i) {
    VehicleSpawn v;
    v.id = "veh_" + std::to_string(i);
    v.edge = "ring_" + std::to_string(i);
    v.speed = 10.0;
    out.push_back(v);
  }
  return out;
}

TEST_CASE("Session refreshes the table once per step") {
  const auto net = make_ring(RingParams{.length = 300.0, .edges = 3});
  KinematicBackend backend(net, ring_trio());
  SessionConfig cfg;
  cfg.sim_step = 0.5;
  Session session(make_scenario(net), backend, cfg);

  REQUIRE(session.step_count() == 0);
  REQUIRE(session.time() == 0.0);
  REQUIRE(session.vehicles().num_vehicles() == 3);

  session.step();
  session.step();
  REQUIRE(session.step_count() == 2);
  REQUIRE(session.time() == Approx(1.0));
  REQUIRE(session.vehicles().position("veh_0") == Approx(10.0));

  // Evenly spaced ring: every gap stays 100 - 5.
  const auto& engine = session.neighbors();
  REQUIRE(engine.leader(session.vehicles(), "veh_0") == "veh_1");
  REQUIRE(engine.headway(session.vehicles(), "veh_0") == Approx(95.0));
  REQUIRE(engine.follower(session.vehicles(), "veh_0") == "veh_2");
  REQUIRE(engine.tailway(session.vehicles(), "veh_0") == Approx(95.0));
}

TEST_CASE("Session reset returns to the initial state") {
  const auto net = make_ring(RingParams{.length = 300.0, .edges = 3});
  KinematicBackend backend(net, ring_trio());
  Session session(make_scenario(net), backend);

  session.vehicles().set_observed("veh_1");
  for (int i = 0; i < 5; ++i) session.step();
  session.reset();

  REQUIRE(session.step_count() == 0);
  REQUIRE(session.time() == 0.0);
  REQUIRE(session.vehicles().position("veh_0") == Approx(0.0));
  REQUIRE(session.vehicles().observed_ids().empty());
}

TEST_CASE("arrivals flow from the backend into the table") {
  const auto net = make_highway(HighwayParams{.length = 100.0, .edges = 1, .lanes = 1});
  VehicleSpawn v;
  v.id = "a";
  v.edge = "highway_0";
  v.pos = 99.0;
  v.speed = 20.0;
  KinematicBackend backend(net, {v});
  Session session(make_scenario(net), backend);

  session.step();
  REQUIRE(session.vehicles().arrived_ids() == std::vector<std::string>{"a"});
  REQUIRE(session.vehicles().num_vehicles() == 0);
  REQUIRE(session.vehicles().speed("a", -1.0) == -1.0);
}

TEST_CASE("one scenario can back several sessions") {
  const auto net = make_ring(RingParams{.length = 300.0, .edges = 3});
  auto scenario = make_scenario(net);
  KinematicBackend b1(net, ring_trio());
  KinematicBackend b2(net, ring_trio());
  Session s1(scenario, b1);
  Session s2(scenario, b2);

  s1.step();
  REQUIRE(s1.time() > s2.time());
  REQUIRE(&s1.scenario() == &s2.scenario());
  REQUIRE(s2.vehicles().position("veh_0") == Approx(0.0));
}

TEST_CASE("session config applies its log level") {
  const auto net = make_ring();
  KinematicBackend backend(net);
  SessionConfig cfg;
  cfg.log_level = LogLevel::Error;
  Session session(make_scenario(net), backend, cfg);
  REQUIRE(log_level() == LogLevel::Error);
  set_log_level(LogLevel::Warn);
}

TEST_CASE("scenario construction fails fast on a malformed network") {
  NetworkDescription net;
  net.edges = {Edge{.id = "a", .length = 10.0}};
  net.connections = {{"a", 0, "missing", 0}};
  REQUIRE_THROWS_AS(make_scenario(net), TopologyError);

  KinematicBackend backend(make_ring());
  REQUIRE_THROWS_AS(Session(nullptr, backend), TopologyError);
}

#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <set>
#include <vector>
// =============================================================================
// Workmates
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("workmate graph", "[workmates]") {
  WorkmateGraph graph({{2, 1}, {3, 2}, {4, 3}, {6, 5}});

  SECTION("closure goes past the second hop") {
    REQUIRE(graph.reachable(1) == std::set<EmployeeId>({2, 3, 4}));
    REQUIRE(graph.reachable(4) == std::set<EmployeeId>({1, 2, 3}));
    REQUIRE(graph.reachable(5) == std::set<EmployeeId>({6}));
  }

  SECTION("cycles and unknown nodes") {
    graph.add_edge(4, 1);
    REQUIRE(graph.reachable(1) == std::set<EmployeeId>({2, 3, 4}));
    REQUIRE(graph.reachable(7).empty());
  }
}

TEST_CASE("workmates", "[workmates]") {
  Fixture fx;
  Workmates workmates(fx.store);
  std::set<EmployeeId> sphere;

  // 100-101 on one trip, 101-102 on another, 102-103 on a third
  fx.put_trip(10, 1, fx.at(8), 100, 101, 1);
  fx.put_trip(11, 2, fx.at(11), 101, 102, 1);
  fx.put_trip(13, 3, fx.on(fx.today + 1, 8), 102, 103, 1);

  SECTION("third hop is included") {
    Result res = workmates.sphere(100, sphere);
    REQUIRE(res.ok());
    REQUIRE(res.count == 3);
    REQUIRE(sphere == std::set<EmployeeId>({101, 102, 103}));
  }

  SECTION("symmetric") {
    REQUIRE(workmates.sphere(103, sphere).ok());
    REQUIRE(sphere.count(100) == 1);
    REQUIRE(sphere.count(103) == 0);
  }

  SECTION("driver without trips") {
    REQUIRE(workmates.sphere(104, sphere).ok());
    REQUIRE(sphere.empty());
  }

  SECTION("not a driver") {
    sphere.insert(1);
    REQUIRE(workmates.sphere(200, sphere).error == ErrorKind::InvalidDriver);
    REQUIRE(sphere.empty());
    REQUIRE(workmates.sphere(999, sphere).error == ErrorKind::InvalidDriver);
  }
}

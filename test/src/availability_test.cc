#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// AvailabilityResolver
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

namespace {

std::vector<int> truck_ids(const std::vector<Truck>& trucks) {
  std::vector<int> ids;
  for (const Truck& truck : trucks) ids.push_back(truck.id());
  return ids;
}

std::vector<int> driver_ids(const std::vector<Driver>& drivers) {
  std::vector<int> ids;
  for (const Driver& driver : drivers) ids.push_back(driver.id());
  return ids;
}

}  // namespace

TEST_CASE("availability", "[availability]") {
  Fixture fx;
  AvailabilityResolver avail(fx.store, fx.opt);

  // Truck 2 with drivers 100/101 from 09:00 to 11:00; busy 08:30 to 11:30
  fx.put_trip(10, 2, fx.at(9), 101, 100, 1);

  SECTION("overlapping windows exclude the truck") {
    REQUIRE(truck_ids(avail.available_trucks({fx.at(10), fx.at(12)}, "compost"))
            == std::vector<int>({3, 1}));
    REQUIRE(truck_ids(avail.available_trucks({fx.at(11, 29), fx.at(12)}, "compost"))
            == std::vector<int>({3, 1}));
    REQUIRE(truck_ids(avail.available_trucks({fx.at(7), fx.at(8, 31)}, "compost"))
            == std::vector<int>({3, 1}));
  }

  SECTION("windows touching the buffer do not overlap") {
    REQUIRE(truck_ids(avail.available_trucks({fx.at(11, 30), fx.at(12)}, "compost"))
            == std::vector<int>({2, 3, 1}));
    REQUIRE(truck_ids(avail.available_trucks({fx.at(7), fx.at(8, 30)}, "compost"))
            == std::vector<int>({2, 3, 1}));
  }

  SECTION("other days are not affected") {
    const Day tomorrow = fx.today + 1;
    REQUIRE(truck_ids(avail.available_trucks(
              {fx.on(tomorrow, 9), fx.on(tomorrow, 11)}, "compost"))
            == std::vector<int>({2, 3, 1}));
  }

  SECTION("maintenance takes the truck for the whole day") {
    const Day serviced = fx.today + 5;  // truck 4
    REQUIRE(avail.available_trucks(
              {fx.on(serviced, 14), fx.on(serviced, 15)}, "recycling").empty());
    REQUIRE(truck_ids(avail.available_trucks(
              {fx.on(serviced + 1, 14), fx.on(serviced + 1, 15)}, "recycling"))
            == std::vector<int>({4}));
  }

  SECTION("drivers of overlapping trips are busy") {
    REQUIRE(driver_ids(avail.available_drivers({fx.at(10), fx.at(12)}))
            == std::vector<int>({102, 103, 104}));
    REQUIRE(driver_ids(avail.available_drivers({fx.at(11, 30), fx.at(12)}))
            == std::vector<int>({100, 101, 102, 103, 104}));
  }

  SECTION("full day") {
    REQUIRE(driver_ids(avail.full_day_free_drivers(fx.today))
            == std::vector<int>({102, 103, 104}));
    REQUIRE(driver_ids(avail.full_day_free_drivers(fx.today + 1)).size() == 5);

    REQUIRE_FALSE(avail.truck_free_on(2, fx.today));
    REQUIRE(avail.truck_free_on(2, fx.today + 1));
    REQUIRE(avail.truck_free_on(3, fx.today));
    REQUIRE_FALSE(avail.truck_free_on(4, fx.today + 5));
  }
}

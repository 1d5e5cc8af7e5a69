#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// TripScheduler
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("trip scheduler", "[trip_scheduler]") {
  Fixture fx;
  AvailabilityResolver avail(fx.store, fx.opt);
  TripScheduler scheduler(fx.store, avail, fx.opt);

  SECTION("largest truck, most senior drivers, lowest facility") {
    Result res = scheduler.schedule(10, fx.at(9));
    REQUIRE(res.ok());
    REQUIRE(res.count == 1);
    std::vector<Trip> trips = fx.store.all_trips();
    REQUIRE(trips.size() == 1);
    const Trip& trip = trips.at(0);
    REQUIRE(trip.route() == 10);
    REQUIRE(trip.truck() == 2);          // tie with truck 3 on capacity
    REQUIRE(trip.start() == fx.at(9));
    REQUIRE(trip.end() == fx.at(11));
    REQUIRE(trip.driver_high() == 101);  // 100 drives B, takes next
    REQUIRE(trip.driver_low() == 100);
    REQUIRE(trip.facility() == 1);
    REQUIRE(trip.volume() == -1);
  }

  SECTION("busy resources are skipped") {
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(11, fx.at(10)).ok());
    Trip trip = fx.store.trips_of_route_on(11, fx.today).at(0);
    REQUIRE(trip.truck() == 3);
    REQUIRE(trip.driver_low() == 102);   // 102 drives A, takes next
    REQUIRE(trip.driver_high() == 103);
  }

  SECTION("a trip 30 minutes after another may reuse its truck") {
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(11, fx.at(11, 30)).ok());
    Trip trip = fx.store.trips_of_route_on(11, fx.today).at(0);
    REQUIRE(trip.truck() == 2);
    REQUIRE(trip.driver_low() == 100);
  }

  SECTION("a trip 29 minutes after another may not") {
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(11, fx.at(11, 29)).ok());
    REQUIRE(fx.store.trips_of_route_on(11, fx.today).at(0).truck() == 3);
  }

  SECTION("unqualified first driver pairs with the next qualified one") {
    REQUIRE(scheduler.schedule(20, fx.at(9)).ok());
    Trip trip = fx.store.all_trips().at(0);
    REQUIRE(trip.truck() == 4);
    REQUIRE(trip.facility() == 3);
    REQUIRE(trip.driver_low() == 100);
    REQUIRE(trip.driver_high() == 103);
  }

  SECTION("invalid route") {
    REQUIRE(scheduler.schedule(999, fx.at(9)).error == ErrorKind::InvalidRoute);
    REQUIRE(fx.store.all_trips().empty());
  }

  SECTION("working hours") {
    REQUIRE(scheduler.schedule(10, fx.at(7, 59)).error
            == ErrorKind::WorkingHoursViolation);
    REQUIRE(scheduler.schedule(10, fx.at(14, 1)).error
            == ErrorKind::WorkingHoursViolation);
    REQUIRE(scheduler.schedule(10, fx.at(16)).error
            == ErrorKind::WorkingHoursViolation);
    REQUIRE(fx.store.all_trips().empty());
    REQUIRE(scheduler.schedule(10, fx.at(14)).ok());  // ends at 16:00
    REQUIRE(scheduler.schedule(11, fx.at(8)).ok());
  }

  SECTION("one trip per route per day") {
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(10, fx.at(13)).error
            == ErrorKind::DuplicateRouteSameDay);
    std::vector<Trip> trips = fx.store.all_trips();
    REQUIRE(trips.size() == 1);
    REQUIRE(trips.at(0).start() == fx.at(9));
    REQUIRE(scheduler.schedule(10, fx.on(fx.today + 1, 9)).ok());
  }

  SECTION("no facility") {
    REQUIRE(scheduler.schedule(30, fx.at(9)).error == ErrorKind::NoFacility);
    REQUIRE(fx.store.all_trips().empty());
  }

  SECTION("no truck") {
    REQUIRE(scheduler.schedule(20, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(21, fx.at(10)).error
            == ErrorKind::NoAvailableTruck);
    REQUIRE(scheduler.schedule(20, fx.on(fx.today + 5, 9)).error
            == ErrorKind::NoAvailableTruck);  // truck 4 in maintenance
    REQUIRE(fx.store.all_trips().size() == 1);
  }

  SECTION("no driver") {
    // Only 104 is free from 09:00 to 11:00
    fx.put_trip(11, 1, fx.at(9), 100, 101, 1);
    fx.put_trip(12, 3, fx.at(9), 102, 103, 1);
    REQUIRE(scheduler.schedule(20, fx.at(9)).error
            == ErrorKind::NoAvailableDriver);
    REQUIRE(fx.store.all_trips().size() == 2);
  }

  SECTION("a zero length route still blocks its truck and drivers") {
    fx.store.execute("insert into routes values (40, 'compost', 0);");
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(40, fx.at(10)).ok());
    Trip trip = fx.store.trips_of_route_on(40, fx.today).at(0);
    REQUIRE(trip.start() == trip.end());
    REQUIRE(trip.truck() == 3);
    REQUIRE(trip.driver_low() == 102);
    REQUIRE(trip.driver_high() == 103);
    // The instant itself is busy for later trips
    const Window later = {fx.at(9, 45), fx.at(10, 45)};
    std::vector<Truck> trucks = avail.available_trucks(later, "compost");
    REQUIRE(trucks.size() == 1);
    REQUIRE(trucks.at(0).id() == 1);
    std::vector<Driver> drivers = avail.available_drivers(later);
    REQUIRE(drivers.size() == 1);
    REQUIRE(drivers.at(0).id() == 104);
  }

  SECTION("a zero length route may touch a buffered trip") {
    fx.store.execute("insert into routes values (40, 'compost', 0);");
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    REQUIRE(scheduler.schedule(40, fx.at(11, 30)).ok());
    Trip trip = fx.store.trips_of_route_on(40, fx.today).at(0);
    REQUIRE(trip.truck() == 2);
    REQUIRE(trip.driver_low() == 100);
    REQUIRE(trip.driver_high() == 101);
  }

  SECTION("drivers are taken by hire date before id") {
    fx.store.execute("update employees set hiredate = 10000 where eid = 104;");
    REQUIRE(scheduler.schedule(10, fx.at(9)).ok());
    Trip trip = fx.store.all_trips().at(0);
    REQUIRE(trip.truck() == 2);
    REQUIRE(trip.driver_high() == 104);  // senior, but cannot drive B
    REQUIRE(trip.driver_low() == 100);   // first B driver after 104
  }

  SECTION("plan writes nothing") {
    Trip trip;
    REQUIRE(scheduler.plan(10, fx.at(9), trip).ok());
    REQUIRE(trip.truck() == 2);
    REQUIRE(fx.store.all_trips().empty());
  }
}

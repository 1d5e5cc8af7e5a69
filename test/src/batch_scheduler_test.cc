#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// BatchScheduler
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("batch scheduler", "[batch_scheduler]") {
  Fixture fx;
  AvailabilityResolver avail(fx.store, fx.opt);
  BatchScheduler batch(fx.store, avail, fx.opt);

  SECTION("routes are packed until one does not fit") {
    // Routes 10 (2h), 11 (1h), 12 (4h): 12 would end exactly at 16:00
    Result res = batch.schedule(3, fx.today);
    REQUIRE(res.ok());
    REQUIRE(res.count == 2);
    std::vector<Trip> trips = fx.store.all_trips();
    REQUIRE(trips.size() == 2);
    REQUIRE(trips.at(0).route() == 10);
    REQUIRE(trips.at(0).start() == fx.at(8));
    REQUIRE(trips.at(0).end() == fx.at(10));
    REQUIRE(trips.at(1).route() == 11);
    REQUIRE(trips.at(1).start() == fx.at(10, 30));
    REQUIRE(trips.at(1).end() == fx.at(11, 30));
    for (const Trip& trip : trips) {
      REQUIRE(trip.truck() == 3);
      REQUIRE(trip.facility() == 1);
      REQUIRE(trip.driver_low() == 100);   // 100 drives B only
      REQUIRE(trip.driver_high() == 101);  // first A driver
    }
  }

  SECTION("scheduled routes and busy drivers are left out") {
    REQUIRE(batch.schedule(3, fx.today).count == 2);
    REQUIRE(batch.schedule(1, fx.today).count == 2);
    std::vector<Trip> trips = fx.store.trips_of_truck_on(1, fx.today);
    REQUIRE(trips.size() == 2);
    REQUIRE(trips.at(0).route() == 12);
    REQUIRE(trips.at(0).end() == fx.at(12));
    REQUIRE(trips.at(1).route() == 13);
    REQUIRE(trips.at(1).start() == fx.at(12, 30));
    REQUIRE(trips.at(1).driver_low() == 102);
    REQUIRE(trips.at(1).driver_high() == 103);
  }

  SECTION("nothing left to schedule") {
    REQUIRE(batch.schedule(3, fx.today).count == 2);
    REQUIRE(batch.schedule(1, fx.today).count == 2);
    Result res = batch.schedule(2, fx.today);
    REQUIRE(res.error == ErrorKind::NothingToDo);
    REQUIRE(res.count == 0);
  }

  SECTION("truck already working that day") {
    REQUIRE(batch.schedule(3, fx.today).count == 2);
    REQUIRE(batch.schedule(3, fx.today).error == ErrorKind::NoAvailableTruck);
    REQUIRE(batch.schedule(4, fx.today + 5).error
            == ErrorKind::NoAvailableTruck);  // maintenance
    REQUIRE(fx.store.all_trips().size() == 2);
  }

  SECTION("invalid truck") {
    REQUIRE(batch.schedule(99, fx.today).error == ErrorKind::InvalidTruck);
  }

  SECTION("no driver for the truck type") {
    REQUIRE(batch.schedule(5, fx.today).error == ErrorKind::NoAvailableDriver);
  }

  SECTION("no facility") {
    fx.store.execute("insert into drivers values (104, 'G');");
    Result res = batch.schedule(5, fx.today);
    REQUIRE(res.error == ErrorKind::NoFacility);
    REQUIRE(res.count == 0);
    REQUIRE(fx.store.all_trips().empty());
  }

  SECTION("no driver pair") {
    fx.put_trip(20, 4, fx.at(9), 100, 101, 3);
    fx.put_trip(21, 4, fx.at(12), 102, 103, 3);
    REQUIRE(batch.schedule(3, fx.today).error == ErrorKind::NoAvailableDriver);
    REQUIRE(fx.store.all_trips().size() == 2);
  }

  SECTION("drivers are taken by hire date before id") {
    fx.store.execute("update employees set hiredate = 10000 where eid = 104;");
    REQUIRE(batch.schedule(3, fx.today).count == 2);
    for (const Trip& trip : fx.store.all_trips()) {
      REQUIRE(trip.driver_high() == 104);  // senior A driver leads
      REQUIRE(trip.driver_low() == 100);   // next by hire date
    }
  }

  SECTION("first route too long") {
    Options opt = fx.opt;
    opt.shift_end_hour = 10;  // route 10 would end at 10:00
    BatchScheduler short_day(fx.store, avail, opt);
    Result res = short_day.schedule(3, fx.today);
    REQUIRE(res.error == ErrorKind::WorkingHoursViolation);
    REQUIRE(res.count == 0);
    REQUIRE(fx.store.all_trips().empty());
  }
}

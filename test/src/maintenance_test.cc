#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// MaintenanceScheduler
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("maintenance scheduler", "[maintenance]") {
  Fixture fx;
  AvailabilityResolver avail(fx.store, fx.opt);
  MaintenanceScheduler maint(fx.store, avail, fx.opt);
  const Day tomorrow = fx.today + 1;

  SECTION("backlog is booked from the next day") {
    // Due: trucks 1 (A), 2 (B), 5 (G). Nobody services G.
    Result res = maint.schedule(fx.today);
    REQUIRE(res.ok());
    REQUIRE(res.count == 2);
    std::vector<Maintenance> booked = fx.store.maintenance_on(tomorrow);
    REQUIRE(booked.size() == 2);
    REQUIRE(booked.at(0).truck() == 1);
    REQUIRE(booked.at(0).technician() == 200);
    REQUIRE(booked.at(1).truck() == 2);
    REQUIRE(booked.at(1).technician() == 201);
  }

  SECTION("booked trucks are not due again") {
    REQUIRE(maint.schedule(fx.today).count == 2);
    Result res = maint.schedule(fx.today);
    REQUIRE(res.ok());
    REQUIRE(res.count == 0);
    REQUIRE(fx.store.all_maintenance().size() == 8);
  }

  SECTION("busy technicians push the booking to a later day") {
    // 201 services truck 3 tomorrow; 201 is the only B technician
    fx.store.insert_maintenance(Maintenance(3, 201, tomorrow));
    REQUIRE(maint.schedule(fx.today).count == 2);
    std::vector<Maintenance> booked = fx.store.maintenance_on(tomorrow);
    REQUIRE(booked.size() == 2);
    REQUIRE(booked.at(0).truck() == 1);
    REQUIRE(booked.at(0).technician() == 200);
    booked = fx.store.maintenance_on(tomorrow + 1);
    REQUIRE(booked.size() == 1);
    REQUIRE(booked.at(0).truck() == 2);
    REQUIRE(booked.at(0).technician() == 201);
  }

  SECTION("the lowest free technician is chosen") {
    fx.store.insert_maintenance(Maintenance(3, 200, tomorrow));
    REQUIRE(maint.schedule(fx.today).count == 2);
    std::vector<Maintenance> booked = fx.store.maintenance_on(tomorrow);
    REQUIRE(booked.size() == 2);  // truck 1 with 201, truck 3
    REQUIRE(booked.at(0).truck() == 1);
    REQUIRE(booked.at(0).technician() == 201);
    booked = fx.store.maintenance_on(tomorrow + 1);
    REQUIRE(booked.size() == 1);  // 201 is taken tomorrow
    REQUIRE(booked.at(0).truck() == 2);
  }

  SECTION("a truck on a trip is not serviced that day") {
    fx.put_trip(10, 1, fx.on(tomorrow, 9), 100, 101, 1);
    REQUIRE(maint.schedule(fx.today).count == 2);
    REQUIRE(fx.store.maintenance_on(tomorrow).size() == 1);  // truck 2
    std::vector<Maintenance> booked = fx.store.maintenance_on(tomorrow + 1);
    REQUIRE(booked.size() == 1);
    REQUIRE(booked.at(0).truck() == 1);
    REQUIRE(booked.at(0).technician() == 200);
  }

  SECTION("without strict mode only technicians are checked") {
    Options opt = fx.opt;
    opt.strict_maintenance = false;
    MaintenanceScheduler loose(fx.store, avail, opt);
    fx.put_trip(10, 1, fx.on(tomorrow, 9), 100, 101, 1);
    REQUIRE(loose.schedule(fx.today).count == 2);
    std::vector<Maintenance> booked = fx.store.maintenance_on(tomorrow);
    REQUIRE(booked.size() == 2);
    REQUIRE(booked.at(0).truck() == 1);
  }

  SECTION("trucks never serviced are not in the backlog") {
    fx.store.execute("insert into trucks values (6, 'A', 9);");
    REQUIRE(maint.schedule(fx.today).count == 2);
    for (const Maintenance& m : fx.store.all_maintenance())
      REQUIRE(m.truck() != 6);
  }

  SECTION("nothing due") {
    Result res = maint.schedule(fx.today - 200);
    REQUIRE(res.error == ErrorKind::NothingToDo);
    REQUIRE(res.count == 0);
  }
}

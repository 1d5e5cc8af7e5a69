#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// SqliteStore
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("sqlite store", "[store]") {
  Fixture fx;
  SqliteStore& store = fx.store;

  SECTION("reference lookups") {
    Route route;
    REQUIRE(store.get_route(10, route));
    REQUIRE(route.waste_type() == "compost");
    REQUIRE(route.length() == 10);
    REQUIRE_FALSE(store.get_route(999, route));

    Truck truck;
    REQUIRE(store.get_truck(4, truck));
    REQUIRE(truck.type() == "R");
    REQUIRE(truck.waste_type() == "recycling");
    REQUIRE_FALSE(store.get_truck(99, truck));

    TruckType type;
    REQUIRE(store.get_truck_type("G", type));
    REQUIRE(type.waste_type() == "glass");
    REQUIRE_FALSE(store.get_truck_type("Z", type));

    Facility facility;
    REQUIRE(store.get_facility(3, facility));
    REQUIRE(facility.waste_type() == "recycling");
  }

  SECTION("lists are ordered") {
    std::vector<Truck> trucks = store.trucks_by_waste_type("compost");
    REQUIRE(trucks.size() == 3);
    REQUIRE(trucks.at(0).id() == 2);  // capacity 12, lower id
    REQUIRE(trucks.at(1).id() == 3);  // capacity 12
    REQUIRE(trucks.at(2).id() == 1);  // capacity 10

    std::vector<Facility> facilities = store.facilities_by_waste_type("compost");
    REQUIRE(facilities.size() == 2);
    REQUIRE(facilities.at(0).id() == 1);
    REQUIRE(store.facilities_by_waste_type("glass").empty());

    std::vector<Route> routes = store.routes_by_waste_type("recycling");
    REQUIRE(routes.size() == 2);
    REQUIRE(routes.at(0).id() == 20);
    REQUIRE(routes.at(1).id() == 21);

    REQUIRE(store.technicians_for("A") == std::vector<EmployeeId>({200, 201}));
    REQUIRE(store.technicians_for("G").empty());
  }

  SECTION("drivers appear once with every qualification") {
    std::vector<Driver> drivers = store.drivers();
    REQUIRE(drivers.size() == 5);
    REQUIRE(drivers.at(0).id() == 100);  // same hire date as 101
    REQUIRE(drivers.at(1).id() == 101);
    REQUIRE(drivers.at(4).id() == 104);
    REQUIRE(drivers.at(4).qualifications().size() == 2);
    REQUIRE(drivers.at(4).can_drive("A"));
    REQUIRE(drivers.at(4).can_drive("R"));
    REQUIRE_FALSE(drivers.at(4).can_drive("B"));
  }

  SECTION("employees") {
    REQUIRE(store.employees_by_name("Ivy Sue").size() == 2);
    REQUIRE(store.employees_by_name("Hal Roe").size() == 1);
    REQUIRE(store.employees_by_name("Nobody").empty());
    REQUIRE(store.is_driver(104));
    REQUIRE_FALSE(store.is_driver(200));
    REQUIRE(store.is_technician(201, "B"));
    REQUIRE_FALSE(store.is_technician(200, "B"));
  }

  SECTION("trips") {
    Trip trip(10, 2, fx.at(9), fx.at(11), 100, 101, 1);
    store.insert_trip(trip);
    std::vector<Trip> trips = store.all_trips();
    REQUIRE(trips.size() == 1);
    REQUIRE(trips.at(0).route() == 10);
    REQUIRE(trips.at(0).end() == fx.at(11));  // computed from length
    REQUIRE(trips.at(0).driver_high() == 101);
    REQUIRE(trips.at(0).driver_low() == 100);
    REQUIRE(trips.at(0).volume() == -1);
    REQUIRE(trips.at(0).has_driver(100));
    REQUIRE_FALSE(trips.at(0).has_driver(102));

    REQUIRE(store.trips_of_route_on(10, fx.today).size() == 1);
    REQUIRE(store.trips_of_route_on(10, fx.today + 1).empty());
    REQUIRE(store.trips_of_truck_on(2, fx.today).size() == 1);
    REQUIRE(store.trips_to_facility_on(1, fx.today).size() == 1);
    REQUIRE(store.trips_between(fx.at(9), fx.at(10)).size() == 1);
    REQUIRE(store.trips_between(fx.at(9, 1), fx.at(10)).empty());
    REQUIRE(store.driver_pairs().size() == 1);
    REQUIRE(store.driver_pairs().at(0) == DriverPair(101, 100));

    REQUIRE(store.update_trip_facility(1, fx.today + 1, 2) == 0);
    REQUIRE(store.update_trip_facility(1, fx.today, 2) == 1);
    REQUIRE(store.all_trips().at(0).facility() == 2);

    // (route, start) is unique
    REQUIRE_THROWS_AS(store.insert_trip(trip), StorageError);
  }

  SECTION("rollback discards writes") {
    store.begin();
    store.insert_trip(Trip(10, 2, fx.at(9), fx.at(11), 100, 101, 1));
    store.rollback();
    REQUIRE(store.all_trips().empty());

    store.begin();
    store.insert_trip(Trip(10, 2, fx.at(9), fx.at(11), 100, 101, 1));
    store.commit();
    REQUIRE(store.all_trips().size() == 1);

    store.rollback();  // nothing open
    REQUIRE(store.all_trips().size() == 1);
  }

  SECTION("maintenance") {
    std::vector<Truck> due = store.maintenance_due(fx.today, 90, 10);
    REQUIRE(due.size() == 3);
    REQUIRE(due.at(0).id() == 1);
    REQUIRE(due.at(1).id() == 2);
    REQUIRE(due.at(2).id() == 5);

    REQUIRE(store.maintenance_on(fx.today + 5).size() == 1);
    store.insert_maintenance(Maintenance(1, 201, fx.today + 5));
    std::vector<Maintenance> booked = store.maintenance_on(fx.today + 5);
    REQUIRE(booked.size() == 2);
    REQUIRE(booked.at(0).truck() == 1);
    REQUIRE(booked.at(0).technician() == 201);
    REQUIRE(store.all_maintenance().size() == 7);
    REQUIRE(store.maintenance_due(fx.today, 90, 10).size() == 2);
  }

  SECTION("technicians") {
    store.insert_technician(202, "R");
    REQUIRE(store.is_technician(202, "R"));
    REQUIRE_THROWS_AS(store.insert_technician(202, "R"), StorageError);
    REQUIRE_THROWS_AS(store.insert_technician(202, "Z"), StorageError);
  }

  SECTION("bad scripts throw") {
    REQUIRE_THROWS_AS(store.execute("insert into nowhere values (1);"),
                      StorageError);
    REQUIRE_THROWS_AS(store.load("no/such/file.sql"), StorageError);
  }
}

TEST_CASE("sqlite store options", "[store]") {
  Options opt = Fixture::options();

  SECTION("missing data script") {
    opt.path_to_data = "no/such/file.sql";
    REQUIRE_THROWS_AS(SqliteStore(opt), StorageError);
  }

  SECTION("no tables") {
    opt.create_tables = false;
    REQUIRE_THROWS_AS(SqliteStore(opt), StorageError);  // cannot prepare
  }
}

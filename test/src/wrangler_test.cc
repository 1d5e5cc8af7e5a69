#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <cstdio>
#include <fstream>
#include <set>
#include <string>
#include <vector>
// =============================================================================
// Wrangler
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("wrangler", "[wrangler]") {
  Fixture fx;
  Wrangler wr(fx.store, fx.opt);

  SECTION("schedule_trip") {
    REQUIRE(wr.schedule_trip(10, fx.at(9)));
    REQUIRE_FALSE(wr.schedule_trip(10, fx.at(13)));
    REQUIRE_FALSE(wr.schedule_trip(999, fx.at(9)));
    REQUIRE(fx.store.all_trips().size() == 1);
  }

  SECTION("schedule_trips") {
    REQUIRE(wr.schedule_trips(3, fx.today) == 2);
    REQUIRE(wr.schedule_trips(3, fx.today) == 0);
    REQUIRE(wr.schedule_trips(99, fx.today) == 0);
  }

  SECTION("schedule_maintenance") {
    REQUIRE(wr.schedule_maintenance(fx.today) == 2);
    REQUIRE(wr.schedule_maintenance(fx.today) == 0);
  }

  SECTION("reroute_waste") {
    REQUIRE(wr.schedule_trip(10, fx.at(9)));
    REQUIRE(wr.schedule_trip(11, fx.at(9)));
    REQUIRE(wr.reroute_waste(1, fx.today) == 2);
    REQUIRE(wr.reroute_waste(1, fx.today) == 0);
  }

  SECTION("workmate_sphere") {
    REQUIRE(wr.schedule_trip(10, fx.at(9)));   // 100, 101
    REQUIRE(wr.schedule_trip(11, fx.at(9)));   // 102, 103
    REQUIRE(wr.workmate_sphere(100) == std::set<EmployeeId>({101}));
    REQUIRE(wr.workmate_sphere(103) == std::set<EmployeeId>({102}));
    REQUIRE(wr.workmate_sphere(200).empty());
  }

  SECTION("update_technicians") {
    std::vector<Qualification> records {{"Hal", "Roe", "A"},
                                        {"Ann", "Lee", "A"}};
    REQUIRE(wr.update_technicians(records) == 1);

    const std::string path = "wrangler_test_qualifications.txt";
    {
      std::ofstream ofs(path);
      ofs << "Fay Orr\nB\nHal Roe\nA\nHal Roe\nR\n";
    }
    REQUIRE(wr.update_technicians(path) == 2);
    std::remove(path.c_str());

    REQUIRE(wr.update_technicians(std::string("no/such/file.txt")) == 0);
  }

  SECTION("components report the reason") {
    REQUIRE(wr.trips().schedule(10, fx.at(7)).error
            == ErrorKind::WorkingHoursViolation);
    REQUIRE(wr.reroute().reroute(1, fx.today).error == ErrorKind::NothingToDo);
  }
}

TEST_CASE("wrangler sets the log threshold", "[wrangler]") {
  Fixture fx;
  Options opt = fx.opt;
  opt.log_level = MessageType::Warning;
  {
    Wrangler wr(fx.store, opt);
    REQUIRE(Message::threshold() == MessageType::Warning);
  }
  REQUIRE(Message::threshold() == MessageType::Warning);
  Message::threshold() = fx.opt.log_level;
}

TEST_CASE("snapshot on close", "[wrangler]") {
  const std::string path = "wrangler_test_snapshot.db";
  std::remove(path.c_str());
  Options opt = Fixture::options();
  opt.path_to_save = path;
  {
    SqliteStore store(opt);
    store.execute(Fixture::sql(make_day(2023, 5, 4)));
    Wrangler wr(store, opt);
    REQUIRE(wr.schedule_trip(10, make_stamp(make_day(2023, 5, 4), 9, 0)));
  }

  Options reopen = Fixture::options();
  reopen.path_to_database = path;
  reopen.create_tables = false;
  {
    SqliteStore store(reopen);
    REQUIRE(store.all_trips().size() == 1);
    REQUIRE(store.drivers().size() == 5);
  }
  std::remove(path.c_str());
}

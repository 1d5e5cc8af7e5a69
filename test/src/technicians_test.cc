#include "catch.hpp"
#include "libwrangler.h"
#include "fixture.h"

#include <vector>
// =============================================================================
// TechnicianImporter
// =============================================================================
using namespace wrangler;
using wrangler::test::Fixture;

TEST_CASE("technician importer", "[technicians]") {
  Fixture fx;
  TechnicianImporter importer(fx.store);

  SECTION("valid records are kept, others skipped") {
    std::vector<Qualification> records {
      {"Hal", "Roe", "A"},   // valid
      {"Fay", "Orr", "A"},   // already qualified
      {"Ann", "Lee", "A"},   // driver
      {"Hal", "Roe", "Z"},   // no such truck type
      {"Fay", "Orr", "B"},   // valid
    };
    Result res = importer.import(records);
    REQUIRE(res.ok());
    REQUIRE(res.count == 2);
    REQUIRE(fx.store.is_technician(202, "A"));
    REQUIRE(fx.store.is_technician(200, "B"));
    REQUIRE_FALSE(fx.store.is_technician(100, "A"));
    REQUIRE(fx.store.technicians_for("A") == std::vector<EmployeeId>({200, 201, 202}));
  }

  SECTION("validation") {
    EmployeeId eid = -1;
    REQUIRE(importer.validate({"Hal", "Roe", "R"}, eid) == ErrorKind::Success);
    REQUIRE(eid == 202);
    REQUIRE(importer.validate({"Hal", "Roe", "Z"}, eid)
            == ErrorKind::InvalidTruckType);
    REQUIRE(importer.validate({"No", "Body", "A"}, eid)
            == ErrorKind::UnknownEmployee);
    REQUIRE(importer.validate({"Ivy", "Sue", "A"}, eid)
            == ErrorKind::UnknownEmployee);  // two employees
    REQUIRE(importer.validate({"Eve", "Kim", "G"}, eid)
            == ErrorKind::EmployeeIsDriver);
    REQUIRE(importer.validate({"Gus", "Poe", "B"}, eid)
            == ErrorKind::AlreadyQualified);
  }

  SECTION("a repeated record counts once") {
    Result res = importer.import({{"Hal", "Roe", "R"}, {"Hal", "Roe", "R"}});
    REQUIRE(res.count == 1);
  }

  SECTION("empty batch") {
    Result res = importer.import({});
    REQUIRE(res.error == ErrorKind::NothingToDo);
    REQUIRE(res.count == 0);
  }
}

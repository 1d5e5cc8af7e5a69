#ifndef WRANGLER_TEST_SRC_FIXTURE_H_
#define WRANGLER_TEST_SRC_FIXTURE_H_

#include <algorithm>
#include <string>

#include "libwrangler.h"

/* Reference data shared by the tests.
 *
 *   truck types  A, B: compost   R: recycling   G: glass
 *   trucks       1 A cap 10   2 B cap 12   3 A cap 12   4 R cap 8   5 G cap 5
 *   routes       10 compost 10km (2h)   11 compost 5km (1h)
 *                12 compost 20km (4h)   13 compost 10km (2h)
 *                20 recycling 10km (2h) 21 recycling 5km (1h)
 *                30 glass 5km (1h)
 *   facilities   1, 2 compost   3 recycling   (no glass facility)
 *   drivers      100 Ann Lee  hired 18000  B
 *                101 Bob Day  hired 18000  A
 *                102 Cat Ray  hired 18100  A
 *                103 Dan Fox  hired 18200  R
 *                104 Eve Kim  hired 18300  A, R
 *   technicians  200 Fay Orr  A
 *                201 Gus Poe  A, B
 *   others       202 Hal Roe, 203 Ivy Sue, 204 Ivy Sue
 *   maintenance  truck 1 today-100, truck 2 today-120, truck 3 today-30,
 *                truck 4 today-200 and today+5, truck 5 today-95
 * With a 90 day interval and 10 day lookahead, trucks 1, 2, 5 are due today
 * and no technician can service truck type G. */
namespace wrangler {
namespace test {

class Fixture {
 public:
  Fixture() : opt(options()), today(make_day(2023, 5, 4)), store(opt) {
    store.execute(sql(today));
  }

  static Options options() {
    Options opt;
    opt.log_level = MessageType::Error;
    Message::threshold() = opt.log_level;
    return opt;
  }

  static std::string sql(const Day& d) {
    auto day = [&](int offset) { return std::to_string(d + offset); };
    return
      "insert into wastetypes values ('compost'), ('recycling'), ('glass');"
      "insert into trucktypes values"
      "  ('A', 'compost'), ('B', 'compost'), ('R', 'recycling'),"
      "  ('G', 'glass');"
      "insert into trucks values"
      "  (1, 'A', 10), (2, 'B', 12), (3, 'A', 12), (4, 'R', 8), (5, 'G', 5);"
      "insert into routes values"
      "  (10, 'compost', 10), (11, 'compost', 5), (12, 'compost', 20),"
      "  (13, 'compost', 10), (20, 'recycling', 10), (21, 'recycling', 5),"
      "  (30, 'glass', 5);"
      "insert into facilities values"
      "  (1, '1 Compost Way', 'compost'), (2, '2 Compost Way', 'compost'),"
      "  (3, '3 Bottle Rd', 'recycling');"
      "insert into employees values"
      "  (100, 'Ann Lee', 18000), (101, 'Bob Day', 18000),"
      "  (102, 'Cat Ray', 18100), (103, 'Dan Fox', 18200),"
      "  (104, 'Eve Kim', 18300), (200, 'Fay Orr', 17000),"
      "  (201, 'Gus Poe', 17100), (202, 'Hal Roe', 17200),"
      "  (203, 'Ivy Sue', 17300), (204, 'Ivy Sue', 17400);"
      "insert into drivers values"
      "  (100, 'B'), (101, 'A'), (102, 'A'), (103, 'R'), (104, 'A'),"
      "  (104, 'R');"
      "insert into technicians values (200, 'A'), (201, 'A'), (201, 'B');"
      "insert into maintenance values"
      "  (1, 200, " + day(-100) + "), (2, 201, " + day(-120) + "),"
      "  (3, 200, " + day(-30) + "), (4, 200, " + day(-200) + "),"
      "  (4, 201, " + day(5) + "), (5, 200, " + day(-95) + ");";
  }

  /* Insert a trip row directly, bypassing the schedulers */
  void put_trip(const RouteId& rid, const TruckId& tid, const Stamp& start,
                const EmployeeId& eid1, const EmployeeId& eid2,
                const FacilityId& fid) {
    store.execute(
      "insert into trips values (" + std::to_string(rid) + ", "
      + std::to_string(tid) + ", " + std::to_string(start) + ", null, "
      + std::to_string(std::max(eid1, eid2)) + ", "
      + std::to_string(std::min(eid1, eid2)) + ", "
      + std::to_string(fid) + ");");
  }

  Stamp at(int h, int m = 0) const { return make_stamp(today, h, m); }
  Stamp on(const Day& d, int h, int m = 0) const {
    return make_stamp(d, h, m);
  }

  Options opt;
  Day today;
  SqliteStore store;
};

}  // namespace test
}  // namespace wrangler

#endif  // WRANGLER_TEST_SRC_FIXTURE_H_

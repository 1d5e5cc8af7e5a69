// MIT License
//
// Copyright (c) 2023 the Wrangler authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_DBSQL_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_DBSQL_H_

#include <sqlite3.h>

#include "types.h" /* SqliteQuery types */

/* -------
 * SUMMARY
 * -------
 * This file contains the SQL statements used by SqliteStore.
 * The statements are:
 *
 *   CREATE STATEMENTS
 *   - create_wrangler_tables  create database tables
 *
 *   SELECT STATEMENTS (s--)
 *   - sro_stmt  select one route
 *   - sot_stmt  select one truck (with waste type)
 *   - sty_stmt  select one truck type
 *   - sof_stmt  select one facility
 *   - srw_stmt  select routes by waste type
 *   - sfw_stmt  select facilities by waste type
 *   - stw_stmt  select trucks by waste type
 *   - sdr_stmt  select drivers (one row per qualification)
 *   - sen_stmt  select employees by name
 *   - sid_stmt  select is-driver
 *   - sit_stmt  select is-technician
 *   - stf_stmt  select technicians for truck type
 *   - stb_stmt  select trips between
 *   - srd_stmt  select trips of route on day
 *   - skd_stmt  select trips of truck on day
 *   - sfd_stmt  select trips to facility on day
 *   - sat_stmt  select all trips
 *   - sdp_stmt  select driver pairs
 *   - smd_stmt  select maintenance due
 *   - smo_stmt  select maintenance on day
 *   - sam_stmt  select all maintenance
 *
 *   INSERT STATEMENTS (i--)
 *   - itr_stmt  insert trip
 *   - ima_stmt  insert maintenance
 *   - ite_stmt  insert technician
 *
 *   UPDATE STATEMENTS (u--)
 *   - ufa_stmt  update trip facility
 */

namespace wrangler {

void prepare_stmt(sqlite3*, SqliteQuery, sqlite3_stmt**);

namespace sql {

/* Create Wrangler database tables. ------------------------------------------*/
const SqliteQuery create_wrangler_tables =
  "create table wastetypes("
    "wastetype      text primary key"
  ") without rowid;"

  "create table trucktypes("
    "trucktype      text primary key,"    // col 0
    "wastetype      text not null,"       // col 1
  "foreign key (wastetype) references wastetypes(wastetype)"
  ") without rowid;"

  "create table trucks("
    "tid            int primary key,"     // col 0
    "trucktype      text not null,"       // col 1
    "capacity       real not null,"       // col 2
  "foreign key (trucktype) references trucktypes(trucktype)"
  ") without rowid;"

  "create table routes("
    "rid            int primary key,"     // col 0
    "wastetype      text not null,"       // col 1
    "length         real not null,"       // col 2
  "foreign key (wastetype) references wastetypes(wastetype)"
  ") without rowid;"

  "create table employees("
    "eid            int primary key,"     // col 0
    "name           text not null,"       // col 1
    "hiredate       int not null"         // col 2 (Day)
  ") without rowid;"

  "create table drivers("
    "eid            int not null,"
    "trucktype      text not null,"
  "primary key (eid, trucktype),"
  "foreign key (eid) references employees(eid),"
  "foreign key (trucktype) references trucktypes(trucktype)"
  ") without rowid;"

  "create table technicians("
    "eid            int not null,"
    "trucktype      text not null,"
  "primary key (eid, trucktype),"
  "foreign key (eid) references employees(eid),"
  "foreign key (trucktype) references trucktypes(trucktype)"
  ") without rowid;"

  "create table facilities("
    "fid            int primary key,"     // col 0
    "address        text,"                // col 1
    "wastetype      text not null,"       // col 2
  "foreign key (wastetype) references wastetypes(wastetype)"
  ") without rowid;"

  "create table trips("
    "rid            int not null,"        // col 0
    "tid            int not null,"        // col 1
    "ttime          int not null,"        // col 2 (Stamp)
    "volume         real,"                // col 3 (null until collected)
    "eid1           int not null,"        // col 4 (driverHigh)
    "eid2           int not null,"        // col 5 (driverLow)
    "fid            int not null,"        // col 6
  "primary key (rid, ttime),"
  "check (eid1 > eid2),"
  "foreign key (rid) references routes(rid),"
  "foreign key (tid) references trucks(tid),"
  "foreign key (eid1) references employees(eid),"
  "foreign key (eid2) references employees(eid),"
  "foreign key (fid) references facilities(fid)"
  ") without rowid;"

  "create table maintenance("
    "tid            int not null,"        // col 0
    "eid            int not null,"        // col 1
    "mdate          int not null,"        // col 2 (Day)
  "primary key (tid, mdate),"
  "foreign key (tid) references trucks(tid),"
  "foreign key (eid) references employees(eid)"
  ") without rowid;";

/* Select reference data. ----------------------------------------------------*/
const SqliteQuery sro_stmt =  // select one route
  "select rid, wastetype, length from routes "
  "where"
  "  rid = ?;";  // param1: RouteId

const SqliteQuery sot_stmt =  // select one truck
  "select t.tid, t.trucktype, t.capacity, y.wastetype "
  "from trucks t join trucktypes y on y.trucktype = t.trucktype "
  "where"
  "  t.tid = ?;";  // param1: TruckId

const SqliteQuery sty_stmt =  // select one truck type
  "select trucktype, wastetype from trucktypes "
  "where"
  "  trucktype = ?;";  // param1: TruckTypeCode

const SqliteQuery sof_stmt =  // select one facility
  "select fid, wastetype from facilities "
  "where"
  "  fid = ?;";  // param1: FacilityId

const SqliteQuery srw_stmt =  // select routes by waste type
  "select rid, wastetype, length from routes "
  "where"
  "  wastetype = ? "  // param1: WasteType
  "order by rid;";

const SqliteQuery sfw_stmt =  // select facilities by waste type
  "select fid, wastetype from facilities "
  "where"
  "  wastetype = ? "  // param1: WasteType
  "order by fid;";

const SqliteQuery stw_stmt =  // select trucks by waste type
  "select t.tid, t.trucktype, t.capacity, y.wastetype "
  "from trucks t join trucktypes y on y.trucktype = t.trucktype "
  "where"
  "  y.wastetype = ? "  // param1: WasteType
  "order by t.capacity desc, t.tid;";

const SqliteQuery sdr_stmt =  // select drivers, one row per qualification
  "select e.eid, e.name, e.hiredate, d.trucktype "
  "from employees e join drivers d on d.eid = e.eid "
  "order by e.hiredate, e.eid, d.trucktype;";

const SqliteQuery sen_stmt =  // select employees by name
  "select eid, name, hiredate from employees "
  "where"
  "  name = ? "  // param1: full name
  "order by eid;";

const SqliteQuery sid_stmt =  // select is-driver
  "select 1 from drivers "
  "where"
  "  eid = ? "  // param1: EmployeeId
  "limit 1;";

const SqliteQuery sit_stmt =  // select is-technician
  "select 1 from technicians "
  "where"
  "  eid = ?"             // param1: EmployeeId
  "  and trucktype = ?;"; // param2: TruckTypeCode

const SqliteQuery stf_stmt =  // select technicians for truck type
  "select eid from technicians "
  "where"
  "  trucktype = ? "  // param1: TruckTypeCode
  "order by eid;";

/* Select trips. -------------------------------------------------------------
 * Every trip select returns the same columns; col 7 is the route length used
 * to compute the trip end time. */
#define WRANGLER_TRIP_COLUMNS                                                  \
  "select t.rid, t.tid, t.ttime, t.volume, t.eid1, t.eid2, t.fid, r.length "   \
  "from trips t join routes r on r.rid = t.rid "

const SqliteQuery stb_stmt =  // select trips between
  WRANGLER_TRIP_COLUMNS
  "where"
  "  t.ttime >= ?"       // param1: from (Stamp)
  "  and t.ttime < ? "   // param2: to (Stamp)
  "order by t.ttime, t.rid;";

const SqliteQuery srd_stmt =  // select trips of route on day
  WRANGLER_TRIP_COLUMNS
  "where"
  "  t.rid = ?"          // param1: RouteId
  "  and t.ttime >= ?"   // param2: day begin
  "  and t.ttime < ? "   // param3: next day begin
  "order by t.ttime;";

const SqliteQuery skd_stmt =  // select trips of truck on day
  WRANGLER_TRIP_COLUMNS
  "where"
  "  t.tid = ?"          // param1: TruckId
  "  and t.ttime >= ?"   // param2: day begin
  "  and t.ttime < ? "   // param3: next day begin
  "order by t.ttime;";

const SqliteQuery sfd_stmt =  // select trips to facility on day
  WRANGLER_TRIP_COLUMNS
  "where"
  "  t.fid = ?"          // param1: FacilityId
  "  and t.ttime >= ?"   // param2: day begin
  "  and t.ttime < ? "   // param3: next day begin
  "order by t.ttime, t.rid;";

const SqliteQuery sat_stmt =  // select all trips
  WRANGLER_TRIP_COLUMNS
  "order by t.ttime, t.rid;";

#undef WRANGLER_TRIP_COLUMNS

const SqliteQuery sdp_stmt =  // select driver pairs
  "select distinct eid1, eid2 from trips "
  "order by eid1, eid2;";

/* Select maintenance. -------------------------------------------------------*/
const SqliteQuery smd_stmt =  // select maintenance due
  "select t.tid, t.trucktype, t.capacity, y.wastetype "
  "from trucks t join trucktypes y on y.trucktype = t.trucktype "
  "where"
  "  t.tid in ("
  "    select tid from maintenance"
  "    group by tid"
  "    having max(mdate) < ?1 - ?2)"   // param1: Day; param2: interval
  "  and t.tid not in ("
  "    select tid from maintenance"
  "    where mdate >= ?1"
  "      and mdate <= ?1 + ?3) "       // param3: lookahead
  "order by t.tid;";

const SqliteQuery smo_stmt =  // select maintenance on day
  "select tid, eid, mdate from maintenance "
  "where"
  "  mdate = ? "  // param1: Day
  "order by tid;";

const SqliteQuery sam_stmt =  // select all maintenance
  "select tid, eid, mdate from maintenance "
  "order by mdate, tid;";

/* Insert. -------------------------------------------------------------------*/
const SqliteQuery itr_stmt =  // insert trip
  "insert into trips values(?, ?, ?, ?, ?, ?, ?);";

const SqliteQuery ima_stmt =  // insert maintenance
  "insert into maintenance values(?, ?, ?);";

const SqliteQuery ite_stmt =  // insert technician
  "insert into technicians values(?, ?);";

/* Update trips. -------------------------------------------------------------*/
const SqliteQuery ufa_stmt =  // update trip facility
  "update trips set fid = ? "  // param1: new FacilityId
  "where"
  "  fid = ?"                  // param2: old FacilityId
  "  and ttime >= ?"           // param3: day begin
  "  and ttime < ?;";          // param4: next day begin

}  // namespace sql
}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_DBSQL_H_

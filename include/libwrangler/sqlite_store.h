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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_SQLITE_STORE_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_SQLITE_STORE_H_

#include <string>

#include <sqlite3.h>

#include "classes.h"
#include "message.h"
#include "options.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* Store backed by one SQLite connection. The connection is opened by the
 * constructor and closed by the destructor; every statement in dbsql.h is
 * prepared once and reused. Not thread-safe: callers serialize access. */
class SqliteStore : public Store {
 public:
  SqliteStore();
  SqliteStore(const Options &);
  ~SqliteStore();

  SqliteStore(const SqliteStore &) = delete;
  SqliteStore & operator=(const SqliteStore &) = delete;

  sqlite3 * db() { return db_; }

  void execute(const std::string &);  // run an SQL script
  void load(const Filepath &);        // run an SQL script from a file

  /* Store */
  void begin();
  void commit();
  void rollback();

  bool get_route(const RouteId &, Route &);
  bool get_truck(const TruckId &, Truck &);
  bool get_truck_type(const TruckTypeCode &, TruckType &);
  bool get_facility(const FacilityId &, Facility &);

  vec_t<Route>    routes_by_waste_type(const WasteType &);
  vec_t<Facility> facilities_by_waste_type(const WasteType &);
  vec_t<Truck>    trucks_by_waste_type(const WasteType &);
  vec_t<Driver>   drivers();
  vec_t<Employee> employees_by_name(const std::string &);
  bool            is_driver(const EmployeeId &);
  bool            is_technician(const EmployeeId &, const TruckTypeCode &);
  vec_t<EmployeeId> technicians_for(const TruckTypeCode &);

  vec_t<Trip> trips_between(const Stamp &, const Stamp &);
  vec_t<Trip> trips_of_route_on(const RouteId &, const Day &);
  vec_t<Trip> trips_of_truck_on(const TruckId &, const Day &);
  vec_t<Trip> trips_to_facility_on(const FacilityId &, const Day &);
  vec_t<Trip> all_trips();
  vec_t<DriverPair> driver_pairs();
  void insert_trip(const Trip &);
  int  update_trip_facility(const FacilityId &, const Day &, const FacilityId &);

  vec_t<Truck> maintenance_due(const Day &, const int &, const int &);
  vec_t<Maintenance> maintenance_on(const Day &);
  vec_t<Maintenance> all_maintenance();
  void insert_maintenance(const Maintenance &);

  void insert_technician(const EmployeeId &, const TruckTypeCode &);

 private:
  Message print;

  sqlite3* db_;
  Speed speed_;                   // for trip end times
  Filepath database_file_;        // snapshot on close

  /* SQL statements */
  sqlite3_stmt* sro_stmt;         // select one route
  sqlite3_stmt* sot_stmt;         // select one truck
  sqlite3_stmt* sty_stmt;         // select one truck type
  sqlite3_stmt* sof_stmt;         // select one facility
  sqlite3_stmt* srw_stmt;         // routes by waste type
  sqlite3_stmt* sfw_stmt;         // facilities by waste type
  sqlite3_stmt* stw_stmt;         // trucks by waste type
  sqlite3_stmt* sdr_stmt;         // drivers
  sqlite3_stmt* sen_stmt;         // employees by name
  sqlite3_stmt* sid_stmt;         // is-driver
  sqlite3_stmt* sit_stmt;         // is-technician
  sqlite3_stmt* stf_stmt;         // technicians for type
  sqlite3_stmt* stb_stmt;         // trips between
  sqlite3_stmt* srd_stmt;         // trips of route on day
  sqlite3_stmt* skd_stmt;         // trips of truck on day
  sqlite3_stmt* sfd_stmt;         // trips to facility on day
  sqlite3_stmt* sat_stmt;         // all trips
  sqlite3_stmt* sdp_stmt;         // driver pairs
  sqlite3_stmt* smd_stmt;         // maintenance due
  sqlite3_stmt* smo_stmt;         // maintenance on day
  sqlite3_stmt* sam_stmt;         // all maintenance
  sqlite3_stmt* itr_stmt;         // insert trip
  sqlite3_stmt* ima_stmt;         // insert maintenance
  sqlite3_stmt* ite_stmt;         // insert technician
  sqlite3_stmt* ufa_stmt;         // update trip facility

  void construct(const Options &);
  void prepare();
  void finalize();
  void save();

  void fail(const std::string &);                // throw StorageError
  void exec(sqlite3_stmt *, const std::string &);  // step to SQLITE_DONE
  Trip read_trip(sqlite3_stmt *);
  Truck read_truck(sqlite3_stmt *);
  Maintenance read_maintenance(sqlite3_stmt *);
  vec_t<Trip> select_trips(sqlite3_stmt *);
  vec_t<Trip> select_trips_on(sqlite3_stmt *, const int &, const Day &);
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_SQLITE_STORE_H_

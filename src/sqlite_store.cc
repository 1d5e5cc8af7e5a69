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
#include <fstream>
#include <sstream>
#include <string>

#include <sqlite3.h>

#include "libwrangler/classes.h"
#include "libwrangler/dbsql.h"
#include "libwrangler/debug.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/sqlite_store.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"

namespace wrangler {

namespace {

std::string column_string(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text == NULL ? "" : reinterpret_cast<const char*>(text);
}

void reset(sqlite3_stmt* stmt) {
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
}

void bind_string(sqlite3_stmt* stmt, int col, const std::string& s) {
  sqlite3_bind_text(stmt, col, s.c_str(), -1, SQLITE_TRANSIENT);
}

}  // namespace

/* SqliteStore constructor */
SqliteStore::SqliteStore() : print("store") { Options _; this->construct(_); }
SqliteStore::SqliteStore(const Options& opt) : print("store") {
  this->construct(opt);
}

void SqliteStore::construct(const Options& opt) {
  db_ = nullptr;
  speed_ = opt.truck_speed;
  database_file_ = opt.path_to_save;
  sro_stmt = sot_stmt = sty_stmt = sof_stmt = srw_stmt = sfw_stmt = nullptr;
  stw_stmt = sdr_stmt = sen_stmt = sid_stmt = sit_stmt = stf_stmt = nullptr;
  stb_stmt = srd_stmt = skd_stmt = sfd_stmt = sat_stmt = sdp_stmt = nullptr;
  smd_stmt = smo_stmt = sam_stmt = nullptr;
  itr_stmt = ima_stmt = ite_stmt = ufa_stmt = nullptr;

  print << "Opening database " << opt.path_to_database << std::endl;
  if (sqlite3_open(opt.path_to_database.c_str(), &db_) != SQLITE_OK) {
    print(MessageType::Error) << "Failed (open db). Reason:\n";
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(reason);
  }

  try {
    /* Enable foreign keys */
    if (sqlite3_db_config(db_, SQLITE_DBCONFIG_ENABLE_FKEY, 1, NULL)
        != SQLITE_OK)
      fail("enable foreign keys");

    if (opt.create_tables) {
      print << "\tCreating Wrangler tables..." << std::endl;
      execute(sql::create_wrangler_tables);
    }
    prepare();
    if (!opt.path_to_data.empty()) {
      print << "\tLoading " << opt.path_to_data << "..." << std::endl;
      load(opt.path_to_data);
    }
  } catch (const StorageError& e) {
    print(MessageType::Error) << "Failed (initialize db). Reason: "
                              << e.what() << std::endl;
    finalize();
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  print(MessageType::Success) << "Database ready" << std::endl;
}

/* Destructor:
 * Finalize every stmt, save a snapshot if asked to, and close the db */
SqliteStore::~SqliteStore() {
  finalize();
  save();
  sqlite3_close(db_);
  print << "Database closed." << std::endl;
}

void SqliteStore::prepare() {
  prepare_stmt(db_, sql::sro_stmt, &sro_stmt);
  prepare_stmt(db_, sql::sot_stmt, &sot_stmt);
  prepare_stmt(db_, sql::sty_stmt, &sty_stmt);
  prepare_stmt(db_, sql::sof_stmt, &sof_stmt);
  prepare_stmt(db_, sql::srw_stmt, &srw_stmt);
  prepare_stmt(db_, sql::sfw_stmt, &sfw_stmt);
  prepare_stmt(db_, sql::stw_stmt, &stw_stmt);
  prepare_stmt(db_, sql::sdr_stmt, &sdr_stmt);
  prepare_stmt(db_, sql::sen_stmt, &sen_stmt);
  prepare_stmt(db_, sql::sid_stmt, &sid_stmt);
  prepare_stmt(db_, sql::sit_stmt, &sit_stmt);
  prepare_stmt(db_, sql::stf_stmt, &stf_stmt);
  prepare_stmt(db_, sql::stb_stmt, &stb_stmt);
  prepare_stmt(db_, sql::srd_stmt, &srd_stmt);
  prepare_stmt(db_, sql::skd_stmt, &skd_stmt);
  prepare_stmt(db_, sql::sfd_stmt, &sfd_stmt);
  prepare_stmt(db_, sql::sat_stmt, &sat_stmt);
  prepare_stmt(db_, sql::sdp_stmt, &sdp_stmt);
  prepare_stmt(db_, sql::smd_stmt, &smd_stmt);
  prepare_stmt(db_, sql::smo_stmt, &smo_stmt);
  prepare_stmt(db_, sql::sam_stmt, &sam_stmt);
  prepare_stmt(db_, sql::itr_stmt, &itr_stmt);
  prepare_stmt(db_, sql::ima_stmt, &ima_stmt);
  prepare_stmt(db_, sql::ite_stmt, &ite_stmt);
  prepare_stmt(db_, sql::ufa_stmt, &ufa_stmt);
}

void SqliteStore::finalize() {
  sqlite3_finalize(sro_stmt);
  sqlite3_finalize(sot_stmt);
  sqlite3_finalize(sty_stmt);
  sqlite3_finalize(sof_stmt);
  sqlite3_finalize(srw_stmt);
  sqlite3_finalize(sfw_stmt);
  sqlite3_finalize(stw_stmt);
  sqlite3_finalize(sdr_stmt);
  sqlite3_finalize(sen_stmt);
  sqlite3_finalize(sid_stmt);
  sqlite3_finalize(sit_stmt);
  sqlite3_finalize(stf_stmt);
  sqlite3_finalize(stb_stmt);
  sqlite3_finalize(srd_stmt);
  sqlite3_finalize(skd_stmt);
  sqlite3_finalize(sfd_stmt);
  sqlite3_finalize(sat_stmt);
  sqlite3_finalize(sdp_stmt);
  sqlite3_finalize(smd_stmt);
  sqlite3_finalize(smo_stmt);
  sqlite3_finalize(sam_stmt);
  sqlite3_finalize(itr_stmt);
  sqlite3_finalize(ima_stmt);
  sqlite3_finalize(ite_stmt);
  sqlite3_finalize(ufa_stmt);
}

// NOTE: This only saves a snapshot of the final state
void SqliteStore::save() {
  if (database_file_.empty() || db_ == nullptr) return;
  sqlite3* p_file;
  if (sqlite3_open(database_file_.c_str(), &p_file) == SQLITE_OK) {
    sqlite3_backup* p_backup = sqlite3_backup_init(p_file, "main", db_, "main");
    if (p_backup) {
      sqlite3_backup_step(p_backup, -1);
      sqlite3_backup_finish(p_backup);
    }
    if (sqlite3_errcode(p_file) != SQLITE_OK)
      print(MessageType::Error) << "Failed (save snapshot). Reason: "
                                << sqlite3_errmsg(p_file) << std::endl;
    else
      print << "Saved snapshot to " << database_file_ << std::endl;
  }
  sqlite3_close(p_file);
}

void SqliteStore::fail(const std::string& what) {
  throw StorageError(what + ": " + sqlite3_errmsg(db_));
}

void SqliteStore::exec(sqlite3_stmt* stmt, const std::string& what) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    std::string reason = sqlite3_errmsg(db_);
    reset(stmt);
    throw StorageError(what + ": " + reason);
  }
  reset(stmt);
}

void SqliteStore::execute(const std::string& script) {
  SqliteErrorMessage err = NULL;
  if (sqlite3_exec(db_, script.c_str(), NULL, NULL, &err) != SQLITE_OK) {
    std::string reason = (err != NULL ? err : sqlite3_errmsg(db_));
    sqlite3_free(err);
    throw StorageError("execute script: " + reason);
  }
}

void SqliteStore::load(const Filepath& path) {
  std::ifstream ifs(path);
  if (!ifs.good()) throw StorageError("data path not found: " + path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  execute(ss.str());
}


/* Transactions --------------------------------------------------------------*/
void SqliteStore::begin() {
  if (sqlite3_exec(db_, "BEGIN", NULL, NULL, NULL) != SQLITE_OK)
    fail("begin");
}

void SqliteStore::commit() {
  if (sqlite3_exec(db_, "COMMIT", NULL, NULL, NULL) != SQLITE_OK)
    fail("commit");
}

void SqliteStore::rollback() {
  if (sqlite3_get_autocommit(db_) != 0) return;  // nothing open
  if (sqlite3_exec(db_, "ROLLBACK", NULL, NULL, NULL) != SQLITE_OK)
    fail("rollback");
}


/* Row readers ---------------------------------------------------------------*/
Trip SqliteStore::read_trip(sqlite3_stmt* stmt) {
  const Stamp start = sqlite3_column_int64(stmt, 2);
  const Length length = sqlite3_column_double(stmt, 7);
  const Volume volume = sqlite3_column_type(stmt, 3) == SQLITE_NULL
                      ? -1 : sqlite3_column_double(stmt, 3);
  return Trip(sqlite3_column_int(stmt, 0),      // rid
              sqlite3_column_int(stmt, 1),      // tid
              start,
              start + trip_duration(length, speed_),
              sqlite3_column_int(stmt, 4),      // eid1
              sqlite3_column_int(stmt, 5),      // eid2
              sqlite3_column_int(stmt, 6),      // fid
              volume);
}

Truck SqliteStore::read_truck(sqlite3_stmt* stmt) {
  return Truck(sqlite3_column_int(stmt, 0),
               column_string(stmt, 1),
               sqlite3_column_double(stmt, 2),
               column_string(stmt, 3));
}

Maintenance SqliteStore::read_maintenance(sqlite3_stmt* stmt) {
  return Maintenance(sqlite3_column_int(stmt, 0),
                     sqlite3_column_int(stmt, 1),
                     sqlite3_column_int(stmt, 2));
}

vec_t<Trip> SqliteStore::select_trips(sqlite3_stmt* stmt) {
  vec_t<Trip> trips;
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    trips.push_back(read_trip(stmt));
  reset(stmt);
  if (rc != SQLITE_DONE) fail("select trips");
  return trips;
}

vec_t<Trip> SqliteStore::select_trips_on(
    sqlite3_stmt* stmt, const int& key, const Day& day) {
  reset(stmt);
  sqlite3_bind_int(stmt, 1, key);
  sqlite3_bind_int64(stmt, 2, day_begin(day));
  sqlite3_bind_int64(stmt, 3, day_begin(day + 1));
  return select_trips(stmt);
}


/* Reference data ------------------------------------------------------------*/
bool SqliteStore::get_route(const RouteId& rid, Route& out) {
  reset(sro_stmt);
  sqlite3_bind_int(sro_stmt, 1, rid);
  SqliteReturnCode rc = sqlite3_step(sro_stmt);
  if (rc == SQLITE_ROW)
    out = Route(sqlite3_column_int(sro_stmt, 0),
                column_string(sro_stmt, 1),
                sqlite3_column_double(sro_stmt, 2));
  reset(sro_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select route");
  return rc == SQLITE_ROW;
}

bool SqliteStore::get_truck(const TruckId& tid, Truck& out) {
  reset(sot_stmt);
  sqlite3_bind_int(sot_stmt, 1, tid);
  SqliteReturnCode rc = sqlite3_step(sot_stmt);
  if (rc == SQLITE_ROW) out = read_truck(sot_stmt);
  reset(sot_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select truck");
  return rc == SQLITE_ROW;
}

bool SqliteStore::get_truck_type(const TruckTypeCode& code, TruckType& out) {
  reset(sty_stmt);
  bind_string(sty_stmt, 1, code);
  SqliteReturnCode rc = sqlite3_step(sty_stmt);
  if (rc == SQLITE_ROW)
    out = TruckType(column_string(sty_stmt, 0), column_string(sty_stmt, 1));
  reset(sty_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select truck type");
  return rc == SQLITE_ROW;
}

bool SqliteStore::get_facility(const FacilityId& fid, Facility& out) {
  reset(sof_stmt);
  sqlite3_bind_int(sof_stmt, 1, fid);
  SqliteReturnCode rc = sqlite3_step(sof_stmt);
  if (rc == SQLITE_ROW)
    out = Facility(sqlite3_column_int(sof_stmt, 0), column_string(sof_stmt, 1));
  reset(sof_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select facility");
  return rc == SQLITE_ROW;
}

vec_t<Route> SqliteStore::routes_by_waste_type(const WasteType& waste) {
  vec_t<Route> routes;
  reset(srw_stmt);
  bind_string(srw_stmt, 1, waste);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(srw_stmt)) == SQLITE_ROW)
    routes.push_back(Route(sqlite3_column_int(srw_stmt, 0),
                           column_string(srw_stmt, 1),
                           sqlite3_column_double(srw_stmt, 2)));
  reset(srw_stmt);
  if (rc != SQLITE_DONE) fail("select routes");
  return routes;
}

vec_t<Facility> SqliteStore::facilities_by_waste_type(const WasteType& waste) {
  vec_t<Facility> facilities;
  reset(sfw_stmt);
  bind_string(sfw_stmt, 1, waste);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(sfw_stmt)) == SQLITE_ROW)
    facilities.push_back(Facility(sqlite3_column_int(sfw_stmt, 0),
                                  column_string(sfw_stmt, 1)));
  reset(sfw_stmt);
  if (rc != SQLITE_DONE) fail("select facilities");
  return facilities;
}

vec_t<Truck> SqliteStore::trucks_by_waste_type(const WasteType& waste) {
  vec_t<Truck> trucks;
  reset(stw_stmt);
  bind_string(stw_stmt, 1, waste);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(stw_stmt)) == SQLITE_ROW)
    trucks.push_back(read_truck(stw_stmt));
  reset(stw_stmt);
  if (rc != SQLITE_DONE) fail("select trucks");
  return trucks;
}

/* One row per (driver, truck type), ordered by hire date then id, so rows of
 * the same driver are adjacent. Fold them into one Driver each. */
vec_t<Driver> SqliteStore::drivers() {
  vec_t<Driver> drivers;
  reset(sdr_stmt);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(sdr_stmt)) == SQLITE_ROW) {
    const EmployeeId eid = sqlite3_column_int(sdr_stmt, 0);
    const TruckTypeCode type = column_string(sdr_stmt, 3);
    if (!drivers.empty() && drivers.back().id() == eid) {
      drivers.back().add_qualification(type);
    } else {
      drivers.push_back(Driver(eid, column_string(sdr_stmt, 1),
                               sqlite3_column_int(sdr_stmt, 2), {type}));
    }
  }
  reset(sdr_stmt);
  if (rc != SQLITE_DONE) fail("select drivers");
  return drivers;
}

vec_t<Employee> SqliteStore::employees_by_name(const std::string& name) {
  vec_t<Employee> employees;
  reset(sen_stmt);
  bind_string(sen_stmt, 1, name);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(sen_stmt)) == SQLITE_ROW)
    employees.push_back(Employee(sqlite3_column_int(sen_stmt, 0),
                                 column_string(sen_stmt, 1),
                                 sqlite3_column_int(sen_stmt, 2)));
  reset(sen_stmt);
  if (rc != SQLITE_DONE) fail("select employees");
  return employees;
}

bool SqliteStore::is_driver(const EmployeeId& eid) {
  reset(sid_stmt);
  sqlite3_bind_int(sid_stmt, 1, eid);
  SqliteReturnCode rc = sqlite3_step(sid_stmt);
  reset(sid_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select is-driver");
  return rc == SQLITE_ROW;
}

bool SqliteStore::is_technician(const EmployeeId& eid,
                                const TruckTypeCode& type) {
  reset(sit_stmt);
  sqlite3_bind_int(sit_stmt, 1, eid);
  bind_string(sit_stmt, 2, type);
  SqliteReturnCode rc = sqlite3_step(sit_stmt);
  reset(sit_stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("select is-technician");
  return rc == SQLITE_ROW;
}

vec_t<EmployeeId> SqliteStore::technicians_for(const TruckTypeCode& type) {
  vec_t<EmployeeId> technicians;
  reset(stf_stmt);
  bind_string(stf_stmt, 1, type);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(stf_stmt)) == SQLITE_ROW)
    technicians.push_back(sqlite3_column_int(stf_stmt, 0));
  reset(stf_stmt);
  if (rc != SQLITE_DONE) fail("select technicians");
  return technicians;
}


/* Trips ---------------------------------------------------------------------*/
vec_t<Trip> SqliteStore::trips_between(const Stamp& from, const Stamp& to) {
  reset(stb_stmt);
  sqlite3_bind_int64(stb_stmt, 1, from);
  sqlite3_bind_int64(stb_stmt, 2, to);
  return select_trips(stb_stmt);
}

vec_t<Trip> SqliteStore::trips_of_route_on(const RouteId& rid, const Day& day) {
  return select_trips_on(srd_stmt, rid, day);
}

vec_t<Trip> SqliteStore::trips_of_truck_on(const TruckId& tid, const Day& day) {
  return select_trips_on(skd_stmt, tid, day);
}

vec_t<Trip> SqliteStore::trips_to_facility_on(const FacilityId& fid,
                                              const Day& day) {
  return select_trips_on(sfd_stmt, fid, day);
}

vec_t<Trip> SqliteStore::all_trips() {
  reset(sat_stmt);
  return select_trips(sat_stmt);
}

vec_t<DriverPair> SqliteStore::driver_pairs() {
  vec_t<DriverPair> pairs;
  reset(sdp_stmt);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(sdp_stmt)) == SQLITE_ROW)
    pairs.push_back(std::make_pair(sqlite3_column_int(sdp_stmt, 0),
                                   sqlite3_column_int(sdp_stmt, 1)));
  reset(sdp_stmt);
  if (rc != SQLITE_DONE) fail("select driver pairs");
  return pairs;
}

void SqliteStore::insert_trip(const Trip& trip) {
  reset(itr_stmt);
  sqlite3_bind_int(itr_stmt, 1, trip.route());
  sqlite3_bind_int(itr_stmt, 2, trip.truck());
  sqlite3_bind_int64(itr_stmt, 3, trip.start());
  if (trip.volume() < 0)
    sqlite3_bind_null(itr_stmt, 4);
  else
    sqlite3_bind_double(itr_stmt, 4, trip.volume());
  sqlite3_bind_int(itr_stmt, 5, trip.driver_high());
  sqlite3_bind_int(itr_stmt, 6, trip.driver_low());
  sqlite3_bind_int(itr_stmt, 7, trip.facility());
  DEBUG(2, { print << "insert " << trip << std::endl; });
  exec(itr_stmt, "insert trip");
}

int SqliteStore::update_trip_facility(
    const FacilityId& from, const Day& day, const FacilityId& to) {
  reset(ufa_stmt);
  sqlite3_bind_int(ufa_stmt, 1, to);
  sqlite3_bind_int(ufa_stmt, 2, from);
  sqlite3_bind_int64(ufa_stmt, 3, day_begin(day));
  sqlite3_bind_int64(ufa_stmt, 4, day_begin(day + 1));
  exec(ufa_stmt, "update trip facility");
  return sqlite3_changes(db_);
}


/* Maintenance ---------------------------------------------------------------*/
vec_t<Truck> SqliteStore::maintenance_due(
    const Day& day, const int& interval, const int& lookahead) {
  vec_t<Truck> trucks;
  reset(smd_stmt);
  sqlite3_bind_int(smd_stmt, 1, day);
  sqlite3_bind_int(smd_stmt, 2, interval);
  sqlite3_bind_int(smd_stmt, 3, lookahead);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(smd_stmt)) == SQLITE_ROW)
    trucks.push_back(read_truck(smd_stmt));
  reset(smd_stmt);
  if (rc != SQLITE_DONE) fail("select maintenance due");
  return trucks;
}

vec_t<Maintenance> SqliteStore::maintenance_on(const Day& day) {
  vec_t<Maintenance> records;
  reset(smo_stmt);
  sqlite3_bind_int(smo_stmt, 1, day);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(smo_stmt)) == SQLITE_ROW)
    records.push_back(read_maintenance(smo_stmt));
  reset(smo_stmt);
  if (rc != SQLITE_DONE) fail("select maintenance");
  return records;
}

vec_t<Maintenance> SqliteStore::all_maintenance() {
  vec_t<Maintenance> records;
  reset(sam_stmt);
  SqliteReturnCode rc;
  while ((rc = sqlite3_step(sam_stmt)) == SQLITE_ROW)
    records.push_back(read_maintenance(sam_stmt));
  reset(sam_stmt);
  if (rc != SQLITE_DONE) fail("select all maintenance");
  return records;
}

void SqliteStore::insert_maintenance(const Maintenance& m) {
  reset(ima_stmt);
  sqlite3_bind_int(ima_stmt, 1, m.truck());
  sqlite3_bind_int(ima_stmt, 2, m.technician());
  sqlite3_bind_int(ima_stmt, 3, m.date());
  DEBUG(2, { print << "insert " << m << std::endl; });
  exec(ima_stmt, "insert maintenance");
}


/* Technicians ---------------------------------------------------------------*/
void SqliteStore::insert_technician(const EmployeeId& eid,
                                    const TruckTypeCode& type) {
  reset(ite_stmt);
  sqlite3_bind_int(ite_stmt, 1, eid);
  bind_string(ite_stmt, 2, type);
  exec(ite_stmt, "insert technician");
}

}  // namespace wrangler

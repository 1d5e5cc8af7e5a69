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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_STORE_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_STORE_H_

#include <stdexcept>
#include <string>

#include "classes.h"
#include "message.h"
#include "types.h"

/* -------
 * SUMMARY
 * -------
 * Store is the storage collaborator used by every scheduling component. It
 * owns the reference data (routes, trucks, employees, facilities) and the
 * two tables the components write (trips, maintenance), plus technician
 * qualifications written by the importer.
 *
 * Every list is returned in the deterministic order noted next to it; the
 * components rely on that order for tie-breaking and never re-sort.
 *
 * Implementations report failures by throwing StorageError. Components catch
 * it at their boundary; it never reaches the public Wrangler surface.
 */

namespace wrangler {

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class Store {
 public:
  virtual ~Store() {}

  /* Transactions
   * begin() opens a transaction that commit() makes durable and rollback()
   * discards. Transactions do not nest. */
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  /* Reference data (read-only) */
  virtual bool get_route(const RouteId &, Route &) = 0;
  virtual bool get_truck(const TruckId &, Truck &) = 0;       // with waste type
  virtual bool get_truck_type(const TruckTypeCode &, TruckType &) = 0;
  virtual bool get_facility(const FacilityId &, Facility &) = 0;

  virtual vec_t<Route>    routes_by_waste_type(const WasteType &) = 0;     // id
  virtual vec_t<Facility> facilities_by_waste_type(const WasteType &) = 0; // id
  virtual vec_t<Truck>    trucks_by_waste_type(const WasteType &) = 0;
                                                 // capacity desc, id asc
  virtual vec_t<Driver>   drivers() = 0;         // hire date asc, id asc
  virtual vec_t<Employee> employees_by_name(const std::string &) = 0;  // id
  virtual bool            is_driver(const EmployeeId &) = 0;
  virtual bool            is_technician(const EmployeeId &,
                                        const TruckTypeCode &) = 0;
  virtual vec_t<EmployeeId> technicians_for(const TruckTypeCode &) = 0; // id

  /* Trips
   * Trip end times are start + route length / speed, computed by the store
   * with the speed it was given. */
  virtual vec_t<Trip> trips_between(const Stamp &, const Stamp &) = 0;
                                     // start in [from, to); start, route
  virtual vec_t<Trip> trips_of_route_on(const RouteId &, const Day &) = 0;
  virtual vec_t<Trip> trips_of_truck_on(const TruckId &, const Day &) = 0;
  virtual vec_t<Trip> trips_to_facility_on(const FacilityId &, const Day &) = 0;
  virtual vec_t<Trip> all_trips() = 0;                      // start, route
  virtual vec_t<DriverPair> driver_pairs() = 0;             // distinct
  virtual void insert_trip(const Trip &) = 0;
  virtual int  update_trip_facility(                        // rows changed
    const FacilityId &,   // current facility
    const Day &,          // trips starting on this day
    const FacilityId &    // new facility
  ) = 0;

  /* Maintenance */
  virtual vec_t<Truck> maintenance_due(
    const Day &,          // reference date
    const int &,          // interval (days)
    const int &           // lookahead (days)
  ) = 0;                                                    // truck id
  virtual vec_t<Maintenance> maintenance_on(const Day &) = 0;   // truck id
  virtual vec_t<Maintenance> all_maintenance() = 0;         // date, truck id
  virtual void insert_maintenance(const Maintenance &) = 0;

  /* Technicians */
  virtual void insert_technician(const EmployeeId &, const TruckTypeCode &) = 0;
};

/* Roll back the open transaction, if any. A failing rollback is reported on
 * the given stream instead of thrown; the caller is already failing. */
void rollback_quietly(Store &, Message &);

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_STORE_H_

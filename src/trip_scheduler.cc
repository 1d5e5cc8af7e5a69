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
#include "libwrangler/availability.h"
#include "libwrangler/classes.h"
#include "libwrangler/debug.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/trip_scheduler.h"
#include "libwrangler/types.h"

namespace wrangler {

TripScheduler::TripScheduler(Store& store, AvailabilityResolver& avail,
                             const Options& opt)
    : print("trip_scheduler"), store_(store), avail_(avail) {
  speed_ = opt.truck_speed;
  shift_begin_ = opt.shift_begin_hour;
  shift_end_ = opt.shift_end_hour;
}

Result TripScheduler::reject(const ErrorKind& e, const RouteId& rid) {
  print(MessageType::Warning)
    << "route " << rid << " rejected (" << to_string(e) << ")" << std::endl;
  return Result(e);
}

Result TripScheduler::plan(const RouteId& rid, const Stamp& start, Trip& out) {
  Route route;
  if (!store_.get_route(rid, route))
    return reject(ErrorKind::InvalidRoute, rid);

  const Day day = day_of(start);
  const Stamp end = start + trip_duration(route.length(), speed_);
  const Stamp shift_begin = make_stamp(day, shift_begin_, 0);
  const Stamp shift_end = make_stamp(day, shift_end_, 0);
  if (start < shift_begin || start > shift_end || end > shift_end)
    return reject(ErrorKind::WorkingHoursViolation, rid);

  if (!store_.trips_of_route_on(rid, day).empty())
    return reject(ErrorKind::DuplicateRouteSameDay, rid);

  vec_t<Facility> facilities = store_.facilities_by_waste_type(route.waste_type());
  if (facilities.empty())
    return reject(ErrorKind::NoFacility, rid);

  const Window window = {start, end};
  vec_t<Truck> trucks = avail_.available_trucks(window, route.waste_type());
  if (trucks.empty())
    return reject(ErrorKind::NoAvailableTruck, rid);
  const Truck& truck = trucks.front();

  Driver driver1, driver2;
  ErrorKind paired = pick_driver_pair(avail_.available_drivers(window),
                                      truck.type(), driver1, driver2);
  if (paired != ErrorKind::Success)
    return reject(paired, rid);

  out = Trip(rid, truck.id(), start, end, driver1.id(), driver2.id(),
             facilities.front().id());
  return Result(ErrorKind::Success, 1);
}

Result TripScheduler::schedule(const RouteId& rid, const Stamp& start) {
  try {
    store_.begin();
    Trip trip;
    Result res = plan(rid, start, trip);
    if (!res.ok()) {
      store_.rollback();
      return res;
    }
    store_.insert_trip(trip);
    store_.commit();
    print(MessageType::Success) << "scheduled " << trip << std::endl;
    return res;
  } catch (const StorageError& e) {
    print(MessageType::Error)
      << "route " << rid << " failed (" << to_string(ErrorKind::StorageFailure)
      << "): " << e.what() << std::endl;
    rollback_quietly(store_, print);
    return Result(ErrorKind::StorageFailure);
  }
}

}  // namespace wrangler

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
#include "libwrangler/batch_scheduler.h"
#include "libwrangler/classes.h"
#include "libwrangler/debug.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"

namespace wrangler {

BatchScheduler::BatchScheduler(Store& store, AvailabilityResolver& avail,
                               const Options& opt)
    : print("batch_scheduler"), store_(store), avail_(avail) {
  speed_ = opt.truck_speed;
  gap_ = opt.buffer_minutes * SecondsPerMinute;
  shift_begin_ = opt.shift_begin_hour;
  shift_end_ = opt.shift_end_hour;
}

Result BatchScheduler::reject(const ErrorKind& e, const TruckId& tid,
                              const Day& day) {
  print(MessageType::Warning)
    << "truck " << tid << " on " << to_date_string(day) << " rejected ("
    << to_string(e) << ")" << std::endl;
  return Result(e);
}

vec_t<Route> BatchScheduler::unscheduled_routes(const WasteType& waste,
                                                const Day& day) {
  vec_t<Route> routes;
  for (const Route& route : store_.routes_by_waste_type(waste))
    if (store_.trips_of_route_on(route.id(), day).empty())
      routes.push_back(route);
  return routes;
}

Result BatchScheduler::schedule(const TruckId& tid, const Day& day) {
  int count = 0;
  try {
    Truck truck;
    if (!store_.get_truck(tid, truck))
      return reject(ErrorKind::InvalidTruck, tid, day);

    // The truck starts the batch at shift begin, so it must be idle all day
    if (!avail_.truck_free_on(tid, day))
      return reject(ErrorKind::NoAvailableTruck, tid, day);

    vec_t<Route> routes = unscheduled_routes(truck.waste_type(), day);
    if (routes.empty())
      return reject(ErrorKind::NothingToDo, tid, day);

    Driver driver1, driver2;
    ErrorKind paired = pick_driver_pair(avail_.full_day_free_drivers(day),
                                        truck.type(), driver1, driver2);
    if (paired != ErrorKind::Success)
      return reject(paired, tid, day);

    vec_t<Facility> facilities =
        store_.facilities_by_waste_type(truck.waste_type());
    if (facilities.empty())
      return reject(ErrorKind::NoFacility, tid, day);
    const FacilityId fid = facilities.front().id();

    const Stamp shift_end = make_stamp(day, shift_end_, 0);
    Stamp start = make_stamp(day, shift_begin_, 0);
    for (const Route& route : routes) {
      const Stamp end = start + trip_duration(route.length(), speed_);
      if (end >= shift_end) {
        DEBUG(1, { print << "route " << route.id() << " ends "
                         << to_stamp_string(end) << "; stop" << std::endl; });
        break;
      }
      Trip trip(route.id(), tid, start, end, driver1.id(), driver2.id(), fid);
      store_.begin();
      store_.insert_trip(trip);
      store_.commit();
      count++;
      print << "scheduled " << trip << std::endl;
      start = end + gap_;
    }
  } catch (const StorageError& e) {
    print(MessageType::Error)
      << "truck " << tid << " failed after " << count << " trips ("
      << to_string(ErrorKind::StorageFailure) << "): " << e.what()
      << std::endl;
    rollback_quietly(store_, print);
    return Result(ErrorKind::StorageFailure, count);
  }

  if (count == 0)
    return reject(ErrorKind::WorkingHoursViolation, tid, day);
  print(MessageType::Success)
    << "truck " << tid << ": " << count << " trips on "
    << to_date_string(day) << std::endl;
  return Result(ErrorKind::Success, count);
}

}  // namespace wrangler

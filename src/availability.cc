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
#include <unordered_set>

#include "libwrangler/availability.h"
#include "libwrangler/classes.h"
#include "libwrangler/debug.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"

namespace wrangler {

AvailabilityResolver::AvailabilityResolver(Store& store, const Options& opt)
    : print("availability"), store_(store) {
  buffer_ = opt.buffer_minutes * SecondsPerMinute;
}

/* Every trip ends on the day it starts, so a trip starting before the
 * previous midnight cannot reach into the window. */
vec_t<Trip> AvailabilityResolver::trips_near(const Window& w) {
  return store_.trips_between(day_begin(day_of(w.begin) - 1),
                              w.end + buffer_);
}

std::unordered_set<TruckId> AvailabilityResolver::busy_trucks(
    const Window& w) {
  std::unordered_set<TruckId> busy;
  for (const Trip& trip : trips_near(w))
    if (overlaps(buffered(trip.window(), buffer_), w))
      busy.insert(trip.truck());
  for (const Maintenance& m : store_.maintenance_on(day_of(w.begin)))
    busy.insert(m.truck());
  return busy;
}

std::unordered_set<EmployeeId> AvailabilityResolver::busy_drivers(
    const Window& w) {
  std::unordered_set<EmployeeId> busy;
  for (const Trip& trip : trips_near(w)) {
    if (overlaps(buffered(trip.window(), buffer_), w)) {
      busy.insert(trip.driver_high());
      busy.insert(trip.driver_low());
    }
  }
  return busy;
}

vec_t<Truck> AvailabilityResolver::available_trucks(const Window& w,
                                                    const WasteType& waste) {
  std::unordered_set<TruckId> busy = busy_trucks(w);
  vec_t<Truck> trucks;
  for (const Truck& truck : store_.trucks_by_waste_type(waste))
    if (busy.count(truck.id()) == 0)
      trucks.push_back(truck);
  DEBUG(1, { print << trucks.size() << " trucks free for " << w
                   << " (" << busy.size() << " busy)" << std::endl; });
  return trucks;
}

vec_t<Driver> AvailabilityResolver::available_drivers(const Window& w) {
  std::unordered_set<EmployeeId> busy = busy_drivers(w);
  vec_t<Driver> drivers;
  for (const Driver& driver : store_.drivers())
    if (busy.count(driver.id()) == 0)
      drivers.push_back(driver);
  DEBUG(1, { print << drivers.size() << " drivers free for " << w
                   << std::endl; });
  return drivers;
}

vec_t<Driver> AvailabilityResolver::full_day_free_drivers(const Day& day) {
  std::unordered_set<EmployeeId> busy;
  for (const Trip& trip : store_.trips_between(day_begin(day),
                                               day_begin(day + 1))) {
    busy.insert(trip.driver_high());
    busy.insert(trip.driver_low());
  }
  vec_t<Driver> drivers;
  for (const Driver& driver : store_.drivers())
    if (busy.count(driver.id()) == 0)
      drivers.push_back(driver);
  return drivers;
}

bool AvailabilityResolver::truck_free_on(const TruckId& tid, const Day& day) {
  if (!store_.trips_of_truck_on(tid, day).empty())
    return false;
  for (const Maintenance& m : store_.maintenance_on(day))
    if (m.truck() == tid)
      return false;
  return true;
}

}  // namespace wrangler

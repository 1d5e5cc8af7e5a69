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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_AVAILABILITY_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_AVAILABILITY_H_

#include <unordered_set>

#include "classes.h"
#include "message.h"
#include "options.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* AvailabilityResolver answers "who is free" for a time window or a whole
 * day. A trip keeps its truck and both of its drivers busy for its buffered
 * window [start - buffer, end + buffer); a maintenance record keeps its truck
 * busy for the whole calendar day.
 *
 * Lists keep the order of the store (trucks by capacity desc then id,
 * drivers by hire date then id). Throws StorageError. */
class AvailabilityResolver {
 public:
  AvailabilityResolver(Store &, const Options & = Options());

  /* Trucks carrying the waste type that are free for the window. The day of
   * window.begin is the day checked for maintenance. */
  vec_t<Truck>  available_trucks(const Window &, const WasteType &);

  /* Drivers not on any trip whose buffered window overlaps */
  vec_t<Driver> available_drivers(const Window &);

  /* Drivers without any trip on the day */
  vec_t<Driver> full_day_free_drivers(const Day &);

  /* True if the truck has neither a trip nor a maintenance on the day */
  bool          truck_free_on(const TruckId &, const Day &);

  const Dur   & buffer() const { return buffer_; }

  Message print;

 private:
  Store & store_;
  Dur buffer_;

  vec_t<Trip> trips_near(const Window &);  // trips that may overlap
  std::unordered_set<TruckId>    busy_trucks(const Window &);
  std::unordered_set<EmployeeId> busy_drivers(const Window &);
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_AVAILABILITY_H_

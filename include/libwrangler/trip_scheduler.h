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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_TRIP_SCHEDULER_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_TRIP_SCHEDULER_H_

#include "availability.h"
#include "classes.h"
#include "message.h"
#include "options.h"
#include "result.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* TripScheduler books one route at one start time. The decision runs in a
 * single transaction: either the trip is inserted and committed, or nothing
 * is written.
 *
 * Checks, in order:
 *   InvalidRoute           route unknown
 *   WorkingHoursViolation  start before shift begin, start after shift end,
 *                          or end after shift end
 *   DuplicateRouteSameDay  route already has a trip on the day of start
 *   NoFacility             no facility accepts the route's waste type
 *   NoAvailableTruck       no free truck carries the route's waste type
 *   NoAvailableDriver      no free driver pair satisfies pick_driver_pair()
 * Picks the lowest-id facility, the free truck of largest capacity (lowest
 * id on ties) and the driver pair from the free drivers in hire-date order. */
class TripScheduler {
 public:
  TripScheduler(Store &, AvailabilityResolver &, const Options & = Options());

  Result schedule(const RouteId &, const Stamp &);

  /* Build the trip without writing it */
  Result plan(const RouteId &, const Stamp &, Trip &);

  Message print;

 private:
  Store & store_;
  AvailabilityResolver & avail_;
  Speed speed_;
  int shift_begin_;       // hour
  int shift_end_;         // hour

  Result reject(const ErrorKind &, const RouteId &);
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_TRIP_SCHEDULER_H_

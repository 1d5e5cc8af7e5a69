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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_MAINTENANCE_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_MAINTENANCE_H_

#include "availability.h"
#include "classes.h"
#include "message.h"
#include "options.h"
#include "result.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* MaintenanceScheduler books the maintenance backlog of a reference date.
 *
 * The backlog is every truck whose latest maintenance is older than the
 * interval and that has nothing booked from the date through the lookahead
 * (Store::maintenance_due). Trucks that were never maintained are not in the
 * backlog.
 *
 * For each truck in id order, days are tried from the day after the date.
 * The first day on which a technician qualified for the truck's type has no
 * maintenance gets the booking, with the lowest-id free technician. In strict
 * mode a day on which the truck itself has a trip or a maintenance is
 * skipped. A truck type without any technician skips the truck.
 *
 * Each booking is committed on its own. Result::count is the number of
 * trucks booked. */
class MaintenanceScheduler {
 public:
  MaintenanceScheduler(Store &, AvailabilityResolver &,
                       const Options & = Options());

  Result schedule(const Day &);

  Message print;

 private:
  Store & store_;
  AvailabilityResolver & avail_;
  int interval_;
  int lookahead_;
  bool strict_;

  /* Find the day and the technician for one truck */
  Maintenance book(const Truck &, const vec_t<EmployeeId> &, const Day &);
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_MAINTENANCE_H_

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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_WRANGLER_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_WRANGLER_H_

#include <set>

#include "availability.h"
#include "batch_scheduler.h"
#include "classes.h"
#include "maintenance.h"
#include "message.h"
#include "options.h"
#include "reroute.h"
#include "store.h"
#include "technicians.h"
#include "trip_scheduler.h"
#include "types.h"
#include "workmates.h"

namespace wrangler {

/* Wrangler is the public surface. None of its operations throw; a rejected
 * or failed operation returns false, 0, or an empty set. Use the components
 * directly for the ErrorKind.
 * Usage:
 *     SqliteStore store(opt);
 *     Wrangler w(store, opt);
 *     w.schedule_trip(30, make_stamp(make_day(2023, 5, 4), 9, 0));
 * The store must outlive the Wrangler. Calls must not run concurrently.
 * Constructing a Wrangler sets the process-wide Message::threshold() to
 * opt.log_level; it is not restored on destruction. */
class Wrangler {
 public:
  Wrangler(Store &, const Options & = Options());

  bool schedule_trip(const RouteId &, const Stamp &);
  int  schedule_trips(const TruckId &, const Day &);
  int  update_technicians(const vec_t<Qualification> &);
  int  update_technicians(const Filepath &);
  std::set<EmployeeId> workmate_sphere(const EmployeeId &);
  int  schedule_maintenance(const Day &);
  int  reroute_waste(const FacilityId &, const Day &);

  /* Components */
  AvailabilityResolver & availability()  { return avail_; }
  TripScheduler        & trips()         { return trip_; }
  BatchScheduler       & batches()       { return batch_; }
  MaintenanceScheduler & maintenance()   { return maint_; }
  WasteReroute         & reroute()       { return reroute_; }
  Workmates            & workmates()     { return workmates_; }
  TechnicianImporter   & technicians()   { return techs_; }

 private:
  Message print;

  AvailabilityResolver avail_;
  TripScheduler trip_;
  BatchScheduler batch_;
  MaintenanceScheduler maint_;
  WasteReroute reroute_;
  Workmates workmates_;
  TechnicianImporter techs_;
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_WRANGLER_H_

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
#include "libwrangler/maintenance.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"

namespace wrangler {

MaintenanceScheduler::MaintenanceScheduler(Store& store,
                                           AvailabilityResolver& avail,
                                           const Options& opt)
    : print("maintenance"), store_(store), avail_(avail) {
  interval_ = opt.maintenance_interval;
  lookahead_ = opt.maintenance_lookahead;
  strict_ = opt.strict_maintenance;
}

/* Terminates: every technician has finitely many bookings, and so does the
 * truck. Technicians must be non-empty. */
Maintenance MaintenanceScheduler::book(const Truck& truck,
                                       const vec_t<EmployeeId>& technicians,
                                       const Day& date) {
  for (Day day = date + 1; ; ++day) {
    if (strict_ && !avail_.truck_free_on(truck.id(), day)) {
      DEBUG(2, { print << "truck " << truck.id() << " busy on "
                       << to_date_string(day) << std::endl; });
      continue;
    }
    std::unordered_set<EmployeeId> busy;
    for (const Maintenance& m : store_.maintenance_on(day))
      busy.insert(m.technician());
    for (const EmployeeId& eid : technicians)  // lowest id first
      if (busy.count(eid) == 0)
        return Maintenance(truck.id(), eid, day);
  }
}

Result MaintenanceScheduler::schedule(const Day& date) {
  int count = 0;
  try {
    vec_t<Truck> due = store_.maintenance_due(date, interval_, lookahead_);
    if (due.empty()) {
      print(MessageType::Warning)
        << "no maintenance due on " << to_date_string(date) << " ("
        << to_string(ErrorKind::NothingToDo) << ")" << std::endl;
      return Result(ErrorKind::NothingToDo);
    }
    for (const Truck& truck : due) {
      vec_t<EmployeeId> technicians = store_.technicians_for(truck.type());
      if (technicians.empty()) {
        print(MessageType::Warning)
          << "truck " << truck.id() << " skipped ("
          << to_string(ErrorKind::NoQualifiedTechnician) << ")" << std::endl;
        continue;
      }
      Maintenance m = book(truck, technicians, date);
      store_.begin();
      store_.insert_maintenance(m);
      store_.commit();
      count++;
      print << "scheduled " << m << std::endl;
    }
  } catch (const StorageError& e) {
    print(MessageType::Error)
      << "maintenance failed after " << count << " trucks ("
      << to_string(ErrorKind::StorageFailure) << "): " << e.what()
      << std::endl;
    rollback_quietly(store_, print);
    return Result(ErrorKind::StorageFailure, count);
  }
  print(MessageType::Success)
    << count << " trucks scheduled for maintenance" << std::endl;
  return Result(ErrorKind::Success, count);
}

}  // namespace wrangler

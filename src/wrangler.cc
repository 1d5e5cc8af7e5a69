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
#include <set>
#include <stdexcept>

#include "libwrangler/classes.h"
#include "libwrangler/file.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"
#include "libwrangler/wrangler.h"

namespace wrangler {

/* Members are constructed in declaration order; avail_ comes first */
Wrangler::Wrangler(Store& store, const Options& opt)
    : print("wrangler"),
      avail_(store, opt),
      trip_(store, avail_, opt),
      batch_(store, avail_, opt),
      maint_(store, avail_, opt),
      reroute_(store),
      workmates_(store),
      techs_(store) {
  Message::threshold() = opt.log_level;  // global
}

bool Wrangler::schedule_trip(const RouteId& rid, const Stamp& start) {
  return trip_.schedule(rid, start).ok();
}

int Wrangler::schedule_trips(const TruckId& tid, const Day& day) {
  return batch_.schedule(tid, day).count;
}

int Wrangler::update_technicians(const vec_t<Qualification>& records) {
  return techs_.import(records).count;
}

int Wrangler::update_technicians(const Filepath& path) {
  vec_t<Qualification> records;
  try {
    read_qualifications(path, records);
  } catch (const std::runtime_error& e) {
    print(MessageType::Error) << path << ": " << e.what() << std::endl;
    return 0;
  }
  return update_technicians(records);
}

std::set<EmployeeId> Wrangler::workmate_sphere(const EmployeeId& eid) {
  std::set<EmployeeId> sphere;
  if (!workmates_.sphere(eid, sphere).ok())
    return std::set<EmployeeId>();
  return sphere;
}

int Wrangler::schedule_maintenance(const Day& day) {
  return maint_.schedule(day).count;
}

int Wrangler::reroute_waste(const FacilityId& fid, const Day& day) {
  return reroute_.reroute(fid, day).count;
}

}  // namespace wrangler

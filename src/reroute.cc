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
#include "libwrangler/classes.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/reroute.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"

namespace wrangler {

WasteReroute::WasteReroute(Store& store)
    : print("reroute"), store_(store) {}

Result WasteReroute::reject(const ErrorKind& e, const FacilityId& fid,
                            const Day& day) {
  print(MessageType::Warning)
    << "facility " << fid << " on " << to_date_string(day) << " not rerouted ("
    << to_string(e) << ")" << std::endl;
  return Result(e);
}

Result WasteReroute::reroute(const FacilityId& fid, const Day& day) {
  try {
    store_.begin();
    if (store_.trips_to_facility_on(fid, day).empty()) {
      store_.rollback();
      return reject(ErrorKind::NothingToDo, fid, day);
    }

    Facility original;
    if (!store_.get_facility(fid, original)) {
      store_.rollback();
      return reject(ErrorKind::NoFacility, fid, day);
    }
    FacilityId alternate = 0;
    bool found = false;
    for (const Facility& f : store_.facilities_by_waste_type(original.waste_type())) {
      if (f.id() != fid) {
        alternate = f.id();
        found = true;
        break;
      }
    }
    if (!found) {
      store_.rollback();
      return reject(ErrorKind::NoFacility, fid, day);
    }

    const int moved = store_.update_trip_facility(fid, day, alternate);
    store_.commit();
    print(MessageType::Success)
      << moved << " trips moved from facility " << fid << " to "
      << alternate << " on " << to_date_string(day) << std::endl;
    return Result(ErrorKind::Success, moved);
  } catch (const StorageError& e) {
    print(MessageType::Error)
      << "facility " << fid << " failed ("
      << to_string(ErrorKind::StorageFailure) << "): " << e.what()
      << std::endl;
    rollback_quietly(store_, print);
    return Result(ErrorKind::StorageFailure);
  }
}

}  // namespace wrangler

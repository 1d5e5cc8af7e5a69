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
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/technicians.h"
#include "libwrangler/types.h"

namespace wrangler {

TechnicianImporter::TechnicianImporter(Store& store)
    : print("technicians"), store_(store) {}

ErrorKind TechnicianImporter::validate(const Qualification& q,
                                       EmployeeId& eid) {
  TruckType type;
  if (!store_.get_truck_type(q.truck_type, type))
    return ErrorKind::InvalidTruckType;
  vec_t<Employee> matches = store_.employees_by_name(q.full_name());
  if (matches.size() != 1)
    return ErrorKind::UnknownEmployee;
  eid = matches.front().id();
  if (store_.is_driver(eid))
    return ErrorKind::EmployeeIsDriver;
  if (store_.is_technician(eid, q.truck_type))
    return ErrorKind::AlreadyQualified;
  return ErrorKind::Success;
}

Result TechnicianImporter::import(const vec_t<Qualification>& records) {
  if (records.empty())
    return Result(ErrorKind::NothingToDo);
  int count = 0;
  for (const Qualification& q : records) {
    try {
      EmployeeId eid;
      ErrorKind valid = validate(q, eid);
      if (valid != ErrorKind::Success) {
        print(MessageType::Warning)
          << "skip " << q << " (" << to_string(valid) << ")" << std::endl;
        continue;
      }
      store_.begin();
      store_.insert_technician(eid, q.truck_type);
      store_.commit();
      count++;
      print << "added " << q << std::endl;
    } catch (const StorageError& e) {
      print(MessageType::Error)
        << "skip " << q << " (" << to_string(ErrorKind::StorageFailure)
        << "): " << e.what() << std::endl;
      rollback_quietly(store_, print);
    }
  }
  print(MessageType::Success)
    << count << " of " << records.size() << " qualifications added"
    << std::endl;
  return Result(ErrorKind::Success, count);
}

}  // namespace wrangler

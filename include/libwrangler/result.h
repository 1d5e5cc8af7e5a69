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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_RESULT_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_RESULT_H_

#include <string>

namespace wrangler {

/* Decision outcomes. None of these are thrown; components return them inside
 * a Result and the Wrangler facade reduces them to bool/int/set. */
enum class ErrorKind {
  Success,                // = 0
  InvalidRoute,           // = 1
  InvalidTruck,           // = 2
  NoAvailableTruck,       // = 3
  NoAvailableDriver,      // = 4
  NoFacility,             // = 5
  DuplicateRouteSameDay,  // = 6
  WorkingHoursViolation,  // = 7
  NoQualifiedTechnician,  // = 8
  StorageFailure,         // = 9
  InvalidTruckType,       // = 10
  UnknownEmployee,        // = 11
  EmployeeIsDriver,       // = 12
  AlreadyQualified,       // = 13
  InvalidDriver,          // = 14
  NothingToDo,            // = 15
};

struct Result {
  ErrorKind error;
  int count;  // units written (trips, maintenance slots, technicians)

  Result(ErrorKind e = ErrorKind::Success, int n = 0) : error(e), count(n) {}
  bool ok() const { return error == ErrorKind::Success; }
};

std::string to_string(ErrorKind);

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_RESULT_H_

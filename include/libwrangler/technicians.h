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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_TECHNICIANS_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_TECHNICIANS_H_

#include "classes.h"
#include "message.h"
#include "result.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* TechnicianImporter validates qualification records one at a time and
 * inserts the valid ones. A record is valid if
 *   - the truck type exists                    (else InvalidTruckType)
 *   - the full name names exactly one employee (else UnknownEmployee)
 *   - that employee is not a driver            (else EmployeeIsDriver)
 *   - the qualification is not already held   (else AlreadyQualified)
 * Invalid records are skipped. Result::count is the number inserted. */
class TechnicianImporter {
 public:
  TechnicianImporter(Store &);

  Result import(const vec_t<Qualification> &);

  /* Validate one record; on success output the employee */
  ErrorKind validate(const Qualification &, EmployeeId &);

  Message print;

 private:
  Store & store_;
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_TECHNICIANS_H_

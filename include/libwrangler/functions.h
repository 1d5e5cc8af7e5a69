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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_FUNCTIONS_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_FUNCTIONS_H_

#include <string>

#include "classes.h"
#include "result.h"
#include "types.h"

namespace wrangler {

/* Calendar --------------------------------------------------------------------
 * Proleptic Gregorian calendar, no time zones. */
Day make_day(int year, int month, int day);             // days since epoch
Stamp make_stamp(const Day &, int h, int m, int s = 0); // seconds since epoch
Stamp day_begin(const Day &);                           // 00:00 of day
Day day_of(const Stamp &);                              // floors negatives
Window day_window(const Day &);                         // [00:00, 24:00)
std::string to_date_string(const Day &);                // YYYY-MM-DD
std::string to_stamp_string(const Stamp &);             // YYYY-MM-DD HH:MM:SS

/* Travel time at the given speed, rounded to the nearest second. A route of
 * length 10 at 5 kph takes 7200 seconds. */
Dur trip_duration(const Length &, const Speed &);

/* Intervals -------------------------------------------------------------------
 * overlaps: [a.begin, a.end) and [b.begin, b.end) share at least one instant.
 *   Touching endpoints do not overlap; empty windows never overlap.
 * buffered: window widened by d on both sides. */
bool overlaps(const Window &, const Window &);
Window buffered(const Window &, const Dur &);

/* Driver pairing --------------------------------------------------------------
 * pick_second_driver: scan candidates starting at index "from" and output the
 *   first one that is not "exclude" and may drive the truck type. Returns
 *   false if none.
 * pick_driver_pair: driver1 is candidates[0]. If driver1 may drive the truck
 *   type, driver2 is candidates[1] (no qualification needed). Otherwise
 *   driver2 is pick_second_driver(candidates, 1, driver1, type). Returns
 *   ErrorKind::NoAvailableDriver if the rule cannot be satisfied.
 * Candidates must already be in priority order (hire date, then id). */
bool pick_second_driver(
  const vec_t<Driver> &,    // candidates
  const size_t &,           // first index to look at
  const EmployeeId &,       // id to skip
  const TruckTypeCode &,    // required qualification
        Driver &);          // output

ErrorKind pick_driver_pair(
  const vec_t<Driver> &,    // candidates
  const TruckTypeCode &,    // truck type of the selected truck
        Driver &,           // output driver1
        Driver &);          // output driver2

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_FUNCTIONS_H_

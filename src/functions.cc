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
#include <cmath> /* std::llround */
#include <iomanip>
#include <sstream>
#include <string>

#include "libwrangler/classes.h"
#include "libwrangler/functions.h"
#include "libwrangler/result.h"
#include "libwrangler/types.h"

namespace wrangler {

/* Calendar ------------------------------------------------------------------*/
// Days-from-civil: http://howardhinnant.github.io/date_algorithms.html
Day make_day(int y, int m, int d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const int yoe = y - era * 400;                                  // [0, 399]
  const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1; // [0, 365]
  const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;          // [0, 146096]
  return era * 146097 + doe - 719468;
}

Stamp make_stamp(const Day& day, int h, int m, int s) {
  return day_begin(day) + h * SecondsPerHour + m * SecondsPerMinute + s;
}

Stamp day_begin(const Day& day) {
  return static_cast<Stamp>(day) * SecondsPerDay;
}

Day day_of(const Stamp& t) {
  Stamp q = t / SecondsPerDay;
  if (t % SecondsPerDay < 0) q--;
  return static_cast<Day>(q);
}

Window day_window(const Day& day) {
  return {day_begin(day), day_begin(day + 1)};
}

std::string to_date_string(const Day& day) {
  // Civil-from-days, inverse of make_day
  const int z = day + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const int doe = z - era * 146097;
  const int yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const int doy = doe - (365*yoe + yoe/4 - yoe/100);
  const int mp = (5*doy + 2) / 153;
  const int d = doy - (153*mp + 2)/5 + 1;
  const int m = mp + (mp < 10 ? 3 : -9);
  const int y = yoe + era * 400 + (m <= 2);
  std::ostringstream os;
  os << std::setfill('0') << std::setw(4) << y << "-"
     << std::setw(2) << m << "-" << std::setw(2) << d;
  return os.str();
}

std::string to_stamp_string(const Stamp& t) {
  const Day day = day_of(t);
  const Dur secs = t - day_begin(day);
  std::ostringstream os;
  os << to_date_string(day) << " " << std::setfill('0')
     << std::setw(2) << secs / SecondsPerHour << ":"
     << std::setw(2) << (secs % SecondsPerHour) / SecondsPerMinute << ":"
     << std::setw(2) << secs % SecondsPerMinute;
  return os.str();
}

Dur trip_duration(const Length& length, const Speed& speed) {
  return std::llround(length / speed * SecondsPerHour);
}


/* Intervals -----------------------------------------------------------------*/
/* Half-open windows, except that an empty window [s, s) stands for the
 * instant s. Windows with the same start always overlap. */
bool overlaps(const Window& a, const Window& b) {
  if (a.begin > b.begin) return a.begin < b.end;
  if (a.begin < b.begin) return b.begin < a.end;
  return true;
}

Window buffered(const Window& w, const Dur& d) {
  return {w.begin - d, w.end + d};
}


/* Driver pairing ------------------------------------------------------------*/
bool pick_second_driver(
    const vec_t<Driver>   & candidates,
    const size_t          & from,
    const EmployeeId      & exclude,
    const TruckTypeCode   & type,
          Driver          & out)
{
  for (size_t i = from; i < candidates.size(); ++i) {
    const Driver& cand = candidates.at(i);
    if (cand.id() != exclude && cand.can_drive(type)) {
      out = cand;
      return true;
    }
  }
  return false;
}

ErrorKind pick_driver_pair(
    const vec_t<Driver>   & candidates,
    const TruckTypeCode   & type,
          Driver          & driver1,
          Driver          & driver2)
{
  if (candidates.size() < 2) return ErrorKind::NoAvailableDriver;
  driver1 = candidates.at(0);
  if (driver1.can_drive(type)) {
    driver2 = candidates.at(1);
    return ErrorKind::Success;
  }
  if (!pick_second_driver(candidates, 1, driver1.id(), type, driver2))
    return ErrorKind::NoAvailableDriver;
  return ErrorKind::Success;
}


/* Result --------------------------------------------------------------------*/
std::string to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::Success:               return "Success";
    case ErrorKind::InvalidRoute:          return "InvalidRoute";
    case ErrorKind::InvalidTruck:          return "InvalidTruck";
    case ErrorKind::NoAvailableTruck:      return "NoAvailableTruck";
    case ErrorKind::NoAvailableDriver:     return "NoAvailableDriver";
    case ErrorKind::NoFacility:            return "NoFacility";
    case ErrorKind::DuplicateRouteSameDay: return "DuplicateRouteSameDay";
    case ErrorKind::WorkingHoursViolation: return "WorkingHoursViolation";
    case ErrorKind::NoQualifiedTechnician: return "NoQualifiedTechnician";
    case ErrorKind::StorageFailure:        return "StorageFailure";
    case ErrorKind::InvalidTruckType:      return "InvalidTruckType";
    case ErrorKind::UnknownEmployee:       return "UnknownEmployee";
    case ErrorKind::EmployeeIsDriver:      return "EmployeeIsDriver";
    case ErrorKind::AlreadyQualified:      return "AlreadyQualified";
    case ErrorKind::InvalidDriver:         return "InvalidDriver";
    case ErrorKind::NothingToDo:           return "NothingToDo";
  }
  return "Unknown";
}

}  // namespace wrangler

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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_TYPES_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_TYPES_H_

#include <limits>
#include <string>
#include <unordered_map>
#include <utility> /* std::pair */
#include <vector>

namespace wrangler {

template <typename K, typename V> using dict  = std::unordered_map<K, V>;
template <typename T>             using vec_t = std::vector<T>;

// Reference-data ids
typedef int RouteId;
typedef int TruckId;
typedef int EmployeeId;
typedef int FacilityId;

// Truck types and waste types are named by short codes, e.g. "A" or
// "compost". A truck type carries exactly one waste type.
typedef std::string TruckTypeCode;
typedef std::string WasteType;

// unit: kilometers
typedef double Length;

// unit: kilometers per hour
typedef double Speed;

// unit: cubic meters (trucks.capacity, trips.volume)
typedef double Volume;

/* "Stamp" type class
 * One Stamp is one second since 1970-01-01 00:00 (no time zone). A "Day" is
 * one calendar day since the same epoch. Trip start times are Stamps;
 * maintenance dates and hire dates are Days. */
typedef long long Stamp;
typedef long long Dur;
typedef int Day;

const Dur SecondsPerMinute = 60;
const Dur SecondsPerHour   = 3600;
const Dur SecondsPerDay    = 86400;

// Half-open interval [begin, end) of Stamps
struct Window {
  Stamp begin;
  Stamp end;
};

// An undirected co-worker edge (driverHigh, driverLow)
typedef std::pair<EmployeeId, EmployeeId> DriverPair;

// Filepath
typedef std::string Filepath;

// Infinity
const int InfInt = std::numeric_limits<int>::max();

// SQLite
typedef int         SqliteReturnCode;
typedef char*       SqliteErrorMessage;
typedef const char* SqliteQuery;

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_TYPES_H_

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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_CLASSES_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_CLASSES_H_

#include <iostream>
#include <string>
#include <vector>

#include "types.h"

/* -------
 * SUMMARY
 * -------
 * This file contains definitions for the records read from and written to
 * the waste-collection database. These classes are:
 *   - Route
 *   - TruckType
 *   - Truck
 *   - Employee
 *   - Driver
 *   - Facility
 *   - Trip
 *   - Maintenance
 *   - Qualification
 * At the bottom are << overloads
 */

namespace wrangler {

/* Route is a collection route of one waste type. ----------------------------*/
class Route {
 public:
  /* Constructors */
  Route() = default;
  Route(
    RouteId,    // param1: id of the route
    WasteType,  // param2: waste type collected along the route
    Length      // param3: route length (km)
  );
  const RouteId   & id()         const;  // return id
  const WasteType & waste_type() const;  // return waste type
  const Length    & length()     const;  // return length

 private:
  RouteId id_;
  WasteType waste_type_;
  Length length_;
};

/* TruckType is a class of vehicle carrying one waste type. ------------------*/
class TruckType {
 public:
  TruckType() = default;
  TruckType(TruckTypeCode, WasteType);
  const TruckTypeCode & code()       const;
  const WasteType     & waste_type() const;

 private:
  TruckTypeCode code_;
  WasteType waste_type_;
};

/* Truck. --------------------------------------------------------------------*/
class Truck {
 public:
  /* Constructors */
  Truck() = default;
  Truck(
    TruckId,        // param1: id of the truck
    TruckTypeCode,  // param2: truck type
    Volume,         // param3: capacity
    WasteType w = ""  // param4: waste type of the truck type (if joined)
  );
  const TruckId       & id()         const;  // return id
  const TruckTypeCode & type()       const;  // return truck type
  const Volume        & capacity()   const;  // return capacity
  const WasteType     & waste_type() const;  // return carried waste type

  bool operator==(const Truck & rhs) const { return id_ == rhs.id_; }
  bool operator<(const Truck & rhs) const { return id_ < rhs.id_; }

 private:
  TruckId id_;
  TruckTypeCode type_;
  Volume capacity_;
  WasteType waste_type_;
};

/* Employee. -----------------------------------------------------------------*/
class Employee {
 public:
  Employee() = default;
  Employee(EmployeeId, std::string, Day);
  const EmployeeId  & id()        const;
  const std::string & name()      const;
  const Day         & hire_date() const;

  bool operator==(const Employee & rhs) const { return id_ == rhs.id_; }
  bool operator<(const Employee & rhs) const { return id_ < rhs.id_; }

 protected:
  EmployeeId id_;
  std::string name_;
  Day hire_date_;
};

/* Driver is an employee together with every truck type it may drive. A
 * driver appears once in a candidate list no matter how many truck types
 * it is qualified for. ------------------------------------------------------*/
class Driver : public Employee {
 public:
  Driver() = default;
  Driver(
    EmployeeId,           // param1: id of the employee
    std::string,          // param2: name
    Day,                  // param3: hire date
    vec_t<TruckTypeCode>  // param4: truck types the employee may drive
  );
  const vec_t<TruckTypeCode> & qualifications() const;
        bool                   can_drive(const TruckTypeCode &) const;
        void                   add_qualification(const TruckTypeCode &);

 private:
  vec_t<TruckTypeCode> qualifications_;
};

/* Facility accepts one waste type. ------------------------------------------*/
class Facility {
 public:
  Facility() = default;
  Facility(FacilityId, WasteType);
  const FacilityId & id()         const;
  const WasteType  & waste_type() const;

 private:
  FacilityId id_;
  WasteType waste_type_;
};

/* Trip is one truck with two drivers on one route. The two drivers are
 * stored as an unordered pair: driver_high() >= driver_low(). ---------------*/
class Trip {
 public:
  /* Constructors */
  Trip() = default;
  Trip(
    RouteId,      // param1: route
    TruckId,      // param2: truck
    Stamp,        // param3: start time
    Stamp,        // param4: end time (start + route length / speed)
    EmployeeId,   // param5: first driver
    EmployeeId,   // param6: second driver
    FacilityId,   // param7: disposal facility
    Volume v = -1 // param8: collected volume (-1 means unknown)
  );
  const RouteId    & route()       const;  // return route
  const TruckId    & truck()       const;  // return truck
  const Stamp      & start()       const;  // return start time
  const Stamp      & end()         const;  // return end time
  const EmployeeId & driver_high() const;  // return larger driver id
  const EmployeeId & driver_low()  const;  // return smaller driver id
  const FacilityId & facility()    const;  // return facility
  const Volume     & volume()      const;  // return volume
        Window       window()      const;  // return [start, end)
        bool         has_driver(const EmployeeId &) const;

 private:
  RouteId route_;
  TruckId truck_;
  Stamp start_;
  Stamp end_;
  EmployeeId driver_high_;
  EmployeeId driver_low_;
  FacilityId facility_;
  Volume volume_;
};

/* Maintenance is one truck serviced by one technician on one day. -----------*/
class Maintenance {
 public:
  Maintenance() = default;
  Maintenance(TruckId, EmployeeId, Day);
  const TruckId    & truck()      const;
  const EmployeeId & technician() const;
  const Day        & date()       const;

 private:
  TruckId truck_;
  EmployeeId technician_;
  Day date_;
};

/* Qualification is one line pair of a technician-qualification file. -------*/
struct Qualification {
  std::string first_name;
  std::string last_name;
  TruckTypeCode truck_type;

  std::string full_name() const { return first_name + " " + last_name; }
};

std::ostream& operator<<(std::ostream& os, const Window &);
std::ostream& operator<<(std::ostream& os, const Trip &);
std::ostream& operator<<(std::ostream& os, const Maintenance &);
std::ostream& operator<<(std::ostream& os, const Qualification &);

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_CLASSES_H_

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
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "libwrangler/classes.h"
#include "libwrangler/functions.h"
#include "libwrangler/types.h"

namespace wrangler {

/* Route ---------------------------------------------------------------------*/
Route::Route(
  RouteId id,
  WasteType waste_type,
  Length length)
{
  this->id_ = id;
  this->waste_type_ = waste_type;
  this->length_ = length;
}

const RouteId   & Route::id()         const { return id_; }
const WasteType & Route::waste_type() const { return waste_type_; }
const Length    & Route::length()     const { return length_; }


/* TruckType -----------------------------------------------------------------*/
TruckType::TruckType(TruckTypeCode code, WasteType waste_type) {
  this->code_ = code;
  this->waste_type_ = waste_type;
}

const TruckTypeCode & TruckType::code()       const { return code_; }
const WasteType     & TruckType::waste_type() const { return waste_type_; }


/* Truck ---------------------------------------------------------------------*/
Truck::Truck(
  TruckId id,
  TruckTypeCode type,
  Volume capacity,
  WasteType waste_type)
{
  this->id_ = id;
  this->type_ = type;
  this->capacity_ = capacity;
  this->waste_type_ = waste_type;
}

const TruckId       & Truck::id()         const { return id_; }
const TruckTypeCode & Truck::type()       const { return type_; }
const Volume        & Truck::capacity()   const { return capacity_; }
const WasteType     & Truck::waste_type() const { return waste_type_; }


/* Employee ------------------------------------------------------------------*/
Employee::Employee(EmployeeId id, std::string name, Day hire_date) {
  this->id_ = id;
  this->name_ = name;
  this->hire_date_ = hire_date;
}

const EmployeeId  & Employee::id()        const { return id_; }
const std::string & Employee::name()      const { return name_; }
const Day         & Employee::hire_date() const { return hire_date_; }


/* Driver --------------------------------------------------------------------*/
Driver::Driver(
  EmployeeId id,
  std::string name,
  Day hire_date,
  vec_t<TruckTypeCode> qualifications)
    : Employee(id, name, hire_date) {
  this->qualifications_ = qualifications;
}

const vec_t<TruckTypeCode> & Driver::qualifications() const {
  return qualifications_;
}

bool Driver::can_drive(const TruckTypeCode& type) const {
  return std::find(qualifications_.begin(), qualifications_.end(), type)
      != qualifications_.end();
}

void Driver::add_qualification(const TruckTypeCode& type) {
  if (!can_drive(type)) qualifications_.push_back(type);
}


/* Facility ------------------------------------------------------------------*/
Facility::Facility(FacilityId id, WasteType waste_type) {
  this->id_ = id;
  this->waste_type_ = waste_type;
}

const FacilityId & Facility::id()         const { return id_; }
const WasteType  & Facility::waste_type() const { return waste_type_; }


/* Trip ----------------------------------------------------------------------*/
Trip::Trip(
  RouteId route,
  TruckId truck,
  Stamp start,
  Stamp end,
  EmployeeId driver1,
  EmployeeId driver2,
  FacilityId facility,
  Volume volume)
{
  this->route_ = route;
  this->truck_ = truck;
  this->start_ = start;
  this->end_ = end;
  this->driver_high_ = std::max(driver1, driver2);
  this->driver_low_ = std::min(driver1, driver2);
  this->facility_ = facility;
  this->volume_ = volume;
}

const RouteId    & Trip::route()       const { return route_; }
const TruckId    & Trip::truck()       const { return truck_; }
const Stamp      & Trip::start()       const { return start_; }
const Stamp      & Trip::end()         const { return end_; }
const EmployeeId & Trip::driver_high() const { return driver_high_; }
const EmployeeId & Trip::driver_low()  const { return driver_low_; }
const FacilityId & Trip::facility()    const { return facility_; }
const Volume     & Trip::volume()      const { return volume_; }
      Window       Trip::window()      const { return {start_, end_}; }

bool Trip::has_driver(const EmployeeId& eid) const {
  return driver_high_ == eid || driver_low_ == eid;
}


/* Maintenance ---------------------------------------------------------------*/
Maintenance::Maintenance(TruckId truck, EmployeeId technician, Day date) {
  this->truck_ = truck;
  this->technician_ = technician;
  this->date_ = date;
}

const TruckId    & Maintenance::truck()      const { return truck_; }
const EmployeeId & Maintenance::technician() const { return technician_; }
const Day        & Maintenance::date()       const { return date_; }


/* Printers ------------------------------------------------------------------*/
std::ostream& operator<<(std::ostream& os, const Window& w) {
  os << "[" << to_stamp_string(w.begin) << ", " << to_stamp_string(w.end) << ")";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Trip& trip) {
  os << "trip(route " << trip.route() << ", truck " << trip.truck() << ", "
     << to_stamp_string(trip.start()) << ", drivers " << trip.driver_high()
     << "/" << trip.driver_low() << ", facility " << trip.facility() << ")";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Maintenance& m) {
  os << "maintenance(truck " << m.truck() << ", technician " << m.technician()
     << ", " << to_date_string(m.date()) << ")";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Qualification& q) {
  os << q.full_name() << " -> " << q.truck_type;
  return os;
}

}  // namespace wrangler

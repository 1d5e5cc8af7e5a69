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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_WORKMATES_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_WORKMATES_H_

#include <set>

#include "classes.h"
#include "message.h"
#include "result.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* Undirected "has shared a trip with" graph. Every trip adds the edge
 * (driver_high, driver_low). */
class WorkmateGraph {
 public:
  WorkmateGraph() = default;
  WorkmateGraph(const vec_t<DriverPair> &);

  void add_edge(const EmployeeId &, const EmployeeId &);

  /* All nodes reachable from the root, without the root */
  std::set<EmployeeId> reachable(const EmployeeId &) const;

  const dict<EmployeeId, vec_t<EmployeeId>> & adjacency() const { return adj_; }

 private:
  dict<EmployeeId, vec_t<EmployeeId>> adj_;
};

/* Workmates computes the workmate sphere of a driver from the trips table.
 * Result::count is the size of the sphere; an unknown driver gives
 * InvalidDriver and an empty sphere. */
class Workmates {
 public:
  Workmates(Store &);

  Result sphere(const EmployeeId &, std::set<EmployeeId> &);

  Message print;

 private:
  Store & store_;
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_WORKMATES_H_

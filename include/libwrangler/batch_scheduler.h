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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_BATCH_SCHEDULER_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_BATCH_SCHEDULER_H_

#include "availability.h"
#include "classes.h"
#include "message.h"
#include "options.h"
#include "result.h"
#include "store.h"
#include "types.h"

namespace wrangler {

/* BatchScheduler packs the unscheduled routes of one truck into one day.
 *
 * The driver pair (from drivers with no trip that day) and the facility
 * (lowest id for the truck's waste type) are fixed for the whole batch.
 * Routes of the truck's waste type without a trip that day are taken in id
 * order starting at shift begin; each trip that ends strictly before shift
 * end is inserted and the next one starts one buffer after it. The first
 * route that does not fit stops the batch.
 *
 * Every trip is committed as it is inserted. Result::count is the number of
 * trips inserted, including when a later insert fails. */
class BatchScheduler {
 public:
  BatchScheduler(Store &, AvailabilityResolver &, const Options & = Options());

  Result schedule(const TruckId &, const Day &);

  Message print;

 private:
  Store & store_;
  AvailabilityResolver & avail_;
  Speed speed_;
  Dur gap_;
  int shift_begin_;
  int shift_end_;

  vec_t<Route> unscheduled_routes(const WasteType &, const Day &);
  Result reject(const ErrorKind &, const TruckId &, const Day &);
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_BATCH_SCHEDULER_H_

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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_H_

namespace wrangler {}  // namespace wrangler

#include "libwrangler/availability.h"
#include "libwrangler/batch_scheduler.h"
#include "libwrangler/classes.h"
#include "libwrangler/dbsql.h"
#include "libwrangler/debug.h"
#include "libwrangler/file.h"
#include "libwrangler/functions.h"
#include "libwrangler/maintenance.h"
#include "libwrangler/message.h"
#include "libwrangler/options.h"
#include "libwrangler/reroute.h"
#include "libwrangler/result.h"
#include "libwrangler/sqlite_store.h"
#include "libwrangler/store.h"
#include "libwrangler/technicians.h"
#include "libwrangler/trip_scheduler.h"
#include "libwrangler/types.h"
#include "libwrangler/workmates.h"
#include "libwrangler/wrangler.h"

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_H_

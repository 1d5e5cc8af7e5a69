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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_OPTIONS_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_OPTIONS_H_

#include "message.h"
#include "types.h"

namespace wrangler {

struct Options {
    // SQLite database to open. The default keeps everything in memory.
    Filepath path_to_database = ":memory:";

    // SQL script (reference data) executed once the tables exist
    Filepath path_to_data = "";

    // Save the database into this file when the store is closed
    Filepath path_to_save = "";

    // Set to FALSE when opening a database that already has the tables
    bool create_tables = true;

    // Working day. Trips start no earlier than shift_begin_hour and end no
    // later than shift_end_hour of the same day.
    int shift_begin_hour = 8;
    int shift_end_hour = 16;

    // Minutes of slack on both sides of a trip (availability) and between
    // consecutive trips of a batch
    int buffer_minutes = 30;

    // Average truck speed (kph); trip duration is route length / speed
    Speed truck_speed = 5;

    // A truck is due for maintenance once its most recent maintenance is more
    // than maintenance_interval days old and nothing is booked for it within
    // maintenance_lookahead days.
    int maintenance_interval = 90;
    int maintenance_lookahead = 10;

    // Set to TRUE to skip maintenance days on which the truck itself has a
    // trip or another maintenance
    bool strict_maintenance = true;

    // Lines less severe than this are not printed
    MessageType log_level = MessageType::Default;
};

} // namespace wrangler

#endif // WRANGLER_INCLUDE_LIBWRANGLER_OPTIONS_H_

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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_DEBUG_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_DEBUG_H_

// Verbose traces, compiled in only up to WRANGLER_DEBUG_LEVEL.
// Usage:
//     DEBUG(2, { print << "candidate truck " << truck.id() << std::endl; });
#ifndef WRANGLER_DEBUG_LEVEL
#define WRANGLER_DEBUG_LEVEL 0
#endif

#define DEBUG(level, ...)                                                     \
  do {                                                                        \
    if ((level) <= WRANGLER_DEBUG_LEVEL) __VA_ARGS__                          \
  } while (0)

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_DEBUG_H_

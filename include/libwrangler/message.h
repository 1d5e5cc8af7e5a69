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
#ifndef WRANGLER_INCLUDE_LIBWRANGLER_MESSAGE_H_
#define WRANGLER_INCLUDE_LIBWRANGLER_MESSAGE_H_

// The following are UBUNTU/LINUX ONLY terminal color codes.
#define WRANGLER_RESET   "\033[0m"
#define WRANGLER_RED     "\033[31m"  /* Red     */
#define WRANGLER_GREEN   "\033[32m"  /* Green   */
#define WRANGLER_BLUE    "\033[34m"  /* Blue    */
#define WRANGLER_MAGENTA "\033[35m"  /* Magenta */

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

// Provides colored, timestamped, named log lines.
// Usage:
//     Message print("trip_scheduler");
//     print(MessageType::Warning) << "route " << 42 << " rejected" << std::endl;
// The type is reset to Default at every flush (std::endl). Lines whose type is
// less severe than Message::threshold() are dropped.
namespace wrangler {

enum class MessageType {
  Default,  // plain
  Info,     // blue
  Warning,  // magenta
  Error,    // red
  Success,  // green
};

// Default, Info and Success rank 0; Warning 1; Error 2
int severity(const MessageType &);

class MessageStreamBuffer : public std::streambuf {
 public:
  MessageStreamBuffer(std::streambuf* sink, const std::string& name)
      : type(MessageType::Default), head(true), mute(false),
        name_(name), sb_(sink) {}

  MessageType type;
  bool head;
  bool mute;

 private:
  std::string name_;
  std::streambuf* sb_;

  int sync();            // override
  int overflow(int c);   // override
};

class Message : public std::ostream {
 public:
  Message(const std::string& name = "noname", std::ostream& os = std::cout);
  ~Message();

  Message& operator()(MessageType t) {
    buf_->type = t;
    return *this;
  }

  const std::string& name() const { return name_; }

  /* Process-wide minimum type that is printed */
  static MessageType& threshold();

 private:
  std::string name_;
  MessageStreamBuffer* buf_;
};

}  // namespace wrangler

#endif  // WRANGLER_INCLUDE_LIBWRANGLER_MESSAGE_H_

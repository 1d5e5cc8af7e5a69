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
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "libwrangler/message.h"

namespace wrangler {

int severity(const MessageType& t) {
  switch (t) {
    case MessageType::Warning: return 1;
    case MessageType::Error:   return 2;
    default:                   return 0;
  }
}

int MessageStreamBuffer::sync() {
  if (!mute) sb_->sputn(WRANGLER_RESET, sizeof(WRANGLER_RESET)-1);
  sb_->pubsync();
  head = true;
  mute = false;
  type = MessageType::Default;
  return 0;
}

/* Message has no buffer; every char "overflows". At the head of a line,
 * decide whether the line is printed, then put the color code and the
 * timestamp into the sink. */
int MessageStreamBuffer::overflow(int c) {
  if (c == traits_type::eof()) return traits_type::not_eof(c);
  if (head) {
    mute = severity(type) < severity(Message::threshold());
    if (!mute) {
      switch (type) {
        case MessageType::Default:
          sb_->sputn(WRANGLER_RESET, sizeof(WRANGLER_RESET)-1);
          break;
        case MessageType::Info:
          sb_->sputn(WRANGLER_BLUE, sizeof(WRANGLER_BLUE)-1);
          break;
        case MessageType::Warning:
          sb_->sputn(WRANGLER_MAGENTA, sizeof(WRANGLER_MAGENTA)-1);
          break;
        case MessageType::Error:
          sb_->sputn(WRANGLER_RED, sizeof(WRANGLER_RED)-1);
          break;
        case MessageType::Success:
          sb_->sputn(WRANGLER_GREEN, sizeof(WRANGLER_GREEN)-1);
          break;
      }
      auto now_c = std::chrono::system_clock::to_time_t(
          std::chrono::system_clock::now());
      auto tm = std::localtime(&now_c);
      std::ostringstream ts;
      ts << std::setfill('0') << "["
         << std::setw(2) << tm->tm_hour << ":"
         << std::setw(2) << tm->tm_min  << ":"
         << std::setw(2) << tm->tm_sec  << "]"
         << "[" << name_ << "] ";
      const std::string& ts_str = ts.str();
      sb_->sputn(ts_str.c_str(), ts_str.length());
    }
    head = false;
  }
  if (!mute) sb_->sputc(c);
  if (c == int('\n')) head = true;
  return c;
}

Message::Message(const std::string& name, std::ostream& os)
    : std::ostream(nullptr), name_(name) {
  buf_ = new MessageStreamBuffer(os.rdbuf(), name);
  this->std::ios::init(buf_);
}

Message::~Message() { delete buf_; }

MessageType& Message::threshold() {
  static MessageType t = MessageType::Default;
  return t;
}

}  // namespace wrangler

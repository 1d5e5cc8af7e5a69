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
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "libwrangler/classes.h"
#include "libwrangler/file.h"
#include "libwrangler/types.h"

namespace wrangler {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  const size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

}  // namespace

size_t read_qualifications(std::istream& is, vec_t<Qualification>& Q) {
  size_t count = 0;
  std::string line;
  bool pending = false;  // a name line is waiting for its type line
  Qualification q;
  while (std::getline(is, line)) {
    line = trim(line);
    if (line.empty()) continue;
    if (!pending) {
      std::istringstream tokens(line);
      vec_t<std::string> names;
      std::string tok;
      while (tokens >> tok) names.push_back(tok);
      q.first_name = (names.size() > 1 ? names.at(names.size() - 2) : "");
      q.last_name = names.back();
      pending = true;
    } else {
      q.truck_type = line;
      Q.push_back(q);
      pending = false;
      count++;
    }
  }
  return count;
}

size_t read_qualifications(const Filepath& path, vec_t<Qualification>& Q) {
  std::ifstream ifs(path);
  if (!ifs.good()) throw std::runtime_error("qualification path not found");
  size_t count = read_qualifications(ifs, Q);
  ifs.close();
  return count;
}

}  // namespace wrangler

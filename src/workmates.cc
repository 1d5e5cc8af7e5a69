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
#include <queue>
#include <set>

#include "libwrangler/classes.h"
#include "libwrangler/functions.h"
#include "libwrangler/message.h"
#include "libwrangler/result.h"
#include "libwrangler/store.h"
#include "libwrangler/types.h"
#include "libwrangler/workmates.h"

namespace wrangler {

WorkmateGraph::WorkmateGraph(const vec_t<DriverPair>& pairs) {
  for (const DriverPair& pair : pairs)
    add_edge(pair.first, pair.second);
}

void WorkmateGraph::add_edge(const EmployeeId& u, const EmployeeId& v) {
  adj_[u].push_back(v);
  adj_[v].push_back(u);
}

std::set<EmployeeId> WorkmateGraph::reachable(const EmployeeId& root) const {
  std::set<EmployeeId> visited = {root};
  std::queue<EmployeeId> frontier;
  frontier.push(root);
  while (!frontier.empty()) {
    const EmployeeId u = frontier.front();
    frontier.pop();
    auto it = adj_.find(u);
    if (it == adj_.end()) continue;
    for (const EmployeeId& v : it->second) {
      if (visited.insert(v).second)
        frontier.push(v);
    }
  }
  visited.erase(root);
  return visited;
}

Workmates::Workmates(Store& store) : print("workmates"), store_(store) {}

Result Workmates::sphere(const EmployeeId& eid, std::set<EmployeeId>& out) {
  out.clear();
  try {
    if (!store_.is_driver(eid)) {
      print(MessageType::Warning)
        << "employee " << eid << " has no sphere ("
        << to_string(ErrorKind::InvalidDriver) << ")" << std::endl;
      return Result(ErrorKind::InvalidDriver);
    }
    WorkmateGraph graph(store_.driver_pairs());
    out = graph.reachable(eid);
  } catch (const StorageError& e) {
    print(MessageType::Error)
      << "employee " << eid << " failed ("
      << to_string(ErrorKind::StorageFailure) << "): " << e.what()
      << std::endl;
    out.clear();
    return Result(ErrorKind::StorageFailure);
  }
  print << "employee " << eid << ": " << out.size() << " workmates" << std::endl;
  return Result(ErrorKind::Success, static_cast<int>(out.size()));
}

}  // namespace wrangler

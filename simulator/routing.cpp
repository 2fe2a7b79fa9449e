#include "routing.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <queue>
#include <sstream>
#include "spdlog/spdlog.h"

Routing::Routing(const Network& network, Strategy strategy, size_t precompute_limit) : network(network), strategy_(strategy), lookups_(0)
{
  if (strategy_ == AUTO)
    strategy_ = network.size() <= precompute_limit ? FLOYD_WARSHALL : DIJKSTRA;
  distances.resize(network.size());
  computed.assign(network.size(), false);
  if (strategy_ == FLOYD_WARSHALL)
    floyd_warshall();
}

Routing::Strategy Routing::parse_strategy(const std::string& name)
{
  if (name == "auto")
    return AUTO;
  else if (name == "dijkstra")
    return DIJKSTRA;
  else if (name == "floyd-warshall")
    return FLOYD_WARSHALL;
  else
    throw std::invalid_argument("Routing strategy (" + name + ") not recognized");
}

Time Routing::travel_time(const std::string& start_point, const std::string& end_point)
{
  size_t s = network.index(start_point), d = network.index(end_point);
  lookups_++;
  return distances_from(s)[d];
}

std::vector<Routing::Segment> Routing::compute_distances(const std::vector<std::string>& start_points, const std::string& end_point)
{
  std::vector<Routing::Segment> results;
  results.reserve(start_points.size());
  for (const auto& p : start_points)
    results.emplace_back(Segment{ p, end_point, travel_time(p, end_point) });
  return results;
}

const std::vector<Time>& Routing::distances_from(size_t source)
{
  if (!computed[source])
    dijkstra(source);
  return distances[source];
}

void Routing::dijkstra(size_t source)
{
  typedef std::pair<Time, size_t> Entry;
  std::vector<Time>& d = distances[source];
  d.assign(network.size(), NEVER);
  d[source] = 0.0;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
  frontier.push({ 0.0, source });
  while (!frontier.empty()) {
    auto [cost, u] = frontier.top();
    frontier.pop();
    // stale entry, a cheaper path has already been settled
    if (cost > d[u])
      continue;
    for (const auto& e : network.edges_from(u)) {
      Time c = cost + e.cost;
      if (c < d[e.to]) {
        d[e.to] = c;
        frontier.push({ c, e.to });
      }
    }
  }
  computed[source] = true;
}

void Routing::floyd_warshall()
{
  auto start = std::chrono::steady_clock::now();
  size_t n = network.size();
  for (size_t i = 0; i < n; i++) {
    distances[i].assign(n, NEVER);
    distances[i][i] = 0.0;
    for (const auto& e : network.edges_from(i))
      distances[i][e.to] = std::min(distances[i][e.to], e.cost);
  }
  for (size_t k = 0; k < n; k++) {
    const auto& dk = distances[k];
    for (size_t i = 0; i < n; i++) {
      Time dik = distances[i][k];
      if (dik == NEVER)
        continue;
      auto& di = distances[i];
      for (size_t j = 0; j < n; j++) {
        if (dik + dk[j] < di[j])
          di[j] = dik + dk[j];
      }
    }
  }
  computed.assign(n, true);
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
  spdlog::debug("Routing precomputation over {} locations took {:.6f}s", n, elapsed.count());
}

std::ostream& operator<<(std::ostream &os, const Routing::Strategy& s) {
  switch (s) {
    case Routing::Strategy::AUTO:
      os << "auto";
      break;
    case Routing::Strategy::DIJKSTRA:
      os << "dijkstra";
      break;
    case Routing::Strategy::FLOYD_WARSHALL:
      os << "floyd-warshall";
      break;
  }
  return os;
}

std::string std::to_string(Routing::Strategy s) {
  std::ostringstream oss;
  oss << s;
  return oss.str();
}

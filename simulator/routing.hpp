#pragma once

#include "data.hpp"
#include "network.hpp"
#include <string>
#include <vector>

// Shortest path travel times over a Network. Costs may be asymmetric and need
// not satisfy the triangle inequality; unreachable destinations take NEVER.
class Routing {
public:
  enum Strategy
  {
    AUTO,
    DIJKSTRA,
    FLOYD_WARSHALL
  };
  struct Segment {
    std::string start_point, end_point;
    // duration is expressed in minutes
    Time duration;
  };

  // AUTO precomputes all pairs up to precompute_limit locations, and falls
  // back to on-demand single source searches on larger networks
  Routing(const Network& network, Strategy strategy = AUTO, size_t precompute_limit = 400);

  static Strategy parse_strategy(const std::string& name);

  Time travel_time(const std::string& start_point, const std::string& end_point);

  std::vector<Segment> compute_distances(const std::vector<std::string>& start_points, const std::string& end_point);

  inline Segment compute_distances(const std::string& start_point, const std::string& end_point)
  {
    return Segment{ start_point, end_point, travel_time(start_point, end_point) };
  }

  bool has_location(const std::string& id) const {
    return network.has_location(id);
  }
  Strategy strategy() const {
    return strategy_;
  }
  size_t lookups() const {
    return lookups_;
  }

protected:
  const std::vector<Time>& distances_from(size_t source);
  void dijkstra(size_t source);
  void floyd_warshall();
  const Network& network;
  Strategy strategy_;
  // full matrix for FLOYD_WARSHALL, per source cache for DIJKSTRA
  std::vector<std::vector<Time>> distances;
  std::vector<bool> computed;
  size_t lookups_;
};

std::ostream& operator<<(std::ostream &os, const Routing::Strategy& s);

namespace std {
string to_string(Routing::Strategy s);
}

#pragma once

#include "data.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Coordinate {
  double lat, lon;
};

struct Location {
  std::string id;
  std::optional<Coordinate> place;
};

// Directed weighted graph of locations, immutable once loaded.
class Network {
public:
  struct Edge {
    size_t to;
    // duration is expressed in minutes
    Time cost;
  };

  void add_location(const Location& l);
  // registers the location if missing, otherwise sets its coordinate
  void place(const std::string& id, Coordinate c);
  // parallel edges collapse to the cheapest one
  void add_edge(const std::string& from, const std::string& to, Time cost);

  bool has_location(const std::string& id) const {
    return index_.count(id) > 0;
  }
  size_t index(const std::string& id) const;
  const Location& location(size_t i) const {
    return locations.at(i);
  }
  const std::vector<Edge>& edges_from(size_t i) const {
    return adjacency.at(i);
  }
  size_t size() const {
    return locations.size();
  }
  size_t edge_count() const;
protected:
  std::vector<Location> locations;
  std::map<std::string, size_t> index_;
  std::vector<std::vector<Edge>> adjacency;
};

std::istream &operator>>(std::istream &is, Coordinate &c);
std::ostream &operator<<(std::ostream &os, const Coordinate &c);

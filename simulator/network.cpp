#include "network.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

void Network::add_location(const Location& l)
{
  if (l.id.empty())
    throw InputError("Empty location identifier");
  if (has_location(l.id))
    throw InputError("Duplicate location " + l.id);
  index_[l.id] = locations.size();
  locations.push_back(l);
  adjacency.emplace_back();
}

void Network::place(const std::string& id, Coordinate c)
{
  auto it = index_.find(id);
  if (it == index_.end())
    add_location(Location{ id, c });
  else
    locations[it->second].place = c;
}

void Network::add_edge(const std::string& from, const std::string& to, Time cost)
{
  if (!has_location(from))
    throw InputError("Edge " + from + " -> " + to + " starts from unknown location " + from);
  if (!has_location(to))
    throw InputError("Edge " + from + " -> " + to + " ends at unknown location " + to);
  if (std::isnan(cost) || std::isinf(cost) || cost < 0.0)
    throw InputError("Edge " + from + " -> " + to + " has invalid cost " + std::to_string(cost));
  size_t s = index_.at(from), d = index_.at(to);
  for (auto& e : adjacency[s]) {
    if (e.to == d) {
      e.cost = std::min(e.cost, cost);
      return;
    }
  }
  adjacency[s].push_back(Edge{ d, cost });
}

size_t Network::index(const std::string& id) const
{
  auto it = index_.find(id);
  if (it == index_.end())
    throw UnknownLocation(id);
  return it->second;
}

size_t Network::edge_count() const
{
  size_t count = 0;
  for (const auto& edges : adjacency)
    count += edges.size();
  return count;
}

std::istream &operator>>(std::istream &is, Coordinate &c)
{
  char sep;
  is >> c.lat >> sep >> c.lon;
  if (sep != ',')
    is.setstate(std::ios::failbit);
  return is;
}

std::ostream &operator<<(std::ostream &os, const Coordinate &c)
{
  os << "(" << c.lat << ", " << c.lon << ")";
  return os;
}

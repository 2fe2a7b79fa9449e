#pragma once

#include "data.hpp"
#include "ambulance.hpp"
#include "routing.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Ambulances of one run and their state transitions.
class FleetRegistry
{
public:
  typedef std::vector<std::pair<std::shared_ptr<Ambulance>, Routing::Segment>> Candidates;

  FleetRegistry(Routing& routing) : routing(routing) {}

  std::shared_ptr<Ambulance> register_ambulance(const std::string& id, const std::string& base);

  // idle ambulances that can reach the location, nearest first, ties by identifier
  Candidates available_near(const std::string& location) const;

  void mark_dispatched(const std::string& ambulance, const std::string& call, Time now);
  void mark_en_route(const std::string& ambulance, Time now);
  void mark_on_scene(const std::string& ambulance, const std::string& location, Time now);
  void mark_returning(const std::string& ambulance, Time now);
  void mark_returned(const std::string& ambulance, const std::string& location, Time now);

  std::shared_ptr<Ambulance> find(const std::string& id) const;
  bool contains(const std::string& id) const {
    return index_.count(id) > 0;
  }
  // ambulance currently serving the call, empty if none
  std::string serving(const std::string& call) const;
  const std::vector<std::shared_ptr<Ambulance>>& ambulances() const {
    return ambulances_;
  }
  size_t idle_count() const;
  size_t size() const {
    return ambulances_.size();
  }
protected:
  std::vector<std::shared_ptr<Ambulance>> ambulances_;
  std::map<std::string, size_t> index_;
  // call -> ambulance, for the calls in service
  std::map<std::string, std::string> assignments;
  Routing& routing;
};

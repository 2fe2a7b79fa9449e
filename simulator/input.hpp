#pragma once

#include "data.hpp"
#include "call.hpp"
#include "network.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct AmbulanceRecord
{
  std::string id;
  std::string base;
};

struct CallRecord
{
  std::string id;
  Time arrival;
  std::string origin;
  std::string type;
};

// Typed input of a run, shared read-only by every run built from it.
class Scenario
{
public:
  Network network;
  std::vector<AmbulanceRecord> ambulances;
  std::vector<CallRecord> calls;
  std::map<std::string, Call::Priority> priorities;

  // call types without a mapping are LOW
  Call::Priority priority_of(const std::string& type) const;
  // throws InputError on duplicate identifiers, unknown locations or invalid arrival times
  void validate() const;

  // CSV tables with a header row, `name` only appears in error messages. Columns:
  //   network: Start, End, and Cost or Travel Time (plus an optional Traffic Delay)
  //   locations: Location, Latitude, Longitude
  //   ambulances: Ambulance Number, Staging Location
  //   calls: Call ID, Location, Call Type, optional Arrival Time (0 when missing)
  //   priorities: Call Type, Priority (level name or rank)
  static void source_network(std::istream& is, Network& network, const std::string& name = "network");
  static void source_locations(std::istream& is, Network& network, const std::string& name = "locations");
  static std::vector<AmbulanceRecord> source_ambulances(std::istream& is, const std::string& name = "ambulances");
  static std::vector<CallRecord> source_calls(std::istream& is, const std::string& name = "calls");
  static std::map<std::string, Call::Priority> source_priorities(std::istream& is, const std::string& name = "priorities");

  static Scenario load(const std::string& network_filename, const std::string& ambulances_filename, const std::string& calls_filename, const std::string& priorities_filename, const std::string& locations_filename = "");
};

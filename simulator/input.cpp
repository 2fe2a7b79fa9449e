#include "input.hpp"
#include "errors.hpp"
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/tokenizer.hpp>

namespace {

// Rows of a CSV table addressed by header name (case insensitive).
class CsvTable
{
public:
  CsvTable(std::istream& is, const std::string& name) : name(name), is(is), line_(0)
  {
    if (!next())
      throw InputError(name, 1, "missing header");
    header = row;
    for (auto& h : header)
      boost::to_lower(h);
  }

  std::optional<size_t> column(std::initializer_list<std::string> names) const
  {
    for (const auto& n : names) {
      for (size_t i = 0; i < header.size(); i++) {
        if (header[i] == boost::to_lower_copy(n))
          return i;
      }
    }
    return std::nullopt;
  }

  size_t required(std::initializer_list<std::string> names) const
  {
    auto c = column(names);
    if (!c)
      throw InputError(name, 1, "missing column " + *names.begin());
    return *c;
  }

  // skips blank lines, false at the end of the table
  bool next()
  {
    std::string tmp;
    while (std::getline(is, tmp)) {
      line_++;
      // UTF-8 byte order mark
      if (line_ == 1 && tmp.compare(0, 3, "\xEF\xBB\xBF") == 0)
        tmp.erase(0, 3);
      boost::trim(tmp);
      if (tmp.empty())
        continue;
      row.clear();
      try {
        boost::tokenizer<boost::escaped_list_separator<char>> tokens(tmp, boost::escaped_list_separator<char>('\\', ',', '"'));
        for (auto t : tokens) {
          boost::trim(t);
          row.push_back(t);
        }
      } catch (boost::escaped_list_error& ex) {
        throw InputError(name, line_, std::string("malformed row (") + ex.what() + ")");
      }
      return true;
    }
    return false;
  }

  const std::string& operator[](size_t i) const
  {
    if (i >= row.size())
      throw InputError(name, line_, "missing value for column " + header[i]);
    return row[i];
  }

  const std::string& value(size_t i) const
  {
    const std::string& v = (*this)[i];
    if (v.empty())
      throw InputError(name, line_, "empty value for column " + header[i]);
    return v;
  }

  Time number(size_t i) const
  {
    const std::string& v = value(i);
    size_t pos = 0;
    Time result = 0.0;
    try {
      result = std::stod(v, &pos);
    } catch (std::exception&) {
      pos = 0;
    }
    if (pos != v.size() || !std::isfinite(result))
      throw InputError(name, line_, "invalid number (" + v + ") for column " + header[i]);
    return result;
  }

  size_t line() const {
    return line_;
  }

  std::string name;
protected:
  std::istream& is;
  std::vector<std::string> header, row;
  size_t line_;
};

std::ifstream open_table(const std::string& filename, const std::string& what)
{
  std::ifstream is(filename);
  if (!is)
    throw InputError("Could not open " + what + " file " + filename);
  return is;
}

}

void Scenario::source_network(std::istream& is, Network& network, const std::string& name)
{
  CsvTable table(is, name);
  size_t start = table.required({ "Start", "From" }), end = table.required({ "End", "To" });
  auto cost = table.column({ "Cost" }), travel_time = table.column({ "Travel Time" }), traffic_delay = table.column({ "Traffic Delay" });
  if (!cost && !travel_time)
    throw InputError(name, 1, "missing column Cost or Travel Time");
  while (table.next()) {
    const std::string& from = table.value(start);
    const std::string& to = table.value(end);
    Time c = cost ? table.number(*cost) : table.number(*travel_time);
    if (!cost && traffic_delay)
      c += table.number(*traffic_delay);
    try {
      if (!network.has_location(from))
        network.add_location(Location{ from, std::nullopt });
      if (!network.has_location(to))
        network.add_location(Location{ to, std::nullopt });
      network.add_edge(from, to, c);
    } catch (InputError& ex) {
      throw InputError(name, table.line(), ex.what());
    }
  }
}

void Scenario::source_locations(std::istream& is, Network& network, const std::string& name)
{
  CsvTable table(is, name);
  size_t id = table.required({ "Location", "Id" }), lat = table.required({ "Latitude", "Lat" }), lon = table.required({ "Longitude", "Lon" });
  while (table.next())
    network.place(table.value(id), Coordinate{ table.number(lat), table.number(lon) });
}

std::vector<AmbulanceRecord> Scenario::source_ambulances(std::istream& is, const std::string& name)
{
  std::vector<AmbulanceRecord> result;
  std::set<std::string> seen;
  CsvTable table(is, name);
  size_t id = table.required({ "Ambulance Number", "Ambulance", "Id" }), base = table.required({ "Staging Location", "Base" });
  while (table.next()) {
    AmbulanceRecord a{ table.value(id), table.value(base) };
    if (!seen.insert(a.id).second)
      throw InputError(name, table.line(), "duplicate ambulance " + a.id);
    result.push_back(a);
  }
#ifdef LOGGING
  spdlog::debug("Read {} ambulances", result.size());
#endif
  return result;
}

std::vector<CallRecord> Scenario::source_calls(std::istream& is, const std::string& name)
{
  std::vector<CallRecord> result;
  std::set<std::string> seen;
  CsvTable table(is, name);
  size_t id = table.required({ "Call ID", "Call" }), origin = table.required({ "Location" }), type = table.required({ "Call Type", "Type" });
  auto arrival = table.column({ "Arrival Time", "Arrival" });
  while (table.next()) {
    CallRecord c{ table.value(id), arrival ? table.number(*arrival) : 0.0, table.value(origin), table.value(type) };
    if (c.arrival < 0.0)
      throw InputError(name, table.line(), "negative arrival time for call " + c.id);
    if (!seen.insert(c.id).second)
      throw InputError(name, table.line(), "duplicate call " + c.id);
    result.push_back(c);
  }
#ifdef LOGGING
  spdlog::debug("Read {} calls", result.size());
#endif
  return result;
}

std::map<std::string, Call::Priority> Scenario::source_priorities(std::istream& is, const std::string& name)
{
  std::map<std::string, Call::Priority> result;
  CsvTable table(is, name);
  size_t type = table.required({ "Call Type", "Type" }), priority = table.required({ "Priority" });
  while (table.next()) {
    Call::Priority p;
    try {
      p = parse_priority(table.value(priority));
    } catch (std::invalid_argument& ex) {
      throw InputError(name, table.line(), ex.what());
    }
    if (!result.emplace(table.value(type), p).second)
      throw InputError(name, table.line(), "duplicate call type " + table.value(type));
  }
  return result;
}

Scenario Scenario::load(const std::string& network_filename, const std::string& ambulances_filename, const std::string& calls_filename, const std::string& priorities_filename, const std::string& locations_filename)
{
  Scenario s;
  {
    auto is = open_table(network_filename, "network");
    source_network(is, s.network, network_filename);
  }
  if (!locations_filename.empty()) {
    auto is = open_table(locations_filename, "locations");
    source_locations(is, s.network, locations_filename);
  }
  {
    auto is = open_table(ambulances_filename, "ambulances");
    s.ambulances = source_ambulances(is, ambulances_filename);
  }
  {
    auto is = open_table(calls_filename, "calls");
    s.calls = source_calls(is, calls_filename);
  }
  {
    auto is = open_table(priorities_filename, "priorities");
    s.priorities = source_priorities(is, priorities_filename);
  }
  s.validate();
  spdlog::info("Loaded {} calls, {} ambulances and {} locations ({} routes)", s.calls.size(), s.ambulances.size(), s.network.size(), s.network.edge_count());
  return s;
}

Call::Priority Scenario::priority_of(const std::string& type) const
{
  auto it = priorities.find(type);
  if (it != priorities.end())
    return it->second;
  spdlog::warn("Call type {} has no priority, using {}", type, std::to_string(Call::Priority::LOW));
  return Call::Priority::LOW;
}

void Scenario::validate() const
{
  std::set<std::string> seen;
  for (const auto& a : ambulances) {
    if (a.id.empty())
      throw InputError("Ambulance with empty identifier");
    if (!seen.insert(a.id).second)
      throw InputError("Duplicate ambulance " + a.id);
    if (!network.has_location(a.base))
      throw InputError("Ambulance " + a.id + " is based at unknown location " + a.base);
  }
  seen.clear();
  for (const auto& c : calls) {
    if (c.id.empty())
      throw InputError("Call with empty identifier");
    if (!seen.insert(c.id).second)
      throw InputError("Duplicate call " + c.id);
    if (!network.has_location(c.origin))
      throw InputError("Call " + c.id + " comes from unknown location " + c.origin);
    if (!std::isfinite(c.arrival) || c.arrival < 0.0)
      throw InputError("Call " + c.id + " has invalid arrival time " + std::to_string(c.arrival));
  }
}

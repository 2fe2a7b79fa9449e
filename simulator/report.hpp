#pragma once

#include "data.hpp"
#include "call.hpp"
#include "simulation.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct ResponseStats
{
  size_t count = 0;
  Time mean = 0.0, median = 0.0, p90 = 0.0, max = 0.0;
};

// Metrics of a finished run, rebuilt from its event log.
class RunReport
{
public:
  RunReport(const Simulation& s, std::string name);

  // arrival to on scene, for the calls that were reached
  const std::map<std::string, Time>& response_times() const {
    return response_times_;
  }
  // busy time over total run time, per ambulance
  const std::map<std::string, double>& utilization() const {
    return utilization_;
  }
  size_t abandoned() const {
    return abandoned_;
  }
  size_t completed() const {
    return completed_;
  }
  ResponseStats response_stats() const;
  ResponseStats response_stats(Call::Priority p) const;

  void print(std::ostream& os) const;
  // one row per assignment: Call ID, Call Type, Call Location, Selected Ambulance, Time to Call Location
  void write_dispatch_log(std::ostream& os) const;

  static ResponseStats summarize(std::vector<Time> values);

  const std::string name;
  const Simulation& simulation;
protected:
  std::map<std::string, Time> response_times_;
  std::map<std::string, double> utilization_;
  size_t abandoned_, completed_;
};

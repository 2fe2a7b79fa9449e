#pragma once

#define LOGGING 1

#include "spdlog/spdlog.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <limits>
#include <string>

namespace pt = boost::posix_time;

// simulated time, expressed in the unit of the network costs (minutes)
typedef double Time;

const Time NEVER = std::numeric_limits<Time>::infinity();

extern bool colored;

struct config
{
  // only used to render simulated timestamps in the log
  pt::ptime start_time;
  std::string policy = "nearest";
  std::string routing = "auto";
  size_t precompute_limit = 400;
  unsigned long seed = 42;
  // calls still pending after max_wait are abandoned (disabled when infinite)
  Time max_wait = NEVER;
  Time turnout_time = 0.0;
  Time service_time = 20.0;
  double service_time_extra_mean = 0.0;
  // priority-weighted reservation
  size_t reserved_units = 1;
  std::string reserved_priority = "high";
};

namespace std {

// [start time + t] when a start time is configured, [t=...] otherwise
std::string to_string(const pt::ptime& start_time, Time t);

}

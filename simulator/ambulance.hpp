#pragma once

#include "data.hpp"
#include <iostream>
#include <string>

class FleetRegistry;

class Ambulance {
  friend class FleetRegistry;
public:
  Ambulance(std::string id, std::string base) : id(id), base(base), location(base), index(0), current_state(IDLE), busy_time(0.0), busy_since(NEVER) {}
  enum State
  {
    IDLE,
    DISPATCHED,
    EN_ROUTE,
    ON_SCENE,
    RETURNING
  };
  std::string id;
  std::string base;
  std::string location;
  size_t index;
  State current_state;
  // empty unless serving a call
  std::string current_call;
  // total time spent outside IDLE, up to the last transition
  Time busy_time;

  inline bool idle() const {
    return current_state == IDLE;
  }
  // busy time including the ongoing service, if any
  Time busy_until(Time now) const {
    return idle() ? busy_time : busy_time + (now - busy_since);
  }
protected:
  Time busy_since;
  // Idle -> Dispatched -> EnRoute -> OnScene -> Returning -> Idle, nothing else
  void transition(State to, Time now);
};

namespace std {
string to_string(Ambulance::State s);
}

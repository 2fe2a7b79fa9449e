#pragma once

#include "data.hpp"
#include <iostream>
#include <optional>
#include <string>

class Call
{
  friend class Dispatcher;
public:
  enum Priority
  {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW
  };
  enum State
  {
    PENDING,
    ASSIGNED,
    EN_ROUTE,
    ON_SCENE,
    COMPLETED,
    ABANDONED
  };
  Call(std::string id, std::string type, Time arrival, std::string origin, Priority priority) : id(id), type(type), origin(origin), priority(priority), arrival(arrival), sequence(0), service_duration(0.0), travel_time(NEVER), assigned_time(NEVER), on_scene_time(NEVER), completed_time(NEVER), abandoned_time(NEVER), current_state(PENDING) {}
  std::string id;
  std::string type;
  std::string origin;
  Priority priority;
  Time arrival;
  // creation order, last tie-break in the call queue
  size_t sequence;
  Time service_duration;
  Time travel_time;
  Time assigned_time, on_scene_time, completed_time, abandoned_time;
  State current_state;
  std::string ambulance;

  inline bool pending() const {
    return current_state == PENDING;
  }
  inline bool terminal() const {
    return current_state == COMPLETED || current_state == ABANDONED;
  }
  // arrival to on scene, only once the call has been reached
  std::optional<Time> response_time() const;
  // throws InvalidTransition unless `to` directly follows the current state
  void transition(State to, Time now);
};

std::ostream& operator<<(std::ostream &os, const Call::Priority& p);
std::istream& operator>>(std::istream &is, Call::Priority& p);

// a level name (critical, high, medium, low) or a rank (1 = critical, 4 and above = low)
Call::Priority parse_priority(const std::string& value);

namespace std {
string to_string(Call::State s);
string to_string(Call::Priority p);
}

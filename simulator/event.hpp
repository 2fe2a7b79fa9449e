#pragma once

#include "data.hpp"
#include <iostream>
#include <string>
#include <vector>

struct Event
{
  enum Kind
  {
    CALL_ARRIVAL,
    DISPATCH_ATTEMPT,
    ASSIGNMENT_MADE,
    POLICY_REJECTION,
    DEPARTURE_COMPLETE,
    ARRIVAL_ON_SCENE,
    SERVICE_COMPLETE,
    RETURN_COMPLETE,
    ABANDON_CHECK,
    ABANDONED
  };
  size_t sequence;
  Kind kind;
  Time time;
  // empty when the event has no such subject
  std::string call;
  std::string ambulance;
  std::string detail;
};

// Append-only record of the state transitions of one run, in processing order.
class EventLog
{
public:
  const Event& append(Event::Kind kind, Time time, std::string call = "", std::string ambulance = "", std::string detail = "");
  const std::vector<Event>& events() const {
    return events_;
  }
  size_t size() const {
    return events_.size();
  }
  size_t count(Event::Kind kind) const;
  std::vector<Event> of_call(const std::string& call) const;
  std::vector<Event>::const_iterator begin() const {
    return events_.begin();
  }
  std::vector<Event>::const_iterator end() const {
    return events_.end();
  }
  void write_csv(std::ostream& os) const;
protected:
  std::vector<Event> events_;
};

std::ostream& operator<<(std::ostream &os, const Event::Kind& k);

namespace std {
string to_string(Event::Kind k);
}

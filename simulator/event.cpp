#include "event.hpp"
#include "spdlog/fmt/fmt.h"
#include <algorithm>
#include <iterator>
#include <sstream>

const Event& EventLog::append(Event::Kind kind, Time time, std::string call, std::string ambulance, std::string detail)
{
  events_.push_back(Event{ events_.size(), kind, time, std::move(call), std::move(ambulance), std::move(detail) });
  return events_.back();
}

size_t EventLog::count(Event::Kind kind) const
{
  return std::count_if(events_.begin(), events_.end(), [kind](const Event& e) { return e.kind == kind; });
}

std::vector<Event> EventLog::of_call(const std::string& call) const
{
  std::vector<Event> result;
  std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), [&call](const Event& e) { return e.call == call; });
  return result;
}

static std::string csv_field(const std::string& value)
{
  if (value.find_first_of(",\"\n") == std::string::npos)
    return value;
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  return quoted + "\"";
}

void EventLog::write_csv(std::ostream& os) const
{
  os << "sequence,kind,time,call,ambulance,detail\n";
  for (const auto& e : events_)
    os << fmt::format("{},{},{},{},{},{}\n", e.sequence, std::to_string(e.kind), e.time, csv_field(e.call), csv_field(e.ambulance), csv_field(e.detail));
}

std::ostream& operator<<(std::ostream &os, const Event::Kind& k) {
  switch (k) {
    case Event::CALL_ARRIVAL:
      os << "CallArrival";
      break;
    case Event::DISPATCH_ATTEMPT:
      os << "DispatchAttempt";
      break;
    case Event::ASSIGNMENT_MADE:
      os << "AssignmentMade";
      break;
    case Event::POLICY_REJECTION:
      os << "PolicyRejection";
      break;
    case Event::DEPARTURE_COMPLETE:
      os << "DepartureComplete";
      break;
    case Event::ARRIVAL_ON_SCENE:
      os << "ArrivalOnScene";
      break;
    case Event::SERVICE_COMPLETE:
      os << "ServiceComplete";
      break;
    case Event::RETURN_COMPLETE:
      os << "ReturnComplete";
      break;
    case Event::ABANDON_CHECK:
      os << "AbandonCheck";
      break;
    case Event::ABANDONED:
      os << "Abandoned";
      break;
  }
  return os;
}

std::string std::to_string(Event::Kind k) {
  std::ostringstream oss;
  oss << k;
  return oss.str();
}

#include "call.hpp"
#include "errors.hpp"
#include <boost/algorithm/string.hpp>
#include <sstream>

std::istream &operator>>(std::istream &is, Call::Priority &p)
{
  std::string tmp;
  is >> tmp;
  p = parse_priority(tmp);
  return is;
}

Call::Priority parse_priority(const std::string& value)
{
  std::string tmp = boost::to_lower_copy(boost::trim_copy(value));
  if (tmp == "critical")
    return Call::Priority::CRITICAL;
  else if (tmp == "high")
    return Call::Priority::HIGH;
  else if (tmp == "medium")
    return Call::Priority::MEDIUM;
  else if (tmp == "low")
    return Call::Priority::LOW;
  size_t pos = 0;
  long rank = 0;
  try {
    rank = std::stol(tmp, &pos);
  } catch (std::exception&) {
    pos = 0;
  }
  if (tmp.empty() || pos != tmp.size() || rank < 1)
    throw std::invalid_argument("Priority (" + value + ") not recognized");
  if (rank >= 4)
    return Call::Priority::LOW;
  return Call::Priority(rank - 1);
}

std::ostream& operator<<(std::ostream &os, const Call::Priority& p) {
  switch (p) {
    case Call::Priority::CRITICAL:
      os << "CRITICAL";
      break;
    case Call::Priority::HIGH:
      os << "HIGH";
      break;
    case Call::Priority::MEDIUM:
      os << "MEDIUM";
      break;
    case Call::Priority::LOW:
      os << "LOW";
      break;
  }
  return os;
}

std::optional<Time> Call::response_time() const
{
  if (on_scene_time == NEVER)
    return std::nullopt;
  return on_scene_time - arrival;
}

void Call::transition(State to, Time now)
{
  bool allowed = false;
  switch (to) {
    case ASSIGNED:
    case ABANDONED:
      allowed = current_state == PENDING;
      break;
    case EN_ROUTE:
      allowed = current_state == ASSIGNED;
      break;
    case ON_SCENE:
      allowed = current_state == EN_ROUTE;
      break;
    case COMPLETED:
      allowed = current_state == ON_SCENE;
      break;
    case PENDING:
      break;
  }
  if (!allowed)
    throw InvalidTransition("Call " + id + " cannot go from " + std::to_string(current_state) + " to " + std::to_string(to));
  current_state = to;
  switch (to) {
    case ASSIGNED:
      assigned_time = now;
      break;
    case ON_SCENE:
      on_scene_time = now;
      break;
    case COMPLETED:
      completed_time = now;
      break;
    case ABANDONED:
      abandoned_time = now;
      break;
    default:
      break;
  }
}

std::string std::to_string(Call::State s) {
  switch (s) {
    case Call::PENDING: return "PENDING";
    case Call::ASSIGNED: return "ASSIGNED";
    case Call::EN_ROUTE: return "EN_ROUTE";
    case Call::ON_SCENE: return "ON_SCENE";
    case Call::COMPLETED: return "COMPLETED";
    case Call::ABANDONED: return "ABANDONED";
  }
  return "ERROR: NO STATE";
}

std::string std::to_string(Call::Priority p) {
  std::ostringstream oss;
  oss << p;
  return oss.str();
}

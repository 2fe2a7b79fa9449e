#include "ambulance.hpp"
#include "errors.hpp"

void Ambulance::transition(State to, Time now)
{
  State expected;
  switch (to) {
    case DISPATCHED:
      expected = IDLE;
      break;
    case EN_ROUTE:
      expected = DISPATCHED;
      break;
    case ON_SCENE:
      expected = EN_ROUTE;
      break;
    case RETURNING:
      expected = ON_SCENE;
      break;
    case IDLE:
    default:
      expected = RETURNING;
      break;
  }
  if (current_state != expected)
    throw InvalidTransition("Ambulance " + id + " cannot go from " + std::to_string(current_state) + " to " + std::to_string(to));
  if (to == DISPATCHED)
    busy_since = now;
  else if (to == IDLE) {
    busy_time += now - busy_since;
    busy_since = NEVER;
  }
  current_state = to;
}

std::string std::to_string(Ambulance::State s) {
  switch (s) {
    case Ambulance::IDLE: return "IDLE";
    case Ambulance::DISPATCHED: return "DISPATCHED";
    case Ambulance::EN_ROUTE: return "EN_ROUTE";
    case Ambulance::ON_SCENE: return "ON_SCENE";
    case Ambulance::RETURNING: return "RETURNING";
    default:
      return "ERROR: NO STATE";
  }
}

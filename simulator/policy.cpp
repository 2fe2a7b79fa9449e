#include "policy.hpp"
#include <stdexcept>

std::optional<std::string> NearestAvailable::select(const Call& c, const FleetSnapshot& fleet) const
{
  if (fleet.candidates.empty())
    return std::nullopt;
  return fleet.candidates.front().first->id;
}

std::optional<std::string> PriorityReservation::select(const Call& c, const FleetSnapshot& fleet) const
{
  if (int(c.priority) <= int(reserved_priority))
    return nearest.select(c, fleet);
  if (fleet.idle > reserved_units || fleet.reservation_eligible_pending == 0)
    return nearest.select(c, fleet);
  return std::nullopt;
}

std::unique_ptr<DispatchPolicy> make_policy(const config& conf)
{
  if (conf.policy == "nearest")
    return std::make_unique<NearestAvailable>();
  else if (conf.policy == "reservation")
    return std::make_unique<PriorityReservation>(conf.reserved_units, parse_priority(conf.reserved_priority));
  else
    throw std::invalid_argument("Dispatch policy (" + conf.policy + ") not recognized");
}

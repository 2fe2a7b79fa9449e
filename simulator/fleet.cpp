#include "fleet.hpp"
#include "errors.hpp"
#include <cmath>
#include "range/v3/view/filter.hpp"
#include "range/v3/view/zip.hpp"
#include "range/v3/view/transform.hpp"
#include "range/v3/range/conversion.hpp"
#include "range/v3/action/sort.hpp"
#include "range/v3/algorithm/count_if.hpp"

using namespace ranges;

std::shared_ptr<Ambulance> FleetRegistry::register_ambulance(const std::string& id, const std::string& base)
{
  if (id.empty())
    throw InputError("Empty ambulance identifier");
  if (contains(id))
    throw InputError("Duplicate ambulance " + id);
  if (!routing.has_location(base))
    throw UnknownLocation(base);
  auto a = std::make_shared<Ambulance>(id, base);
  a->index = ambulances_.size();
  index_[id] = a->index;
  ambulances_.push_back(a);
  return a;
}

FleetRegistry::Candidates FleetRegistry::available_near(const std::string& location) const
{
  auto idle = ambulances_ | views::filter([](const auto& a) { return a->idle(); }) | to<std::vector>();
  if (idle.size() == 0)
    return {};
  std::vector<Routing::Segment> result = routing.compute_distances(idle | views::transform([](const auto& a) { return a->location; }) | to<std::vector>(), location);
  return views::zip(idle, result) | views::filter([](const auto& p) { return !std::isinf(p.second.duration); }) | to<Candidates>() | actions::sort([](const auto& p1, const auto& p2) { return p1.second.duration < p2.second.duration || (p1.second.duration == p2.second.duration && p1.first->id < p2.first->id); });
}

void FleetRegistry::mark_dispatched(const std::string& ambulance, const std::string& call, Time now)
{
  auto a = find(ambulance);
  auto it = assignments.find(call);
  if (it != assignments.end())
    throw InvalidTransition("Call " + call + " is already served by ambulance " + it->second);
  a->transition(Ambulance::DISPATCHED, now);
  a->current_call = call;
  assignments[call] = ambulance;
}

void FleetRegistry::mark_en_route(const std::string& ambulance, Time now)
{
  find(ambulance)->transition(Ambulance::EN_ROUTE, now);
}

void FleetRegistry::mark_on_scene(const std::string& ambulance, const std::string& location, Time now)
{
  auto a = find(ambulance);
  a->transition(Ambulance::ON_SCENE, now);
  a->location = location;
}

void FleetRegistry::mark_returning(const std::string& ambulance, Time now)
{
  auto a = find(ambulance);
  a->transition(Ambulance::RETURNING, now);
  assignments.erase(a->current_call);
  a->current_call.clear();
}

void FleetRegistry::mark_returned(const std::string& ambulance, const std::string& location, Time now)
{
  auto a = find(ambulance);
  a->transition(Ambulance::IDLE, now);
  a->location = location;
}

std::shared_ptr<Ambulance> FleetRegistry::find(const std::string& id) const
{
  auto it = index_.find(id);
  if (it == index_.end())
    throw UnknownAmbulance(id);
  return ambulances_[it->second];
}

std::string FleetRegistry::serving(const std::string& call) const
{
  auto it = assignments.find(call);
  return it == assignments.end() ? std::string() : it->second;
}

size_t FleetRegistry::idle_count() const
{
  return count_if(ambulances_, [](const auto& a) { return a->idle(); });
}

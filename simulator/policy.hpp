#pragma once

#include "data.hpp"
#include "call.hpp"
#include "fleet.hpp"
#include <memory>
#include <optional>
#include <string>

// What a policy gets to see about the fleet when deciding for one call.
struct FleetSnapshot
{
  // idle ambulances reaching the call's origin, nearest first, ties by identifier
  FleetRegistry::Candidates candidates;
  size_t idle;
  // queued calls eligible for reserved units, the evaluated call excluded
  size_t reservation_eligible_pending;
};

// Decides which idle ambulance answers a call; std::nullopt defers the call
// to the next dispatch round. Implementations hold configuration only.
class DispatchPolicy
{
public:
  virtual ~DispatchPolicy() = default;
  virtual std::optional<std::string> select(const Call& c, const FleetSnapshot& fleet) const = 0;
  virtual std::string name() const = 0;
};

class NearestAvailable : public DispatchPolicy
{
public:
  std::optional<std::string> select(const Call& c, const FleetSnapshot& fleet) const override;
  std::string name() const override {
    return "nearest";
  }
};

// Keeps reserved_units idle ambulances for calls at reserved_priority or more
// urgent. Less urgent calls only get a unit while more than reserved_units are
// idle, or once no eligible call is waiting.
class PriorityReservation : public DispatchPolicy
{
public:
  PriorityReservation(size_t reserved_units, Call::Priority reserved_priority) : reserved_units(reserved_units), reserved_priority(reserved_priority) {}
  std::optional<std::string> select(const Call& c, const FleetSnapshot& fleet) const override;
  std::string name() const override {
    return "reservation";
  }
  const size_t reserved_units;
  const Call::Priority reserved_priority;
protected:
  NearestAvailable nearest;
};

// policy named by conf.policy (nearest, reservation)
std::unique_ptr<DispatchPolicy> make_policy(const config& conf);

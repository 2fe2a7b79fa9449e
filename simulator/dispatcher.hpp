#pragma once

#include "helpers.hpp"
#include "call_queue.hpp"
#include "event.hpp"
#include "fleet.hpp"
#include "policy.hpp"
#include "routing.hpp"
#include "simcpp20/simcpp20.hpp"
#include <exception>
#include <memory>

// Matches queued calls to ambulances and drives their service. The simulation
// processes it spawns record every state transition into the event log.
class Dispatcher
{
public:
  Dispatcher(simcpp20::simulation<Time>& sim, const config& conf, Routing& routing, FleetRegistry& fleet, CallQueue& queue, EventLog& log, const DispatchPolicy& policy) : sim(sim), conf(conf), routing(routing), fleet(fleet), queue(queue), log(log), policy(policy), reserved_priority(parse_priority(conf.reserved_priority)), round_requested(false) {}
  // waits for the arrival of the call, then queues it
  simcpp20::event<Time> new_call(std::shared_ptr<Call> c);
  // a dispatch round at the current time, after the events already due
  void request_round();
  // rethrows the first fatal error raised by a simulation process
  void check() const;
protected:
  simcpp20::event<Time> dispatch_round();
  bool dispatch(std::shared_ptr<Call> c);
  FleetSnapshot snapshot(const Call& c) const;
  simcpp20::event<Time> rescue(std::shared_ptr<Ambulance> a, std::shared_ptr<Call> c, Routing::Segment s);
  simcpp20::event<Time> abandon_check(std::shared_ptr<Call> c);
  void fail(std::exception_ptr ex);
  simcpp20::simulation<Time>& sim;
  const config& conf;
  Routing& routing;
  FleetRegistry& fleet;
  CallQueue& queue;
  EventLog& log;
  const DispatchPolicy& policy;
  // calls this urgent count as waiting for reserved units
  const Call::Priority reserved_priority;
  bool round_requested;
  std::exception_ptr failure;
};

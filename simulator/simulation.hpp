#pragma once

#include "data.hpp"
#include "input.hpp"
#include "routing.hpp"
#include "fleet.hpp"
#include "call_queue.hpp"
#include "event.hpp"
#include "policy.hpp"
#include "dispatcher.hpp"
#include "simcpp20/simcpp20.hpp"
#include <memory>
#include <random>
#include <stop_token>
#include <vector>

// One run: clock, fleet, queue, routing cache and event log, none of them
// shared with other runs. Only the scenario is shared, read-only.
class Simulation
{
public:
  // throws InputError if the scenario cannot be simulated
  Simulation(const Scenario& scenario, config conf) : Simulation(scenario, conf, make_policy(conf)) {}
  Simulation(const Scenario& scenario, config conf, std::unique_ptr<DispatchPolicy> policy);
  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // processes events until none is left or a stop is requested; fatal errors
  // raised by the simulation processes are rethrown here
  void run(std::stop_token stop = {});

  // every call ended Completed or Abandoned
  bool complete() const;
  bool truncated() const {
    return truncated_;
  }
  Time now() const {
    return sim.now();
  }
  // time of the last processed event
  Time end_time() const {
    return end_time_;
  }
  // busy time over total run time, 0 on an empty run
  double utilization(const std::string& ambulance) const;
  size_t abandoned() const;

  const config& configuration() const {
    return conf;
  }
  const DispatchPolicy& policy() const {
    return *policy_;
  }
  const Routing& routing() const {
    return routing_;
  }
  const FleetRegistry& fleet() const {
    return fleet_;
  }
  const CallQueue& queue() const {
    return queue_;
  }
  const EventLog& events() const {
    return log;
  }
  // in creation order, i.e., by arrival time
  const std::vector<std::shared_ptr<Call>>& calls() const {
    return calls_;
  }
  std::shared_ptr<Call> call(const std::string& id) const;
protected:
  void check_reachability();
  config conf;
  const Scenario& scenario;
  simcpp20::simulation<Time> sim;
  Routing routing_;
  FleetRegistry fleet_;
  CallQueue queue_;
  EventLog log;
  std::unique_ptr<DispatchPolicy> policy_;
  Dispatcher dispatcher;
  std::mt19937 gen;
  std::vector<std::shared_ptr<Call>> calls_;
  std::map<std::string, size_t> call_index;
  Time end_time_;
  bool started, truncated_;
};

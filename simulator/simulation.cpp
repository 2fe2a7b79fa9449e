#include "simulation.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <cmath>
#include <set>

Simulation::Simulation(const Scenario& scenario, config conf, std::unique_ptr<DispatchPolicy> policy) : conf(conf), scenario(scenario), routing_(scenario.network, Routing::parse_strategy(conf.routing), conf.precompute_limit), fleet_(routing_), policy_(std::move(policy)), dispatcher(sim, this->conf, routing_, fleet_, queue_, log, *policy_), gen(conf.seed), end_time_(0.0), started(false), truncated_(false)
{
  scenario.validate();
  if (conf.service_time < 0.0 || conf.turnout_time < 0.0 || conf.service_time_extra_mean < 0.0 || conf.max_wait < 0.0)
    throw std::invalid_argument("Negative durations in the simulation configuration");
  for (const auto& a : scenario.ambulances)
    fleet_.register_ambulance(a.id, a.base);
  check_reachability();

  // creation order is arrival order, ties kept in input order
  std::vector<const CallRecord*> records;
  for (const auto& r : scenario.calls)
    records.push_back(&r);
  std::stable_sort(records.begin(), records.end(), [](const auto* r1, const auto* r2) { return r1->arrival < r2->arrival; });
  std::exponential_distribution<> extra_service_time(conf.service_time_extra_mean > 0.0 ? 1.0 / conf.service_time_extra_mean : 1.0);
  for (const auto* r : records) {
    auto c = std::make_shared<Call>(r->id, r->type, r->arrival, r->origin, scenario.priority_of(r->type));
    c->sequence = calls_.size();
    c->service_duration = conf.service_time;
    if (conf.service_time_extra_mean > 0.0)
      c->service_duration += extra_service_time(gen);
    call_index[c->id] = calls_.size();
    calls_.push_back(c);
  }
}

void Simulation::check_reachability()
{
  std::set<std::string> origins;
  for (const auto& r : scenario.calls)
    origins.insert(r.origin);
  for (const auto& o : origins) {
    bool reachable = std::any_of(fleet_.ambulances().begin(), fleet_.ambulances().end(), [this, &o](const auto& a) { return !std::isinf(routing_.travel_time(a->base, o)); });
    if (!reachable)
      throw InputError("No ambulance can reach location " + o + " from its base");
  }
}

void Simulation::run(std::stop_token stop)
{
  if (started)
    throw std::logic_error("Simulation already run");
  started = true;
#ifdef LOGGING
  spdlog::info("[{}] Simulation started ({} policy, {} routing, seed {})", std::to_string(conf.start_time, sim.now()), policy_->name(), std::to_string(routing_.strategy()), conf.seed);
#endif
  for (const auto& c : calls_)
    dispatcher.new_call(c);
  while (!sim.empty()) {
    if (stop.stop_requested()) {
      truncated_ = true;
      spdlog::warn("[{}] Simulation stopped, {} calls still queued", std::to_string(conf.start_time, sim.now()), queue_.size());
      break;
    }
    sim.step();
    end_time_ = sim.now();
    dispatcher.check();
  }
  if (!truncated_ && !complete()) {
    for (const auto& c : calls_) {
      if (!c->terminal())
        spdlog::error("[{}] Call {} ended the simulation {}", std::to_string(conf.start_time, sim.now()), *c, std::to_string(c->current_state));
    }
  }
#ifdef LOGGING
  spdlog::info("[{}] Simulation ended, {} events", std::to_string(conf.start_time, sim.now()), log.size());
#endif
}

bool Simulation::complete() const
{
  return std::all_of(calls_.begin(), calls_.end(), [](const auto& c) { return c->terminal(); });
}

double Simulation::utilization(const std::string& ambulance) const
{
  auto a = fleet_.find(ambulance);
  if (end_time_ <= 0.0)
    return 0.0;
  return a->busy_until(end_time_) / end_time_;
}

size_t Simulation::abandoned() const
{
  return std::count_if(calls_.begin(), calls_.end(), [](const auto& c) { return c->current_state == Call::ABANDONED; });
}

std::shared_ptr<Call> Simulation::call(const std::string& id) const
{
  auto it = call_index.find(id);
  if (it == call_index.end())
    throw UnknownCall(id);
  return calls_[it->second];
}

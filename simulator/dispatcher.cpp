#include "data.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <vector>
#include "units.h"

simcpp20::event<Time> Dispatcher::new_call(std::shared_ptr<Call> c) {
  try {
    co_await sim.timeout(c->arrival - sim.now());
    log.append(Event::CALL_ARRIVAL, sim.now(), c->id, "", std::to_string(c->priority) + " at " + c->origin);
#ifdef LOGGING
    spdlog::info("[{}] Call {} received", std::to_string(conf.start_time, sim.now()), *c);
#endif
    queue.enqueue(c);
    if (!std::isinf(conf.max_wait))
      abandon_check(c);
    request_round();
  } catch (std::exception&) {
    fail(std::current_exception());
  }
}

void Dispatcher::request_round() {
  if (round_requested)
    return;
  round_requested = true;
  dispatch_round();
}

simcpp20::event<Time> Dispatcher::dispatch_round() {
  co_await sim.timeout(0); // just to be sure that is done when everything else at the same timepoint has been executed
  round_requested = false;
  try {
    // assignments shrink the queue, walk a copy of it
    std::vector<std::shared_ptr<Call>> waiting(queue.begin(), queue.end());
    size_t served = 0;
    for (const auto& c : waiting) {
      if (fleet.idle_count() == 0)
        break;
      if (dispatch(c))
        served++;
    }
#ifdef LOGGING
    spdlog::debug("[{}] Dispatch round served {} of {} waiting calls, {} ambulances idle", std::to_string(conf.start_time, sim.now()), served, waiting.size(), fleet.idle_count());
#endif
  } catch (std::exception&) {
    fail(std::current_exception());
  }
}

FleetSnapshot Dispatcher::snapshot(const Call& c) const {
  size_t eligible = queue.count_at_least(reserved_priority);
  if (int(c.priority) <= int(reserved_priority) && queue.contains(c.id))
    eligible--;
  return FleetSnapshot{ fleet.available_near(c.origin), fleet.idle_count(), eligible };
}

bool Dispatcher::dispatch(std::shared_ptr<Call> c) {
  FleetSnapshot available = snapshot(*c);
  log.append(Event::DISPATCH_ATTEMPT, sim.now(), c->id, "", std::to_string(available.candidates.size()) + " of " + std::to_string(available.idle) + " idle in reach");
  auto selected = policy.select(*c, available);
  if (!selected) {
#ifdef LOGGING
    spdlog::debug("[{}] Call {} deferred by policy {}", std::to_string(conf.start_time, sim.now()), *c, policy.name());
#endif
    return false;
  }
  auto it = std::find_if(available.candidates.begin(), available.candidates.end(), [&selected](const auto& p) { return p.first->id == *selected; });
  if (it == available.candidates.end()) {
    std::string reason;
    if (!fleet.contains(*selected))
      reason = "unknown ambulance";
    else if (!fleet.find(*selected)->idle())
      reason = "ambulance is " + std::to_string(fleet.find(*selected)->current_state);
    else
      reason = "ambulance cannot reach " + c->origin;
    log.append(Event::POLICY_REJECTION, sim.now(), c->id, *selected, reason);
    spdlog::warn("[{}] Policy {} selected {} for call {}: {}, call stays pending", std::to_string(conf.start_time, sim.now()), policy.name(), *selected, *c, reason);
    return false;
  }
  std::shared_ptr<Ambulance> a;
  Routing::Segment s;
  std::tie(a, s) = *it;
  fleet.mark_dispatched(a->id, c->id, sim.now());
  queue.dequeue_assigned(c->id);
  c->transition(Call::ASSIGNED, sim.now());
  c->ambulance = a->id;
  c->travel_time = s.duration;
  log.append(Event::ASSIGNMENT_MADE, sim.now(), c->id, a->id, "travel " + fmt::format("{}", s.duration));
#ifdef LOGGING
  spdlog::info("[{}] Call {} assigned to ambulance {} at {} ({})", std::to_string(conf.start_time, sim.now()), *c, *a, a->location, units::time::to_string(units::time::minute_t(s.duration)));
#endif
  rescue(a, c, s);
  return true;
}

simcpp20::event<Time> Dispatcher::rescue(std::shared_ptr<Ambulance> a, std::shared_ptr<Call> c, Routing::Segment s) {
  try {
    co_await sim.timeout(conf.turnout_time);
    fleet.mark_en_route(a->id, sim.now());
    c->transition(Call::EN_ROUTE, sim.now());
    log.append(Event::DEPARTURE_COMPLETE, sim.now(), c->id, a->id);
#ifdef LOGGING
    spdlog::info("[{}] Ambulance {} going to call {} from {}", std::to_string(conf.start_time, sim.now()), *a, *c, s.start_point);
#endif
    co_await sim.timeout(s.duration);
    fleet.mark_on_scene(a->id, c->origin, sim.now());
    c->transition(Call::ON_SCENE, sim.now());
    log.append(Event::ARRIVAL_ON_SCENE, sim.now(), c->id, a->id, "response " + fmt::format("{}", *c->response_time()));
#ifdef LOGGING
    spdlog::info("[{}] Ambulance {} reached call {} after {}", std::to_string(conf.start_time, sim.now()), *a, *c, units::time::to_string(units::time::minute_t(*c->response_time())));
#endif
    co_await sim.timeout(c->service_duration);
    c->transition(Call::COMPLETED, sim.now());
    fleet.mark_returning(a->id, sim.now());
    log.append(Event::SERVICE_COMPLETE, sim.now(), c->id, a->id);
    auto back = routing.compute_distances(a->location, a->base);
    if (std::isinf(back.duration)) {
      spdlog::warn("[{}] Ambulance {} cannot reach its base from {}, staying there", std::to_string(conf.start_time, sim.now()), *a, a->location);
      back = Routing::Segment{ a->location, a->location, 0.0 };
    }
#ifdef LOGGING
    spdlog::info("[{}] Ambulance {} finished call {}, going to {} ({})", std::to_string(conf.start_time, sim.now()), *a, *c, back.end_point, units::time::to_string(units::time::minute_t(back.duration)));
#endif
    co_await sim.timeout(back.duration);
    fleet.mark_returned(a->id, back.end_point, sim.now());
    log.append(Event::RETURN_COMPLETE, sim.now(), "", a->id, back.end_point);
#ifdef LOGGING
    spdlog::info("[{}] Ambulance {} back in service at {}", std::to_string(conf.start_time, sim.now()), *a, a->location);
#endif
    request_round();
  } catch (std::exception&) {
    fail(std::current_exception());
  }
}

simcpp20::event<Time> Dispatcher::abandon_check(std::shared_ptr<Call> c) {
  try {
    co_await sim.timeout(conf.max_wait);
    if (c->pending()) {
      // a unit freed at this very instant still gets the call
      request_round();
      co_await sim.timeout(0);
    }
    if (c->terminal())
      co_return;
    log.append(Event::ABANDON_CHECK, sim.now(), c->id, "", std::to_string(c->current_state));
    if (!c->pending())
      co_return;
    queue.remove_abandoned(c->id);
    c->transition(Call::ABANDONED, sim.now());
    log.append(Event::ABANDONED, sim.now(), c->id, "", "waited " + fmt::format("{}", sim.now() - c->arrival));
    spdlog::warn("[{}] Call {} abandoned, waiting too long {}", std::to_string(conf.start_time, sim.now()), *c, units::time::to_string(units::time::minute_t(sim.now() - c->arrival)));
  } catch (std::exception&) {
    fail(std::current_exception());
  }
}

void Dispatcher::check() const {
  if (failure)
    std::rethrow_exception(failure);
}

void Dispatcher::fail(std::exception_ptr ex) {
  if (!failure)
    failure = ex;
}

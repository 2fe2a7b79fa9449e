#include "gtest/gtest.h"
#include "errors.hpp"
#include "simulation.hpp"
#include "scenarios.hpp"
#include <cmath>
#include <map>
#include <sstream>
#include <stop_token>

static std::vector<Event::Kind> kinds(const std::vector<Event>& events)
{
  std::vector<Event::Kind> result;
  for (const auto& e : events)
    result.push_back(e.kind);
  return result;
}

static const Event& first(const EventLog& log, Event::Kind kind, const std::string& call)
{
  for (const auto& e : log) {
    if (e.kind == kind && e.call == call)
      return e;
  }
  throw std::out_of_range("no " + std::to_string(kind) + " for call " + call);
}

// one ambulance at B, 5 minutes away from A in both directions
static Scenario single_call()
{
  return make_scenario(make_network({ "A", "B" }, { { "A", "B", 5.0 }, { "B", "A", 5.0 } }), { { "U1", "B" } }, { { "C1", 0.0, "A", "cardiac" } });
}

// every call at the base of the only ambulance, which is busy with P until t=10
static Scenario busy_unit(std::vector<CallRecord> calls)
{
  calls.insert(calls.begin(), CallRecord{ "P", 0.0, "A", "injury" });
  return make_scenario(make_network({ "A" }, {}), { { "U1", "A" } }, calls);
}

TEST(Simulation, SingleCallLifecycle) {
  Scenario scenario = single_call();
  Simulation s(scenario, test_config());
  s.run();
  const EventLog& log = s.events();
  EXPECT_EQ(kinds(log.events()), (std::vector<Event::Kind>{ Event::CALL_ARRIVAL, Event::DISPATCH_ATTEMPT, Event::ASSIGNMENT_MADE, Event::DEPARTURE_COMPLETE, Event::ARRIVAL_ON_SCENE, Event::SERVICE_COMPLETE, Event::RETURN_COMPLETE }));
  EXPECT_DOUBLE_EQ(first(log, Event::ASSIGNMENT_MADE, "C1").time, 0.0);
  EXPECT_EQ(first(log, Event::ASSIGNMENT_MADE, "C1").ambulance, "U1");
  EXPECT_DOUBLE_EQ(first(log, Event::DEPARTURE_COMPLETE, "C1").time, 0.0);
  EXPECT_DOUBLE_EQ(first(log, Event::ARRIVAL_ON_SCENE, "C1").time, 5.0);
  EXPECT_DOUBLE_EQ(first(log, Event::SERVICE_COMPLETE, "C1").time, 15.0);
  EXPECT_DOUBLE_EQ(log.events().back().time, 20.0);
  EXPECT_EQ(log.events().back().ambulance, "U1");
  EXPECT_EQ(log.events().back().detail, "B");
  for (size_t i = 0; i < log.size(); i++)
    EXPECT_EQ(log.events()[i].sequence, i);

  auto c = s.call("C1");
  EXPECT_EQ(c->current_state, Call::COMPLETED);
  EXPECT_EQ(c->ambulance, "U1");
  ASSERT_TRUE(c->response_time());
  EXPECT_DOUBLE_EQ(*c->response_time(), 5.0);
  EXPECT_TRUE(s.complete());
  EXPECT_FALSE(s.truncated());
  EXPECT_DOUBLE_EQ(s.end_time(), 20.0);
  EXPECT_DOUBLE_EQ(s.utilization("U1"), 1.0);
  EXPECT_TRUE(s.fleet().find("U1")->idle());
  EXPECT_EQ(s.fleet().find("U1")->location, "B");
  EXPECT_TRUE(s.queue().empty());
}

TEST(Simulation, TurnoutDelaysDeparture) {
  Scenario scenario = single_call();
  config conf = test_config();
  conf.turnout_time = 1.5;
  Simulation s(scenario, conf);
  s.run();
  EXPECT_DOUBLE_EQ(first(s.events(), Event::DEPARTURE_COMPLETE, "C1").time, 1.5);
  EXPECT_DOUBLE_EQ(*s.call("C1")->response_time(), 6.5);
  EXPECT_DOUBLE_EQ(s.end_time(), 21.5);
}

TEST(Simulation, NearestAmbulanceAnswers) {
  Network n = make_network({ "A", "B", "C", "D" }, { { "B", "A", 5.0 }, { "C", "A", 3.0 }, { "D", "A", 3.0 }, { "A", "B", 5.0 }, { "A", "C", 3.0 }, { "A", "D", 3.0 } });
  Scenario scenario = make_scenario(n, { { "U1", "B" }, { "U3", "D" }, { "U2", "C" } }, { { "C1", 0.0, "A", "fall" } });
  Simulation s(scenario, test_config());
  s.run();
  EXPECT_EQ(s.call("C1")->ambulance, "U2");
  EXPECT_DOUBLE_EQ(s.call("C1")->travel_time, 3.0);
  EXPECT_DOUBLE_EQ(s.utilization("U1"), 0.0);
}

TEST(Simulation, FifoWithinPriority) {
  Scenario scenario = busy_unit({ { "C1", 1.0, "A", "fall" }, { "C2", 2.0, "A", "fall" } });
  Simulation s(scenario, test_config());
  s.run();
  EXPECT_DOUBLE_EQ(s.call("C1")->assigned_time, 10.0);
  EXPECT_DOUBLE_EQ(s.call("C2")->assigned_time, 20.0);
  EXPECT_DOUBLE_EQ(*s.call("C1")->response_time(), 9.0);
  EXPECT_DOUBLE_EQ(*s.call("C2")->response_time(), 18.0);
}

TEST(Simulation, UrgentCallsFirst) {
  Scenario scenario = busy_unit({ { "C1", 1.0, "A", "fall" }, { "C2", 2.0, "A", "cardiac" } });
  Simulation s(scenario, test_config());
  s.run();
  EXPECT_DOUBLE_EQ(s.call("C2")->assigned_time, 10.0);
  EXPECT_DOUBLE_EQ(s.call("C1")->assigned_time, 20.0);
  EXPECT_TRUE(s.complete());
}

TEST(Simulation, EarlierCallServedFirst) {
  // the unit serves C0 until t=10, C1 waits or abandons
  Scenario scenario = make_scenario(make_network({ "A" }, {}), { { "U1", "A" } }, { { "C1", 1.0, "A", "fall" }, { "C0", 0.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 20.0;
  Simulation waiting(scenario, conf);
  waiting.run();
  EXPECT_DOUBLE_EQ(waiting.call("C0")->assigned_time, 0.0);
  EXPECT_DOUBLE_EQ(waiting.call("C1")->assigned_time, 10.0);
  EXPECT_EQ(waiting.call("C1")->current_state, Call::COMPLETED);

  conf.max_wait = 4.0;
  Simulation abandoning(scenario, conf);
  abandoning.run();
  EXPECT_EQ(abandoning.call("C0")->current_state, Call::COMPLETED);
  EXPECT_EQ(abandoning.call("C1")->current_state, Call::ABANDONED);
  EXPECT_DOUBLE_EQ(abandoning.call("C1")->abandoned_time, 5.0);
}

TEST(Simulation, AbandonAfterMaxWait) {
  Scenario scenario = busy_unit({ { "C1", 1.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 5.0;
  Simulation s(scenario, conf);
  s.run();
  auto c = s.call("C1");
  EXPECT_EQ(c->current_state, Call::ABANDONED);
  EXPECT_DOUBLE_EQ(c->abandoned_time, 6.0);
  EXPECT_FALSE(c->response_time());
  EXPECT_EQ(kinds(s.events().of_call("C1")), (std::vector<Event::Kind>{ Event::CALL_ARRIVAL, Event::ABANDON_CHECK, Event::ABANDONED }));
  EXPECT_EQ(s.abandoned(), 1u);
  EXPECT_TRUE(s.complete());
  EXPECT_TRUE(s.queue().empty());
  // the unit is never sent to an abandoned call
  EXPECT_EQ(s.events().count(Event::ASSIGNMENT_MADE), 1u);
}

TEST(Simulation, ZeroMaxWaitStillDispatches) {
  Scenario scenario = make_scenario(make_network({ "A" }, {}), { { "U1", "A" } }, { { "C1", 0.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 0.0;
  Simulation s(scenario, conf);
  s.run();
  auto c = s.call("C1");
  EXPECT_EQ(c->current_state, Call::COMPLETED);
  EXPECT_DOUBLE_EQ(c->assigned_time, 0.0);
  EXPECT_EQ(c->ambulance, "U1");
  EXPECT_EQ(s.events().count(Event::ABANDONED), 0u);
  EXPECT_EQ(first(s.events(), Event::ABANDON_CHECK, "C1").detail, "ASSIGNED");
}

TEST(Simulation, UnitFreedAtDeadlineTakesCall) {
  // U1 is back at t=10, exactly when C1 has waited max_wait
  Scenario scenario = busy_unit({ { "C1", 1.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 9.0;
  Simulation s(scenario, conf);
  s.run();
  auto c = s.call("C1");
  EXPECT_EQ(c->current_state, Call::COMPLETED);
  EXPECT_DOUBLE_EQ(c->assigned_time, 10.0);
  EXPECT_EQ(s.abandoned(), 0u);
}

TEST(Simulation, ServedBeforeMaxWait) {
  Scenario scenario = busy_unit({ { "C1", 1.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 12.0;
  Simulation s(scenario, conf);
  s.run();
  auto c = s.call("C1");
  EXPECT_EQ(c->current_state, Call::COMPLETED);
  EXPECT_DOUBLE_EQ(c->assigned_time, 10.0);
  // checked at t=13 while on scene, never abandoned
  const Event& check = first(s.events(), Event::ABANDON_CHECK, "C1");
  EXPECT_DOUBLE_EQ(check.time, 13.0);
  EXPECT_EQ(check.detail, "ON_SCENE");
  EXPECT_EQ(s.events().count(Event::ABANDONED), 0u);
  EXPECT_EQ(s.abandoned(), 0u);
}

TEST(Simulation, UnreachableCallRejected) {
  Scenario scenario = make_scenario(make_network({ "A", "B" }, { { "A", "B", 2.0 } }), { { "U1", "B" } }, { { "C1", 0.0, "A", "fall" } });
  EXPECT_THROW({ Simulation s(scenario, test_config()); }, InputError);
}

TEST(Simulation, InvalidConfiguration) {
  Scenario scenario = single_call();
  config conf = test_config();
  conf.policy = "random";
  EXPECT_THROW({ Simulation s(scenario, conf); }, std::invalid_argument);
  conf = test_config(-1.0);
  EXPECT_THROW({ Simulation s(scenario, conf); }, std::invalid_argument);
  conf = test_config();
  conf.routing = "astar";
  EXPECT_THROW({ Simulation s(scenario, conf); }, std::invalid_argument);
  conf = test_config();
  conf.reserved_priority = "urgent";
  EXPECT_THROW({ Simulation s(scenario, conf); }, std::invalid_argument);
  scenario.calls.push_back(CallRecord{ "C1", 3.0, "A", "fall" });
  EXPECT_THROW({ Simulation s(scenario, test_config()); }, InputError);
}

TEST(Simulation, StopRequested) {
  Scenario scenario = single_call();
  Simulation s(scenario, test_config());
  std::stop_source stop;
  stop.request_stop();
  s.run(stop.get_token());
  EXPECT_TRUE(s.truncated());
  EXPECT_FALSE(s.complete());
  EXPECT_EQ(s.events().size(), 0u);
  EXPECT_THROW(s.run(), std::logic_error);
}

TEST(Simulation, SameSeedSameLog) {
  Network n = make_network({ "A", "B", "C" }, { { "A", "B", 4.0 }, { "B", "A", 4.5 }, { "B", "C", 2.0 }, { "C", "B", 2.0 }, { "A", "C", 7.0 }, { "C", "A", 6.0 } });
  std::vector<CallRecord> calls;
  for (int i = 0; i < 30; i++)
    calls.push_back(CallRecord{ "C" + std::to_string(i), 1.5 * i, i % 3 == 0 ? "A" : (i % 3 == 1 ? "B" : "C"), i % 4 == 0 ? "cardiac" : "fall" });
  Scenario scenario = make_scenario(n, { { "U1", "A" }, { "U2", "C" } }, calls);
  config conf = test_config();
  conf.service_time_extra_mean = 8.0;
  conf.max_wait = 30.0;
  conf.seed = 7;

  std::ostringstream first_log, second_log;
  {
    Simulation s(scenario, conf);
    s.run();
    s.events().write_csv(first_log);
    EXPECT_TRUE(s.complete());
  }
  {
    Simulation s(scenario, conf);
    s.run();
    s.events().write_csv(second_log);
  }
  EXPECT_EQ(first_log.str(), second_log.str());
  EXPECT_EQ(first_log.str().rfind("sequence,kind,time,call,ambulance,detail\n", 0), 0u);
}

TEST(Simulation, FleetInvariants) {
  Network n = make_network({ "A", "B", "C" }, { { "A", "B", 3.0 }, { "B", "A", 3.0 }, { "B", "C", 4.0 }, { "C", "B", 4.0 } });
  std::vector<CallRecord> calls;
  for (int i = 0; i < 20; i++)
    calls.push_back(CallRecord{ "C" + std::to_string(i), double(i % 7), i % 2 == 0 ? "C" : "A", i % 5 == 0 ? "breathing" : "injury" });
  Scenario scenario = make_scenario(n, { { "U1", "A" }, { "U2", "B" }, { "U3", "C" } }, calls);
  Simulation s(scenario, test_config(6.0));
  s.run();
  ASSERT_TRUE(s.complete());

  // each unit alternates between one assignment and one return
  std::map<std::string, std::string> serving;
  std::map<std::string, int> assignments;
  Time last = 0.0;
  for (const auto& e : s.events()) {
    EXPECT_GE(e.time, last);
    last = e.time;
    if (e.kind == Event::ASSIGNMENT_MADE) {
      EXPECT_EQ(serving[e.ambulance], "") << e.ambulance << " assigned twice";
      serving[e.ambulance] = e.call;
      assignments[e.call]++;
    } else if (e.kind == Event::RETURN_COMPLETE) {
      EXPECT_NE(serving[e.ambulance], "");
      serving[e.ambulance] = "";
    }
  }
  for (const auto& c : s.calls()) {
    EXPECT_EQ(assignments[c->id], 1) << c->id;
    EXPECT_EQ(c->current_state, Call::COMPLETED);
  }
  for (const auto& a : s.fleet().ambulances()) {
    EXPECT_TRUE(a->idle());
    EXPECT_EQ(a->location, a->base);
  }
}

TEST(Simulation, ReservationHoldsLastUnit) {
  // X is only reached from B
  Network n = make_network({ "A", "B", "X" }, { { "B", "X", 2.0 }, { "X", "B", 2.0 } });
  std::vector<CallRecord> calls = { { "K1", 0.0, "X", "cardiac" }, { "K2", 1.0, "X", "cardiac" }, { "L", 2.0, "A", "fall" } };
  Scenario scenario = make_scenario(n, { { "U1", "A" }, { "U2", "B" } }, calls);

  config conf = test_config();
  Simulation nearest(scenario, conf);
  nearest.run();
  EXPECT_DOUBLE_EQ(nearest.call("L")->assigned_time, 2.0);

  conf.policy = "reservation";
  conf.reserved_units = 1;
  conf.reserved_priority = "high";
  Simulation reservation(scenario, conf);
  reservation.run();
  // U1 is kept idle while K2 waits for U2, back at t=14
  EXPECT_DOUBLE_EQ(reservation.call("K2")->assigned_time, 14.0);
  EXPECT_EQ(reservation.call("K2")->ambulance, "U2");
  EXPECT_DOUBLE_EQ(reservation.call("L")->assigned_time, 14.0);
  EXPECT_EQ(reservation.call("L")->ambulance, "U1");
  EXPECT_TRUE(reservation.complete());
}

// selects by name, whatever the fleet looks like
class FixedChoice : public DispatchPolicy
{
public:
  FixedChoice(std::string ambulance) : ambulance(ambulance) {}
  std::optional<std::string> select(const Call& c, const FleetSnapshot& fleet) const override {
    return ambulance;
  }
  std::string name() const override {
    return "fixed";
  }
  std::string ambulance;
};

TEST(Simulation, PolicyRejectionKeepsCallPending) {
  Scenario scenario = make_scenario(make_network({ "A" }, {}), { { "U1", "A" }, { "U2", "A" } }, { { "C1", 0.0, "A", "fall" }, { "C2", 0.0, "A", "fall" } });
  Simulation s(scenario, test_config(), std::make_unique<FixedChoice>("U1"));
  s.run();
  const Event& rejection = first(s.events(), Event::POLICY_REJECTION, "C2");
  EXPECT_DOUBLE_EQ(rejection.time, 0.0);
  EXPECT_EQ(rejection.ambulance, "U1");
  EXPECT_EQ(rejection.detail, "ambulance is DISPATCHED");
  // C2 waits for U1, U2 is never used
  EXPECT_EQ(s.call("C2")->ambulance, "U1");
  EXPECT_DOUBLE_EQ(s.call("C2")->assigned_time, 10.0);
  EXPECT_DOUBLE_EQ(s.utilization("U2"), 0.0);
  EXPECT_TRUE(s.complete());
}

TEST(Simulation, UnknownSelectionAbandoned) {
  Scenario scenario = make_scenario(make_network({ "A" }, {}), { { "U1", "A" } }, { { "C1", 0.0, "A", "fall" } });
  config conf = test_config();
  conf.max_wait = 3.0;
  Simulation s(scenario, conf, std::make_unique<FixedChoice>("U9"));
  s.run();
  EXPECT_EQ(first(s.events(), Event::POLICY_REJECTION, "C1").detail, "unknown ambulance");
  EXPECT_EQ(s.call("C1")->current_state, Call::ABANDONED);
  EXPECT_TRUE(s.fleet().find("U1")->idle());
}

// hands out a unit it has already put on scene
class CorruptingChoice : public DispatchPolicy
{
public:
  std::optional<std::string> select(const Call& c, const FleetSnapshot& fleet) const override {
    if (fleet.candidates.empty())
      return std::nullopt;
    fleet.candidates.front().first->current_state = Ambulance::ON_SCENE;
    return fleet.candidates.front().first->id;
  }
  std::string name() const override {
    return "corrupting";
  }
};

TEST(Simulation, InvalidTransitionStopsRun) {
  Scenario scenario = make_scenario(make_network({ "A" }, {}), { { "U1", "A" } }, { { "C1", 0.0, "A", "fall" }, { "C2", 5.0, "A", "fall" } });
  Simulation s(scenario, test_config(), std::make_unique<CorruptingChoice>());
  EXPECT_THROW(s.run(), InvalidTransition);
  // nothing after the failing dispatch round
  EXPECT_EQ(kinds(s.events().events()), (std::vector<Event::Kind>{ Event::CALL_ARRIVAL, Event::DISPATCH_ATTEMPT }));
  EXPECT_DOUBLE_EQ(s.end_time(), 0.0);
  EXPECT_EQ(s.call("C1")->current_state, Call::PENDING);
  EXPECT_EQ(s.call("C2")->current_state, Call::PENDING);
  EXPECT_FALSE(s.complete());
}

#include "report.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "spdlog/fmt/fmt.h"

RunReport::RunReport(const Simulation& s, std::string name) : name(name), simulation(s), abandoned_(0), completed_(0)
{
  std::map<std::string, Time> arrivals, busy_since, busy;
  for (const auto& e : s.events()) {
    switch (e.kind) {
      case Event::CALL_ARRIVAL:
        arrivals[e.call] = e.time;
        break;
      case Event::ARRIVAL_ON_SCENE:
        response_times_[e.call] = e.time - arrivals.at(e.call);
        break;
      case Event::ASSIGNMENT_MADE:
        busy_since[e.ambulance] = e.time;
        break;
      case Event::RETURN_COMPLETE:
        busy[e.ambulance] += e.time - busy_since.at(e.ambulance);
        busy_since.erase(e.ambulance);
        break;
      case Event::SERVICE_COMPLETE:
        completed_++;
        break;
      case Event::ABANDONED:
        abandoned_++;
        break;
      default:
        break;
    }
  }
  // units still busy when a truncated run stopped
  for (const auto& [ambulance, since] : busy_since)
    busy[ambulance] += s.end_time() - since;
  for (const auto& a : s.fleet().ambulances())
    utilization_[a->id] = s.end_time() > 0.0 ? busy[a->id] / s.end_time() : 0.0;
}

ResponseStats RunReport::summarize(std::vector<Time> values)
{
  ResponseStats stats;
  stats.count = values.size();
  if (values.empty())
    return stats;
  std::sort(values.begin(), values.end());
  size_t n = values.size();
  stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  stats.median = n % 2 == 1 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
  // nearest rank
  stats.p90 = values[size_t(std::ceil(0.9 * n)) - 1];
  stats.max = values.back();
  return stats;
}

ResponseStats RunReport::response_stats() const
{
  std::vector<Time> values;
  for (const auto& [call, t] : response_times_)
    values.push_back(t);
  return summarize(values);
}

ResponseStats RunReport::response_stats(Call::Priority p) const
{
  std::vector<Time> values;
  for (const auto& [call, t] : response_times_) {
    if (simulation.call(call)->priority == p)
      values.push_back(t);
  }
  return summarize(values);
}

void RunReport::print(std::ostream& os) const
{
  std::string status = simulation.truncated() ? "truncated" : (simulation.complete() ? "complete" : "incomplete");
  os << fmt::format("Run {} ({} policy, seed {}): {} calls, {} completed, {} abandoned, {} at t={}\n", name, simulation.policy().name(), simulation.configuration().seed, simulation.calls().size(), completed_, abandoned_, status, simulation.end_time());
  auto stats = response_stats();
  os << fmt::format("  Response time: mean {:.2f}, median {:.2f}, p90 {:.2f}, max {:.2f} over {} calls\n", stats.mean, stats.median, stats.p90, stats.max, stats.count);
  for (auto p : { Call::CRITICAL, Call::HIGH, Call::MEDIUM, Call::LOW }) {
    auto s = response_stats(p);
    if (s.count == 0)
      continue;
    os << fmt::format("    {:<8}: mean {:.2f}, median {:.2f}, p90 {:.2f}, max {:.2f} over {} calls\n", std::to_string(p), s.mean, s.median, s.p90, s.max, s.count);
  }
  os << "  Utilization:";
  for (const auto& a : simulation.fleet().ambulances())
    os << fmt::format(" {} {:.1f}%", a->id, 100.0 * utilization_.at(a->id));
  os << "\n";
}

void RunReport::write_dispatch_log(std::ostream& os) const
{
  os << "Call ID,Call Type,Call Location,Selected Ambulance,Time to Call Location\n";
  for (const auto& e : simulation.events()) {
    if (e.kind != Event::ASSIGNMENT_MADE)
      continue;
    auto c = simulation.call(e.call);
    os << fmt::format("{},{},{},{},{:.2f}\n", c->id, c->type, c->origin, e.ambulance, c->travel_time);
  }
}

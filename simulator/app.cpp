// Copyright © 2022 Luca Di Gaspero.
// Licensed under the MIT license. See the LICENSE file for details.

#include <cstdio>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "data.hpp"
#include "errors.hpp"
#include "input.hpp"
#include "simulation.hpp"
#include "report.hpp"
#include "helpers.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "spdlog/spdlog.h"
#include "spdlog/async.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"

#include "indicators/progress_bar.hpp"

namespace po = boost::program_options;
namespace pt = boost::posix_time;

// output file of one run, suffixed with the run name when there are several
std::string run_filename(const std::string& filename, const std::string& run, size_t runs)
{
  if (runs == 1)
    return filename;
  std::filesystem::path p(filename);
  return (p.parent_path() / (p.stem().string() + "." + run + p.extension().string())).string();
}

// stops the run once the budget is exhausted, unless released earlier
void watch_budget(std::stop_token released, std::stop_source run, double budget)
{
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock lock(m);
  cv.wait_for(lock, released, std::chrono::duration<double>(budget), [] { return false; });
  if (!released.stop_requested())
    run.request_stop();
}

int main(int argc, const char *argv[])
{
  config conf;
  std::string network_filename, locations_filename, ambulances_filename, calls_filename, priorities_filename;
  std::string policies = "nearest", seeds = "42", start_time;
  std::string log_filename, events_filename, dispatch_log_filename, data_filename;
  bool progress = false, no_log = false, debug = false;
  double max_wait = 0.0, time_budget = 0.0;
  size_t workers = std::max(1u, std::thread::hardware_concurrency());
  po::options_description desc("Command line options");
  desc.add_options()("help,?", "print usage message")
  ("network,g", po::value(&network_filename), "Location network file")
  ("locations", po::value(&locations_filename), "Location coordinates file")
  ("ambulances,a", po::value(&ambulances_filename), "Ambulances file")
  ("calls,e", po::value(&calls_filename), "Calls file")
  ("priorities,r", po::value(&priorities_filename), "Call priorities file")
  ("policy", po::value(&policies), "Dispatch policies, comma separated (nearest, reservation)")
  ("seed,s", po::value(&seeds), "Random seeds, comma separated")
  ("routing", po::value(&conf.routing), "Routing strategy (auto, dijkstra, floyd-warshall)")
  ("precompute-limit", po::value(&conf.precompute_limit), "Largest network precomputed by the auto routing strategy")
  ("max-wait", po::value(&max_wait), "Waiting time after which a pending call is abandoned (in minutes)")
  ("turnout-time", po::value(&conf.turnout_time), "Delay between assignment and departure (in minutes)")
  ("service-time", po::value(&conf.service_time), "Time spent on scene (in minutes)")
  ("service-time-extra-mean", po::value(&conf.service_time_extra_mean), "Mean of the exponential extra time spent on scene (in minutes)")
  ("reserved-units", po::value(&conf.reserved_units), "Idle ambulances kept for urgent calls by the reservation policy")
  ("reserved-priority", po::value(&conf.reserved_priority), "Least urgent priority entitled to reserved ambulances")
  ("start-time", po::value(&start_time), "Wall clock time of the simulation start, for the log")
  ("workers,w", po::value(&workers), "Runs executed in parallel")
  ("time-budget", po::value(&time_budget), "Wall clock budget of each run (in seconds)")
  ("progress-bar,p", po::bool_switch(&progress), "Show progress bar")
  ("no-log,n", po::bool_switch(&no_log), "Disable log")
  ("debug", po::bool_switch(&debug), "Debug log")
  ("colored-log,c", po::bool_switch(&colored), "Show colored log")
  ("log-file,l", po::value(&log_filename), "Log file")
  ("events-file", po::value(&events_filename), "Event log CSV filename")
  ("dispatch-log", po::value(&dispatch_log_filename), "Dispatch log CSV filename")
  ("data-file,d", po::value(&data_filename), "Simulation SQLite filename");

  // Parse command line arguments
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::notify(vm);
  } catch (po::error& ex) {
    std::cerr << ex.what() << "\n" << desc << "\n";
    return 1;
  }
  if (vm.count("help") || !vm.count("network") || !vm.count("ambulances") || !vm.count("calls") || !vm.count("priorities")) {
    std::cerr << desc << "\n";
    return 1;
  }
  if (vm.count("start-time")) {
    conf.start_time = pt::time_from_string(start_time);
  }
  if (vm.count("max-wait")) {
    conf.max_wait = max_wait;
  }

  if (no_log) {
    spdlog::set_level(spdlog::level::off);
  } else {
    if (vm.count("log-file")) {
      auto async_file = spdlog::basic_logger_mt<spdlog::async_factory>("simulator", log_filename);
      spdlog::set_default_logger(async_file);
    } else {
      auto console = spdlog::stdout_logger_mt("simulator");
      spdlog::set_default_logger(console);
    }
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
  }
  spdlog::set_pattern("%v");

  std::vector<std::string> policy_names, seed_values;
  boost::split(policy_names, policies, boost::is_any_of(","));
  boost::split(seed_values, seeds, boost::is_any_of(","));
  std::vector<config> runs;
  std::vector<std::string> run_names;
  try {
    for (auto p : policy_names) {
      for (auto s : seed_values) {
        config c = conf;
        c.policy = boost::trim_copy(p);
        c.seed = std::stoul(boost::trim_copy(s));
        runs.push_back(c);
        run_names.push_back(c.policy + "-" + std::to_string(c.seed));
      }
    }
  } catch (std::logic_error& ex) {
    spdlog::error("Invalid seed list {}: {}", seeds, ex.what());
    return 1;
  }

  Scenario scenario;
  try {
    scenario = Scenario::load(network_filename, ambulances_filename, calls_filename, priorities_filename, locations_filename);
  } catch (InputError& ex) {
    spdlog::error("Invalid input: {}", ex.what());
    return 1;
  }

  std::vector<std::unique_ptr<Simulation>> simulations(runs.size());
  std::vector<std::exception_ptr> failures(runs.size());
  std::atomic<size_t> next_run{0};
  std::mutex progress_mutex;
  using namespace indicators;
  ProgressBar bar{
    option::BarWidth{50},
    option::Start{"["},
    option::Fill{"="},
    option::Lead{">"},
    option::Remainder{" "},
    option::End{"]"},
    option::PostfixText{"Runs "},
    option::MaxProgress{runs.size()},
    option::ForegroundColor{Color::green},
    option::ShowElapsedTime{true},
    option::ShowRemainingTime{true},
    option::ShowPercentage{true},
    option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
    option::Stream{std::cerr}};

  {
    std::vector<std::jthread> pool;
    for (size_t w = 0; w < std::min(workers, runs.size()); w++) {
      pool.emplace_back([&]() {
        for (size_t i = next_run++; i < runs.size(); i = next_run++) {
          try {
            simulations[i] = std::make_unique<Simulation>(scenario, runs[i]);
            std::stop_source stop;
            std::jthread watchdog;
            if (time_budget > 0.0)
              watchdog = std::jthread(watch_budget, stop, time_budget);
            simulations[i]->run(stop.get_token());
          } catch (std::exception&) {
            failures[i] = std::current_exception();
          }
          if (progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            bar.set_option(option::PostfixText{"Run " + run_names[i]});
            bar.tick();
          }
        }
      });
    }
  }

  int status = 0;
  std::unique_ptr<SimulationData> data;
  try {
    if (!data_filename.empty())
      data = std::make_unique<SimulationData>(data_filename);
    for (size_t i = 0; i < runs.size(); i++) {
      if (failures[i]) {
        try {
          std::rethrow_exception(failures[i]);
        } catch (std::exception& ex) {
          spdlog::error("Run {} failed: {}", run_names[i], ex.what());
        }
        status = 1;
        continue;
      }
      const Simulation& s = *simulations[i];
      RunReport report(s, run_names[i]);
      report.print(std::cout);
      if (!s.complete())
        status = 1;
      if (!events_filename.empty()) {
        std::ofstream os(run_filename(events_filename, run_names[i], runs.size()));
        s.events().write_csv(os);
      }
      if (!dispatch_log_filename.empty()) {
        std::ofstream os(run_filename(dispatch_log_filename, run_names[i], runs.size()));
        report.write_dispatch_log(os);
      }
      if (data)
        data->log_run(report);
    }
  } catch (std::exception& ex) {
    spdlog::error("Could not write the results: {}", ex.what());
    return 1;
  }

  return status;
}

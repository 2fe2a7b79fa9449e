#include "data.hpp"
#include "helpers.hpp"
#include "report.hpp"
#include <cmath>

bool colored = false;

std::string std::to_string(const pt::ptime& start_time, Time t) {
  if (start_time.is_special())
    return fmt::format("t={:.2f}", t);
  return to_simple_string(start_time + pt::seconds(std::llround(t * 60.0)));
}

SimulationData::SimulationData(const std::string& db_filename) {
  db = std::make_unique<SQLite::Database>(db_filename, SQLite::OPEN_READWRITE|SQLite::OPEN_CREATE);
  SQLite::Transaction transaction(*db);
  db->exec("DROP TABLE IF EXISTS run");
  db->exec("CREATE TABLE run (run VARCHAR(255) NOT NULL PRIMARY KEY, policy VARCHAR(32) NOT NULL, seed INTEGER NOT NULL, routing VARCHAR(32) NOT NULL, end_time REAL NOT NULL, status VARCHAR(16) NOT NULL, completed INTEGER NOT NULL, abandoned INTEGER NOT NULL)");
  db->exec("DROP TABLE IF EXISTS event");
  db->exec("CREATE TABLE event (run VARCHAR(255) NOT NULL, sequence INTEGER NOT NULL, kind VARCHAR(32) NOT NULL, time REAL NOT NULL, call VARCHAR(255), ambulance VARCHAR(255), detail VARCHAR(255), PRIMARY KEY (run, sequence))");
  db->exec("DROP TABLE IF EXISTS call");
  db->exec("CREATE TABLE call (run VARCHAR(255) NOT NULL, call VARCHAR(255) NOT NULL, type VARCHAR(255) NOT NULL, priority VARCHAR(10) NOT NULL, location VARCHAR(255) NOT NULL, state VARCHAR(16) NOT NULL, ambulance VARCHAR(255), arrival REAL NOT NULL, assigned REAL, on_scene REAL, completed REAL, abandoned REAL, response REAL, PRIMARY KEY (run, call))");
  db->exec("DROP TABLE IF EXISTS ambulance");
  db->exec("CREATE TABLE ambulance (run VARCHAR(255) NOT NULL, ambulance VARCHAR(255) NOT NULL, base VARCHAR(255) NOT NULL, utilization REAL NOT NULL, PRIMARY KEY (run, ambulance))");
  transaction.commit();
}

namespace {

// NULL for the timestamps a call never reached
void bind_time(SQLite::Statement& query, int index, Time t) {
  if (std::isinf(t))
    query.bind(index);
  else
    query.bind(index, t);
}

void bind_text(SQLite::Statement& query, int index, const std::string& s) {
  if (s.empty())
    query.bind(index);
  else
    query.bind(index, s);
}

}

void SimulationData::log_run(const RunReport& r) {
  const Simulation& s = r.simulation;
  SQLite::Transaction transaction(*db);
  {
    SQLite::Statement query(*db, "INSERT INTO run VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    query.bind(1, r.name);
    query.bind(2, s.policy().name());
    query.bind(3, int64_t(s.configuration().seed));
    query.bind(4, std::to_string(s.routing().strategy()));
    query.bind(5, s.end_time());
    query.bind(6, s.truncated() ? "truncated" : (s.complete() ? "complete" : "incomplete"));
    query.bind(7, int64_t(r.completed()));
    query.bind(8, int64_t(r.abandoned()));
    query.exec();
  }
  SQLite::Statement event_query(*db, "INSERT INTO event VALUES (?, ?, ?, ?, ?, ?, ?)");
  for (const auto& e : s.events()) {
    event_query.bind(1, r.name);
    event_query.bind(2, int64_t(e.sequence));
    event_query.bind(3, std::to_string(e.kind));
    event_query.bind(4, e.time);
    bind_text(event_query, 5, e.call);
    bind_text(event_query, 6, e.ambulance);
    bind_text(event_query, 7, e.detail);
    event_query.exec();
    event_query.reset();
  }
  SQLite::Statement call_query(*db, "INSERT INTO call VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  for (const auto& c : s.calls()) {
    call_query.bind(1, r.name);
    call_query.bind(2, c->id);
    call_query.bind(3, c->type);
    call_query.bind(4, std::to_string(c->priority));
    call_query.bind(5, c->origin);
    call_query.bind(6, std::to_string(c->current_state));
    bind_text(call_query, 7, c->ambulance);
    call_query.bind(8, c->arrival);
    bind_time(call_query, 9, c->assigned_time);
    bind_time(call_query, 10, c->on_scene_time);
    bind_time(call_query, 11, c->completed_time);
    bind_time(call_query, 12, c->abandoned_time);
    if (c->response_time())
      call_query.bind(13, *c->response_time());
    else
      call_query.bind(13);
    call_query.exec();
    call_query.reset();
  }
  SQLite::Statement ambulance_query(*db, "INSERT INTO ambulance VALUES (?, ?, ?, ?)");
  for (const auto& a : s.fleet().ambulances()) {
    ambulance_query.bind(1, r.name);
    ambulance_query.bind(2, a->id);
    ambulance_query.bind(3, a->base);
    ambulance_query.bind(4, r.utilization().at(a->id));
    ambulance_query.exec();
    ambulance_query.reset();
  }
  transaction.commit();
}

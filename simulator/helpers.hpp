#pragma once

#include "data.hpp"
#include "call.hpp"
#include "ambulance.hpp"
#include <iostream>
#include <memory>
#include "SQLiteCpp/SQLiteCpp.h"
#include "spdlog/fmt/ostr.h"
#include "termcolor/termcolor.hpp"

class RunReport;

// Exports finished runs into a SQLite database, one row set per run.
class SimulationData {
public:
  SimulationData(const std::string& db_filename);
  void log_run(const RunReport& r);
protected:
  std::unique_ptr<SQLite::Database> db;
};

template <typename OStream>
OStream& operator<<(OStream &os, const Call& c) {
  if (colored)
    os << termcolor::colorize << termcolor::bold;
  switch (c.priority) {
    case Call::Priority::CRITICAL:
      os << termcolor::bright_red;
      break;
    case Call::Priority::HIGH:
      os << termcolor::bright_yellow;
      break;
    case Call::Priority::MEDIUM:
      os << termcolor::bright_green;
      break;
    case Call::Priority::LOW:
      os << termcolor::bright_white;
      break;
  }
  os << c.id << "[" << c.type << ", " << c.priority << ", " << c.origin << "]";
  if (colored)
    os << termcolor::reset;
  return os;
}

template <typename OStream>
OStream& operator<<(OStream &os, const Ambulance& a) {
  if (colored)
    os << termcolor::colorize << termcolor::bold << termcolor::bright_cyan;
  os << a.id << "[" << a.base << "]";
  if (colored)
    os << termcolor::reset;
  return os;
}

template <> struct fmt::formatter<Call> : fmt::ostream_formatter {};
template <> struct fmt::formatter<Ambulance> : fmt::ostream_formatter {};

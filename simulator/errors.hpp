#pragma once

#include <stdexcept>
#include <string>

// malformed or inconsistent input, raised before a run starts
class InputError : public std::runtime_error
{
public:
  explicit InputError(const std::string& what) : std::runtime_error(what) {}
  InputError(const std::string& source, size_t line, const std::string& what) : std::runtime_error(source + ":" + std::to_string(line) + ": " + what) {}
};

class UnknownLocation : public std::out_of_range
{
public:
  explicit UnknownLocation(const std::string& id) : std::out_of_range("Unknown location " + id), id(id) {}
  std::string id;
};

class UnknownAmbulance : public std::out_of_range
{
public:
  explicit UnknownAmbulance(const std::string& id) : std::out_of_range("Unknown ambulance " + id), id(id) {}
  std::string id;
};

class UnknownCall : public std::out_of_range
{
public:
  explicit UnknownCall(const std::string& id) : std::out_of_range("Unknown call " + id), id(id) {}
  std::string id;
};

// a state machine violation, i.e., an engine or policy defect
class InvalidTransition : public std::logic_error
{
public:
  explicit InvalidTransition(const std::string& what) : std::logic_error(what) {}
};

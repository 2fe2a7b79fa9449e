#pragma once

#include "call.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>

// Pending calls ordered by priority, then arrival time, then creation order.
// Priorities are fixed: a queued call never moves ahead of a more urgent one.
class CallQueue
{
  struct Order
  {
    bool operator()(const std::shared_ptr<Call>& c1, const std::shared_ptr<Call>& c2) const {
      if (c1->priority != c2->priority)
        return int(c1->priority) < int(c2->priority);
      if (c1->arrival != c2->arrival)
        return c1->arrival < c2->arrival;
      return c1->sequence < c2->sequence;
    }
  };
  typedef std::set<std::shared_ptr<Call>, Order> Calls;
public:
  typedef Calls::const_iterator const_iterator;

  void enqueue(std::shared_ptr<Call> c);
  // nullptr when empty
  std::shared_ptr<Call> peek_next() const;
  std::shared_ptr<Call> dequeue_assigned(const std::string& id);
  std::shared_ptr<Call> remove_abandoned(const std::string& id);

  bool contains(const std::string& id) const {
    return index_.count(id) > 0;
  }
  // queued calls with priority p or more urgent
  size_t count_at_least(Call::Priority p) const;
  size_t size() const {
    return calls.size();
  }
  bool empty() const {
    return calls.empty();
  }
  const_iterator begin() const {
    return calls.begin();
  }
  const_iterator end() const {
    return calls.end();
  }
protected:
  std::shared_ptr<Call> erase(const std::string& id);
  Calls calls;
  std::map<std::string, Calls::const_iterator> index_;
};

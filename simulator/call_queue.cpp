#include "call_queue.hpp"
#include "errors.hpp"

void CallQueue::enqueue(std::shared_ptr<Call> c)
{
  if (!c->pending())
    throw InvalidTransition("Call " + c->id + " is " + std::to_string(c->current_state) + " and cannot be queued");
  if (contains(c->id))
    throw InvalidTransition("Call " + c->id + " is already queued");
  index_[c->id] = calls.insert(c).first;
}

std::shared_ptr<Call> CallQueue::peek_next() const
{
  if (calls.empty())
    return nullptr;
  return *calls.begin();
}

std::shared_ptr<Call> CallQueue::dequeue_assigned(const std::string& id)
{
  return erase(id);
}

std::shared_ptr<Call> CallQueue::remove_abandoned(const std::string& id)
{
  return erase(id);
}

size_t CallQueue::count_at_least(Call::Priority p) const
{
  size_t count = 0;
  for (const auto& c : calls) {
    // ordered by priority, nothing more urgent follows
    if (int(c->priority) > int(p))
      break;
    count++;
  }
  return count;
}

std::shared_ptr<Call> CallQueue::erase(const std::string& id)
{
  auto it = index_.find(id);
  if (it == index_.end())
    throw UnknownCall(id);
  auto c = *it->second;
  calls.erase(it->second);
  index_.erase(it);
  return c;
}

#include "ckpt/app/event_queue.hpp"

namespace ckpt::app {

void EventQueue::push(Event event) {
  const std::scoped_lock lock(mutex_);
  events_.push_back(std::move(event));
}

std::vector<Event> EventQueue::drain() {
  const std::scoped_lock lock(mutex_);
  std::vector<Event> drained;
  drained.reserve(events_.size());
  while (!events_.empty()) {
    drained.push_back(std::move(events_.front()));
    events_.pop_front();
  }
  return drained;
}

bool EventQueue::empty() const {
  const std::scoped_lock lock(mutex_);
  return events_.empty();
}

}  // namespace ckpt::app

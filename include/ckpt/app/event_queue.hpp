#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "ckpt/app/events.hpp"

namespace ckpt::app {

// Completion events handed from workers to the UI thread
class EventQueue {
public:
  void push(Event event);

  // Take every queued event, oldest first
  std::vector<Event> drain();

  bool empty() const;

private:
  mutable std::mutex mutex_;
  std::deque<Event> events_;
};

}  // namespace ckpt::app

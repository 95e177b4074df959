#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "ckpt/app/events.hpp"

namespace ckpt::app {

/**
 * @brief Runs each task on its own thread and reports the resulting event
 *
 * The completion callback is invoked on the worker thread. The destructor
 * waits for every running task, so no work is cut off at exit.
 */
class TaskRunner {
public:
  using Task = std::function<Event()>;
  using Completion = std::function<void(Event)>;

  explicit TaskRunner(Completion on_complete);
  ~TaskRunner();

  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  void submit(Task task);

  // Block until every submitted task has finished
  void waitIdle();

  size_t running() const;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  Completion on_complete_;
  mutable std::mutex mutex_;
  std::vector<Worker> workers_;

  void reapFinished();
};

}  // namespace ckpt::app

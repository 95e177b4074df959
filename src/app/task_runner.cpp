#include "ckpt/app/task_runner.hpp"

#include <spdlog/spdlog.h>

namespace ckpt::app {

TaskRunner::TaskRunner(Completion on_complete)
  : on_complete_(std::move(on_complete)) {}

TaskRunner::~TaskRunner() {
  waitIdle();
}

void TaskRunner::submit(Task task) {
  reapFinished();

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, task = std::move(task), done] {
    Event event = task();
    on_complete_(std::move(event));
    done->store(true);
  });

  const std::scoped_lock lock(mutex_);
  workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void TaskRunner::waitIdle() {
  std::vector<Worker> workers;
  {
    const std::scoped_lock lock(mutex_);
    workers.swap(workers_);
  }
  if (!workers.empty()) {
    spdlog::debug("waiting for {} task(s)", workers.size());
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

size_t TaskRunner::running() const {
  const std::scoped_lock lock(mutex_);
  size_t count = 0;
  for (const auto& worker : workers_) {
    if (!worker.done->load()) {
      ++count;
    }
  }
  return count;
}

void TaskRunner::reapFinished() {
  const std::scoped_lock lock(mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace ckpt::app

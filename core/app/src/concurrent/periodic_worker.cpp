#include "tether/concurrent/periodic_worker.hpp"

#include <iostream>
#include <utility>

namespace tether {

PeriodicWorker::PeriodicWorker(std::string name,
                               std::chrono::milliseconds interval,
                               ShutdownSignal& signal, Task task)
    : name_(std::move(name)),
      interval_(interval),
      signal_(signal),
      task_(std::move(task)) {}

PeriodicWorker::~PeriodicWorker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PeriodicWorker::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PeriodicWorker::stop() {
  if (!thread_.joinable()) {
    return;
  }

  // Wake the worker if it is sleeping between runs. No lock is held across
  // join(), so the worker can always finish its current run.
  signal_.request();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop: task, interval sleep, repeat
// -----------------------------------------------------------------------------
void PeriodicWorker::run() {
  std::cout << "[" << name_ << "] loop started (interval "
            << interval_.count() << " ms)\n";

  while (!signal_.isRequested()) {
    task_();

    // waitFor() returns false as soon as the signal is requested, so the
    // loop exits without waiting out the rest of the interval.
    if (!signal_.waitFor(interval_)) {
      break;
    }
  }

  std::cout << "[" << name_ << "] loop exited\n";
}

}  // namespace tether

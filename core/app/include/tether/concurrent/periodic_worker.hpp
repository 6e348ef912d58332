#pragma once

#include "tether/concurrent/shutdown_signal.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace tether {

// -----------------------------------------------------------------------------
// PeriodicWorker
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that runs a task, waits one
// interval, runs it again, and so on until a ShutdownSignal is requested.
//
// Why in architecture: The ConnectionMonitor has two long-running checks
// (liveness and heartbeat) that must both stop promptly when the monitor is
// stopped. Each check is one PeriodicWorker; both share the monitor's
// ShutdownSignal, so one request() wakes both from their interval sleep.
//
// Thread model: The task runs only on the owned thread. start() and stop()
// are called from the owner's thread. stop() requests the shared signal and
// joins; it never detaches. The task itself must not call stop() on its own
// worker (that would join the current thread).
// -----------------------------------------------------------------------------
class PeriodicWorker {
 public:
  using Task = std::function<void()>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // Input: name     — used in log lines only.
  //        interval — pause between the end of one run and the next.
  //        signal   — shared stop flag; must outlive this worker.
  //        task     — the periodic work. Exceptions must be handled inside
  //                   the task; an escaping exception terminates the thread
  //                   function and therefore the process.
  // Side-effects: None; no thread is started.
  // -------------------------------------------------------------------------
  PeriodicWorker(std::string name, std::chrono::milliseconds interval,
                 ShutdownSignal& signal, Task task);

  // RAII: stops and joins if still running.
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&) = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;
  PeriodicWorker(PeriodicWorker&&) = delete;
  PeriodicWorker& operator=(PeriodicWorker&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker thread. The first run happens immediately.
  // Idempotent: a second call while running does nothing.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Requests the shared signal (which also interrupts any other waiter
  // on it), then joins. If the task is mid-run, stop() blocks until that run
  // returns; the interval sleep is interrupted immediately.
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return thread_.joinable(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  ShutdownSignal& signal_;
  Task task_;
  std::thread thread_;
};

}  // namespace tether

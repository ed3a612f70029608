#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace settlement::scheduler {

/*
  Background thread that runs one task on a fixed interval.

  Drives:
      maturity sweep      held -> available
      retry queue drain   re-dispatch queued events

  A task that throws is logged and run again on the next tick. Stop()
  interrupts the wait and joins.
*/
class PeriodicWorker {
 public:
  PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&)            = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     task_;

  std::mutex              mutex_;
  std::condition_variable wake_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace settlement::scheduler

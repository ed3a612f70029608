#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/scheduler/periodic_worker.hpp"

namespace {

using namespace std::chrono_literals;
using settlement::scheduler::PeriodicWorker;

// Polls until cond holds or two seconds pass.
template <typename Cond>
bool Eventually(Cond cond) {
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return cond();
}

void TestRunsRepeatedlyUntilStopped() {
  std::atomic<int> runs{0};
  PeriodicWorker   worker("counter", 5ms, [&] { ++runs; });

  assert(!worker.Running());
  worker.Start();
  assert(worker.Running());
  assert(Eventually([&] { return runs.load() >= 3; }));

  worker.Stop();
  assert(!worker.Running());
  const int after_stop = runs.load();
  std::this_thread::sleep_for(20ms);
  assert(runs.load() == after_stop);
}

void TestStopInterruptsLongInterval() {
  std::atomic<int> runs{0};
  PeriodicWorker   worker("slow", std::chrono::hours(1), [&] { ++runs; });
  worker.Start();
  assert(Eventually([&] { return runs.load() == 1; }));

  const auto started = std::chrono::steady_clock::now();
  worker.Stop();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(runs.load() == 1);
}

void TestThrowingTaskKeepsRunning() {
  std::atomic<int> runs{0};
  PeriodicWorker   worker("flaky", 1ms, [&] {
    ++runs;
    throw std::runtime_error("store unavailable");
  });
  worker.Start();
  assert(Eventually([&] { return runs.load() >= 3; }));
  worker.Stop();
}

void TestStartTwiceAndStopTwice() {
  std::atomic<int> runs{0};
  PeriodicWorker   worker("idempotent", std::chrono::hours(1), [&] { ++runs; });
  worker.Start();
  worker.Start();
  assert(Eventually([&] { return runs.load() == 1; }));
  worker.Stop();
  worker.Stop();
  assert(runs.load() == 1);
}

void TestDestructorStops() {
  std::atomic<int> runs{0};
  {
    PeriodicWorker worker("scoped", 1ms, [&] { ++runs; });
    worker.Start();
    assert(Eventually([&] { return runs.load() >= 1; }));
  }
  const int after = runs.load();
  std::this_thread::sleep_for(10ms);
  assert(runs.load() == after);
}

} // namespace

int main() {
  TestRunsRepeatedlyUntilStopped();
  TestStopInterruptsLongInterval();
  TestThrowingTaskKeepsRunning();
  TestStartTwiceAndStopTwice();
  TestDestructorStops();

  std::cout << "settlement_unit_periodic_worker: pass\n";
  return 0;
}

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/replay/wake_scheduler.hpp"

namespace {

using namespace std::chrono_literals;
using fieldsync::replay::WakeScheduler;

void TestRepeatedSignalsCoalesce() {
  WakeScheduler scheduler;
  scheduler.RequestWake();
  scheduler.RequestWake();
  scheduler.RequestWake();

  assert(scheduler.WaitForWake(0ms));

  // the three signals were consumed by one wake-up; a poll now times out
  const auto start = std::chrono::steady_clock::now();
  assert(scheduler.WaitForWake(30ms));
  assert(std::chrono::steady_clock::now() - start >= 25ms);
}

void TestWakeFromAnotherThread() {
  WakeScheduler     scheduler;
  std::atomic<bool> woke{false};

  std::thread waiter([&] { woke = scheduler.WaitForWake(); });
  std::this_thread::sleep_for(20ms);
  assert(!woke);

  scheduler.RequestWake();
  waiter.join();
  assert(woke);
}

void TestShutdownReleasesWaiters() {
  WakeScheduler scheduler;
  bool          result = true;

  std::thread waiter([&] { result = scheduler.WaitForWake(); });
  std::this_thread::sleep_for(20ms);
  scheduler.Shutdown();
  waiter.join();
  assert(!result);

  // a pending wake does not outlive shutdown
  scheduler.RequestWake();
  assert(!scheduler.WaitForWake(0ms));
}

} // namespace

int main() {
  TestRepeatedSignalsCoalesce();
  TestWakeFromAnotherThread();
  TestShutdownReleasesWaiters();

  std::cout << "fieldsync_unit_wake_scheduler: pass\n";
  return 0;
}

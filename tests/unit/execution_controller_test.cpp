#include "internal/execution/execution_controller.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using rtask::execution::ExecutionController;

void TestRunningControllerDoesNotBlock() {
  ExecutionController controller;
  assert(!controller.IsPaused());
  const bool running = controller.WaitUntilRunning();
  assert(running);
}

void TestPauseAndResumeAreIdempotent() {
  ExecutionController controller;
  controller.Pause();
  controller.Pause();
  assert(controller.IsPaused());
  controller.Resume();
  controller.Resume();
  assert(!controller.IsPaused());
}

void TestResumeReleasesWaiters() {
  ExecutionController controller(true);
  assert(controller.IsPaused());

  std::atomic<int> released{0};
  std::atomic<int> proceeded{0};
  std::thread      waiter_a([&] {
    if (controller.WaitUntilRunning()) proceeded.fetch_add(1);
    released.fetch_add(1);
  });
  std::thread      waiter_b([&] {
    if (controller.WaitUntilRunning()) proceeded.fetch_add(1);
    released.fetch_add(1);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(released.load() == 0);

  controller.Resume();
  waiter_a.join();
  waiter_b.join();
  assert(released.load() == 2);
  assert(proceeded.load() == 2);
}

void TestShutdownAbortsPausedWaiters() {
  ExecutionController controller(true);

  std::atomic<bool> result{true};
  std::thread       waiter([&] { result = controller.WaitUntilRunning(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  controller.Shutdown();
  waiter.join();
  assert(!result.load());

  // later waits return at once
  const bool again = controller.WaitUntilRunning();
  assert(!again);
}

} // namespace

int main() {
  TestRunningControllerDoesNotBlock();
  TestPauseAndResumeAreIdempotent();
  TestResumeReleasesWaiters();
  TestShutdownAbortsPausedWaiters();

  std::cout << "rtask_unit_execution_controller: pass\n";
  return 0;
}

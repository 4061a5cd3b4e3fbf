#pragma once

#include <condition_variable>
#include <mutex>

namespace rtask::execution {

/*
  Global running/paused switch.

  Pausing only stops pausable workers from starting a handler. It never
  interrupts a running handler and never affects the high priority pool or
  the dispatch router.
*/
class ExecutionController {
 public:
  explicit ExecutionController(bool start_paused = false);

  void Pause();
  void Resume();

  bool IsPaused() const;

  // Blocks while paused. Returns false if the controller was shut down
  // while paused, true once execution may proceed.
  bool WaitUntilRunning();

  // Releases every waiter. Later waits no longer block.
  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    paused_;
  bool                    shutdown_ = false;
};

} // namespace rtask::execution

#include "execution_controller.hpp"

#include "internal/observability/logging.hpp"

namespace rtask::execution {

ExecutionController::ExecutionController(bool start_paused) : paused_(start_paused) {
}

void ExecutionController::Pause() {
  {
    std::lock_guard lock(mutex_);
    if (paused_) return;
    paused_ = true;
  }
  RTASK_LOG_INFO("Pausing task execution");
}

void ExecutionController::Resume() {
  {
    std::lock_guard lock(mutex_);
    if (!paused_) return;
    paused_ = false;
  }
  cv_.notify_all();
  RTASK_LOG_INFO("Resuming task execution");
}

bool ExecutionController::IsPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

bool ExecutionController::WaitUntilRunning() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return !paused_ || shutdown_; });
  return !paused_;
}

void ExecutionController::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace rtask::execution

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "internal/util/errors.hpp"

namespace rtask::queue {

/*
  Fixed capacity blocking FIFO.

  Push blocks while the queue is full, Pop blocks while it is empty.
  After Close() no new items are accepted; Pop keeps returning the items
  already queued and returns nullopt once they are drained.
*/
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw util::InvalidArgument("queue capacity must be positive");
    }
  }

  BoundedQueue(const BoundedQueue&)            = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false if the queue was closed before the item could be queued.
  bool Push(T item) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [&] { return closed_ || items_.size() < capacity_; });
      if (closed_) return false;
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // Waits for space, then queues make() without releasing the lock, so the
  // item is only built once the queue is certain to accept it. Returns false,
  // without calling make(), if the queue is closed first.
  template <typename Make>
  bool PushWith(Make&& make) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock, [&] { return closed_ || items_.size() < capacity_; });
      if (closed_) return false;
      items_.push_back(make());
    }
    not_empty_.notify_one();
    return true;
  }

  bool TryPush(T item) {
    {
      std::lock_guard lock(mutex_);
      if (closed_ || items_.size() >= capacity_) return false;
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return closed_ || !items_.empty(); });

    if (items_.empty()) return std::nullopt;

    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T>           items_;
  bool                    closed_ = false;
};

} // namespace rtask::queue

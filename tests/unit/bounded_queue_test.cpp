#include "internal/queue/bounded_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using rtask::queue::BoundedQueue;

void TestFifoOrder() {
  BoundedQueue<int> queue(4);
  queue.Push(1);
  queue.Push(2);
  queue.Push(3);

  assert(*queue.Pop() == 1);
  assert(*queue.Pop() == 2);
  assert(*queue.Pop() == 3);
  assert(queue.Size() == 0);
}

void TestTryPushRespectsCapacity() {
  BoundedQueue<int> queue(2);
  const bool first  = queue.TryPush(1);
  const bool second = queue.TryPush(2);
  const bool third  = queue.TryPush(3);
  assert(first && second);
  assert(!third);
  assert(queue.Size() == 2);
  assert(queue.Capacity() == 2);
}

void TestPushBlocksWhileFull() {
  BoundedQueue<int> queue(1);
  queue.Push(1);

  std::atomic<bool> pushed{false};
  std::thread       producer([&] { pushed = queue.Push(2); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!pushed);

  assert(*queue.Pop() == 1);
  producer.join();
  assert(pushed);
  assert(*queue.Pop() == 2);
}

void TestCloseDrainsRemainingItems() {
  BoundedQueue<int> queue(3);
  queue.Push(7);
  queue.Push(8);
  queue.Close();

  assert(queue.IsClosed());
  const bool pushed     = queue.Push(9);
  const bool try_pushed = queue.TryPush(9);
  assert(!pushed && !try_pushed);
  assert(*queue.Pop() == 7);
  assert(*queue.Pop() == 8);
  assert(!queue.Pop().has_value());
}

void TestCloseWakesBlockedConsumers() {
  BoundedQueue<int> queue(1);
  std::atomic<int>  finished{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i) {
    consumers.emplace_back([&] {
      auto item = queue.Pop();
      assert(!item.has_value());
      ++finished;
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  queue.Close();
  for (auto& consumer : consumers) consumer.join();
  assert(finished == 3);
}

void TestCloseReleasesBlockedProducer() {
  BoundedQueue<int> queue(1);
  queue.Push(1);

  std::atomic<bool> result{true};
  std::thread       producer([&] { result = queue.Push(2); });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  queue.Close();
  producer.join();
  assert(!result);
}

void TestPushWithBuildsOnlyAcceptedItems() {
  BoundedQueue<int> queue(1);
  std::atomic<int>  built{0};

  const bool first = queue.PushWith([&] { return ++built; });
  assert(first);
  assert(built == 1);

  // full: the producer waits before building anything
  std::atomic<bool> result{true};
  std::thread       producer([&] { result = queue.PushWith([&] { return ++built; }); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(built == 1);

  queue.Close();
  producer.join();
  assert(!result);
  assert(built == 1);
  assert(queue.Pop().value() == 1);

  const bool after_close = queue.PushWith([&] { return ++built; });
  assert(!after_close);
  assert(built == 1);
}

void TestZeroCapacityIsRejected() {
  bool threw = false;
  try {
    BoundedQueue<int> queue(0);
  } catch (const rtask::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentProducersDeliverEverything() {
  constexpr int kProducers   = 4;
  constexpr int kPerProducer = 250;

  BoundedQueue<int>        queue(8);
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.Push(p * kPerProducer + i);
      }
    });
  }

  std::vector<int> last_seen(kProducers, -1);
  int              received = 0;
  while (received < kProducers * kPerProducer) {
    auto item = queue.Pop();
    assert(item.has_value());
    const int producer = *item / kPerProducer;
    // per-producer order is preserved
    assert(*item > last_seen[producer]);
    last_seen[producer] = *item;
    ++received;
  }

  for (auto& producer : producers) producer.join();
  assert(queue.Size() == 0);
}

} // namespace

int main() {
  TestFifoOrder();
  TestTryPushRespectsCapacity();
  TestPushBlocksWhileFull();
  TestCloseDrainsRemainingItems();
  TestCloseWakesBlockedConsumers();
  TestCloseReleasesBlockedProducer();
  TestPushWithBuildsOnlyAcceptedItems();
  TestZeroCapacityIsRejected();
  TestConcurrentProducersDeliverEverything();

  std::cout << "rtask_unit_bounded_queue: pass\n";
  return 0;
}

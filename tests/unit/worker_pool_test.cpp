#include "internal/runtime/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/runtime/work_queue.hpp"

namespace {

using txcluster::runtime::WorkerPool;
using txcluster::runtime::WorkQueue;

void TestWaitIdleIsABarrier() {
  WorkerPool       pool(4);
  std::atomic<int> done{0};

  for (int round = 1; round <= 3; ++round) {
    for (int i = 0; i < 50; ++i) {
      pool.Submit([&] {
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        ++done;
      });
    }
    pool.WaitIdle();
    assert(done.load() == round * 50);
  }
}

void TestFirstFailureIsRethrownAndPoolStaysUsable() {
  WorkerPool       pool(2, 1);
  std::atomic<int> ran{0};

  pool.Submit([] { throw std::runtime_error("first"); });
  for (int i = 0; i < 10; ++i) pool.Submit([&] { ++ran; });

  bool threw = false;
  try {
    pool.WaitIdle();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "first";
  }
  assert(threw);

  // error is cleared by the barrier
  pool.Submit([&] { ++ran; });
  pool.WaitIdle();
  assert(ran.load() >= 1);
}

void TestBoundedQueueBlocksProducer() {
  WorkQueue<int>    queue(2);
  std::atomic<bool> third_pushed{false};

  assert(queue.Push(1));
  assert(queue.Push(2));

  std::thread producer([&] {
    queue.Push(3);
    third_pushed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!third_pushed.load());

  assert(queue.Pop() == 1);
  producer.join();
  assert(third_pushed.load());
  assert(queue.Pop() == 2);
  assert(queue.Pop() == 3);
}

void TestShutdownDrainsThenStops() {
  WorkQueue<std::string> queue(4);
  assert(queue.Push("a"));
  queue.Shutdown();

  assert(!queue.Push("b"));
  assert(queue.Pop() == std::optional<std::string>("a"));
  assert(!queue.Pop().has_value());
}

} // namespace

int main() {
  TestWaitIdleIsABarrier();
  TestFirstFailureIsRethrownAndPoolStaysUsable();
  TestBoundedQueueBlocksProducer();
  TestShutdownDrainsThenStops();

  std::cout << "txcluster_unit_worker_pool: pass\n";
  return 0;
}

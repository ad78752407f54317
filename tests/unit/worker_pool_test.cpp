#include "internal/runtime/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/runtime/task_queue.hpp"

namespace {

using colguard::runtime::Task;
using colguard::runtime::TaskQueue;
using colguard::runtime::WorkerPool;

void TestRunAllWaitsForEveryTask() {
  WorkerPool pool(4);
  assert(pool.Size() == 4);

  std::atomic<int>  sum{0};
  std::vector<Task> tasks;
  for (int i = 1; i <= 100; ++i) {
    tasks.push_back([&sum, i] { sum += i; });
  }
  pool.RunAll(std::move(tasks));

  assert(sum.load() == 5050);
}

void TestPoolIsReusableAcrossBatches() {
  WorkerPool       pool(2);
  std::atomic<int> count{0};

  for (int batch = 0; batch < 5; ++batch) {
    std::vector<Task> tasks(10, [&count] { ++count; });
    pool.RunAll(std::move(tasks));
    assert(count.load() == (batch + 1) * 10);
  }

  pool.RunAll({});
}

void TestFirstExceptionIsRethrownAfterBatch() {
  WorkerPool       pool(3);
  std::atomic<int> finished{0};

  std::vector<Task> tasks;
  for (int i = 0; i < 20; ++i) {
    tasks.push_back([&finished, i] {
      if (i == 7) throw std::runtime_error("task 7 failed");
      ++finished;
    });
  }

  bool threw = false;
  try {
    pool.RunAll(std::move(tasks));
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "task 7 failed";
  }

  assert(threw);
  assert(finished.load() == 19);
}

void TestZeroThreadsUsesAtLeastOne() {
  WorkerPool pool(0);
  assert(pool.Size() >= 1);
}

void TestQueueDrainsBeforeShutdown() {
  TaskQueue queue;
  int       ran = 0;
  queue.Enqueue([&ran] { ++ran; });
  queue.Enqueue([&ran] { ++ran; });
  queue.Shutdown();

  while (auto task = queue.Dequeue()) {
    (*task)();
  }
  assert(ran == 2);
  assert(!queue.Dequeue().has_value());
}

} // namespace

int main() {
  TestRunAllWaitsForEveryTask();
  TestPoolIsReusableAcrossBatches();
  TestFirstExceptionIsRethrownAfterBatch();
  TestZeroThreadsUsesAtLeastOne();
  TestQueueDrainsBeforeShutdown();

  std::cout << "colguard_unit_worker_pool: pass\n";
  return 0;
}

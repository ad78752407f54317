#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace colguard::runtime {

/*
  Fixed set of threads fed by a TaskQueue.

  RunAll() blocks until every task of the batch has finished. Must not
  be called from inside a pool task.
*/
class WorkerPool {
 public:
  // 0 = hardware concurrency
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Rethrows the first exception raised by a task, after all tasks ran.
  void RunAll(std::vector<Task> tasks);

  std::size_t Size() const {
    return threads_.size();
  }

  void Stop();

 private:
  void Run();

  std::shared_ptr<TaskQueue> queue_;
  std::vector<std::thread>   threads_;
};

} // namespace colguard::runtime

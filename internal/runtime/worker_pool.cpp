#include "worker_pool.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>

namespace colguard::runtime {

WorkerPool::WorkerPool(std::size_t threads) : queue_(std::make_shared<TaskQueue>()) {
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
  }
  if (threads == 0) {
    threads = 1;
  }

  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;
    (*task)();
  }
}

void WorkerPool::RunAll(std::vector<Task> tasks) {
  if (tasks.empty()) return;

  struct Batch {
    std::mutex              mutex;
    std::condition_variable done;
    std::size_t             remaining = 0;
    std::exception_ptr      first_error;
  };

  auto batch       = std::make_shared<Batch>();
  batch->remaining = tasks.size();

  for (auto& task : tasks) {
    queue_->Enqueue([batch, task = std::move(task)] {
      std::exception_ptr error;
      try {
        task();
      } catch (...) {
        error = std::current_exception();
      }

      std::lock_guard lock(batch->mutex);
      if (error && !batch->first_error) batch->first_error = error;
      if (--batch->remaining == 0) batch->done.notify_all();
    });
  }

  std::unique_lock lock(batch->mutex);
  batch->done.wait(lock, [&] { return batch->remaining == 0; });

  if (batch->first_error) {
    std::rethrow_exception(batch->first_error);
  }
}

} // namespace colguard::runtime

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace colguard::runtime {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue for pool workers.
*/
class TaskQueue {
 public:
  void Enqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace colguard::runtime

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace mirrorwatch::scheduler {

/*
  Fixed-size worker pool over a blocking FIFO queue.

  The pool size bounds outbound connection fan-out, not the number of
  hosts. Jobs must not throw; a job that does is logged and dropped.
*/
class WorkerPool {
 public:
  using Job = std::function<void()>;

  WorkerPool(std::string name, std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // false once Shutdown was called
  bool Submit(Job job);

  // Discards queued jobs, waits for running ones and joins the workers.
  void Shutdown();

  std::size_t Size() const {
    return workers_.size();
  }

  std::size_t Pending() const;

  // true once Shutdown joined the workers; queued jobs were dropped
  bool Stopped() const {
    return stopped_.load();
  }

 private:
  // blocking wait
  std::optional<Job> Dequeue();
  void               Run();

  std::string              name_;
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<Job>          queue_;
  bool                     shutdown_ = false;
  std::atomic<bool>        stopped_{false};
  std::vector<std::thread> workers_;
};

} // namespace mirrorwatch::scheduler

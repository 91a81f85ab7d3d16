#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace mirrorwatch::scheduler {

WorkerPool::WorkerPool(std::string name, std::size_t workers) : name_(std::move(name)) {
  if (workers == 0) workers = 1;
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

bool WorkerPool::Submit(Job job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

std::size_t WorkerPool::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<WorkerPool::Job> WorkerPool::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  Job job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ && workers_.empty()) return;
    shutdown_ = true;
    std::queue<Job>().swap(queue_);
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  stopped_ = true;
}

void WorkerPool::Run() {
  while (auto job = Dequeue()) {
    try {
      (*job)();
    } catch (const std::exception& e) {
      MIRRORWATCH_LOG_ERROR("worker job failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace mirrorwatch::scheduler
